#include "hatch/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace hatch {

namespace fs = std::filesystem;

namespace {

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

void sync_parent_of(const std::string& path) {
    std::string dir = get_parent_directory(path);
    if (dir.empty()) return;
    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    sync_fd(fd);
    close(fd);
}

bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// Sibling of dst so the final rename never crosses a filesystem
std::string temp_sibling(const std::string& dst) {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> pick(0, 15);

    std::string name = dst + ".hatch-tmp.";
    for (int i = 0; i < 8; ++i) {
        name += digits[pick(gen)];
    }
    return name;
}

// Flush and close fd (open on temp), then rename temp over dst.
// temp is unlinked on any failure.
AtomicWriteResult commit_temp(int fd, const std::string& temp, const std::string& dst) {
    AtomicWriteResult result;
    if (!sync_fd(fd)) {
        result.error = errno_text("failed to fsync " + temp);
        close(fd);
        unlink(temp.c_str());
        return result;
    }
    close(fd);

    if (rename(temp.c_str(), dst.c_str()) != 0) {
        result.error = errno_text("failed to rename into " + dst);
        unlink(temp.c_str());
        return result;
    }
    sync_parent_of(dst);
    result.ok = true;
    return result;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    std::string temp = temp_sibling(path);

    int fd = open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = errno_text("failed to create " + temp);
        return result;
    }
    if (!write_all(fd, content.data(), content.size())) {
        result.error = errno_text("failed to write " + temp);
        close(fd);
        unlink(temp.c_str());
        return result;
    }
    return commit_temp(fd, temp, path);
}

AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst) {
    AtomicWriteResult result;
    std::error_code ec;

    auto src_status = fs::status(src, ec);
    if (ec || !fs::is_regular_file(src_status)) {
        result.error = "source is not a readable regular file: " + src;
        return result;
    }
    auto src_time = fs::last_write_time(src, ec);
    if (ec) {
        result.error = "failed to stat " + src + ": " + ec.message();
        return result;
    }

    int in = open(src.c_str(), O_RDONLY);
    if (in < 0) {
        result.error = errno_text("failed to open " + src);
        return result;
    }

    std::string temp = temp_sibling(dst);
    int out = open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (out < 0) {
        result.error = errno_text("failed to create " + temp);
        close(in);
        return result;
    }

    char buffer[65536];
    for (;;) {
        ssize_t n = read(in, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) break;
        if (n < 0 || !write_all(out, buffer, static_cast<size_t>(n))) {
            result.error = errno_text(n < 0 ? "failed to read " + src : "failed to write " + temp);
            close(in);
            close(out);
            unlink(temp.c_str());
            return result;
        }
    }
    close(in);

    // Mode and mtime travel with the file; if_newer_version compares mtimes later
    fs::permissions(temp, src_status.permissions(), fs::perm_options::replace, ec);
    if (!ec) {
        fs::last_write_time(temp, src_time, ec);
    }
    if (ec) {
        result.error = "failed to apply metadata of " + src + ": " + ec.message();
        close(out);
        unlink(temp.c_str());
        return result;
    }

    return commit_temp(out, temp, dst);
}

AtomicWriteResult durable_append_line(const std::string& path, const std::string& line) {
    AtomicWriteResult result;
    std::string data = line;
    if (data.empty() || data.back() != '\n') {
        data += '\n';
    }

    int fd = open(path.c_str(), O_RDWR | O_CREAT | O_APPEND, 0644);
    if (fd < 0) {
        result.error = errno_text("failed to open " + path + " for append");
        return result;
    }

    // A torn last line from an interrupted append stays on its own line
    off_t size = lseek(fd, 0, SEEK_END);
    if (size > 0) {
        char last = '\n';
        if (pread(fd, &last, 1, size - 1) != 1) {
            result.error = errno_text("failed to read tail of " + path);
            close(fd);
            return result;
        }
        if (last != '\n') {
            data.insert(data.begin(), '\n');
        }
    }

    bool written = write_all(fd, data.data(), data.size()) && sync_fd(fd);
    if (!written) {
        result.error = errno_text("failed to append to " + path);
    }
    close(fd);
    result.ok = written;
    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    sync_parent_of(path);

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) return to_portable_path(path);
    return to_portable_path(abs.lexically_normal().string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_files_recursive(const std::string& root) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    for (auto it = fs::recursive_directory_iterator(root, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(to_portable_path(
                fs::relative(it->path(), root, ec).generic_string()));
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::optional<int64_t> file_mtime(const std::string& path) {
    std::error_code ec;
    auto t = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count());
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    return !ec;
}

bool remove_empty_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec) || !fs::is_empty(path, ec)) {
        return false;
    }
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val == nullptr || *val == '\0') {
        return std::nullopt;
    }
    return std::string(val);
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace hatch
