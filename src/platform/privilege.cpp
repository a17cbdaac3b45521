#include "hatch/privilege.hpp"
#include "hatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hatch {

namespace {

Error privilege_error(const std::string& message, const std::string& path = "") {
    return Error(ErrorCode::PRIVILEGE_ERROR, message, path);
}

} // namespace

std::string nearest_existing_ancestor(const std::string& path) {
    std::string current = absolute_path(path);
    while (!current.empty()) {
        if (path_exists(current)) {
            return current;
        }
        std::string parent = get_parent_directory(current);
        if (parent == current) break;
        current = parent;
    }
    return "";
}

Result<PrivilegeContext> PrivilegeContext::acquire(const std::string& lock_path,
                                                   const std::vector<std::string>& writable_dirs,
                                                   bool require_root) {
    if (require_root && geteuid() != 0) {
        return Result<PrivilegeContext>::err(
            privilege_error("this operation must run as root (privilege.require_root)"));
    }

    for (const auto& dir : writable_dirs) {
        if (dir.empty()) continue;
        std::string existing = nearest_existing_ancestor(dir);
        if (existing.empty() || access(existing.c_str(), W_OK | X_OK) != 0) {
            return Result<PrivilegeContext>::err(
                privilege_error("no write permission", existing.empty() ? dir : existing));
        }
    }

    std::string lock_dir = get_parent_directory(lock_path);
    if (!lock_dir.empty() && !is_directory(lock_dir)) {
        auto made = atomic_create_directory(lock_dir);
        if (!made.ok) {
            return Result<PrivilegeContext>::err(privilege_error(made.error, lock_dir));
        }
    }

    int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<PrivilegeContext>::err(
            privilege_error("cannot open lock file: " + std::string(strerror(errno)), lock_path));
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK) {
            return Result<PrivilegeContext>::err(
                privilege_error("another hatch session is running", lock_path));
        }
        return Result<PrivilegeContext>::err(
            privilege_error("cannot lock: " + std::string(strerror(err)), lock_path));
    }

    // Owner pid, for humans inspecting a stuck lock
    std::string pid = std::to_string(getpid()) + "\n";
    if (ftruncate(fd, 0) != 0 || write(fd, pid.data(), pid.size()) < 0) {
        spdlog::debug("could not record pid in {}", lock_path);
    }

    spdlog::debug("acquired session lock {}", lock_path);
    return Result<PrivilegeContext>::ok(PrivilegeContext(fd, lock_path));
}

PrivilegeContext::PrivilegeContext(PrivilegeContext&& other) noexcept
    : fd_(other.fd_), lock_path_(std::move(other.lock_path_)) {
    other.fd_ = -1;
}

PrivilegeContext& PrivilegeContext::operator=(PrivilegeContext&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        lock_path_ = std::move(other.lock_path_);
        other.fd_ = -1;
    }
    return *this;
}

PrivilegeContext::~PrivilegeContext() {
    release();
}

void PrivilegeContext::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

} // namespace hatch
