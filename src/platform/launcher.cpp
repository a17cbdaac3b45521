#include "hatch/launcher.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hatch {

namespace {

// Messages on the status pipe
enum : int { MSG_PID = 1, MSG_ERRNO = 2 };

void write_message(int fd, int kind, int value) {
    int msg[2] = {kind, value};
    const char* data = reinterpret_cast<const char*>(msg);
    size_t size = sizeof(msg);
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

} // namespace

LaunchResult launch_detached(const LaunchRequest& request) {
    LaunchResult result;

    if (request.command.empty()) {
        result.error = "empty command";
        return result;
    }

    // Build C-style arrays
    std::vector<std::string> argv_strings;
    argv_strings.push_back(request.command);
    for (const auto& arg : request.arguments) {
        argv_strings.push_back(arg);
    }
    std::vector<char*> argv;
    for (auto& s : argv_strings) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    // Closed by a successful exec, so EOF without an errno message means
    // the command is running
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(status_pipe[0]);
        close(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Intermediate child: new session, then fork the real process so it
        // is reparented and never becomes our zombie
        close(status_pipe[0]);
        setsid();

        pid_t grandchild = fork();
        if (grandchild == -1) {
            write_message(status_pipe[1], MSG_ERRNO, errno);
            _exit(127);
        }
        if (grandchild > 0) {
            write_message(status_pipe[1], MSG_PID, static_cast<int>(grandchild));
            _exit(0);
        }

        if (!request.working_dir.empty() && chdir(request.working_dir.c_str()) != 0) {
            write_message(status_pipe[1], MSG_ERRNO, errno);
            _exit(127);
        }

        execvp(request.command.c_str(), argv.data());

        // If execvp returns, it failed
        write_message(status_pipe[1], MSG_ERRNO, errno);
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }

    int launched = -1;
    int err = 0;
    int msg[2];
    for (;;) {
        ssize_t n = read(status_pipe[0], msg, sizeof(msg));
        if (n < 0 && errno == EINTR) continue;
        if (n != static_cast<ssize_t>(sizeof(msg))) break;
        if (msg[0] == MSG_PID) launched = msg[1];
        if (msg[0] == MSG_ERRNO) err = msg[1];
    }
    close(status_pipe[0]);

    if (err != 0) {
        result.error = "exec " + request.command + " failed: " + strerror(err);
        return result;
    }
    if (launched < 0) {
        result.error = "launch of " + request.command + " failed";
        return result;
    }

    result.ok = true;
    result.pid = launched;
    spdlog::debug("launched {} (pid {})", request.command, launched);
    return result;
}

} // namespace hatch
