#include "bato_core/child_process.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bato_core {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

// Kills and reaps the child unless it was already reaped.
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ > 0) {
            ::kill(pid_, SIGKILL);
            while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
            }
        }
    }
    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    pid_t pid() const { return pid_; }
    void markReaped() { pid_ = -1; }

private:
    pid_t pid_;
};

} // namespace

bool writeAll(int fd, const char* data, std::size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

ChildResult runInChild(const std::function<int(int outFd)>& body, std::chrono::milliseconds timeout) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    FdGuard readEnd(fds[0]);
    FdGuard writeEnd(fds[1]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::generic_category(), "fork");
    }

    if (pid == 0) {
        ::close(fds[0]);
        int rc = 125;
        try {
            rc = body(fds[1]);
        } catch (const std::exception&) {
            rc = 124;
        }
        ::_exit(rc);
    }

    ChildGuard child(pid);
    writeEnd.reset();

    ChildResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remainingMs = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    char buffer[4096];
    bool eof = false;
    while (!eof) {
        int waitMs = remainingMs();
        if (waitMs == 0) {
            result.timedOut = true;
            return result; // ChildGuard kills the child
        }
        pollfd pfd{readEnd.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ready == 0) continue;

        ssize_t n = ::read(readEnd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read");
        }
        if (n == 0) {
            eof = true;
        } else {
            size_t room = kMaxChildOutput - result.output.size();
            if (static_cast<size_t>(n) > room) {
                result.truncated = true;
            }
            result.output.append(buffer, std::min(room, static_cast<size_t>(n)));
        }
    }

    // Output is closed; give the child the rest of the budget to exit.
    int status = 0;
    while (true) {
        pid_t r = ::waitpid(child.pid(), &status, WNOHANG);
        if (r == child.pid()) {
            child.markReaped();
            break;
        }
        if (r < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (remainingMs() == 0) {
            result.timedOut = true;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFEXITED(status)) {
        result.exitedNormally = true;
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

} // namespace bato_core
