#ifndef BATO_CORE_CHILD_PROCESS_H
#define BATO_CORE_CHILD_PROCESS_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace bato_core {

struct ChildResult {
    bool timedOut = false;
    bool exitedNormally = false;
    int exitCode = -1;
    std::string output;
    bool truncated = false; // child wrote more than kMaxChildOutput bytes
};

// Upper bound on captured child output.
constexpr std::size_t kMaxChildOutput = 64 * 1024;

// write(2) until everything is out; false on error.
bool writeAll(int fd, const char* data, std::size_t len);

/**
 * @brief Forks, runs @p body in the child with the write end of a pipe, and
 *        collects what the child writes until it exits or @p timeout elapses.
 *
 * The pipe is close-on-exec; a body that execs must dup2 it onto a standard
 * stream. The child's exit status is body's return value. On timeout, or if anything in
 * the parent throws, the child is killed with SIGKILL and reaped before this
 * returns; no process outlives the call.
 *
 * @throws std::system_error if the pipe or fork cannot be created.
 */
ChildResult runInChild(const std::function<int(int outFd)>& body, std::chrono::milliseconds timeout);

} // namespace bato_core

#endif // BATO_CORE_CHILD_PROCESS_H
