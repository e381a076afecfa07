#pragma once

#include <map>
#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process with its three standard streams piped
// back to the parent. Owns the pid and the parent ends of the pipes.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Non-blocking liveness check. Reaps the child once it has exited.
    bool running();

    // SIGKILL and reap. Safe to call more than once.
    void kill();

    // Close the parent ends of the pipes. Safe to call more than once.
    void close_pipes();

    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    void reset();

    friend ProcessHandle spawn_piped(const std::string& program,
                                     const std::vector<std::string>& args,
                                     const std::map<std::string, std::string>& env);
};

// Spawn a child with stdin/stdout/stderr connected to pipes.
// The child inherits the parent environment with `env` layered on top.
// Returns an invalid handle (errno set) if pipe(), fork() or exec fails.
ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::map<std::string, std::string>& env = {});

// Write the whole buffer, retrying on EINTR/EAGAIN. False on EPIPE or any
// other write error.
bool write_all(int fd, const std::string& data);

// Command lines of all running processes (`ps -e -ww -o args`, header skipped).
std::vector<std::string> list_process_commands();

} // namespace platform
