#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <array>

extern char** environ;

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), stdin_fd_(other.stdin_fd_),
      stdout_fd_(other.stdout_fd_), stderr_fd_(other.stderr_fd_) {
    other.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        stderr_fd_ = other.stderr_fd_;
        other.reset();
    }
    return *this;
}

void ProcessHandle::reset() {
    pid_ = -1;
    reaped_ = false;
    stdin_fd_ = -1;
    stdout_fd_ = -1;
    stderr_fd_ = -1;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    reaped_ = true;             // reaped now, or ECHILD: someone else did
    return false;
}

void ProcessHandle::kill() {
    if (pid_ <= 0 || reaped_) return;
    // The child leads its own process group; take the foreground job with it
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    reaped_ = true;
}

void ProcessHandle::close_pipes() {
    for (int* fd : {&stdin_fd_, &stdout_fd_, &stderr_fd_}) {
        if (*fd >= 0) {
            ::close(*fd);
            *fd = -1;
        }
    }
}

// ── spawn ────────────────────────────────────────────────────

static void ignore_sigpipe() {
    // A write to a dead shell must surface as EPIPE, not kill the caller
    static bool installed = false;
    if (!installed) {
        signal(SIGPIPE, SIG_IGN);
        installed = true;
    }
}

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1) fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags != -1) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

ProcessHandle spawn_piped(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::map<std::string, std::string>& env) {
    ProcessHandle handle;
    ignore_sigpipe();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports a failed exec back to the parent
    if (pipe(in_pipe) == -1 || pipe(out_pipe) == -1 || pipe(err_pipe) == -1 ||
        pipe(exec_pipe) == -1) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        errno = err;
        return handle;
    }
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    // Build argv and envp before fork; the child only calls exec.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && env.count(entry.substr(0, eq))) continue;
        env_strings.push_back(std::move(entry));
    }
    for (const auto& [key, value] : env) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        errno = err;
        return handle;
    }

    if (pid == 0) {
        // Child process
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        ::close(exec_pipe[0]);

        // Own process group so SIGKILL on teardown doesn't race with job control
        setpgid(0, 0);

        execvpe(program.c_str(), const_cast<char* const*>(argv.data()), envp.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent: keep our ends only
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // EOF means exec succeeded (the CLOEXEC write end went away with it)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        errno = exec_errno;
        return handle;
    }

    set_cloexec(in_pipe[1]);
    set_cloexec(out_pipe[0]);
    set_cloexec(err_pipe[0]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    handle.pid_ = pid;
    handle.stdin_fd_ = in_pipe[1];
    handle.stdout_fd_ = out_pipe[0];
    handle.stderr_fd_ = err_pipe[0];
    return handle;
}

bool write_all(int fd, const std::string& data) {
    if (fd < 0) return false;
    size_t sent = 0;
    int retries = 0;
    while (sent < data.size()) {
        ssize_t w = ::write(fd, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN && ++retries <= 100) {
                sleep_ms(10);
                continue;
            }
            return false;
        }
        retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

std::vector<std::string> list_process_commands() {
    std::vector<std::string> commands;

    FILE* pipe = popen("ps -e -ww -o args", "r");
    if (!pipe) {
        return commands;
    }

    std::string current;
    std::array<char, 1024> buffer;
    bool header_skipped = false;
    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        current += buffer.data();
        if (current.empty() || current.back() != '\n') continue;  // long line, keep reading
        current.pop_back();
        if (!header_skipped) {
            header_skipped = true;
        } else {
            commands.push_back(current);
        }
        current.clear();
    }
    if (!current.empty() && header_skipped) commands.push_back(current);
    pclose(pipe);

    return commands;
}

} // namespace platform
