#include "pipe_stream_source.hpp"
#include <core/constants.hpp>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

PipeStreamSource::PipeStreamSource(platform::ProcessHandle& process)
    : process_(process) {}

ReadyStreams PipeStreamSource::poll(std::chrono::milliseconds timeout) {
    ReadyStreams ready;
    struct pollfd fds[2];
    fds[0].fd = process_.stdout_fd();
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = process_.stderr_fd();
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    int ret = ::poll(fds, 2, static_cast<int>(timeout.count()));
    if (ret <= 0) return ready;

    // POLLHUP alone means EOF; only report streams that can yield bytes
    ready.out = (fds[0].revents & POLLIN) != 0;
    ready.err = (fds[1].revents & POLLIN) != 0;
    return ready;
}

std::string PipeStreamSource::read_fd(int fd) {
    if (fd < 0) return "";
    char buf[PIPE_READ_BUF_SIZE];
    ssize_t n;
    do {
        n = ::read(fd, buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);
    if (n <= 0) return "";
    return std::string(buf, static_cast<size_t>(n));
}

std::string PipeStreamSource::drain_fd(int fd) {
    std::string drained;
    while (true) {
        std::string chunk = read_fd(fd);
        if (chunk.empty()) break;
        drained += chunk;
    }
    return drained;
}

std::string PipeStreamSource::read_out() {
    return read_fd(process_.stdout_fd());
}

std::string PipeStreamSource::read_err() {
    return read_fd(process_.stderr_fd());
}

std::string PipeStreamSource::drain_out() {
    return drain_fd(process_.stdout_fd());
}

std::string PipeStreamSource::drain_err() {
    return drain_fd(process_.stderr_fd());
}

bool PipeStreamSource::alive() {
    return process_.running();
}
