#include "ssh_shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>

SshShellChannel::SshShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex)
    : ch_(ch), io_mutex_(std::move(io_mutex)) {}

SshShellChannel::~SshShellChannel() {
    close();
}

void SshShellChannel::close() {
    if (!ch_ || !io_mutex_) return;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

bool SshShellChannel::send(const std::string& data) {
    if (!ch_ || broken_) return false;

    size_t total = data.size();
    size_t sent = 0;
    int write_retries = 0;
    while (sent < total) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(ch_, data.c_str() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > SSH_WRITE_RETRIES) {
                hostshell_log("ssh: write stalled (EAGAIN for too long)");
                return false;
            }
            platform::sleep_ms(SSH_RETRY_MS);
            continue;
        }
        if (w < 0) {
            hostshell_log(fmt::format("ssh: channel write error {}", w));
            broken_ = true;
            return false;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void SshShellChannel::fill_pending() {
    if (!ch_ || broken_) return;

    char buf[SSH_READ_BUF_SIZE];
    std::lock_guard<std::mutex> lock(*io_mutex_);
    while (true) {
        ssize_t n = libssh2_channel_read(ch_, buf, sizeof(buf));
        if (n > 0) {
            out_pending_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) broken_ = true;
        break;
    }
    while (!broken_) {
        ssize_t n = libssh2_channel_read_stderr(ch_, buf, sizeof(buf));
        if (n > 0) {
            err_pending_.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) broken_ = true;
        break;
    }
}

std::string SshShellChannel::take(std::string& pending, std::size_t max_bytes) {
    std::string chunk = pending.substr(0, max_bytes);
    pending.erase(0, chunk.size());
    return chunk;
}

bool SshShellChannel::recv_ready() {
    if (out_pending_.empty()) fill_pending();
    return !out_pending_.empty();
}

std::string SshShellChannel::recv(std::size_t max_bytes) {
    if (out_pending_.empty()) fill_pending();
    return take(out_pending_, max_bytes);
}

bool SshShellChannel::recv_stderr_ready() {
    if (err_pending_.empty()) fill_pending();
    return !err_pending_.empty();
}

std::string SshShellChannel::recv_stderr(std::size_t max_bytes) {
    if (err_pending_.empty()) fill_pending();
    return take(err_pending_, max_bytes);
}

bool SshShellChannel::eof() {
    if (!out_pending_.empty() || !err_pending_.empty()) return false;
    if (!ch_ || broken_) return true;
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return libssh2_channel_eof(ch_) != 0;
}
