#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <session/remote_channel.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RAII handle for an interactive PTY shell channel.
// Owns the channel and closes+frees it on destruction. The session it was
// opened on must outlive it. All libssh2 calls take brief io_mutex_ holds.
//
// libssh2 has no "bytes available" query, so readiness is answered by
// reading into a pending buffer that recv()/recv_stderr() then hand out.
class SshShellChannel : public RemoteChannel {
public:
    SshShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<std::mutex> io_mutex);
    ~SshShellChannel() override;

    SshShellChannel(const SshShellChannel&) = delete;
    SshShellChannel& operator=(const SshShellChannel&) = delete;

    bool send(const std::string& data) override;

    bool recv_ready() override;
    std::string recv(std::size_t max_bytes) override;

    bool recv_stderr_ready() override;
    std::string recv_stderr(std::size_t max_bytes) override;

    bool eof() override;
    void close() override;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::string out_pending_;
    std::string err_pending_;
    bool broken_ = false;

    void fill_pending();
    static std::string take(std::string& pending, std::size_t max_bytes);
};
