#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <session/remote_channel.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One authenticated SSH transport to a remote host. Shell channels opened
// from it borrow the session and must be closed before the host is.
class SshHost : public RemoteHost {
public:
    explicit SshHost(const RemoteConfig& config);
    ~SshHost() override;

    SshHost(const SshHost&) = delete;
    SshHost& operator=(const SshHost&) = delete;

    // TCP connect, handshake and user authentication.
    SSHResult connect(StatusCallback callback = nullptr);
    void close();

    Result<std::unique_ptr<RemoteChannel>> open_shell(const Environment& env) override;
    SSHResult exec(const std::string& command) override;

    const std::string& target() const { return target_str_; }

private:
    RemoteConfig config_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult authenticate(StatusCallback callback);
    LIBSSH2_CHANNEL* open_channel();
    void free_channel(LIBSSH2_CHANNEL* ch);
};
