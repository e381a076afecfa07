#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <core/types.hpp>

// Bidirectional interactive channel to a remote shell (already
// authenticated). All receive calls are non-blocking.
class RemoteChannel {
public:
    virtual ~RemoteChannel() = default;

    // Send everything; false if the channel is closed or broken.
    virtual bool send(const std::string& data) = 0;

    virtual bool recv_ready() = 0;
    virtual std::string recv(std::size_t max_bytes) = 0;

    virtual bool recv_stderr_ready() = 0;
    virtual std::string recv_stderr(std::size_t max_bytes) = 0;

    // True once the remote side has closed the channel
    virtual bool eof() = 0;

    // Safe to call more than once
    virtual void close() = 0;
};

// Factory for shell channels plus a side channel for one-off commands on the
// same host (used for process-table polling).
class RemoteHost {
public:
    virtual ~RemoteHost() = default;

    // Open an interactive shell channel, negotiating `env` with the server.
    virtual Result<std::unique_ptr<RemoteChannel>> open_shell(const Environment& env) = 0;

    // Run a command to completion on its own channel.
    virtual SSHResult exec(const std::string& command) = 0;
};
