#pragma once

#include <platform/process.hpp>
#include "stream_source.hpp"

// StreamSource over the stdout/stderr pipes of a spawned shell.
class PipeStreamSource : public StreamSource {
public:
    explicit PipeStreamSource(platform::ProcessHandle& process);

    ReadyStreams poll(std::chrono::milliseconds timeout) override;
    std::string read_out() override;
    std::string read_err() override;
    bool alive() override;

    // Read and return everything currently buffered on both pipes.
    std::string drain_out();
    std::string drain_err();

private:
    platform::ProcessHandle& process_;

    static std::string read_fd(int fd);
    static std::string drain_fd(int fd);
};
