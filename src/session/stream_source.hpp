#pragma once

#include <chrono>
#include <string>

// Which of the two logical streams has data
struct ReadyStreams {
    bool out = false;
    bool err = false;

    bool any() const { return out || err; }
};

// A pair of poll-style byte streams (a child's stdout/stderr pipes).
class StreamSource {
public:
    virtual ~StreamSource() = default;

    // Wait up to `timeout` for either stream to become readable.
    virtual ReadyStreams poll(std::chrono::milliseconds timeout) = 0;

    // Read whatever one stream has (may be empty at EOF).
    virtual std::string read_out() = 0;
    virtual std::string read_err() = 0;

    // Non-blocking liveness check of the producer behind the streams.
    virtual bool alive() = 0;
};
