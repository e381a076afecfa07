#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include "clock.hpp"
#include "completion_detector.hpp"
#include "stream_source.hpp"

struct ReaderTimings {
    std::chrono::milliseconds poll_interval{READ_POLL_MS};
    std::chrono::milliseconds loop_pause{READ_PAUSE_MS};
    std::chrono::milliseconds completion_retry{COMPLETION_RETRY_MS};
};

struct StreamOutput {
    std::string stdout_data;
    std::string stderr_data;
};

// Timeout-bounded polling loop that accumulates a stdout/stderr pair until
// the requested end markers show up.
//
// A stream whose marker has been seen (or that has no marker) stops taking
// bytes for the rest of the call, so a later command's early output is never
// folded into this result. On success each buffer is cut at the first
// occurrence of its marker.
//
// Throws ProcessExited if the producer dies first and ReadTimeout if the
// deadline passes; both carry the partial buffers.
class OutputReader {
public:
    OutputReader(StreamSource& source, CompletionDetector& detector,
                 Clock& clock, ReaderTimings timings = {});

    // An empty `command` means "grab what is there": one poll, no waiting.
    StreamOutput read(const std::string& command,
                      const std::optional<std::string>& command_end_marker,
                      const std::optional<std::string>& stderr_end_marker,
                      bool wait,
                      std::chrono::milliseconds timeout);

private:
    StreamSource& source_;
    CompletionDetector& detector_;
    Clock& clock_;
    ReaderTimings timings_;

    // Sleep for `d`, but never past `deadline`
    void sleep_bounded(std::chrono::milliseconds d, Clock::time_point deadline);
};
