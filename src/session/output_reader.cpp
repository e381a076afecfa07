#include "output_reader.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

OutputReader::OutputReader(StreamSource& source, CompletionDetector& detector,
                           Clock& clock, ReaderTimings timings)
    : source_(source), detector_(detector), clock_(clock), timings_(timings) {}

void OutputReader::sleep_bounded(std::chrono::milliseconds d, Clock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now());
    if (remaining.count() <= 0) return;
    clock_.sleep_for(std::min(d, remaining));
}

StreamOutput OutputReader::read(const std::string& command,
                                const std::optional<std::string>& command_end_marker,
                                const std::optional<std::string>& stderr_end_marker,
                                bool wait,
                                std::chrono::milliseconds timeout) {
    const auto deadline = clock_.now() + timeout;

    std::string out_buf;
    std::string err_buf;
    bool out_done = false;
    bool err_done = false;

    while (clock_.now() < deadline) {
        if (wait && !command.empty() && !detector_.has_exited(command, deadline)) {
            if (!source_.alive()) break;
            sleep_bounded(timings_.completion_retry, deadline);
            continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_.now());
        auto ready = source_.poll(std::max(std::chrono::milliseconds(0),
                                           std::min(timings_.poll_interval, remaining)));
        bool got_data = false;
        if (ready.out && !out_done) {
            std::string chunk = source_.read_out();
            got_data = got_data || !chunk.empty();
            out_buf += chunk;
        }
        if (ready.err && !err_done) {
            std::string chunk = source_.read_err();
            got_data = got_data || !chunk.empty();
            err_buf += chunk;
        }

        if (ready.any()) {
            out_done = !command_end_marker || out_buf.find(*command_end_marker) != std::string::npos;
            err_done = !stderr_end_marker || err_buf.find(*stderr_end_marker) != std::string::npos;
            if (out_done && err_done) {
                if (command_end_marker) out_buf.erase(out_buf.find(*command_end_marker));
                if (stderr_end_marker) err_buf.erase(err_buf.find(*stderr_end_marker));
                return StreamOutput{out_buf, err_buf};
            }
        }

        if (command.empty()) {
            return StreamOutput{out_buf, err_buf};
        }

        if (!got_data && !source_.alive()) break;

        sleep_bounded(timings_.loop_pause, deadline);
    }

    if (!source_.alive()) {
        hostshell_log(fmt::format("reader: shell exited, stdout({}) stderr({})",
                                  out_buf.size(), err_buf.size()));
        throw ProcessExited(
            fmt::format("Shell process exited unexpectedly.\nCurrent stdout: {}\nCurrent stderr: {}",
                        out_buf, err_buf),
            out_buf, err_buf);
    }

    hostshell_log(fmt::format("reader: timeout after {}ms, stdout({}) stderr({})",
                              timeout.count(), out_buf.size(), err_buf.size()));
    throw ReadTimeout(
        fmt::format("Timeout reached while reading from shell after {}s.\n"
                    "Current stdout: {}\nCurrent stderr: {}\n"
                    "Note that interactive commands are not supported and can time out. "
                    "Use a corresponding non-interactive command if possible.",
                    timeout.count() / 1000.0, out_buf, err_buf),
        out_buf, err_buf);
}
