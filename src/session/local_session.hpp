#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <platform/process.hpp>
#include "session.hpp"
#include "clock.hpp"
#include "completion_detector.hpp"
#include "interactivity_guard.hpp"
#include "output_reader.hpp"
#include "pipe_stream_source.hpp"

// Session backed by a locally spawned shell, driven through its
// stdin/stdout/stderr pipes. Completion is detected by polling the OS
// process table.
//
// Usage:
//     LocalSession session(Config::defaults().shell(), {{"FOO", "bar"}});
//     session.setup();
//     auto r = session.execute("echo $FOO");   // r.stdout_data == "bar\n"
//     session.teardown();
class LocalSession : public Session {
public:
    LocalSession(ShellConfig shell, Environment environment, Clock& clock = system_clock());

    // Substitute the completion heuristic (tests, or a more precise detector)
    LocalSession(ShellConfig shell, Environment environment,
                 std::unique_ptr<CompletionDetector> detector,
                 Clock& clock = system_clock());

    ~LocalSession() override;

    void setup() override;
    void teardown() override;
    CommandResult execute(const std::string& command, bool wait = true) override;

    void set_reader_timings(const ReaderTimings& timings) { timings_ = timings; }

    // pid of the shell, -1 before setup / after teardown
    int pid() const { return process_.native_handle(); }

private:
    ShellConfig shell_;
    Environment environment_;
    Clock& clock_;
    InteractivityGuard guard_;
    std::unique_ptr<CompletionDetector> detector_;
    ReaderTimings timings_;

    platform::ProcessHandle process_;
    std::unique_ptr<PipeStreamSource> streams_;
    uint64_t call_count_ = 0;

    std::chrono::milliseconds timeout() const;
};
