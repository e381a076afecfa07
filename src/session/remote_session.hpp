#pragma once

#include <memory>
#include <string>
#include "session.hpp"
#include "clock.hpp"
#include "completion_detector.hpp"
#include "interactivity_guard.hpp"
#include "remote_channel.hpp"

// Session over a remote interactive channel.
//
// Differs from LocalSession in how it frames output: commands are split on
// "&&" and each clause is sent on its own, waited for through the remote
// process table, and read by draining whatever the channel holds. The
// channel's echo of the sent line, escape sequences and the activation
// banner are stripped. stderr is not separated. The exit code comes from a
// follow-up `echo $?`.
class RemoteSession : public Session {
public:
    RemoteSession(RemoteHost& host, ShellConfig shell, Environment environment,
                  Clock& clock = system_clock());

    RemoteSession(RemoteHost& host, ShellConfig shell, Environment environment,
                  std::unique_ptr<CompletionDetector> detector,
                  Clock& clock = system_clock());

    ~RemoteSession() override;

    void setup() override;
    void teardown() override;
    CommandResult execute(const std::string& command, bool wait = true) override;

private:
    RemoteHost& host_;
    ShellConfig shell_;
    Environment environment_;
    Clock& clock_;
    InteractivityGuard guard_;
    std::unique_ptr<CompletionDetector> detector_;
    std::unique_ptr<RemoteChannel> channel_;

    void send(const std::string& line);

    // Wait (bounded by deadline) until the channel has something, then drain
    // both facilities in one pass. Escape sequences are removed.
    std::string read_available(Clock::time_point deadline);
    std::string drain();

    // Drop the echoed command line, trailing blanks and the activation banner
    std::string sanitize(const std::string& output) const;

    void wait_for(const std::string& clause, Clock::time_point deadline,
                  const std::string& partial);
    int exit_status(Clock::time_point deadline);

    void check_open(const std::string& partial);
    Clock::time_point deadline() const;
};

// Status code from an `echo $?` response: the first non-empty line after the
// echoed query, parsed as an integer. Anything unparsable yields 1.
int parse_status_response(const std::string& response);
