#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "clock.hpp"

// Decides whether a command submitted to a shell has finished, without a
// native wait primitive on the shell's pipes.
//
// The implementations below are heuristics that match command text against a
// process table. They can both under- and over-detect completion for unusual
// process names. Keep callers on this interface so a more precise mechanism
// can replace them.
class CompletionDetector {
public:
    virtual ~CompletionDetector() = default;

    // Any delay the check itself takes ends no later than `deadline`.
    virtual bool has_exited(const std::string& command, Clock::time_point deadline) = 0;
};

// Fast-command short-circuit shared by both detectors: returns true when the
// first token of every non-empty clause is in `fast_commands`.
bool all_fast_commands(const std::vector<std::string>& clauses,
                       const std::vector<std::string>& fast_commands);

// Local process table: a command has exited once none of its "&&" clauses
// appears verbatim (or followed by a space and more arguments) among the
// running command lines.
class ProcessTableDetector : public CompletionDetector {
public:
    using ProcessLister = std::function<std::vector<std::string>()>;

    ProcessTableDetector(ProcessLister lister,
                         std::vector<std::string> fast_commands,
                         Clock& clock,
                         std::chrono::milliseconds fast_delay);

    bool has_exited(const std::string& command, Clock::time_point deadline) override;

private:
    ProcessLister lister_;
    std::vector<std::string> fast_commands_;
    Clock& clock_;
    std::chrono::milliseconds fast_delay_;
};

// Remote process table, fetched through a side-channel command. A clause has
// exited once no process line ends with it.
class RemoteProcessDetector : public CompletionDetector {
public:
    // Runs the listing command on the remote host and returns its output
    using RemoteLister = std::function<std::string()>;

    RemoteProcessDetector(RemoteLister lister,
                          std::vector<std::string> fast_commands,
                          Clock& clock,
                          std::chrono::milliseconds fast_delay);

    bool has_exited(const std::string& clause, Clock::time_point deadline) override;

private:
    RemoteLister lister_;
    std::vector<std::string> fast_commands_;
    Clock& clock_;
    std::chrono::milliseconds fast_delay_;
};
