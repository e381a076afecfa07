#pragma once

#include <functional>
#include <map>
#include <string>
#include <core/config.hpp>

class Session;

// Front end over a LocalSession or RemoteSession: a readline REPL plus a
// one-shot exec mode. Every method returns a process exit code.
class HostshellCLI {
public:
    explicit HostshellCLI(Config config);

    int run_local_repl();
    int run_remote_repl();

    // Run one command in a fresh local session. stdout/stderr are forwarded
    // and the command's exit code is returned.
    int run_exec(const std::string& command);

private:
    using Builtin = std::function<void(const std::string& arg)>;

    Config config_;
    std::map<std::string, std::pair<Builtin, std::string>> builtins_;
    bool running_ = false;

    void register_builtins();
    void print_help() const;
    std::string get_prompt_string(const std::string& where) const;

    // Returns false once the session is no longer usable
    bool run_line(Session& session, const std::string& line);
    void repl(Session& session, const std::string& where);
};
