#pragma once

#include <cstdint>
#include <string>

// Sentinel protocol that frames one command's output inside the shell's
// undifferentiated byte stream.
//
// Every marker is "<PREFIX>_<session id>_<call number>__". The call number
// is a per-session counter, so markers never repeat within a session and the
// session id keeps them apart across sessions.

struct MarkerSet {
    std::string command_end;   // echoed to stdout after the command
    std::string stderr_end;    // printf'd to stderr last
    std::string exit_code;     // echoed to stdout with $? (local sessions only)

    static MarkerSet for_call(const std::string& session_id, uint64_t call_number);
};

// "<PREFIX>_<session id>_": common to every marker of that kind in a session.
std::string session_marker_prefix(const char* prefix, const std::string& session_id);

// Command actually sent to the shell, newline terminated:
//   <cmd>; echo '<exit> '$?; echo '<cmd_end>'; printf '<stderr_end>' > /dev/stderr
// An empty command becomes `true` (a bare leading ';' is a syntax error).
// Multi-line commands (heredocs) get the marker statements on a new line.
std::string build_local_command(const std::string& cmd, const MarkerSet& markers);

// The user command as it will run, i.e. what completion polling looks for.
std::string effective_command(const std::string& cmd);

struct MarkerResult {
    std::string output;
    int exit_code;
    bool found;
};

// Post-process the stdout a reader collected up to `markers.command_end`:
// drop stale output from earlier calls of the same session, take the exit
// code from the exit-marker line (1 if missing or unparsable), remove that
// whole line from the output, and truncate at any stray exit-marker prefix.
MarkerResult extract_exit_code(const std::string& raw_stdout, const MarkerSet& markers,
                               const std::string& session_id);

// Drop everything up to and including the last complete marker that starts
// with `prefix` (plus one trailing newline). Used to discard late output of a
// previous call that reached the stream after its own reader gave up.
std::string strip_stale_output(const std::string& text, const std::string& prefix);
