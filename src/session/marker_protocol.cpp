#include "marker_protocol.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

MarkerSet MarkerSet::for_call(const std::string& session_id, uint64_t call_number) {
    MarkerSet m;
    m.command_end = fmt::format("{}_{}_{}__", CMD_END_PREFIX, session_id, call_number);
    m.stderr_end  = fmt::format("{}_{}_{}__", STDERR_END_PREFIX, session_id, call_number);
    m.exit_code   = fmt::format("{}_{}_{}__", EXIT_PREFIX, session_id, call_number);
    return m;
}

std::string session_marker_prefix(const char* prefix, const std::string& session_id) {
    return fmt::format("{}_{}_", prefix, session_id);
}

std::string effective_command(const std::string& cmd) {
    std::string safe = rtrimmed(cmd);
    return safe.empty() ? "true" : safe;
}

std::string build_local_command(const std::string& cmd, const MarkerSet& markers) {
    std::string safe = effective_command(cmd);
    // Exit status must be captured right after the user command, before any
    // other statement overwrites $?.
    const char* sep = (safe.find('\n') == std::string::npos) ? "; " : "\n";
    return fmt::format("{}{}echo '{} '$?; echo '{}'; printf '{}' > /dev/stderr\n",
                       safe, sep, markers.exit_code, markers.command_end, markers.stderr_end);
}

// Strict integer parse of the exit status token; anything else is 1.
static int parse_exit_status(const std::string& text) {
    std::string token = first_token(text);
    if (token.empty()) return 1;
    size_t i = (token[0] == '-') ? 1 : 0;
    if (i == token.size()) return 1;
    for (; i < token.size(); i++) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) return 1;
    }
    return safe_stoi(token, 1);
}

std::string strip_stale_output(const std::string& text, const std::string& prefix) {
    size_t search_end = text.size();
    while (true) {
        auto pos = text.rfind(prefix, search_end);
        if (pos == std::string::npos) return text;

        // A complete marker is prefix + digits + "__"
        size_t i = pos + prefix.size();
        size_t digits_start = i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) i++;
        if (i > digits_start && text.compare(i, 2, "__") == 0) {
            size_t cut = i + 2;
            if (cut < text.size() && text[cut] == '\r') cut++;
            if (cut < text.size() && text[cut] == '\n') cut++;
            return text.substr(cut);
        }
        if (pos == 0) return text;
        search_end = pos - 1;
    }
}

MarkerResult extract_exit_code(const std::string& raw_stdout, const MarkerSet& markers,
                               const std::string& session_id) {
    std::string stdout_data =
        strip_stale_output(raw_stdout, session_marker_prefix(CMD_END_PREFIX, session_id));

    MarkerResult result{stdout_data, 1, false};

    auto pos = stdout_data.find(markers.exit_code);
    if (pos != std::string::npos) {
        size_t line_start = stdout_data.rfind('\n', pos);
        line_start = (line_start == std::string::npos) ? 0 : line_start + 1;
        size_t line_end = stdout_data.find('\n', pos);
        size_t status_start = pos + markers.exit_code.size();

        result.found = true;
        if (line_end == std::string::npos) {
            result.exit_code = parse_exit_status(stdout_data.substr(status_start));
            result.output = stdout_data.substr(0, line_start);
        } else {
            result.exit_code =
                parse_exit_status(stdout_data.substr(status_start, line_end - status_start));
            // The whole exit line goes, including output that shared it
            result.output = stdout_data.substr(0, line_start) + stdout_data.substr(line_end + 1);
        }
    }

    // A previous call that timed out may have left an exit line behind
    auto stray = result.output.find(session_marker_prefix(EXIT_PREFIX, session_id));
    if (stray != std::string::npos) {
        result.output.erase(stray);
    }

    return result;
}
