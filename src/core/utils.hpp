#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
std::string trimmed(const std::string& s);

// Strip trailing whitespace only.
std::string rtrimmed(const std::string& s);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on a multi-character separator. Pieces are returned untrimmed.
std::vector<std::string> split_on(const std::string& s, const std::string& sep);

// Split on any of the given separators, e.g. {"&&", ";"}.
std::vector<std::string> split_on_any(const std::string& s,
                                      const std::vector<std::string>& seps);

// Split into lines on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& s);

// First whitespace-delimited token, or "" if there is none.
std::string first_token(const std::string& s);

// Remove ANSI / VT100 escape sequences (CSI sequences and two-byte escapes).
std::string strip_escape_sequences(const std::string& s);
