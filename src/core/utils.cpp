#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string trimmed(const std::string& s) {
    std::string out = s;
    trim(out);
    return out;
}

std::string rtrimmed(const std::string& s) {
    auto last = s.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) return "";
    return s.substr(0, last + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_on(const std::string& s, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(s);
        return parts;
    }
    size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    return parts;
}

std::vector<std::string> split_on_any(const std::string& s,
                                      const std::vector<std::string>& seps) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t i = 0;
    while (i < s.size()) {
        bool matched = false;
        for (const auto& sep : seps) {
            if (!sep.empty() && s.compare(i, sep.size(), sep) == 0) {
                parts.push_back(s.substr(start, i - start));
                i += sep.size();
                start = i;
                matched = true;
                break;
            }
        }
        if (!matched) i++;
    }
    parts.push_back(s.substr(start));
    return parts;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < s.size()) {
        auto nl = s.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(start));
            break;
        }
        lines.push_back(s.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string first_token(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_first_of(" \t\r\n", start);
    return s.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

// ESC followed by either a single byte in @-Z or \-_ (two-byte escape),
// or '[' params(0x30-0x3F)* intermediates(0x20-0x2F)* final(0x40-0x7E).
std::string strip_escape_sequences(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] != '\x1b' || i + 1 >= s.size()) {
            out += s[i++];
            continue;
        }
        unsigned char next = static_cast<unsigned char>(s[i + 1]);
        if (next == '[') {
            size_t j = i + 2;
            while (j < s.size() && s[j] >= 0x30 && s[j] <= 0x3F) j++;
            while (j < s.size() && s[j] >= 0x20 && s[j] <= 0x2F) j++;
            if (j < s.size() && s[j] >= 0x40 && s[j] <= 0x7E) {
                i = j + 1;
                continue;
            }
            // Incomplete CSI: keep the bytes as-is
            out += s[i++];
        } else if ((next >= '@' && next <= 'Z') || (next >= '\\' && next <= '_')) {
            i += 2;
        } else {
            out += s[i++];
        }
    }
    return out;
}
