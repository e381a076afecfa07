#pragma once

#include <string>
#include <vector>

// Best-effort filter for commands that need a live terminal (pagers,
// editors, monitors). Not a sandbox: "not flagged" does not mean safe to
// run unattended.
//
// A clause (split on "&&" and ";") matches a catalog entry when its first
// token equals the entry's first token and the lowercased, trimmed clause
// starts with the full entry. So "tail -f log" matches "tail -f" while
// "tail -n 5 log" does not.
class InteractivityGuard {
public:
    // Uses the built-in catalog
    InteractivityGuard();
    explicit InteractivityGuard(std::vector<std::string> catalog);

    bool is_interactive(const std::string& command) const;

    const std::vector<std::string>& catalog() const { return catalog_; }

private:
    std::vector<std::string> catalog_;
};
