#include "interactivity_guard.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <iterator>

InteractivityGuard::InteractivityGuard()
    : catalog_(std::begin(DEFAULT_INTERACTIVE_COMMANDS), std::end(DEFAULT_INTERACTIVE_COMMANDS)) {}

InteractivityGuard::InteractivityGuard(std::vector<std::string> catalog)
    : catalog_(std::move(catalog)) {
    for (auto& entry : catalog_) {
        entry = to_lower(trimmed(entry));
    }
}

bool InteractivityGuard::is_interactive(const std::string& command) const {
    for (const auto& part : split_on_any(command, {"&&", ";"})) {
        std::string clause = to_lower(trimmed(part));
        std::string program = first_token(clause);
        if (program.empty()) continue;

        for (const auto& entry : catalog_) {
            if (entry.empty()) continue;
            if (program == first_token(entry) && starts_with(clause, entry)) {
                return true;
            }
        }
    }
    return false;
}
