#pragma once

#include <string>

// Process-unique session identifier: 16 lowercase hex characters.
// Safe to embed in single-quoted shell strings.
std::string generate_session_id();
