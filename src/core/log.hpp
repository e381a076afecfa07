#pragma once

#include <string>

// Debug file logger. Lines look like "[14:03:22.517] message".
// Default path is <tmp>/hostshell_debug.log.

void set_log_path(const std::string& path);
void set_log_enabled(bool enabled);

void hostshell_log(const std::string& msg);
