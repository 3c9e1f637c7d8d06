#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Pipeline run identity: "2026-02-15T14-44-10-637__<name>".
std::string generate_run_id(const std::string& name);

// Expand a leading "~/" to the user's home directory.
std::string expand_home(const std::string& path);

// Quote a string for a POSIX shell command line.
std::string shell_quote(const std::string& s);
