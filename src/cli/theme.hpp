#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

// Terminal styling for jobrunner output. Every helper returns a finished
// string; nothing here writes to stdout.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";   // commands, submitted jobs
    const std::string BROWN     = "\033[38;2;128;99;58m";    // section titles, arguments
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string blue(const std::string& s)   { return color::BLUE + s + color::RESET; }
inline std::string brown(const std::string& s)  { return color::BROWN + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)    { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    std::string rule;
    for (int i = 0; i < 44; i++) rule += "\xe2\x94\x80";
    return "\n" + color::BLUE + color::BOLD + "  jobrunner" + color::RESET + "\n"
        + dim(fmt::format("  v{}\n  Dependency pipelines for batch schedulers", JOBRUNNER_VERSION))
        + "\n\n" + dim("  " + rule) + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// `jobrunner <command> <args>   description`, args padded so descriptions line up.
inline std::string usage_line(const std::string& command, const std::string& args,
                              const std::string& description) {
    return blue("    jobrunner " + command + " ") + brown(fmt::format("{:<16}", args))
        + dim(description) + "\n";
}

// One entry of the grouped command list.
inline std::string command_row(const std::string& name, const std::string& description) {
    return blue(fmt::format("    {:<14}", name)) + dim(description) + "\n";
}

// Column titles above a listing (pipelines, hosts).
inline std::string table_header(const std::string& columns) {
    return dim("  " + columns) + "\n";
}

inline std::string version_line() {
    return color::BROWN + color::BOLD + "jobrunner" + color::RESET
        + dim(fmt::format(" version {}", JOBRUNNER_VERSION)) + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<10}", key)) + value + "\n";
}

} // namespace theme
