#include "process.hpp"
#include "platform.hpp"
#include <array>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace platform {

CommandResult run_command(const std::string& command) {
    // stderr goes to a side file so it stays separate from the parsed stdout
    fs::path err_path = temp_file("jobrunner_stderr");
    std::string full = "(" + command + ") 2>\"" + err_path.string() + "\"";

    FILE* pipe = popen(full.c_str(), "r");
    if (!pipe) {
        return CommandResult{-1, "", "Failed to start command: " + command};
    }

    std::array<char, 4096> buffer;
    std::string out;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        out.append(buffer.data(), n);
    }
    int status = pclose(pipe);

    std::string err;
    {
        std::ifstream ef(err_path);
        if (ef) {
            std::ostringstream ss;
            ss << ef.rdbuf();
            err = ss.str();
        }
    }
    std::error_code ec;
    fs::remove(err_path, ec);

    int exit_code = -1;
    if (status != -1 && WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    }
    return CommandResult{exit_code, out, err};
}

} // namespace platform
