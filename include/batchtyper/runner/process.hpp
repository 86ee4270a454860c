#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace batchtyper::runner {

namespace fs = std::filesystem;

struct ProcessResult {
    bool launched = false;
    int exit_code = -1;   // valid when the child exited normally
    int term_signal = 0;  // non-zero when the child was killed by a signal
    std::string stdout_output;
    std::string stderr_output;
    std::string error;    // launch failure description
};

// Runs argv[0] (PATH lookup when it has no '/') with the given working
// directory and waits for it. stdin is /dev/null; stdout and stderr are
// captured. A non-zero exit is reported, never thrown.
ProcessResult run_process(const std::vector<std::string>& argv, const fs::path& cwd);

// True if exe names an executable file, either relative to cwd or on PATH.
bool executable_available(const std::string& exe, const fs::path& cwd);

} // namespace batchtyper::runner
