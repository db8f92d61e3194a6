#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace lanprobe {

struct ProcessResult {
    int exit_code = -1;   // valid when !signaled
    bool signaled = false;
    int signal = 0;
    std::string out;
    std::string err;
    bool truncated = false; // output hit the capture cap
};

// PATH lookup (or access check for names containing '/').
std::optional<std::string> find_executable(const std::string& name);

// fork/execv without a shell. Throws ScanFailure when the program is missing,
// cannot be started or outlives the timeout (the child is killed).
ProcessResult run_process(const std::vector<std::string>& argv, std::chrono::milliseconds timeout,
                          size_t max_output = 8 * 1024 * 1024);

}
