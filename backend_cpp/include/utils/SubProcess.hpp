#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace data_agent {

struct ProcessOptions {
    std::string stdin_data;                       // written to the child, then stdin is closed
    std::chrono::milliseconds timeout{0};         // 0 = wait forever
    size_t max_output_bytes = 16 * 1024 * 1024;   // merged stdout+stderr cap
};

struct ProcessResult {
    std::string output;     // stdout+stderr merged, raw bytes
    int exit_code = -1;     // 128+N when killed by signal N
    bool success = false;
    bool timed_out = false;
    bool truncated = false;
};

class SubProcess {
public:
    // Runs argv[0] (PATH lookup) with stderr redirected into stdout. The child
    // gets its own process group; on timeout the whole group is SIGKILLed.
    // Throws std::runtime_error if the process cannot be spawned or exec fails.
    static ProcessResult run(const std::vector<std::string>& argv, const ProcessOptions& options = {});

    // Human readable rendering for logs only; never fed back to a shell.
    static std::string describe(const std::vector<std::string>& argv);
};

}
