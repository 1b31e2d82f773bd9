#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace data_agent {

// What happens to the rest of the plan when one code unit fails to execute.
enum class UnitFailurePolicy {
    RECORD,   // store block_<i>_error in the interim result and keep going
    ABORT     // propagate the ExecutionError and fail the request
};

struct ProviderSettings {
    std::vector<std::string> api_keys;   // GROQ_API_KEY, comma separated pool
    std::string model = "llama-3.3-70b-versatile";
    std::string base_url = "https://api.groq.com/openai/v1";
    int timeout_seconds = 120;
    int max_retries = 2;
};

struct SandboxSettings {
    std::string docker_bin = "docker";
    std::string image = "python:3.11";
    std::string interpreter = "python";
    std::string workdir = "/workspace";   // path inside every unit
    std::string network = "bridge";
    std::string memory = "512m";
    std::string cpus = "1.0";
    int unit_timeout_seconds = 90;
};

struct AgentConfig {
    ProviderSettings provider;
    SandboxSettings sandbox;

    std::string bind_address = "0.0.0.0";
    int port = 8000;
    int request_timeout_seconds = 170;
    size_t max_parallel_units = 1;
    bool fail_on_nonzero_exit = true;
    UnitFailurePolicy unit_failure_policy = UnitFailurePolicy::RECORD;
    std::string log_level = "info";

    // Reads the process environment. Malformed numbers fall back to the
    // default with a warning.
    static AgentConfig from_env();
};

// Loads KEY=VALUE lines from a dotenv file into the environment without
// overriding variables that are already set. Returns how many were applied;
// a missing file is not an error.
size_t load_dotenv(const std::string& path = ".env");

std::string to_string(UnitFailurePolicy policy);

}
