#include "config/AgentConfig.hpp"
#include "utils/Scrubber.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data_agent {

namespace {

std::string env_or(const char* key, const std::string& fallback) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    return v;
}

int env_int(const char* key, int fallback, int min_value) {
    const char* v = std::getenv(key);
    if (!v || !*v) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != std::string(v).size() || parsed < min_value) throw std::invalid_argument(v);
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("⚠️ Ignoring {}='{}' (expected integer >= {}), using {}", key, v, min_value, fallback);
        return fallback;
    }
}

bool env_bool(const char* key, bool fallback) {
    std::string v = env_or(key, "");
    if (v.empty()) return fallback;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    spdlog::warn("⚠️ Ignoring {}='{}' (expected boolean)", key, v);
    return fallback;
}

std::vector<std::string> split_keys(const std::string& raw) {
    std::vector<std::string> keys;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) comma = raw.size();
        std::string k = trim_copy(raw.substr(start, comma - start));
        if (!k.empty()) keys.push_back(k);
        start = comma + 1;
    }
    return keys;
}

}

std::string to_string(UnitFailurePolicy policy) {
    return policy == UnitFailurePolicy::ABORT ? "abort" : "record";
}

size_t load_dotenv(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return 0;

    size_t applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim_copy(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim_copy(line.substr(0, eq));
        std::string value = trim_copy(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (std::getenv(key.c_str()) != nullptr) continue;
        if (setenv(key.c_str(), value.c_str(), 1) == 0) ++applied;
    }
    spdlog::debug("Loaded {} variables from {}", applied, path);
    return applied;
}

AgentConfig AgentConfig::from_env() {
    AgentConfig cfg;

    cfg.provider.api_keys = split_keys(env_or("GROQ_API_KEY", ""));
    cfg.provider.model = env_or("GROQ_MODEL_DEFAULT", cfg.provider.model);
    cfg.provider.base_url = env_or("GROQ_BASE_URL", cfg.provider.base_url);
    cfg.provider.timeout_seconds = env_int("GROQ_TIMEOUT_SEC", cfg.provider.timeout_seconds, 1);
    cfg.provider.max_retries = env_int("GROQ_MAX_RETRIES", cfg.provider.max_retries, 0);

    cfg.sandbox.docker_bin = env_or("DOCKER_BIN", cfg.sandbox.docker_bin);
    cfg.sandbox.image = env_or("SANDBOX_IMAGE", cfg.sandbox.image);
    cfg.sandbox.interpreter = env_or("SANDBOX_INTERPRETER", cfg.sandbox.interpreter);
    cfg.sandbox.network = env_or("SANDBOX_NETWORK", cfg.sandbox.network);
    cfg.sandbox.memory = env_or("SANDBOX_MEMORY", cfg.sandbox.memory);
    cfg.sandbox.cpus = env_or("SANDBOX_CPUS", cfg.sandbox.cpus);
    cfg.sandbox.unit_timeout_seconds = env_int("SANDBOX_UNIT_TIMEOUT_SEC", cfg.sandbox.unit_timeout_seconds, 1);

    cfg.bind_address = env_or("HOST", cfg.bind_address);
    cfg.port = env_int("PORT", cfg.port, 1);
    cfg.request_timeout_seconds = env_int("AGENT_TIMEOUT_SEC", cfg.request_timeout_seconds, 1);
    cfg.max_parallel_units = static_cast<size_t>(env_int("AGENT_MAX_PARALLEL_UNITS", 1, 1));
    cfg.fail_on_nonzero_exit = env_bool("AGENT_FAIL_ON_NONZERO_EXIT", cfg.fail_on_nonzero_exit);

    std::string policy = env_or("AGENT_UNIT_FAILURE_POLICY", to_string(cfg.unit_failure_policy));
    std::transform(policy.begin(), policy.end(), policy.begin(), [](unsigned char c) { return std::tolower(c); });
    if (policy == "abort") cfg.unit_failure_policy = UnitFailurePolicy::ABORT;
    else if (policy == "record") cfg.unit_failure_policy = UnitFailurePolicy::RECORD;
    else spdlog::warn("⚠️ Unknown AGENT_UNIT_FAILURE_POLICY '{}', using {}", policy, to_string(cfg.unit_failure_policy));

    cfg.log_level = env_or("AGENT_LOG_LEVEL", cfg.log_level);

    if (cfg.provider.api_keys.empty()) {
        spdlog::warn("⚠️ GROQ_API_KEY is not set. Set it in the environment before sending requests.");
    }
    return cfg;
}

}
