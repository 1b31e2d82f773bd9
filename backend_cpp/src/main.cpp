#include <httplib.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <thread>
#include <signal.h>

#include "KeyManager.hpp"
#include "config/AgentConfig.hpp"
#include "llm/GroqProvider.hpp"
#include "sandbox/DockerCliEngine.hpp"
#include "sandbox/UnitRegistry.hpp"
#include "sandbox/SandboxRuntime.hpp"
#include "agent/RequestOrchestrator.hpp"
#include "server/AgentServer.hpp"

std::unique_ptr<data_agent::AgentServer> global_server_ptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

void pre_flight_check(const data_agent::AgentConfig& cfg, data_agent::DockerCliEngine& engine) {
    if (cfg.provider.api_keys.empty()) spdlog::warn("⚠️ GROQ_API_KEY not set! Planning calls will fail.");
    if (!engine.probe()) spdlog::warn("⚠️ Docker daemon unreachable via '{}'. Requests with code will fail.", cfg.sandbox.docker_bin);
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    size_t loaded = data_agent::load_dotenv();
    if (loaded > 0) spdlog::info("📄 Loaded {} variable(s) from .env", loaded);

    data_agent::AgentConfig cfg = data_agent::AgentConfig::from_env();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto engine = std::make_shared<data_agent::DockerCliEngine>(cfg.sandbox.docker_bin);
    pre_flight_check(cfg, *engine);

    auto registry = std::make_shared<data_agent::UnitRegistry>(engine);
    auto runtime = std::make_shared<data_agent::SandboxRuntime>(engine, registry, cfg.sandbox);
    auto key_manager = std::make_shared<data_agent::KeyManager>(cfg.provider.api_keys);
    auto provider = std::make_shared<data_agent::GroqProvider>(cfg.provider, key_manager);
    auto orchestrator = std::make_shared<data_agent::RequestOrchestrator>(
        provider, runtime, data_agent::OrchestratorSettings::from_config(cfg));

    // Warm the base image in the background; a failure here is retried by
    // the first request that needs it.
    std::thread([runtime]() {
        try {
            runtime->ensure_base_image();
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Base image warm-up failed: {}", e.what());
        }
    }).detach();

    spdlog::info("⚙️ image={} network={} timeout={}s unit_timeout={}s parallel={} policy={}",
                 cfg.sandbox.image, cfg.sandbox.network, cfg.request_timeout_seconds,
                 cfg.sandbox.unit_timeout_seconds, cfg.max_parallel_units,
                 data_agent::to_string(cfg.unit_failure_policy));

    global_server_ptr = std::make_unique<data_agent::AgentServer>(orchestrator, cfg.bind_address, cfg.port);
    int rc = 0;
    try {
        global_server_ptr->run(); // This blocks
    } catch (const std::exception& e) {
        spdlog::critical("💥 {}", e.what());
        rc = 1;
    }

    size_t reaped = registry->reap_all();
    if (reaped > 0) spdlog::info("🧹 Reaped {} leftover unit(s) on shutdown", reaped);
    global_server_ptr.reset();
    return rc;
}
