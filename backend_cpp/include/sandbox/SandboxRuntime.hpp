#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config/AgentConfig.hpp"
#include "planning/ExecutionPlan.hpp"
#include "sandbox/ContainerEngine.hpp"
#include "sandbox/UnitRegistry.hpp"
#include "workspace/Workspace.hpp"

namespace data_agent {

struct RawOutput {
    std::string text;                        // decoded permissively
    int exit_code = 0;                       // not interpreted here
    std::chrono::milliseconds elapsed{0};
};

// Scoped owner of one sandbox unit. Destroys the unit when it goes out of
// scope unless the reaper got there first; destroy failures are logged only.
class SandboxHandle {
public:
    enum class State { PENDING, CREATED, RUNNING, EXITED, DESTROYED };

    SandboxHandle(std::shared_ptr<ContainerEngine> engine, std::shared_ptr<UnitRegistry> registry, UnitKey key);
    ~SandboxHandle();
    SandboxHandle(const SandboxHandle&) = delete;
    SandboxHandle& operator=(const SandboxHandle&) = delete;

    // Creates the unit and registers it. Throws ProvisioningError, or
    // TimeoutError if the request was reaped in the meantime.
    void create(const UnitSpec& spec);
    void start();
    void inject(const std::string& tar_stream, const std::string& dest_dir);
    ExecCapture exec(const std::vector<std::string>& command, const std::string& workdir, std::chrono::milliseconds timeout);
    void destroy() noexcept;

    State state() const { return state_; }
    const std::string& id() const { return id_; }

private:
    std::shared_ptr<ContainerEngine> engine_;
    std::shared_ptr<UnitRegistry> registry_;
    UnitKey key_;
    std::string id_;
    State state_ = State::PENDING;
    bool tracked_ = false;
};

class SandboxRuntime {
public:
    SandboxRuntime(std::shared_ptr<ContainerEngine> engine, std::shared_ptr<UnitRegistry> registry, SandboxSettings settings);

    // Makes sure the base image is present locally, pulling it once if not.
    // Concurrent first callers wait for a single pull. Throws ProvisioningError.
    void ensure_base_image();
    bool base_image_ready() const { return image_ready_.load(); }

    // Runs one code unit in a fresh unit holding `files` plus the unit's script.
    // Throws ProvisioningError (create/start/inject) or ExecutionError
    // (cannot start, cannot capture, or `timeout` elapsed). The unit is
    // destroyed before this returns on every path.
    RawOutput run(const CodeUnit& unit,
                  const std::vector<WorkspaceFile>& files,
                  std::chrono::milliseconds timeout,
                  const UnitKey& key);

    const SandboxSettings& settings() const { return settings_; }
    std::shared_ptr<UnitRegistry> registry() const { return registry_; }

    // Basename the unit's script is stored under inside the unit.
    static std::string script_name(const CodeUnit& unit);

private:
    UnitSpec unit_spec(const UnitKey& key) const;

    std::shared_ptr<ContainerEngine> engine_;
    std::shared_ptr<UnitRegistry> registry_;
    SandboxSettings settings_;
    std::mutex image_mutex_;
    std::atomic<bool> image_ready_{false};
};

}
