#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace data_agent {

struct UnitSpec {
    std::string image;
    std::vector<std::string> idle_command{"sleep", "infinity"};
    std::string name;          // optional, must be unique on the engine
    std::string workdir;
    std::string network;
    std::string memory;
    std::string cpus;
    std::vector<std::pair<std::string, std::string>> labels;
};

struct ExecCapture {
    std::string output;        // raw merged stdout+stderr bytes
    int exit_code = -1;
    bool timed_out = false;
};

// The isolation substrate a sandbox unit lives in. Every failure is thrown:
// ProvisioningError for image/create/start/inject, ExecutionError when a
// command cannot be started or captured, AgentError for destroy.
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    virtual bool image_exists(const std::string& image) = 0;
    virtual void pull_image(const std::string& image) = 0;

    // Returns the engine's id for the new, not yet started unit.
    virtual std::string create_unit(const UnitSpec& spec) = 0;
    virtual void start(const std::string& unit_id) = 0;

    // Extracts a tar stream into dest_dir inside the unit, as one transfer.
    virtual void inject_files(const std::string& unit_id, const std::string& tar_stream, const std::string& dest_dir) = 0;

    // Runs one foreground command and captures its merged output until it
    // exits or `timeout` elapses (timed_out set, process abandoned to destroy()).
    virtual ExecCapture exec_and_capture(const std::string& unit_id,
                                         const std::vector<std::string>& command,
                                         const std::string& workdir,
                                         std::chrono::milliseconds timeout) = 0;

    // Force-removes the unit, killing anything still running in it.
    virtual void destroy(const std::string& unit_id) = 0;
};

}
