#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "sandbox/ContainerEngine.hpp"
#include "utils/SubProcess.hpp"

namespace data_agent {

// ContainerEngine backed by the docker CLI. Each operation is one docker
// invocation through SubProcess; nothing is passed through a shell.
class DockerCliEngine : public ContainerEngine {
public:
    explicit DockerCliEngine(std::string docker_bin = "docker");

    // `docker version` round trip; false (with a warning) if the daemon is unreachable.
    bool probe();

    bool image_exists(const std::string& image) override;
    void pull_image(const std::string& image) override;
    std::string create_unit(const UnitSpec& spec) override;
    void start(const std::string& unit_id) override;
    void inject_files(const std::string& unit_id, const std::string& tar_stream, const std::string& dest_dir) override;
    ExecCapture exec_and_capture(const std::string& unit_id,
                                 const std::vector<std::string>& command,
                                 const std::string& workdir,
                                 std::chrono::milliseconds timeout) override;
    void destroy(const std::string& unit_id) override;

    // docker exec exits 125 for its own failures (unit gone, daemon error)
    // and prefixes them with "Error". A script may exit 125 by itself.
    static bool is_engine_fault(int exit_code, const std::string& output);

    // Argument vectors, exposed for tests.
    std::vector<std::string> create_args(const UnitSpec& spec) const;
    std::vector<std::string> exec_args(const std::string& unit_id,
                                       const std::vector<std::string>& command,
                                       const std::string& workdir) const;

private:
    ProcessResult docker(const std::vector<std::string>& args, const ProcessOptions& options) const;

    std::string docker_bin_;
};

}
