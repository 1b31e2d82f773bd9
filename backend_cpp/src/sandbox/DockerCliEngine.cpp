#include "sandbox/DockerCliEngine.hpp"
#include "errors/AgentErrors.hpp"
#include "utils/Scrubber.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace data_agent {

namespace {

constexpr std::chrono::seconds kControlTimeout{60};
constexpr std::chrono::minutes kPullTimeout{15};

std::string last_line(const std::string& text) {
    std::string t = trim_copy(text);
    size_t nl = t.find_last_of('\n');
    return nl == std::string::npos ? t : trim_copy(t.substr(nl + 1));
}

std::string short_id(const std::string& id) {
    return id.substr(0, 12);
}

}

DockerCliEngine::DockerCliEngine(std::string docker_bin) : docker_bin_(std::move(docker_bin)) {}

ProcessResult DockerCliEngine::docker(const std::vector<std::string>& args, const ProcessOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_bin_);
    argv.insert(argv.end(), args.begin(), args.end());
    spdlog::debug("🐳 {}", SubProcess::describe(argv));
    return SubProcess::run(argv, options);
}

bool DockerCliEngine::probe() {
    try {
        ProcessOptions opts;
        opts.timeout = std::chrono::seconds(10);
        auto res = docker({"version", "--format", "{{.Server.Version}}"}, opts);
        if (res.success) {
            spdlog::info("🐳 Docker daemon reachable (server {})", trim_copy(res.output));
            return true;
        }
        spdlog::warn("⚠️ Docker daemon not reachable: {}", trim_copy(res.output));
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Docker not detected ({}). Code execution will fail.", e.what());
    }
    return false;
}

bool DockerCliEngine::image_exists(const std::string& image) {
    ProcessOptions opts;
    opts.timeout = kControlTimeout;
    try {
        return docker({"image", "inspect", "--format", "{{.Id}}", image}, opts).success;
    } catch (const std::exception& e) {
        throw ProvisioningError(std::string("Cannot query docker images: ") + e.what());
    }
}

void DockerCliEngine::pull_image(const std::string& image) {
    ProcessOptions opts;
    opts.timeout = kPullTimeout;
    ProcessResult res;
    try {
        res = docker({"pull", image}, opts);
    } catch (const std::exception& e) {
        throw ProvisioningError(std::string("Cannot run docker pull: ") + e.what());
    }
    if (!res.success) {
        throw ProvisioningError("docker pull " + image + " failed: " +
                                (res.timed_out ? std::string("timed out") : last_line(res.output)));
    }
}

std::vector<std::string> DockerCliEngine::create_args(const UnitSpec& spec) const {
    std::vector<std::string> args = {"create"};
    if (!spec.name.empty()) { args.push_back("--name"); args.push_back(spec.name); }
    if (!spec.workdir.empty()) { args.push_back("--workdir"); args.push_back(spec.workdir); }
    if (!spec.network.empty()) { args.push_back("--network"); args.push_back(spec.network); }
    if (!spec.memory.empty()) { args.push_back("--memory"); args.push_back(spec.memory); }
    if (!spec.cpus.empty()) { args.push_back("--cpus"); args.push_back(spec.cpus); }
    for (const auto& kv : spec.labels) {
        args.push_back("--label");
        args.push_back(kv.first + "=" + kv.second);
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.idle_command.begin(), spec.idle_command.end());
    return args;
}

std::string DockerCliEngine::create_unit(const UnitSpec& spec) {
    ProcessOptions opts;
    opts.timeout = kControlTimeout;
    ProcessResult res;
    try {
        res = docker(create_args(spec), opts);
    } catch (const std::exception& e) {
        throw ProvisioningError(std::string("Cannot run docker create: ") + e.what());
    }
    std::string id = last_line(res.output);
    if (!res.success || id.empty()) {
        throw ProvisioningError("docker create failed: " + (res.timed_out ? std::string("timed out") : id));
    }
    return id;
}

void DockerCliEngine::start(const std::string& unit_id) {
    ProcessOptions opts;
    opts.timeout = kControlTimeout;
    ProcessResult res;
    try {
        res = docker({"start", unit_id}, opts);
    } catch (const std::exception& e) {
        throw ProvisioningError(std::string("Cannot run docker start: ") + e.what());
    }
    if (!res.success) throw ProvisioningError("docker start " + short_id(unit_id) + " failed: " + last_line(res.output));
}

void DockerCliEngine::inject_files(const std::string& unit_id, const std::string& tar_stream, const std::string& dest_dir) {
    ProcessOptions opts;
    opts.timeout = kControlTimeout;
    opts.stdin_data = tar_stream;
    ProcessResult res;
    try {
        res = docker({"cp", "-", unit_id + ":" + dest_dir}, opts);
    } catch (const std::exception& e) {
        throw ProvisioningError(std::string("Cannot run docker cp: ") + e.what());
    }
    if (!res.success) {
        throw ProvisioningError("File injection into " + short_id(unit_id) + " failed: " +
                                (res.timed_out ? std::string("timed out") : last_line(res.output)));
    }
}

bool DockerCliEngine::is_engine_fault(int exit_code, const std::string& output) {
    if (exit_code != 125) return false;
    std::string text = trim_copy(output);
    return text.rfind("Error response from daemon", 0) == 0 || text.rfind("Error:", 0) == 0;
}

std::vector<std::string> DockerCliEngine::exec_args(const std::string& unit_id,
                                                    const std::vector<std::string>& command,
                                                    const std::string& workdir) const {
    std::vector<std::string> args = {"exec"};
    if (!workdir.empty()) { args.push_back("--workdir"); args.push_back(workdir); }
    args.push_back(unit_id);
    args.insert(args.end(), command.begin(), command.end());
    return args;
}

ExecCapture DockerCliEngine::exec_and_capture(const std::string& unit_id,
                                              const std::vector<std::string>& command,
                                              const std::string& workdir,
                                              std::chrono::milliseconds timeout) {
    ProcessOptions opts;
    opts.timeout = timeout;
    ProcessResult res;
    try {
        res = docker(exec_args(unit_id, command, workdir), opts);
    } catch (const std::exception& e) {
        throw ExecutionError(std::string("Cannot start docker exec: ") + e.what());
    }
    if (!res.timed_out && is_engine_fault(res.exit_code, res.output)) {
        throw ExecutionError("docker exec in " + short_id(unit_id) + " failed: " + last_line(res.output),
                             res.exit_code, res.output);
    }

    ExecCapture cap;
    cap.output = std::move(res.output);
    cap.exit_code = res.exit_code;
    cap.timed_out = res.timed_out;
    if (res.truncated) spdlog::warn("⚠️ Output of unit {} truncated", short_id(unit_id));
    return cap;
}

void DockerCliEngine::destroy(const std::string& unit_id) {
    ProcessOptions opts;
    opts.timeout = kControlTimeout;
    ProcessResult res;
    try {
        res = docker({"rm", "--force", unit_id}, opts);
    } catch (const std::exception& e) {
        throw AgentError(std::string("Cannot run docker rm: ") + e.what());
    }
    if (!res.success) throw AgentError("docker rm " + short_id(unit_id) + " failed: " + last_line(res.output));
}

}
