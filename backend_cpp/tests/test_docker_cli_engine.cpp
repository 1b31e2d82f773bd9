#include <gtest/gtest.h>
#include "sandbox/DockerCliEngine.hpp"
#include "errors/AgentErrors.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace data_agent;

namespace {

bool has_pair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) return true;
    }
    return false;
}

// Writes an executable stand-in for the docker binary.
std::string fake_docker(const std::string& body) {
    char dir[] = "/tmp/fake-docker-XXXXXX";
    if (!mkdtemp(dir)) return "";
    std::string path = std::string(dir) + "/docker";
    std::ofstream(path) << "#!/bin/sh\n" << body << "\n";
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

}

TEST(DockerCliEngine, CreateArgsCarryLimitsLabelsAndIdleCommand) {
    DockerCliEngine engine;
    UnitSpec spec;
    spec.image = "python:3.11";
    spec.name = "data-agent-abc-0";
    spec.workdir = "/workspace";
    spec.network = "none";
    spec.memory = "512m";
    spec.cpus = "1.0";
    spec.labels = {{"data-agent.request", "abc"}};

    auto args = engine.create_args(spec);
    EXPECT_EQ(args.front(), "create");
    EXPECT_TRUE(has_pair(args, "--name", "data-agent-abc-0"));
    EXPECT_TRUE(has_pair(args, "--workdir", "/workspace"));
    EXPECT_TRUE(has_pair(args, "--network", "none"));
    EXPECT_TRUE(has_pair(args, "--memory", "512m"));
    EXPECT_TRUE(has_pair(args, "--cpus", "1.0"));
    EXPECT_TRUE(has_pair(args, "--label", "data-agent.request=abc"));
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "python:3.11");
    EXPECT_EQ(args[args.size() - 2], "sleep");
    EXPECT_EQ(args.back(), "infinity");
}

TEST(DockerCliEngine, CreateArgsSkipEmptyOptions) {
    DockerCliEngine engine;
    UnitSpec spec;
    spec.image = "alpine";
    auto args = engine.create_args(spec);
    EXPECT_EQ(args, (std::vector<std::string>{"create", "alpine", "sleep", "infinity"}));
}

TEST(DockerCliEngine, ExecArgsRunInWorkdir) {
    DockerCliEngine engine;
    auto args = engine.exec_args("cafe", {"python", "run.py"}, "/workspace");
    EXPECT_EQ(args, (std::vector<std::string>{"exec", "--workdir", "/workspace", "cafe", "python", "run.py"}));
}

TEST(DockerCliEngine, MissingBinaryIsProvisioningError) {
    DockerCliEngine engine("/nonexistent/docker");
    EXPECT_FALSE(engine.probe());
    EXPECT_THROW(engine.image_exists("python:3.11"), ProvisioningError);
    EXPECT_THROW(engine.create_unit(UnitSpec{}), ProvisioningError);
    EXPECT_THROW(engine.exec_and_capture("x", {"true"}, "", std::chrono::seconds(1)), ExecutionError);
    EXPECT_THROW(engine.destroy("x"), AgentError);
}

TEST(DockerCliEngine, FailingCommandIsProvisioningError) {
    // /bin/false stands in for a docker that always fails
    DockerCliEngine engine("/bin/false");
    EXPECT_FALSE(engine.image_exists("python:3.11"));
    EXPECT_THROW(engine.pull_image("python:3.11"), ProvisioningError);
    EXPECT_THROW(engine.start("x"), ProvisioningError);
    EXPECT_THROW(engine.inject_files("x", std::string(1024, '\0'), "/workspace"), ProvisioningError);
}

TEST(DockerCliEngine, ExitCode125IsEngineFaultOnlyWithDockerError) {
    EXPECT_TRUE(DockerCliEngine::is_engine_fault(125, "Error response from daemon: No such container: cafe\n"));
    EXPECT_TRUE(DockerCliEngine::is_engine_fault(125, "Error: unknown flag --bogus"));
    EXPECT_FALSE(DockerCliEngine::is_engine_fault(125, "partial result\n"));
    EXPECT_FALSE(DockerCliEngine::is_engine_fault(125, ""));
    EXPECT_FALSE(DockerCliEngine::is_engine_fault(1, "Error: something"));
}

TEST(DockerCliEngine, ScriptExiting125IsCapturedNotThrown) {
    std::string bin = fake_docker("echo 'computed 42'; exit 125");
    ASSERT_FALSE(bin.empty());
    DockerCliEngine engine(bin);
    ExecCapture cap = engine.exec_and_capture("cafe", {"python", "run.py"}, "/workspace", std::chrono::seconds(5));
    EXPECT_EQ(cap.exit_code, 125);
    EXPECT_EQ(cap.output, "computed 42\n");
    EXPECT_FALSE(cap.timed_out);
    std::filesystem::remove_all(std::filesystem::path(bin).parent_path());
}

TEST(DockerCliEngine, DaemonErrorOnExecIsExecutionError) {
    std::string bin = fake_docker("echo 'Error response from daemon: No such container: cafe' 1>&2; exit 125");
    ASSERT_FALSE(bin.empty());
    DockerCliEngine engine(bin);
    EXPECT_THROW(engine.exec_and_capture("cafe", {"python", "run.py"}, "/workspace", std::chrono::seconds(5)),
                 ExecutionError);
    std::filesystem::remove_all(std::filesystem::path(bin).parent_path());
}
