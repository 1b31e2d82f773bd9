#include <gtest/gtest.h>
#include "agent/RequestOrchestrator.hpp"
#include "errors/AgentErrors.hpp"
#include "LogManager.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <thread>

using namespace data_agent;
using fakes::FakeContainerEngine;
using fakes::ScriptedProvider;

namespace {

std::string plan_with(const nlohmann::json& blocks, const std::string& format = "object") {
    return nlohmann::json{
        {"steps", {"compute"}},
        {"python_blocks", blocks},
        {"final_format", format},
        {"postprocess_instructions", "none"}
    }.dump();
}

struct OrchestratorFixture : public ::testing::Test {
    std::shared_ptr<FakeContainerEngine> engine = std::make_shared<FakeContainerEngine>();
    std::shared_ptr<UnitRegistry> registry = std::make_shared<UnitRegistry>(engine);
    std::shared_ptr<SandboxRuntime> runtime = std::make_shared<SandboxRuntime>(engine, registry, SandboxSettings{});
    std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();
    OrchestratorSettings settings;

    OrchestratorFixture() {
        engine->image_present = true;
        settings.request_timeout = std::chrono::seconds(10);
        settings.unit_timeout = std::chrono::seconds(5);
    }

    RequestOrchestrator orchestrator() { return RequestOrchestrator(provider, runtime, settings); }

    static RequestInput question(const std::string& q, std::vector<Attachment> files = {}) {
        RequestInput in;
        in.question = q;
        in.attachments = std::move(files);
        return in;
    }

    nlohmann::json assembly_document() const {
        auto calls = provider->calls();
        EXPECT_EQ(calls.size(), 2u);
        return nlohmann::json::parse(calls.back().messages.back().content);
    }

    // Exit 1 with "partial" for bad.py, echo the code otherwise.
    void fail_bad_script() {
        engine->exec_handler = [](const fakes::FakeUnit& unit, const std::vector<std::string>& cmd) {
            ExecCapture cap;
            if (cmd.back() == "bad.py") {
                cap.exit_code = 1;
                cap.output = "partial";
            } else {
                cap.exit_code = 0;
                cap.output = unit.files.at(cmd.back());
            }
            return cap;
        };
    }
};

}

TEST_F(OrchestratorFixture, EndToEndStructuredAnswer) {
    provider->push(plan_with({{{"filename", "run1.py"}, {"code", R"({"sum": 42})"}}}));
    provider->push(R"({"sum": 42})");

    auto answer = orchestrator().handle(question("Sum the column", {{"data.csv", "v\n40\n2\n"}}));

    ASSERT_TRUE(answer.is_json());
    EXPECT_EQ(answer.value, nlohmann::json({{"sum", 42}}));
    EXPECT_EQ(engine->live_units(), 0u);

    auto doc = assembly_document();
    EXPECT_EQ(doc["question"], "Sum the column");
    EXPECT_EQ(doc["interim"]["sum"], 42);
    EXPECT_EQ(doc["expected_format"], "object");

    auto units = engine->units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_TRUE(units[0].files.count("data.csv"));
    EXPECT_TRUE(units[0].files.count("questions.txt"));
}

TEST_F(OrchestratorFixture, SamplingSettingsPerPhase) {
    provider->push(plan_with(nlohmann::json::array()));
    provider->push("[]");
    settings.model = "m";
    orchestrator().handle(question("q"));

    auto calls = provider->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_DOUBLE_EQ(calls[0].options.temperature, 0.1);
    EXPECT_EQ(calls[0].options.max_tokens, 1200);
    EXPECT_DOUBLE_EQ(calls[1].options.temperature, 0.0);
    EXPECT_EQ(calls[1].options.max_tokens, 1000);
    EXPECT_EQ(calls[0].options.model, "m");
    EXPECT_GT(calls[0].options.timeout.count(), 0);
    EXPECT_LE(calls[0].options.timeout, settings.request_timeout);
}

TEST_F(OrchestratorFixture, NonJsonAssemblyIsReturnedAsText) {
    provider->push(plan_with(nlohmann::json::array()));
    provider->push("plain answer");
    auto answer = orchestrator().handle(question("q"));
    EXPECT_FALSE(answer.is_json());
    EXPECT_EQ(answer.body(), "plain answer");
}

TEST_F(OrchestratorFixture, MissingQuestionFailsBeforeAnyWork) {
    RequestInput in;
    in.attachments = {{"data.csv", "x"}};
    EXPECT_THROW(orchestrator().handle(in), ValidationError);
    EXPECT_TRUE(provider->calls().empty());
    EXPECT_EQ(engine->creates.load(), 0);
}

TEST_F(OrchestratorFixture, DegradedPlanRunsRawTextAsOneUnit) {
    provider->push("print('hello')");
    provider->push(R"(["hello"])");

    auto answer = orchestrator().handle(question("q"));
    EXPECT_EQ(answer.value, nlohmann::json::array({"hello"}));

    auto units = engine->units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].files.at("run.py"), "print('hello')");

    auto doc = assembly_document();
    EXPECT_EQ(doc["interim"]["block_0_raw"], "print('hello')");
    EXPECT_EQ(doc["expected_format"], "array");
}

TEST_F(OrchestratorFixture, LaterBlocksOverwriteEarlierKeys) {
    provider->push(plan_with({{{"filename", "a.py"}, {"code", R"({"x": 1})"}},
                              {{"filename", "b.py"}, {"code", "hello"}},
                              {{"filename", "c.py"}, {"code", R"({"x": 2})"}}}));
    provider->push("{}");
    orchestrator().handle(question("q"));

    auto doc = assembly_document();
    EXPECT_EQ(doc["interim"]["x"], 2);
    EXPECT_EQ(doc["interim"]["block_1_raw"], "hello");
    EXPECT_EQ(engine->creates.load(), 3);
    EXPECT_EQ(engine->live_units(), 0u);
}

TEST_F(OrchestratorFixture, RecordPolicyKeepsGoingAfterFailure) {
    fail_bad_script();
    provider->push(plan_with({{{"filename", "bad.py"}, {"code", "raise"}},
                              {{"filename", "good.py"}, {"code", R"({"ok": true})"}}}));
    provider->push(R"({"done": true})");

    auto answer = orchestrator().handle(question("q"));
    EXPECT_TRUE(answer.is_json());

    auto doc = assembly_document();
    EXPECT_EQ(doc["interim"]["ok"], true);
    EXPECT_EQ(doc["interim"]["block_0_error"]["exit_code"], 1);
    EXPECT_EQ(doc["interim"]["block_0_error"]["output"], "partial");
}

TEST_F(OrchestratorFixture, AbortPolicyFailsTheRequest) {
    fail_bad_script();
    settings.unit_failure_policy = UnitFailurePolicy::ABORT;
    provider->push(plan_with({{{"filename", "bad.py"}, {"code", "raise"}},
                              {{"filename", "good.py"}, {"code", "{}"}}}));
    provider->push("{}");

    EXPECT_THROW(orchestrator().handle(question("q")), ExecutionError);
    EXPECT_EQ(provider->calls().size(), 1u);
    EXPECT_EQ(engine->creates.load(), 1);
    EXPECT_EQ(engine->live_units(), 0u);
}

TEST_F(OrchestratorFixture, NonZeroExitCanBeTolerated) {
    fail_bad_script();
    settings.fail_on_nonzero_exit = false;
    provider->push(plan_with({{{"filename", "bad.py"}, {"code", "raise"}}}));
    provider->push("{}");
    orchestrator().handle(question("q"));
    EXPECT_EQ(assembly_document()["interim"]["block_0_raw"], "partial");
}

TEST_F(OrchestratorFixture, ProvisioningFailureIsFatalEvenWhenRecording) {
    engine->image_present = false;
    engine->fail_pull = true;
    provider->push(plan_with({{{"filename", "a.py"}, {"code", "{}"}}}));
    provider->push("{}");
    EXPECT_THROW(orchestrator().handle(question("q")), ProvisioningError);
    EXPECT_EQ(engine->creates.load(), 0);
}

TEST_F(OrchestratorFixture, PlanWithoutBlocksNeverTouchesSandbox) {
    engine->image_present = false;
    provider->push(plan_with(nlohmann::json::array()));
    provider->push("[1]");
    orchestrator().handle(question("q"));
    EXPECT_EQ(engine->pulls.load(), 0);
    EXPECT_EQ(assembly_document()["interim"], nlohmann::json::object());
}

TEST_F(OrchestratorFixture, ProviderFailurePropagates) {
    EXPECT_THROW(orchestrator().handle(question("q")), ProviderError);
}

TEST_F(OrchestratorFixture, ParallelBlocksMergeInPlanOrder) {
    settings.max_parallel_units = 3;
    engine->exec_handler = [](const fakes::FakeUnit& unit, const std::vector<std::string>& cmd) {
        // first block finishes last
        int delay = cmd.back() == "b0.py" ? 150 : cmd.back() == "b1.py" ? 75 : 0;
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        ExecCapture cap;
        cap.exit_code = 0;
        cap.output = unit.files.at(cmd.back());
        return cap;
    };
    provider->push(plan_with({{{"filename", "b0.py"}, {"code", R"({"k": 0, "a": 1})"}},
                              {{"filename", "b1.py"}, {"code", R"({"k": 1})"}},
                              {{"filename", "b2.py"}, {"code", R"({"k": 2})"}}}));
    provider->push("{}");
    orchestrator().handle(question("q"));

    auto doc = assembly_document();
    EXPECT_EQ(doc["interim"]["k"], 2);
    EXPECT_EQ(doc["interim"]["a"], 1);
    EXPECT_EQ(engine->live_units(), 0u);
}

TEST_F(OrchestratorFixture, DeadlineReapsEveryUnitOfTheRequest) {
    engine->hang_exec = true;
    settings.request_timeout = std::chrono::milliseconds(300);
    provider->push(plan_with({{{"filename", "slow.py"}, {"code", "while True: pass"}}}));
    provider->push("{}");

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(orchestrator().handle(question("q")), TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));

    EXPECT_EQ(engine->live_units(), 0u);
    EXPECT_EQ(registry->live_count(), 0u);
    // the assembly phase is never reached
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(provider->calls().size(), 1u);
    EXPECT_EQ(engine->destroy_calls.load(), 1);
}

TEST_F(OrchestratorFixture, DeadlineDuringPlanningIsTimeout) {
    provider->delay = std::chrono::milliseconds(400);
    settings.request_timeout = std::chrono::milliseconds(100);
    provider->push(plan_with({{{"filename", "a.py"}, {"code", "{}"}}}));
    EXPECT_THROW(orchestrator().handle(question("q")), TimeoutError);

    // the worker notices the deadline once planning returns and starts nothing
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(engine->creates.load(), 0);
}

TEST_F(OrchestratorFixture, StateTransitionsAreTraced) {
    LogManager::instance().clear();
    provider->push(plan_with(nlohmann::json::array()));
    provider->push("{}");
    RequestInput in = question("q");
    in.request_id = "trace-me";
    orchestrator().handle(in);

    std::vector<std::string> states;
    for (const auto& t : LogManager::instance().get_traces_json()) {
        if (t["request_id"] == "trace-me") states.push_back(t["state"].get<std::string>());
    }
    EXPECT_EQ(states, (std::vector<std::string>{"RECEIVED", "PLANNING", "EXECUTING", "ASSEMBLING",
                                                 "RESPONDING", "RESPONDED"}));
}

TEST_F(OrchestratorFixture, NothingIsTracedAfterTimeoutFailure) {
    LogManager::instance().clear();
    provider->delay = std::chrono::milliseconds(300);
    settings.request_timeout = std::chrono::milliseconds(100);
    provider->push(plan_with({{{"filename", "a.py"}, {"code", "{}"}}}));
    provider->push("{}");
    RequestInput in = question("q");
    in.request_id = "late-worker";
    EXPECT_THROW(orchestrator().handle(in), TimeoutError);

    // let the worker come back from planning and unwind
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    std::vector<std::string> states;
    for (const auto& t : LogManager::instance().get_traces_json()) {
        if (t["request_id"] == "late-worker") states.push_back(t["state"].get<std::string>());
    }
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), "FAILED");
    EXPECT_EQ(std::count(states.begin(), states.end(), "FAILED"), 1);
    EXPECT_EQ(std::count(states.begin(), states.end(), "EXECUTING"), 0);
}

TEST(AgentAnswer, AnyJsonValueIsStructured) {
    EXPECT_TRUE(AgentAnswer::from_assembler("[1, \"two\"]").is_json());
    EXPECT_TRUE(AgentAnswer::from_assembler(" 42 ").is_json());
    EXPECT_FALSE(AgentAnswer::from_assembler("The answer is 42").is_json());
    EXPECT_EQ(AgentAnswer::from_assembler("{\"a\":1}").body(), "{\"a\":1}");
}

TEST(RequestOrchestrator, RequestIdsAreHexAndDistinct) {
    auto a = RequestOrchestrator::make_request_id();
    auto b = RequestOrchestrator::make_request_id();
    EXPECT_EQ(a.size(), 12u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(a, b);
}
