#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "aggregation/ResultAggregator.hpp"
#include "config/AgentConfig.hpp"
#include "llm/ReasoningProvider.hpp"
#include "planning/ExecutionPlan.hpp"
#include "sandbox/SandboxRuntime.hpp"
#include "workspace/Workspace.hpp"

namespace data_agent {

enum class RequestState { RECEIVED, PLANNING, EXECUTING, ASSEMBLING, RESPONDING, RESPONDED, FAILED };

std::string to_string(RequestState state);

struct RequestInput {
    std::string request_id;                // generated when empty
    std::optional<std::string> question;   // content of the *questions.txt upload
    std::vector<Attachment> attachments;
};

// Final answer: structured JSON when the assembler produced parseable JSON,
// otherwise its raw text.
struct AgentAnswer {
    enum class Kind { JSON, TEXT };

    Kind kind = Kind::TEXT;
    nlohmann::json value;
    std::string text;

    bool is_json() const { return kind == Kind::JSON; }
    std::string body() const;

    static AgentAnswer from_assembler(const std::string& final_text);
};

struct OrchestratorSettings {
    std::chrono::milliseconds request_timeout{170000};
    std::chrono::milliseconds unit_timeout{90000};
    size_t max_parallel_units = 1;
    bool fail_on_nonzero_exit = true;
    UnitFailurePolicy unit_failure_policy = UnitFailurePolicy::RECORD;
    std::string model;   // empty = provider default

    static OrchestratorSettings from_config(const AgentConfig& cfg);
};

// Drives one request through Plan -> Execute(0..N) -> Aggregate -> Assemble
// under a single end-to-end deadline. The state machine runs on a worker
// thread; when the deadline fires first the caller gets TimeoutError while
// every unit the request still holds is reaped and its workspace removed.
class RequestOrchestrator {
public:
    RequestOrchestrator(std::shared_ptr<ReasoningProvider> provider,
                        std::shared_ptr<SandboxRuntime> runtime,
                        OrchestratorSettings settings);

    // Throws ValidationError, TimeoutError, ProvisioningError, ExecutionError
    // (abort policy), ProviderError, or whatever else escaped the pipeline.
    AgentAnswer handle(RequestInput input);

    const OrchestratorSettings& settings() const;

    static std::string make_request_id();

private:
    struct Deps;
    struct Session;

    static AgentAnswer run_state_machine(const Deps& deps, Session& session);
    static void execute_blocks(const Deps& deps, Session& session, const ExecutionPlan& plan,
                               const std::vector<WorkspaceFile>& files, ResultAggregator& aggregator);
    static BlockOutcome run_block(const Deps& deps, Session& session, const CodeUnit& unit,
                                  const std::vector<WorkspaceFile>& files, size_t ordinal);

    std::shared_ptr<Deps> deps_;
};

}
