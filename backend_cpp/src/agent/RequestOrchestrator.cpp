#include "agent/RequestOrchestrator.hpp"
#include "errors/AgentErrors.hpp"
#include "planning/PromptBuilder.hpp"
#include "LogManager.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <random>
#include <sstream>
#include <iomanip>
#include <thread>
#include <spdlog/spdlog.h>

namespace data_agent {

using Clock = std::chrono::steady_clock;

namespace {

constexpr double kPlanningTemperature = 0.1;
constexpr int kPlanningMaxTokens = 1200;
constexpr double kAssemblyTemperature = 0.0;
constexpr int kAssemblyMaxTokens = 1000;

double ms_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

}

std::string to_string(RequestState state) {
    switch (state) {
        case RequestState::RECEIVED:   return "RECEIVED";
        case RequestState::PLANNING:   return "PLANNING";
        case RequestState::EXECUTING:  return "EXECUTING";
        case RequestState::ASSEMBLING: return "ASSEMBLING";
        case RequestState::RESPONDING: return "RESPONDING";
        case RequestState::RESPONDED:  return "RESPONDED";
        case RequestState::FAILED:     return "FAILED";
    }
    return "UNKNOWN";
}

std::string AgentAnswer::body() const {
    return is_json() ? value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) : text;
}

AgentAnswer AgentAnswer::from_assembler(const std::string& final_text) {
    AgentAnswer answer;
    nlohmann::json parsed = nlohmann::json::parse(final_text, nullptr, false);
    if (!parsed.is_discarded()) {
        answer.kind = Kind::JSON;
        answer.value = std::move(parsed);
    } else {
        answer.kind = Kind::TEXT;
        answer.text = final_text;
    }
    return answer;
}

OrchestratorSettings OrchestratorSettings::from_config(const AgentConfig& cfg) {
    OrchestratorSettings s;
    s.request_timeout = std::chrono::seconds(cfg.request_timeout_seconds);
    s.unit_timeout = std::chrono::seconds(cfg.sandbox.unit_timeout_seconds);
    s.max_parallel_units = std::max<size_t>(1, cfg.max_parallel_units);
    s.fail_on_nonzero_exit = cfg.fail_on_nonzero_exit;
    s.unit_failure_policy = cfg.unit_failure_policy;
    s.model = cfg.provider.model;
    return s;
}

struct RequestOrchestrator::Deps {
    std::shared_ptr<ReasoningProvider> provider;
    std::shared_ptr<SandboxRuntime> runtime;
    OrchestratorSettings settings;
};

// State shared between the caller waiting on the deadline and the worker
// running the pipeline. Either side may outlive the other.
struct RequestOrchestrator::Session {
    std::string request_id;
    RequestInput input;
    Clock::time_point started;
    Clock::time_point deadline;

    std::atomic<bool> cancelled{false};
    std::atomic<RequestState> state{RequestState::RECEIVED};

    std::mutex mtx;                          // guards workspace + finished
    std::shared_ptr<Workspace> workspace;
    bool finished = false;

    std::mutex trace_mtx;
    bool closed = false;                     // a terminal state was traced

    // Once RESPONDED or FAILED is traced, a worker still unwinding after the
    // deadline leaves no further states behind it.
    void transition(RequestState next, const std::string& detail = "") {
        std::lock_guard<std::mutex> lock(trace_mtx);
        if (closed) return;
        if (cancelled.load() && next != RequestState::FAILED) return;
        closed = next == RequestState::RESPONDED || next == RequestState::FAILED;
        state = next;
        double elapsed = ms_between(started, Clock::now());
        spdlog::info("🔀 [{}] {} {}", request_id, to_string(next), detail);
        LogManager::instance().add_trace({request_id, 0, to_string(next), detail, elapsed});
    }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    // Time left for the next bounded step; never 0, which downstream means "no limit".
    std::chrono::milliseconds budget() const {
        check_cancelled();
        auto left = remaining();
        if (left.count() == 0) throw TimeoutError("Request " + request_id + " exceeded its deadline");
        return left;
    }

    void check_cancelled() const {
        if (cancelled.load() || remaining().count() == 0) {
            throw TimeoutError("Request " + request_id + " exceeded its deadline");
        }
    }
};

RequestOrchestrator::RequestOrchestrator(std::shared_ptr<ReasoningProvider> provider,
                                         std::shared_ptr<SandboxRuntime> runtime,
                                         OrchestratorSettings settings)
    : deps_(std::make_shared<Deps>(Deps{std::move(provider), std::move(runtime), std::move(settings)})) {
    if (!deps_->provider || !deps_->runtime) {
        throw std::invalid_argument("RequestOrchestrator needs a provider and a sandbox runtime");
    }
    if (deps_->settings.max_parallel_units == 0) deps_->settings.max_parallel_units = 1;
}

const OrchestratorSettings& RequestOrchestrator::settings() const {
    return deps_->settings;
}

std::string RequestOrchestrator::make_request_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << std::setw(12) << std::setfill('0') << (rng() & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

AgentAnswer RequestOrchestrator::handle(RequestInput input) {
    auto session = std::make_shared<Session>();
    session->request_id = input.request_id.empty() ? make_request_id() : input.request_id;
    session->input = std::move(input);
    session->started = Clock::now();
    session->deadline = session->started + deps_->settings.request_timeout;
    session->transition(RequestState::RECEIVED);

    auto promise = std::make_shared<std::promise<AgentAnswer>>();
    std::future<AgentAnswer> future = promise->get_future();

    auto deps = deps_;
    std::thread([deps, session, promise]() {
        std::exception_ptr failure;
        AgentAnswer answer;
        try {
            answer = run_state_machine(*deps, *session);
        } catch (...) {
            failure = std::current_exception();
        }

        std::shared_ptr<Workspace> workspace;
        {
            std::lock_guard<std::mutex> lock(session->mtx);
            session->finished = true;
            workspace = std::move(session->workspace);
            deps->runtime->registry()->forget(session->request_id);
        }
        if (workspace) workspace->remove();

        if (failure) promise->set_exception(failure);
        else promise->set_value(std::move(answer));
    }).detach();

    if (future.wait_until(session->deadline) == std::future_status::ready) {
        try {
            AgentAnswer answer = future.get();
            session->transition(RequestState::RESPONDED, answer.is_json() ? "json" : "text");
            return answer;
        } catch (const std::exception& e) {
            session->transition(RequestState::FAILED, e.what());
            throw;
        }
    }

    // Deadline fired while the pipeline was still running.
    session->cancelled = true;
    std::shared_ptr<Workspace> workspace;
    size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(session->mtx);
        if (!session->finished) {
            reaped = deps_->runtime->registry()->reap(session->request_id);
            workspace = session->workspace;
        }
    }
    if (workspace) workspace->remove();

    std::string detail = "deadline of " + std::to_string(deps_->settings.request_timeout.count()) +
                         "ms exceeded in " + to_string(session->state.load()) + ", reaped " +
                         std::to_string(reaped) + " unit(s)";
    spdlog::warn("⏰ [{}] {}", session->request_id, detail);
    session->transition(RequestState::FAILED, detail);
    throw TimeoutError("Timed out");
}

AgentAnswer RequestOrchestrator::run_state_machine(const Deps& deps, Session& session) {
    session.transition(RequestState::PLANNING);

    auto workspace = Workspace::stage(session.input.question, session.input.attachments);
    {
        std::lock_guard<std::mutex> lock(session.mtx);
        session.workspace = workspace;
    }
    session.check_cancelled();

    const std::string& question = workspace->question_text();

    CompletionOptions planning_opts;
    planning_opts.model = deps.settings.model;
    planning_opts.temperature = kPlanningTemperature;
    planning_opts.max_tokens = kPlanningMaxTokens;
    planning_opts.timeout = session.budget();

    auto planning = PromptBuilder::planning_messages(question, deps.runtime->settings().workdir,
                                                     workspace->attachment_names());
    std::string raw_plan = deps.provider->complete(planning, planning_opts);
    session.check_cancelled();

    ParsedPlan parsed = parse_plan(raw_plan);
    if (parsed.degraded()) {
        spdlog::warn("⚠️ [{}] Plan was not structured ({}), running raw text as {}",
                     session.request_id, parsed.parse_error, ExecutionPlan::kDefaultUnitFilename);
    }
    const ExecutionPlan& plan = parsed.plan;
    spdlog::debug("📋 [{}] Plan: {}", session.request_id,
                  plan.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    session.transition(RequestState::EXECUTING,
                       std::to_string(plan.code_units.size()) + " block(s), " +
                       (parsed.degraded() ? "degraded plan" : "structured plan"));

    ResultAggregator aggregator;
    if (!plan.code_units.empty()) {
        deps.runtime->ensure_base_image();
        session.check_cancelled();
        std::vector<WorkspaceFile> files = workspace->read_files();
        execute_blocks(deps, session, plan, files, aggregator);
    }
    session.check_cancelled();

    session.transition(RequestState::ASSEMBLING, std::to_string(aggregator.interim().size()) + " interim key(s)");

    CompletionOptions assembly_opts;
    assembly_opts.model = deps.settings.model;
    assembly_opts.temperature = kAssemblyTemperature;
    assembly_opts.max_tokens = kAssemblyMaxTokens;
    assembly_opts.timeout = session.budget();

    auto assembly = PromptBuilder::assembly_messages(question, aggregator.interim(), plan);
    std::string final_text = deps.provider->complete(assembly, assembly_opts);
    session.check_cancelled();

    session.transition(RequestState::RESPONDING);
    return AgentAnswer::from_assembler(final_text);
}

void RequestOrchestrator::execute_blocks(const Deps& deps, Session& session, const ExecutionPlan& plan,
                                         const std::vector<WorkspaceFile>& files, ResultAggregator& aggregator) {
    const size_t n = plan.code_units.size();
    const bool abort_on_failure = deps.settings.unit_failure_policy == UnitFailurePolicy::ABORT;
    OrderedResultBuffer buffer(n);

    if (deps.settings.max_parallel_units <= 1 || n <= 1) {
        for (size_t i = 0; i < n; ++i) {
            BlockOutcome outcome = run_block(deps, session, plan.code_units[i], files, i);
            if (!outcome.ok && abort_on_failure) {
                throw ExecutionError(outcome.error, outcome.exit_code, outcome.output, outcome.timed_out);
            }
            buffer.put(i, std::move(outcome));
        }
        buffer.drain_into(aggregator);
        return;
    }

    // Bounded fan-out: waves of at most max_parallel_units blocks, merged in
    // plan order once all of them are in.
    std::vector<std::exception_ptr> failures(n);
    const size_t width = deps.settings.max_parallel_units;
    for (size_t begin = 0; begin < n; begin += width) {
        session.check_cancelled();
        const size_t end = std::min(n, begin + width);
        std::vector<std::thread> wave;
        wave.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            wave.emplace_back([&, i]() {
                try {
                    buffer.put(i, run_block(deps, session, plan.code_units[i], files, i));
                } catch (...) {
                    failures[i] = std::current_exception();
                }
            });
        }
        for (auto& t : wave) t.join();

        for (size_t i = begin; i < end; ++i) {
            if (failures[i]) std::rethrow_exception(failures[i]);
            const auto& slot = buffer.at(i);
            if (abort_on_failure && slot && !slot->ok) {
                throw ExecutionError(slot->error, slot->exit_code, slot->output, slot->timed_out);
            }
        }
    }
    buffer.drain_into(aggregator);
}

BlockOutcome RequestOrchestrator::run_block(const Deps& deps, Session& session, const CodeUnit& unit,
                                            const std::vector<WorkspaceFile>& files, size_t ordinal) {
    auto timeout = std::min(deps.settings.unit_timeout, session.budget());
    UnitKey key{session.request_id, ordinal};

    BlockOutcome outcome;
    try {
        RawOutput out = deps.runtime->run(unit, files, timeout, key);
        outcome.output = out.text;
        outcome.exit_code = out.exit_code;
        if (out.exit_code != 0 && deps.settings.fail_on_nonzero_exit) {
            throw ExecutionError("Block " + std::to_string(ordinal) + " exited with status " +
                                 std::to_string(out.exit_code), out.exit_code, out.text);
        }
        outcome.ok = true;
        spdlog::info("✅ [{}] Block {} done in {}ms (exit {})", session.request_id, ordinal,
                     out.elapsed.count(), out.exit_code);
    } catch (const ExecutionError& e) {
        // A block cut short because the whole request ran out of time is a
        // request timeout, not a block failure.
        session.check_cancelled();
        spdlog::warn("⚠️ [{}] Block {} failed: {}", session.request_id, ordinal, e.what());
        outcome.ok = false;
        outcome.error = e.what();
        outcome.exit_code = e.exit_code();
        outcome.timed_out = e.timed_out();
        outcome.output = e.output();
    }
    return outcome;
}

}
