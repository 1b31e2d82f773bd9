#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace data_agent {

// Folds per-block outputs into the interim result mapping.
class ResultAggregator {
public:
    // A JSON object output merges key by key, later blocks overwriting
    // earlier ones. Anything else lands verbatim under block_<ordinal>_raw.
    void fold(size_t ordinal, const std::string& output);

    // Stores {exit_code, timed_out, error, output} under block_<ordinal>_error.
    void record_failure(size_t ordinal, const std::string& error, int exit_code, bool timed_out, const std::string& output);

    const nlohmann::json& interim() const { return interim_; }

    static std::string raw_key(size_t ordinal) { return "block_" + std::to_string(ordinal) + "_raw"; }
    static std::string error_key(size_t ordinal) { return "block_" + std::to_string(ordinal) + "_error"; }

private:
    nlohmann::json interim_ = nlohmann::json::object();
};

struct BlockOutcome {
    bool ok = false;
    std::string output;       // captured text, kept on failure too
    std::string error;        // failure message otherwise
    int exit_code = 0;
    bool timed_out = false;
};

// Per-block slots filled in any order by parallel workers and folded in plan
// order once every block is done, so merge order never depends on timing.
class OrderedResultBuffer {
public:
    explicit OrderedResultBuffer(size_t blocks) : slots_(blocks) {}

    void put(size_t ordinal, BlockOutcome outcome);
    size_t size() const { return slots_.size(); }
    const std::optional<BlockOutcome>& at(size_t ordinal) const { return slots_.at(ordinal); }

    // Folds successes and records failures in plan order.
    void drain_into(ResultAggregator& aggregator) const;

private:
    std::vector<std::optional<BlockOutcome>> slots_;
};

}
