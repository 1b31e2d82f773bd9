#include "aggregation/ResultAggregator.hpp"
#include "utils/Scrubber.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace data_agent {

using json = nlohmann::json;

void ResultAggregator::fold(size_t ordinal, const std::string& output) {
    json parsed = json::parse(trim_copy(output), nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            if (interim_.contains(it.key())) {
                spdlog::debug("Block {} overwrites interim key '{}'", ordinal, it.key());
            }
            interim_[it.key()] = it.value();
        }
        spdlog::info("🧩 Block {} merged {} key(s)", ordinal, parsed.size());
        return;
    }
    interim_[raw_key(ordinal)] = output;
    spdlog::info("🧩 Block {} stored as raw text ({} chars)", ordinal, output.size());
}

void ResultAggregator::record_failure(size_t ordinal, const std::string& error, int exit_code, bool timed_out,
                                      const std::string& output) {
    interim_[error_key(ordinal)] = {
        {"error", error},
        {"exit_code", exit_code},
        {"timed_out", timed_out},
        {"output", output}
    };
}

void OrderedResultBuffer::put(size_t ordinal, BlockOutcome outcome) {
    if (ordinal >= slots_.size()) throw std::out_of_range("OrderedResultBuffer: ordinal " + std::to_string(ordinal));
    slots_[ordinal] = std::move(outcome);
}

void OrderedResultBuffer::drain_into(ResultAggregator& aggregator) const {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i].has_value()) continue;
        const auto& o = *slots_[i];
        if (o.ok) aggregator.fold(i, o.output);
        else aggregator.record_failure(i, o.error, o.exit_code, o.timed_out, o.output);
    }
}

}
