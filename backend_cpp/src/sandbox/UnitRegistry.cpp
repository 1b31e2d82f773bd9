#include "sandbox/UnitRegistry.hpp"

#include <spdlog/spdlog.h>
#include <vector>

namespace data_agent {

UnitRegistry::UnitRegistry(std::shared_ptr<ContainerEngine> engine) : engine_(std::move(engine)) {}

bool UnitRegistry::track(const UnitKey& key, const std::string& unit_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_requests_.count(key.request_id)) return false;
    units_[unit_id] = key;
    return true;
}

bool UnitRegistry::release(const std::string& unit_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return units_.erase(unit_id) > 0;
}

void UnitRegistry::destroy_quietly(const std::string& unit_id, const UnitKey& key) {
    try {
        engine_->destroy(unit_id);
        spdlog::warn("🪓 Reaped unit {} (request {}, block {})", unit_id.substr(0, 12), key.request_id, key.ordinal);
    } catch (const std::exception& e) {
        spdlog::error("💥 Reaper failed to destroy unit {}: {}", unit_id.substr(0, 12), e.what());
    }
}

size_t UnitRegistry::reap(const std::string& request_id) {
    std::vector<std::pair<std::string, UnitKey>> doomed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_requests_.insert(request_id);
        for (auto it = units_.begin(); it != units_.end();) {
            if (it->second.request_id == request_id) {
                doomed.emplace_back(it->first, it->second);
                it = units_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& d : doomed) destroy_quietly(d.first, d.second);
    return doomed.size();
}

size_t UnitRegistry::reap_all() {
    std::vector<std::pair<std::string, UnitKey>> doomed;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& u : units_) closed_requests_.insert(u.second.request_id);
        doomed.assign(units_.begin(), units_.end());
        units_.clear();
    }
    for (const auto& d : doomed) destroy_quietly(d.first, d.second);
    return doomed.size();
}

void UnitRegistry::forget(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_requests_.erase(request_id);
}

size_t UnitRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return units_.size();
}

size_t UnitRegistry::live_count(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n = 0;
    for (const auto& u : units_) if (u.second.request_id == request_id) ++n;
    return n;
}

}
