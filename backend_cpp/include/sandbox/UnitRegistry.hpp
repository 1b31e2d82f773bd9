#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "sandbox/ContainerEngine.hpp"

namespace data_agent {

struct UnitKey {
    std::string request_id;
    size_t ordinal = 0;
};

// Arena of live sandbox units keyed by request and plan ordinal. The owner of
// a unit releases it on the normal path; the reaper destroys whatever a
// request still holds when its deadline fires. Exactly one of the two ever
// calls destroy() for a given unit.
class UnitRegistry {
public:
    explicit UnitRegistry(std::shared_ptr<ContainerEngine> engine);

    // Records a freshly created unit. Returns false if the request was
    // already reaped; the caller must then destroy the unit itself.
    bool track(const UnitKey& key, const std::string& unit_id);

    // True if the caller took the unit back and must destroy it; false if
    // the reaper already did.
    bool release(const std::string& unit_id);

    // Destroys every unit still tracked for the request and refuses new ones.
    // Destroy failures are logged, never thrown. Returns units destroyed.
    size_t reap(const std::string& request_id);

    // Same as reap() for every request; used at shutdown.
    size_t reap_all();

    // Drops the request's closed marker once nothing can track under it anymore.
    void forget(const std::string& request_id);

    size_t live_count() const;
    size_t live_count(const std::string& request_id) const;

private:
    void destroy_quietly(const std::string& unit_id, const UnitKey& key);

    std::shared_ptr<ContainerEngine> engine_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, UnitKey> units_;   // unit id -> owner
    std::unordered_set<std::string> closed_requests_;
};

}
