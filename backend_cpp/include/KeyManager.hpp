#pragma once
#include <vector>
#include <string>
#include <shared_mutex>
#include <atomic>
#include <spdlog/spdlog.h>

namespace data_agent {

// Pool of provider API keys. A key that keeps hitting rate limits is
// decommissioned; once every key is out the whole pool is revived.
class KeyManager {
private:
    struct ApiKey {
        std::string key;
        bool is_active = true;
        int fail_count = 0;
    };

    std::vector<ApiKey> key_pool;
    mutable std::shared_mutex pool_mutex;
    std::atomic<size_t> current_key_index{0};

public:
    explicit KeyManager(const std::vector<std::string>& keys) {
        for (const auto& k : keys) key_pool.push_back({k, true, 0});
        spdlog::info("🔑 Key pool: {} key(s) loaded.", key_pool.size());
    }

    std::string get_current_key() const {
        std::shared_lock lock(pool_mutex);
        if (key_pool.empty()) return "";

        size_t start_idx = current_key_index.load();
        size_t pool_size = key_pool.size();

        // First active key from the cursor on
        for (size_t i = 0; i < pool_size; ++i) {
            size_t idx = (start_idx + i) % pool_size;
            if (key_pool[idx].is_active) return key_pool[idx].key;
        }
        return key_pool[start_idx % pool_size].key;
    }

    void report_rate_limit() {
        std::unique_lock lock(pool_mutex);
        if (key_pool.empty()) return;

        size_t idx = current_key_index.load() % key_pool.size();
        if (key_pool[idx].is_active) {
            key_pool[idx].fail_count++;
            // allow 2 failures before the key is benched
            if (key_pool[idx].fail_count > 2) {
                key_pool[idx].is_active = false;
                spdlog::warn("⚠️ Key #{} decommissioned due to rate limits", idx);
            }
        }

        bool any_active = false;
        for (const auto& k : key_pool) {
            if (k.is_active) { any_active = true; break; }
        }
        if (!any_active) {
            spdlog::error("🔥 All provider keys exhausted. Reviving pool.");
            for (auto& k : key_pool) {
                k.is_active = true;
                k.fail_count = 0;
            }
        }

        current_key_index++;
    }

    size_t get_active_key_count() const {
        std::shared_lock lock(pool_mutex);
        size_t count = 0;
        for (const auto& k : key_pool) if (k.is_active) count++;
        return count;
    }

    size_t get_total_keys() const {
        std::shared_lock lock(pool_mutex);
        return key_pool.size();
    }
};

}
