#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace data_agent {

struct AgentTrace {
    std::string request_id;
    long long timestamp = 0;    // unix ms, filled by add_trace when 0
    std::string state;
    std::string detail;
    double duration_ms = 0.0;
};

struct RequestLog {
    long long timestamp = 0;
    std::string request_id;
    std::string question_preview;
    std::string outcome;        // "json" | "text" | "validation" | "timeout" | "error"
    int http_status = 0;
    double duration_ms = 0.0;
};

// In-memory ring of recent request outcomes and state transitions, served
// by the admin endpoint. Nothing is written to disk.
class LogManager {
public:
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_log(RequestLog log) {
        if (log.timestamp == 0) log.timestamp = now_ms();
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.push_back(std::move(log));
        if (logs_.size() > kMaxLogs) logs_.pop_front();
    }

    void add_trace(AgentTrace trace) {
        if (trace.timestamp == 0) trace.timestamp = now_ms();
        std::lock_guard<std::mutex> lock(mtx_);
        agent_traces_.push_back(std::move(trace));
        if (agent_traces_.size() > kMaxTraces) agent_traces_.pop_front();
    }

    json get_logs_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        for (auto it = logs_.rbegin(); it != logs_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"request_id", it->request_id},
                {"question", it->question_preview},
                {"outcome", it->outcome},
                {"status", it->http_status},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    json get_traces_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j = json::array();
        for (const auto& t : agent_traces_) {
            j.push_back({
                {"request_id", t.request_id},
                {"timestamp", t.timestamp},
                {"state", t.state},
                {"detail", t.detail},
                {"duration", t.duration_ms}
            });
        }
        return j;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        logs_.clear();
        agent_traces_.clear();
    }

private:
    static constexpr size_t kMaxLogs = 50;
    static constexpr size_t kMaxTraces = 200;

    LogManager() = default;

    static long long now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    std::deque<RequestLog> logs_;
    std::deque<AgentTrace> agent_traces_;
    std::mutex mtx_;
};

}
