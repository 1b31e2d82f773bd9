#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

#include "llm/GroqProvider.hpp"
#include "errors/AgentErrors.hpp"

namespace data_agent {

using json = nlohmann::json;

namespace {

using Clock = std::chrono::steady_clock;

// Retry only what a second attempt can fix: rate limits, server faults and
// transport errors. 4xx other than 429 is returned immediately. With a
// request budget, no attempt runs past `deadline` and a transport timeout
// caused by the budget is final.
template<typename Func>
cpr::Response perform_request_with_retry(Func request_factory, std::shared_ptr<KeyManager> km, int max_attempts,
                                         long long attempt_timeout_ms, std::optional<Clock::time_point> deadline) {
    cpr::Response r;
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        long long timeout_ms = attempt_timeout_ms;
        bool budget_bound = false;
        if (deadline) {
            long long left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
            if (left <= 0) {
                if (attempt > 0) break;
                left = 1;
            }
            if (left <= timeout_ms) {
                timeout_ms = left;
                budget_bound = true;
            }
        }

        r = request_factory(timeout_ms);
        if (r.status_code == 200) return r;
        if (r.status_code >= 400 && r.status_code < 500 && r.status_code != 429) return r;
        if (budget_bound && r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            spdlog::warn("⏰ Provider call ran out of request budget after {} ms", timeout_ms);
            return r;
        }

        if (attempt < max_attempts - 1) {
            if (r.status_code == 429) km->report_rate_limit();
            spdlog::warn("⚠️ Provider attempt {}/{} failed (status {}{}), retrying",
                         attempt + 1, max_attempts, r.status_code,
                         r.error.message.empty() ? "" : ", " + r.error.message);
            std::this_thread::sleep_for(std::chrono::milliseconds(200 * (attempt + 1)));
        }
    }
    return r;
}

}

GroqProvider::GroqProvider(ProviderSettings settings, std::shared_ptr<KeyManager> key_manager)
    : settings_(std::move(settings)), key_manager_(std::move(key_manager)) {}

std::string GroqProvider::build_payload(const std::vector<ChatMessage>& messages, const CompletionOptions& options) const {
    json msgs = json::array();
    for (const auto& m : messages) msgs.push_back({{"role", m.role}, {"content", m.content}});
    return json{
        {"model", options.model.empty() ? settings_.model : options.model},
        {"messages", msgs},
        {"temperature", options.temperature},
        {"max_tokens", options.max_tokens}
    }.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string GroqProvider::extract_content(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw ProviderError("Provider returned a non-JSON body");
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw ProviderError("Provider response has no choices");
    }
    const auto& choice = j["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        throw ProviderError("Provider response has no message");
    }
    const auto& msg = choice["message"];
    if (!msg.contains("content") || !msg["content"].is_string()) {
        throw ProviderError("Provider response has no message content");
    }
    return msg["content"].get<std::string>();
}

std::string GroqProvider::complete(const std::vector<ChatMessage>& messages, const CompletionOptions& options) {
    const std::string url = settings_.base_url + "/chat/completions";
    const std::string payload = build_payload(messages, options);
    const long long provider_timeout_ms = static_cast<long long>(settings_.timeout_seconds) * 1000;

    auto started = Clock::now();
    std::optional<Clock::time_point> deadline;
    if (options.timeout.count() > 0) deadline = started + options.timeout;

    auto r = perform_request_with_retry([&](long long timeout_ms) {
        return cpr::Post(cpr::Url{url},
                         cpr::Body{payload},
                         cpr::Header{{"Content-Type", "application/json"},
                                     {"Authorization", "Bearer " + key_manager_->get_current_key()}},
                         cpr::Timeout{std::chrono::milliseconds(timeout_ms)});
    }, key_manager_, settings_.max_retries + 1, provider_timeout_ms, deadline);
    double ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();

    if (r.status_code != 200) {
        std::string why = r.error.message.empty() ? r.text.substr(0, 300) : r.error.message;
        spdlog::error("❌ Provider call failed after {:.0f} ms: status {} {}", ms, r.status_code, why);
        throw ProviderError("Reasoning provider request failed (status " + std::to_string(r.status_code) + "): " + why,
                            r.status_code);
    }

    std::string content = extract_content(r.text);
    spdlog::info("🤖 Provider answered in {:.0f} ms ({} chars)", ms, content.size());
    return content;
}

}
