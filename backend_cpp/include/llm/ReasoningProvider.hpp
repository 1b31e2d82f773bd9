#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace data_agent {

struct ChatMessage {
    std::string role;      // "system" | "user" | "assistant"
    std::string content;
};

struct CompletionOptions {
    std::string model;                      // empty = provider default
    double temperature = 0.2;
    int max_tokens = 1500;
    std::chrono::milliseconds timeout{0};   // 0 = provider default
};

// Stateless text completion. Implementations throw ProviderError when no
// text could be obtained; any text that comes back is returned verbatim.
class ReasoningProvider {
public:
    virtual ~ReasoningProvider() = default;
    virtual std::string complete(const std::vector<ChatMessage>& messages, const CompletionOptions& options) = 0;
};

}
