#pragma once
#include <memory>
#include <string>

#include "KeyManager.hpp"
#include "config/AgentConfig.hpp"
#include "llm/ReasoningProvider.hpp"

namespace data_agent {

// OpenAI-compatible chat completions client (Groq by default).
class GroqProvider : public ReasoningProvider {
public:
    GroqProvider(ProviderSettings settings, std::shared_ptr<KeyManager> key_manager);

    std::string complete(const std::vector<ChatMessage>& messages, const CompletionOptions& options) override;

    // Builds the request document; exposed for tests.
    std::string build_payload(const std::vector<ChatMessage>& messages, const CompletionOptions& options) const;

    // Pulls choices[0].message.content out of a response body.
    // Throws ProviderError if the body has no such string.
    static std::string extract_content(const std::string& body);

private:
    ProviderSettings settings_;
    std::shared_ptr<KeyManager> key_manager_;
};

}
