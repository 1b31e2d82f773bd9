#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "llm/ReasoningProvider.hpp"
#include "planning/ExecutionPlan.hpp"

namespace data_agent {

class PromptBuilder {
public:
    // Planning request: question verbatim, the directory the code will run in,
    // and the attachment basenames available there.
    static std::vector<ChatMessage> planning_messages(const std::string& question,
                                                      const std::string& working_dir,
                                                      const std::vector<std::string>& files);

    // Assembly request: a JSON document carrying the question, the interim
    // mapping, the plan's expected format and its postprocess instructions.
    static std::vector<ChatMessage> assembly_messages(const std::string& question,
                                                      const nlohmann::json& interim,
                                                      const ExecutionPlan& plan);
};

}
