#include "planning/PromptBuilder.hpp"

namespace data_agent {

using json = nlohmann::json;

std::vector<ChatMessage> PromptBuilder::planning_messages(const std::string& question,
                                                          const std::string& working_dir,
                                                          const std::vector<std::string>& files) {
    std::string system =
        "You are a data analyst agent. Read the question and local files, then respond with ONLY a JSON object:\n"
        "{\"steps\":[...],"
        "\"python_blocks\":[{\"filename\":\"run1.py\",\"code\":\"...\"}],"
        "\"final_format\":\"array|object\","
        "\"postprocess_instructions\":\"...\"}\n"
        "Rules:\n"
        "- Python blocks must be self-contained: read local files using their basenames relative to the working dir provided.\n"
        "- Perform scraping if required (use requests + BeautifulSoup with a User-Agent).\n"
        "- Compute stats/plots in Python and print a SINGLE JSON object with interim results to stdout.\n"
        "- If a plot is needed, ensure base64 data URI and keep image under 100,000 bytes.\n"
        "- Do not include placeholders; include full runnable code.";

    std::string file_list;
    for (const auto& f : files) {
        if (!file_list.empty()) file_list += ", ";
        file_list += f;
    }

    std::string user =
        "Question (verbatim):\n" + question + "\n\n"
        "Working directory: " + working_dir + "\n"
        "Files: " + file_list + "\n"
        "Return strictly the planning JSON. No prose.";

    return {{"system", system}, {"user", user}};
}

std::vector<ChatMessage> PromptBuilder::assembly_messages(const std::string& question,
                                                          const json& interim,
                                                          const ExecutionPlan& plan) {
    std::string system =
        "You will be given the original question and the interim JSON results from Python runs. "
        "Return ONLY the final answer in the exact schema requested by the question. "
        "If the question asks for a JSON array, return an array; if it asks for a JSON object with specific keys, "
        "return an object with exactly those keys. No prose.";

    json user = {
        {"question", question},
        {"interim", interim},
        {"expected_format", to_string(plan.final_format)},
        {"postprocess_instructions", plan.postprocess_instructions}
    };

    return {{"system", system}, {"user", user.dump(-1, ' ', false, json::error_handler_t::replace)}};
}

}
