#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace data_agent {

enum class FinalFormat { ARRAY, OBJECT };

struct CodeUnit {
    std::string filename;
    std::string code;
};

struct ExecutionPlan {
    static constexpr const char* kDefaultUnitFilename = "run.py";

    std::vector<std::string> steps;
    std::vector<CodeUnit> code_units;
    FinalFormat final_format = FinalFormat::ARRAY;
    std::string postprocess_instructions;

    nlohmann::json to_json() const;
};

// Outcome of parsing planner output. A plan is always present: when the text
// does not have the plan shape, `plan` is the degraded single-unit fallback
// and `parse_error` says why.
struct ParsedPlan {
    enum class Kind { STRUCTURED, DEGRADED };

    Kind kind = Kind::DEGRADED;
    ExecutionPlan plan;
    std::string parse_error;

    bool degraded() const { return kind == Kind::DEGRADED; }
};

ParsedPlan parse_plan(const std::string& raw_text);

// Strict shape check; throws ParseError naming the first offending field.
ExecutionPlan plan_from_json(const nlohmann::json& j);

ExecutionPlan make_degraded_plan(const std::string& raw_text);

std::string to_string(FinalFormat format);

}
