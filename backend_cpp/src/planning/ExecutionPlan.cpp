#include "planning/ExecutionPlan.hpp"
#include "errors/AgentErrors.hpp"

#include <spdlog/spdlog.h>

namespace data_agent {

using json = nlohmann::json;

std::string to_string(FinalFormat format) {
    return format == FinalFormat::OBJECT ? "object" : "array";
}

json ExecutionPlan::to_json() const {
    json units = json::array();
    for (const auto& u : code_units) units.push_back({{"filename", u.filename}, {"code", u.code}});
    return {
        {"steps", steps},
        {"python_blocks", units},
        {"final_format", to_string(final_format)},
        {"postprocess_instructions", postprocess_instructions}
    };
}

ExecutionPlan make_degraded_plan(const std::string& raw_text) {
    ExecutionPlan plan;
    plan.code_units.push_back({ExecutionPlan::kDefaultUnitFilename, raw_text});
    plan.final_format = FinalFormat::ARRAY;
    return plan;
}

ExecutionPlan plan_from_json(const json& j) {
    if (!j.is_object()) throw ParseError(std::string("plan must be a JSON object, got ") + j.type_name());

    ExecutionPlan plan;

    if (j.contains("steps") && !j["steps"].is_null()) {
        if (!j["steps"].is_array()) throw ParseError("'steps' must be an array");
        for (const auto& s : j["steps"]) {
            if (!s.is_string()) throw ParseError("'steps' entries must be strings");
            plan.steps.push_back(s.get<std::string>());
        }
    }

    // The planner prompt asks for python_blocks; code_units is accepted too.
    const char* units_key = j.contains("python_blocks") ? "python_blocks" : "code_units";
    if (j.contains(units_key) && !j[units_key].is_null()) {
        const auto& units = j[units_key];
        if (!units.is_array()) throw ParseError(std::string("'") + units_key + "' must be an array");
        for (const auto& u : units) {
            if (!u.is_object()) throw ParseError("code unit must be an object");
            CodeUnit unit;
            unit.filename = ExecutionPlan::kDefaultUnitFilename;
            if (u.contains("filename") && !u["filename"].is_null()) {
                if (!u["filename"].is_string()) throw ParseError("code unit 'filename' must be a string");
                unit.filename = u["filename"].get<std::string>();
            }
            if (u.contains("code") && !u["code"].is_null()) {
                if (!u["code"].is_string()) throw ParseError("code unit 'code' must be a string");
                unit.code = u["code"].get<std::string>();
            }
            plan.code_units.push_back(std::move(unit));
        }
    }

    if (j.contains("final_format") && !j["final_format"].is_null()) {
        if (!j["final_format"].is_string()) throw ParseError("'final_format' must be a string");
        plan.final_format = j["final_format"].get<std::string>() == "object" ? FinalFormat::OBJECT : FinalFormat::ARRAY;
    }

    if (j.contains("postprocess_instructions") && !j["postprocess_instructions"].is_null()) {
        if (!j["postprocess_instructions"].is_string()) throw ParseError("'postprocess_instructions' must be a string");
        plan.postprocess_instructions = j["postprocess_instructions"].get<std::string>();
    }

    return plan;
}

ParsedPlan parse_plan(const std::string& raw_text) {
    ParsedPlan parsed;
    try {
        json j = json::parse(raw_text);
        parsed.plan = plan_from_json(j);
        parsed.kind = ParsedPlan::Kind::STRUCTURED;
        spdlog::info("📝 Plan parsed: {} step(s), {} code unit(s), final_format={}",
                     parsed.plan.steps.size(), parsed.plan.code_units.size(), to_string(parsed.plan.final_format));
    } catch (const json::exception& e) {
        parsed.parse_error = e.what();
    } catch (const ParseError& e) {
        parsed.parse_error = e.what();
    }

    if (parsed.kind == ParsedPlan::Kind::DEGRADED) {
        spdlog::warn("⚠️ Planner output is not a valid plan ({}). Running it verbatim as one unit.", parsed.parse_error);
        parsed.plan = make_degraded_plan(raw_text);
    }
    return parsed;
}

}
