#include "kernel/pipeline_config.hpp"
#include "kernel/error.hpp"
#include <algorithm>
#include <set>

using json = nlohmann::json;

namespace helm::kernel {

void PipelineConfig::validate() {
    if (name.empty()) {
        throw validation_error("pipeline name is required");
    }
    if (stages.empty()) {
        throw validation_error("pipeline " + name + " has no stages");
    }
    if (max_iterations <= 0 || max_llm_calls <= 0 || max_agent_hops <= 0) {
        throw validation_error("pipeline " + name + " bounds must be positive");
    }

    std::stable_sort(stages.begin(), stages.end(),
        [](const StageConfig& a, const StageConfig& b) { return a.stage_order < b.stage_order; });

    std::set<std::string> names;
    for (auto& stage : stages) {
        if (stage.name.empty()) {
            throw validation_error("pipeline " + name + " has a stage without a name");
        }
        if (stage.name == kEndStage) {
            throw validation_error("stage name 'end' is reserved");
        }
        if (!names.insert(stage.name).second) {
            throw validation_error("duplicate stage: " + stage.name);
        }
        if (stage.output_key.empty()) {
            stage.output_key = stage.name;
        }
    }

    auto check_target = [&names](const std::string& stage, const std::string& target) {
        if (!target.empty() && target != kEndStage && names.count(target) == 0) {
            throw validation_error("stage " + stage + " routes to unknown stage: " + target);
        }
    };

    for (const auto& stage : stages) {
        for (const auto& rule : stage.routing_rules) {
            if (rule.condition.empty()) {
                throw validation_error("stage " + stage.name + " has a routing rule without a condition");
            }
            if (rule.target.empty()) {
                throw validation_error("stage " + stage.name + " has a routing rule without a target");
            }
            check_target(stage.name, rule.target);
        }
        check_target(stage.name, stage.default_next);
        check_target(stage.name, stage.error_next);
        for (const auto& sibling : stage.runs_with) {
            if (sibling == stage.name || names.count(sibling) == 0) {
                throw validation_error("stage " + stage.name + " runs with unknown stage: " + sibling);
            }
        }
    }

    for (const auto& [edge, limit] : edge_limits) {
        if (edge.find("->") == std::string::npos) {
            throw validation_error("edge limit key must look like 'from->to': " + edge);
        }
        if (limit <= 0) {
            throw validation_error("edge limit for " + edge + " must be positive");
        }
    }
}

const StageConfig* PipelineConfig::get_stage(const std::string& stage_name) const {
    for (const auto& stage : stages) {
        if (stage.name == stage_name) {
            return &stage;
        }
    }
    return nullptr;
}

std::vector<std::string> PipelineConfig::stage_order() const {
    std::vector<std::string> order;
    order.reserve(stages.size());
    for (const auto& stage : stages) {
        order.push_back(stage.name);
    }
    return order;
}

int PipelineConfig::stage_index(const std::string& stage_name) const {
    for (size_t i = 0; i < stages.size(); i++) {
        if (stages[i].name == stage_name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string PipelineConfig::next_in_order(const std::string& stage_name) const {
    int index = stage_index(stage_name);
    if (index < 0 || index + 1 >= static_cast<int>(stages.size())) {
        return kEndStage;
    }
    return stages[static_cast<size_t>(index) + 1].name;
}

PipelineConfig PipelineConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw validation_error("pipeline config must be an object");
    }

    PipelineConfig config;
    config.name = j.value("name", std::string());
    config.max_iterations = j.value("max_iterations", config.max_iterations);
    config.max_llm_calls = j.value("max_llm_calls", config.max_llm_calls);
    config.max_agent_hops = j.value("max_agent_hops", config.max_agent_hops);
    config.default_timeout_seconds = j.value("default_timeout_seconds", config.default_timeout_seconds);

    // "agents" is accepted as an alias for "stages"
    const char* key = j.contains("stages") ? "stages" : "agents";
    if (j.contains(key)) {
        if (!j[key].is_array()) {
            throw validation_error(std::string(key) + " must be an array");
        }
        int position = 0;
        for (const auto& s : j[key]) {
            StageConfig stage;
            stage.name = s.value("name", std::string());
            stage.stage_order = s.value("stage_order", position);
            stage.output_key = s.value("output_key", std::string());
            stage.default_next = s.value("default_next", std::string());
            stage.error_next = s.value("error_next", std::string());
            stage.runs_with = s.value("runs_with", std::vector<std::string>{});
            stage.has_llm = s.value("has_llm", false);
            stage.has_tools = s.value("has_tools", false);
            stage.timeout_seconds = s.value("timeout_seconds", 0);
            if (s.contains("routing_rules")) {
                for (const auto& r : s["routing_rules"]) {
                    stage.routing_rules.push_back(RoutingRule{
                        r.value("condition", std::string()),
                        r.contains("value") ? r["value"] : json(nullptr),
                        r.value("target", std::string())});
                }
            }
            config.stages.push_back(std::move(stage));
            position++;
        }
    }

    if (j.contains("edge_limits")) {
        const auto& limits = j["edge_limits"];
        if (limits.is_object()) {
            for (auto it = limits.begin(); it != limits.end(); ++it) {
                config.edge_limits[it.key()] = it.value().get<int>();
            }
        } else if (limits.is_array()) {
            for (const auto& l : limits) {
                config.edge_limits[l.at("from").get<std::string>() + "->" +
                                   l.at("to").get<std::string>()] = l.at("max_count").get<int>();
            }
        }
    }
    return config;
}

json PipelineConfig::to_json() const {
    json j;
    j["name"] = name;
    j["max_iterations"] = max_iterations;
    j["max_llm_calls"] = max_llm_calls;
    j["max_agent_hops"] = max_agent_hops;
    j["default_timeout_seconds"] = default_timeout_seconds;
    j["edge_limits"] = edge_limits;

    json list = json::array();
    for (const auto& stage : stages) {
        json rules = json::array();
        for (const auto& rule : stage.routing_rules) {
            rules.push_back({{"condition", rule.condition}, {"value", rule.value}, {"target", rule.target}});
        }
        list.push_back({
            {"name", stage.name},
            {"stage_order", stage.stage_order},
            {"output_key", stage.output_key},
            {"routing_rules", rules},
            {"default_next", stage.default_next},
            {"error_next", stage.error_next},
            {"runs_with", stage.runs_with},
            {"has_llm", stage.has_llm},
            {"has_tools", stage.has_tools},
            {"timeout_seconds", stage.timeout_seconds}
        });
    }
    j["stages"] = list;
    return j;
}

} // namespace helm::kernel
