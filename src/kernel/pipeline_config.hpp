#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace helm::kernel {

// Reserved routing targets that are not stages
inline constexpr const char* kEndStage = "end";

struct RoutingRule {
    std::string condition;   // key in the agent's output
    nlohmann::json value;    // expected value
    std::string target;      // next stage
};

// One stage of a pipeline; the stage name is also the agent name
struct StageConfig {
    std::string name;
    int stage_order = 0;
    std::string output_key;  // defaults to name
    std::vector<RoutingRule> routing_rules;
    std::string default_next;
    std::string error_next;
    std::vector<std::string> runs_with;  // stages dispatched alongside this one
    bool has_llm = false;
    bool has_tools = false;
    int timeout_seconds = 0;
};

struct PipelineConfig {
    std::string name;
    std::vector<StageConfig> stages;
    int max_iterations = 3;
    int max_llm_calls = 10;
    int max_agent_hops = 21;
    int default_timeout_seconds = 300;
    // "from->to" -> maximum traversals of that edge
    std::map<std::string, int> edge_limits;

    // Sorts stages by stage_order and checks names, targets and limits.
    // Throws a VALIDATION KernelError.
    void validate();

    const StageConfig* get_stage(const std::string& name) const;
    bool has_stage(const std::string& name) const { return get_stage(name) != nullptr; }
    std::vector<std::string> stage_order() const;
    // Position in stage order, -1 when unknown
    int stage_index(const std::string& name) const;
    // Stage following name in stage order, or "end"
    std::string next_in_order(const std::string& name) const;

    static PipelineConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace helm::kernel
