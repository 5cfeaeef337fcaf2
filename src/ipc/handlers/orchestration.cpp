#include "ipc/handlers.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::ipc {

using namespace helm::kernel;

void OrchestrationHandlers::register_methods(Router& router) {
    router.register_handler("orchestration", "InitializeSession",
        [this](const json& b) { return handle_initialize_session(b); });
    router.register_handler("orchestration", "GetNextInstruction",
        [this](const json& b) { return handle_get_next_instruction(b); });
    router.register_handler("orchestration", "ReportAgentResult",
        [this](const json& b) { return handle_report_agent_result(b); });
    router.register_handler("orchestration", "GetSessionState",
        [this](const json& b) { return handle_get_session_state(b); });
}

json OrchestrationHandlers::handle_initialize_session(const json& body) {
    auto pid = require_string(body, "pid");
    auto state = context_.kernel.initialize_orchestration(
        pid, pipeline_from_body(body), envelope_from_body(body), body.value("force", false));
    spdlog::info("InitializeSession: pid={} pipeline={} stage={}",
        pid, state.pipeline, state.current_stage);
    return state.to_json();
}

json OrchestrationHandlers::handle_get_next_instruction(const json& body) {
    return context_.kernel.get_next_instruction(require_string(body, "pid")).to_json();
}

json OrchestrationHandlers::handle_report_agent_result(const json& body) {
    auto pid = require_string(body, "pid");

    AgentResult result;
    result.agent_name = optional_string(body, "agent_name");
    result.success = body.value("success", true);
    result.error = optional_string(body, "error");
    if (body.contains("output") && !body["output"].is_null()) {
        if (!body["output"].is_object()) {
            throw validation_error("output must be an object");
        }
        result.output = body["output"];
    }
    if (body.contains("metadata") && !body["metadata"].is_null()) {
        if (!body["metadata"].is_object()) {
            throw validation_error("metadata must be an object");
        }
        result.metadata = body["metadata"];
    }

    AgentExecutionMetrics metrics;
    if (body.contains("metrics") && body["metrics"].is_object()) {
        const auto& m = body["metrics"];
        metrics.llm_calls = m.value("llm_calls", 0);
        metrics.tool_calls = m.value("tool_calls", 0);
        metrics.tokens_in = m.value("tokens_in", int64_t{0});
        metrics.tokens_out = m.value("tokens_out", int64_t{0});
        metrics.duration_ms = m.value("duration_ms", int64_t{0});
    }
    if (metrics.llm_calls < 0 || metrics.tool_calls < 0 || metrics.tokens_in < 0 ||
        metrics.tokens_out < 0 || metrics.duration_ms < 0) {
        throw validation_error("metrics must be non-negative");
    }

    return context_.kernel.report_agent_result(pid, metrics, result).to_json();
}

json OrchestrationHandlers::handle_get_session_state(const json& body) {
    return context_.kernel.get_session_state(require_string(body, "pid")).to_json();
}

} // namespace helm::ipc
