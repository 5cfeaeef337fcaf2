#include "ipc/handlers.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::ipc {

using namespace helm::kernel;

namespace {

// Envelopes are addressed by pid, falling back to envelope_id
std::string envelope_key(const json& body) {
    auto pid = optional_string(body, "pid");
    if (!pid.empty()) {
        return pid;
    }
    return require_string(body, "envelope_id");
}

} // namespace

void EngineHandlers::register_methods(Router& router) {
    router.register_handler("engine", "CreateEnvelope", [this](const json& b) { return handle_create_envelope(b); });
    router.register_handler("engine", "GetEnvelope", [this](const json& b) { return handle_get_envelope(b); });
    router.register_handler("engine", "UpdateEnvelope", [this](const json& b) { return handle_update_envelope(b); });
    router.register_handler("engine", "CheckBounds", [this](const json& b) { return handle_check_bounds(b); });
    router.register_handler("engine", "ExecutePipeline", [this](const json& b) { return handle_execute_pipeline(b); });
    router.register_handler("engine", "CloneEnvelope", [this](const json& b) { return handle_clone_envelope(b); });
}

json EngineHandlers::handle_create_envelope(const json& body) {
    // Either {"envelope": {...}, "pid": ...} or the envelope fields inline
    const json& source = body.contains("envelope") && body["envelope"].is_object()
        ? body["envelope"] : body;
    Envelope envelope = Envelope::from_json(source);

    std::optional<std::string> pid;
    if (body.contains("pid") && !body["pid"].is_null()) {
        pid = require_string(body, "pid");
    }

    auto created = context_.kernel.create_envelope(std::move(envelope), pid);
    spdlog::debug("CreateEnvelope: envelope_id={} pid={}", created.envelope_id, pid.value_or("-"));
    return created.to_json();
}

json EngineHandlers::handle_get_envelope(const json& body) {
    return context_.kernel.get_envelope(envelope_key(body)).to_json();
}

json EngineHandlers::handle_update_envelope(const json& body) {
    auto key = envelope_key(body);
    if (!body.contains("update") || !body["update"].is_object()) {
        throw validation_error("update must be an object");
    }
    return context_.kernel.update_envelope(key, body["update"]).to_json();
}

json EngineHandlers::handle_check_bounds(const json& body) {
    auto check = context_.kernel.check_bounds(envelope_key(body));

    json response;
    response["can_continue"] = check.can_continue;
    response["terminal_reason"] = check.terminal_reason
        ? json(terminal_reason_to_string(*check.terminal_reason)) : json();
    response["llm_calls_remaining"] = check.llm_calls_remaining;
    response["agent_hops_remaining"] = check.agent_hops_remaining;
    response["iterations_remaining"] = check.iterations_remaining;
    return response;
}

json EngineHandlers::handle_execute_pipeline(const json& body) {
    auto pid = require_string(body, "pid");
    auto start = context_.kernel.execute_pipeline(
        pid, pipeline_from_body(body), envelope_from_body(body), body.value("force", false));

    spdlog::info("ExecutePipeline: pid={} first={}", pid,
        instruction_kind_to_string(start.instruction.kind));
    return json{
        {"state", start.state.to_json()},
        {"instruction", start.instruction.to_json()}
    };
}

json EngineHandlers::handle_clone_envelope(const json& body) {
    auto key = envelope_key(body);
    std::optional<std::string> new_key;
    if (body.contains("new_key") && !body["new_key"].is_null()) {
        new_key = require_string(body, "new_key");
    }
    return context_.kernel.clone_envelope(key, new_key).to_json();
}

} // namespace helm::ipc
