#include "ipc/handlers.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::ipc {

using namespace helm::kernel;

namespace {

InterruptKind parse_kind(const std::string& name) {
    auto kind = interrupt_kind_from_string(name);
    if (!kind) {
        throw validation_error("unknown interrupt kind: " + name);
    }
    return *kind;
}

std::optional<std::string> optional_text(const json& body, const char* field) {
    auto value = optional_string(body, field);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

void InterruptHandlers::register_methods(Router& router) {
    router.register_handler("interrupt", "CreateInterrupt", [this](const json& b) { return handle_create_interrupt(b); });
    router.register_handler("interrupt", "ResolveInterrupt", [this](const json& b) { return handle_resolve_interrupt(b); });
    router.register_handler("interrupt", "CancelInterrupt", [this](const json& b) { return handle_cancel_interrupt(b); });
    router.register_handler("interrupt", "GetInterrupt", [this](const json& b) { return handle_get_interrupt(b); });
    router.register_handler("interrupt", "GetPendingForSession",
        [this](const json& b) { return handle_get_pending_for_session(b); });
}

json InterruptHandlers::handle_create_interrupt(const json& body) {
    CreateInterruptParams params;
    params.kind = parse_kind(require_string(body, "kind"));
    params.request_id = optional_string(body, "request_id");
    params.user_id = optional_string(body, "user_id");
    params.session_id = optional_string(body, "session_id");
    params.envelope_id = optional_string(body, "envelope_id");
    params.process_id = optional_string(body, "process_id");
    params.question = optional_text(body, "question");
    params.message = optional_text(body, "message");
    if (body.contains("data") && !body["data"].is_null()) {
        params.data = body["data"];
    }
    if (body.contains("ttl_seconds") && !body["ttl_seconds"].is_null()) {
        params.ttl_seconds = body["ttl_seconds"].get<double>();
    }

    return kernel_interrupt_to_json(context_.kernel.create_interrupt(params));
}

json InterruptHandlers::handle_resolve_interrupt(const json& body) {
    auto id = require_string(body, "interrupt_id");
    InterruptResponse response = response_from_json(body.value("response", json::object()));

    std::optional<std::string> user;
    if (body.contains("user_id") && !body["user_id"].is_null()) {
        user = require_string(body, "user_id");
    }

    bool resolved = context_.kernel.resolve_interrupt(id, response, user);
    return json{{"interrupt_id", id}, {"resolved", resolved}};
}

json InterruptHandlers::handle_cancel_interrupt(const json& body) {
    auto id = require_string(body, "interrupt_id");
    bool cancelled = context_.kernel.cancel_interrupt(id, optional_string(body, "reason", "cancelled"));
    return json{{"interrupt_id", id}, {"cancelled", cancelled}};
}

json InterruptHandlers::handle_get_interrupt(const json& body) {
    return kernel_interrupt_to_json(context_.kernel.get_interrupt(require_string(body, "interrupt_id")));
}

json InterruptHandlers::handle_get_pending_for_session(const json& body) {
    auto session = require_string(body, "session_id");

    std::set<InterruptKind> kinds;
    if (body.contains("kinds") && body["kinds"].is_array()) {
        for (const auto& name : body["kinds"]) {
            kinds.insert(parse_kind(name.get<std::string>()));
        }
    }

    json interrupts = json::array();
    for (const auto& interrupt : context_.kernel.get_pending_for_session(session, kinds)) {
        interrupts.push_back(kernel_interrupt_to_json(interrupt));
    }
    return json{{"session_id", session}, {"interrupts", interrupts}};
}

} // namespace helm::ipc
