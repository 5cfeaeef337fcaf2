#include "ipc/handlers.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::ipc {

using namespace helm::kernel;

namespace {

json violation_to_json(const QuotaViolation& v) {
    return json{
        {"dimension", v.dimension},
        {"usage", v.usage},
        {"limit", v.limit},
        {"message", v.message}
    };
}

int non_negative(const json& body, const char* field) {
    int value = body.value(field, 0);
    if (value < 0) {
        throw validation_error(std::string(field) + " must be non-negative");
    }
    return value;
}

int64_t non_negative64(const json& body, const char* field) {
    int64_t value = body.value(field, int64_t{0});
    if (value < 0) {
        throw validation_error(std::string(field) + " must be non-negative");
    }
    return value;
}

} // namespace

void KernelHandlers::register_methods(Router& router) {
    router.register_handler("kernel", "CreateProcess", [this](const json& b) { return handle_create_process(b); });
    router.register_handler("kernel", "GetProcess", [this](const json& b) { return handle_get_process(b); });
    router.register_handler("kernel", "ScheduleProcess", [this](const json& b) { return handle_schedule_process(b); });
    router.register_handler("kernel", "GetNextRunnable", [this](const json& b) { return handle_get_next_runnable(b); });
    router.register_handler("kernel", "TransitionState", [this](const json& b) { return handle_transition_state(b); });
    router.register_handler("kernel", "TerminateProcess", [this](const json& b) { return handle_terminate_process(b); });
    router.register_handler("kernel", "CheckQuota", [this](const json& b) { return handle_check_quota(b); });
    router.register_handler("kernel", "RecordUsage", [this](const json& b) { return handle_record_usage(b); });
    router.register_handler("kernel", "CheckRateLimit", [this](const json& b) { return handle_check_rate_limit(b); });
    router.register_handler("kernel", "ListProcesses", [this](const json& b) { return handle_list_processes(b); });
    router.register_handler("kernel", "GetProcessCounts", [this](const json& b) { return handle_get_process_counts(b); });
    router.register_handler("kernel", "GetSystemStatus", [this](const json& b) { return handle_get_system_status(b); });
}

json KernelHandlers::handle_create_process(const json& body) {
    CreateProcessRequest request;
    request.pid = require_string(body, "pid");
    request.request_id = optional_string(body, "request_id");
    request.user_id = optional_string(body, "user_id");
    request.session_id = optional_string(body, "session_id");
    request.parent_pid = body.contains("parent_pid") && !body["parent_pid"].is_null()
        ? std::optional<std::string>(require_string(body, "parent_pid"))
        : std::nullopt;

    auto priority_name = optional_string(body, "priority", "NORMAL");
    auto priority = priority_from_string(priority_name);
    if (!priority) {
        throw validation_error("unknown priority: " + priority_name);
    }
    request.priority = *priority;

    if (body.contains("quota") && !body["quota"].is_null()) {
        request.quota = quota_from_json(body["quota"], context_.kernel.default_quota());
    }

    auto pcb = context_.kernel.create_process(request);
    spdlog::info("CreateProcess: pid={} user={} state={}",
        pcb.pid.str(), pcb.user_id.str(), process_state_to_string(pcb.state));
    return pcb_to_json(pcb);
}

json KernelHandlers::handle_get_process(const json& body) {
    return pcb_to_json(context_.kernel.get_process(require_string(body, "pid")));
}

json KernelHandlers::handle_schedule_process(const json& body) {
    return pcb_to_json(context_.kernel.schedule_process(require_string(body, "pid")));
}

json KernelHandlers::handle_get_next_runnable(const json& /*body*/) {
    auto pcb = context_.kernel.get_next_runnable();
    json response;
    response["process"] = pcb ? pcb_to_json(*pcb) : json();
    return response;
}

json KernelHandlers::handle_transition_state(const json& body) {
    auto pid = require_string(body, "pid");
    auto state_name = require_string(body, "state");
    auto state = process_state_from_string(state_name);
    if (!state) {
        throw validation_error("unknown process state: " + state_name);
    }
    return pcb_to_json(context_.kernel.transition_state(pid, *state, optional_string(body, "reason")));
}

json KernelHandlers::handle_terminate_process(const json& body) {
    auto pid = require_string(body, "pid");
    auto reason = optional_string(body, "reason", "Process terminated");
    return pcb_to_json(context_.kernel.terminate_process(pid, reason));
}

json KernelHandlers::handle_check_quota(const json& body) {
    auto pid = require_string(body, "pid");
    auto check = context_.kernel.check_quota(pid);

    json response;
    response["within_bounds"] = check.within_bounds;
    response["violation"] = check.violation ? violation_to_json(*check.violation) : json();
    response["usage"] = usage_to_json(check.usage);
    response["quota"] = quota_to_json(check.quota);
    response["remaining"] = budget_to_json(remaining_budget(check.quota, check.usage));
    return response;
}

json KernelHandlers::handle_record_usage(const json& body) {
    auto pid = require_string(body, "pid");

    UsageDelta delta;
    delta.llm_calls = non_negative(body, "llm_calls");
    delta.tool_calls = non_negative(body, "tool_calls");
    delta.agent_hops = non_negative(body, "agent_hops");
    delta.iterations = non_negative(body, "iterations");
    delta.tokens_in = non_negative64(body, "tokens_in");
    delta.tokens_out = non_negative64(body, "tokens_out");
    delta.inference_requests = non_negative(body, "inference_requests");
    delta.inference_input_chars = non_negative64(body, "inference_input_chars");

    return usage_to_json(context_.kernel.record_usage(pid, delta));
}

json KernelHandlers::handle_check_rate_limit(const json& body) {
    auto user = require_string(body, "user_id");
    auto result = context_.kernel.check_rate_limit(user, body.value("record", true));

    json response;
    response["allowed"] = result.allowed;
    response["limit_type"] = result.limit_type;
    response["current_count"] = result.current_count;
    response["limit"] = result.limit;
    response["retry_after_seconds"] = result.retry_after_seconds;
    response["remaining"] = result.remaining;
    response["reason"] = result.reason;
    return response;
}

json KernelHandlers::handle_list_processes(const json& body) {
    std::optional<ProcessState> state;
    if (body.contains("state") && !body["state"].is_null()) {
        auto name = require_string(body, "state");
        state = process_state_from_string(name);
        if (!state) {
            throw validation_error("unknown process state: " + name);
        }
    }
    std::optional<std::string> user;
    if (body.contains("user_id") && !body["user_id"].is_null()) {
        user = require_string(body, "user_id");
    }

    json processes = json::array();
    for (const auto& pcb : context_.kernel.list_processes(state, user)) {
        processes.push_back(pcb_to_json(pcb));
    }
    json response;
    response["count"] = processes.size();
    response["processes"] = std::move(processes);
    return response;
}

json KernelHandlers::handle_get_process_counts(const json& /*body*/) {
    json counts = json::object();
    size_t total = 0;
    for (const auto& [state, count] : context_.kernel.process_counts()) {
        counts[process_state_to_string(state)] = count;
        total += count;
    }
    return json{{"counts", counts}, {"total", total}};
}

json KernelHandlers::handle_get_system_status(const json& /*body*/) {
    return context_.kernel.system_status().to_json();
}

} // namespace helm::ipc
