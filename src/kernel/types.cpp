#include "kernel/types.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace helm::kernel {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

json optional_time(const std::optional<util::Timestamp>& t) {
    return t ? json(util::to_unix_seconds(*t)) : json(nullptr);
}

// A dimension is spent once usage reaches its limit; a zero limit allows nothing
template <typename T>
bool exhausted(T usage, T limit) {
    return usage >= limit;
}

} // namespace

// ============================================================================
// State and priority
// ============================================================================

const char* process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::NEW:        return "NEW";
        case ProcessState::READY:      return "READY";
        case ProcessState::RUNNING:    return "RUNNING";
        case ProcessState::WAITING:    return "WAITING";
        case ProcessState::BLOCKED:    return "BLOCKED";
        case ProcessState::TERMINATED: return "TERMINATED";
        case ProcessState::ZOMBIE:     return "ZOMBIE";
    }
    return "NEW";
}

std::optional<ProcessState> process_state_from_string(const std::string& s) {
    static const ProcessState all[] = {
        ProcessState::NEW, ProcessState::READY, ProcessState::RUNNING,
        ProcessState::WAITING, ProcessState::BLOCKED, ProcessState::TERMINATED,
        ProcessState::ZOMBIE};
    auto upper = to_upper(s);
    for (auto state : all) {
        if (upper == process_state_to_string(state)) {
            return state;
        }
    }
    return std::nullopt;
}

bool can_transition(ProcessState from, ProcessState to) {
    switch (from) {
        case ProcessState::NEW:
            return to == ProcessState::READY || to == ProcessState::TERMINATED;
        case ProcessState::READY:
            return to == ProcessState::RUNNING || to == ProcessState::TERMINATED;
        case ProcessState::RUNNING:
            return to == ProcessState::READY || to == ProcessState::WAITING ||
                   to == ProcessState::BLOCKED || to == ProcessState::TERMINATED;
        case ProcessState::WAITING:
        case ProcessState::BLOCKED:
            return to == ProcessState::READY || to == ProcessState::TERMINATED;
        case ProcessState::TERMINATED:
            return to == ProcessState::ZOMBIE;
        case ProcessState::ZOMBIE:
            return false;
    }
    return false;
}

const char* priority_to_string(SchedulingPriority priority) {
    switch (priority) {
        case SchedulingPriority::REALTIME: return "REALTIME";
        case SchedulingPriority::HIGH:     return "HIGH";
        case SchedulingPriority::NORMAL:   return "NORMAL";
        case SchedulingPriority::LOW:      return "LOW";
        case SchedulingPriority::IDLE:     return "IDLE";
    }
    return "NORMAL";
}

std::optional<SchedulingPriority> priority_from_string(const std::string& s) {
    static const SchedulingPriority all[] = {
        SchedulingPriority::REALTIME, SchedulingPriority::HIGH, SchedulingPriority::NORMAL,
        SchedulingPriority::LOW, SchedulingPriority::IDLE};
    auto upper = to_upper(s);
    for (auto priority : all) {
        if (upper == priority_to_string(priority)) {
            return priority;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Quota and usage
// ============================================================================

void ResourceQuota::merge_overrides(const ResourceQuota& o) {
    if (o.max_llm_calls > 0) max_llm_calls = o.max_llm_calls;
    if (o.max_tool_calls > 0) max_tool_calls = o.max_tool_calls;
    if (o.max_agent_hops > 0) max_agent_hops = o.max_agent_hops;
    if (o.max_iterations > 0) max_iterations = o.max_iterations;
    if (o.timeout_seconds > 0) timeout_seconds = o.timeout_seconds;
    if (o.soft_timeout_seconds > 0) soft_timeout_seconds = o.soft_timeout_seconds;
    if (o.max_input_tokens > 0) max_input_tokens = o.max_input_tokens;
    if (o.max_output_tokens > 0) max_output_tokens = o.max_output_tokens;
    if (o.max_context_tokens > 0) max_context_tokens = o.max_context_tokens;
    if (o.rate_limit_rpm > 0) rate_limit_rpm = o.rate_limit_rpm;
    if (o.rate_limit_rph > 0) rate_limit_rph = o.rate_limit_rph;
    if (o.rate_limit_burst > 0) rate_limit_burst = o.rate_limit_burst;
    if (o.max_inference_requests > 0) max_inference_requests = o.max_inference_requests;
    if (o.max_inference_input_chars > 0) max_inference_input_chars = o.max_inference_input_chars;
}

std::optional<QuotaViolation> ResourceUsage::exceeds_quota(const ResourceQuota& quota) const {
    auto violation = [](const char* dimension, double usage, double limit) {
        return QuotaViolation{dimension, usage, limit,
            fmt::format("{} {} >= {}", dimension, usage, limit)};
    };

    if (exhausted(llm_calls, quota.max_llm_calls)) {
        return violation("llm_calls", llm_calls, quota.max_llm_calls);
    }
    if (exhausted(tool_calls, quota.max_tool_calls)) {
        return violation("tool_calls", tool_calls, quota.max_tool_calls);
    }
    if (exhausted(agent_hops, quota.max_agent_hops)) {
        return violation("agent_hops", agent_hops, quota.max_agent_hops);
    }
    if (exhausted(iterations, quota.max_iterations)) {
        return violation("iterations", iterations, quota.max_iterations);
    }
    if (exhausted(tokens_in, quota.max_input_tokens)) {
        return violation("tokens_in", static_cast<double>(tokens_in),
                         static_cast<double>(quota.max_input_tokens));
    }
    if (exhausted(tokens_out, quota.max_output_tokens)) {
        return violation("tokens_out", static_cast<double>(tokens_out),
                         static_cast<double>(quota.max_output_tokens));
    }
    if (exhausted(elapsed_seconds, static_cast<double>(quota.timeout_seconds))) {
        return violation("elapsed_seconds", elapsed_seconds, quota.timeout_seconds);
    }
    if (exhausted(inference_requests, quota.max_inference_requests)) {
        return violation("inference_requests", inference_requests, quota.max_inference_requests);
    }
    if (exhausted(inference_input_chars, quota.max_inference_input_chars)) {
        return violation("inference_input_chars", static_cast<double>(inference_input_chars),
                         static_cast<double>(quota.max_inference_input_chars));
    }
    return std::nullopt;
}

RemainingBudget remaining_budget(const ResourceQuota& quota, const ResourceUsage& usage) {
    RemainingBudget budget;
    budget.llm_calls = std::max(0, quota.max_llm_calls - usage.llm_calls);
    budget.tool_calls = std::max(0, quota.max_tool_calls - usage.tool_calls);
    budget.agent_hops = std::max(0, quota.max_agent_hops - usage.agent_hops);
    budget.iterations = std::max(0, quota.max_iterations - usage.iterations);
    budget.tokens_in = std::max<int64_t>(0, quota.max_input_tokens - usage.tokens_in);
    budget.tokens_out = std::max<int64_t>(0, quota.max_output_tokens - usage.tokens_out);
    budget.time_seconds = std::max(0.0, quota.timeout_seconds - usage.elapsed_seconds);
    return budget;
}

// ============================================================================
// Process Control Block
// ============================================================================

ProcessControlBlock::ProcessControlBlock(ProcessId pid_, RequestId request_id_,
                                         UserId user_id_, SessionId session_id_)
    : pid(std::move(pid_)),
      request_id(std::move(request_id_)),
      user_id(std::move(user_id_)),
      session_id(std::move(session_id_)),
      created_at(util::now()) {}

void ProcessControlBlock::start(util::Timestamp now) {
    if (!started_at) {
        started_at = now;
    }
    last_scheduled_at = now;
}

void ProcessControlBlock::complete(util::Timestamp now) {
    refresh_elapsed(now);
    completed_at = now;
}

void ProcessControlBlock::block(const std::string& reason) {
    interrupt_data["block_reason"] = reason;
}

void ProcessControlBlock::wait(InterruptKind kind) {
    pending_interrupt = kind;
}

void ProcessControlBlock::resume() {
    pending_interrupt.reset();
    interrupt_data = json::object();
}

void ProcessControlBlock::refresh_elapsed(util::Timestamp now) {
    if (started_at && !completed_at) {
        usage.elapsed_seconds = std::max(0.0, util::seconds_between(*started_at, now));
    }
}

// ============================================================================
// JSON views
// ============================================================================

json quota_to_json(const ResourceQuota& q) {
    return json{
        {"max_llm_calls", q.max_llm_calls},
        {"max_tool_calls", q.max_tool_calls},
        {"max_agent_hops", q.max_agent_hops},
        {"max_iterations", q.max_iterations},
        {"timeout_seconds", q.timeout_seconds},
        {"soft_timeout_seconds", q.soft_timeout_seconds},
        {"max_input_tokens", q.max_input_tokens},
        {"max_output_tokens", q.max_output_tokens},
        {"max_context_tokens", q.max_context_tokens},
        {"rate_limit_rpm", q.rate_limit_rpm},
        {"rate_limit_rph", q.rate_limit_rph},
        {"rate_limit_burst", q.rate_limit_burst},
        {"max_inference_requests", q.max_inference_requests},
        {"max_inference_input_chars", q.max_inference_input_chars}
    };
}

ResourceQuota quota_from_json(const json& j, const ResourceQuota& base) {
    if (!j.is_object()) {
        throw validation_error("quota must be an object");
    }
    ResourceQuota q = base;
    q.max_llm_calls = j.value("max_llm_calls", q.max_llm_calls);
    q.max_tool_calls = j.value("max_tool_calls", q.max_tool_calls);
    q.max_agent_hops = j.value("max_agent_hops", q.max_agent_hops);
    q.max_iterations = j.value("max_iterations", q.max_iterations);
    q.timeout_seconds = j.value("timeout_seconds", q.timeout_seconds);
    q.soft_timeout_seconds = j.value("soft_timeout_seconds", q.soft_timeout_seconds);
    q.max_input_tokens = j.value("max_input_tokens", q.max_input_tokens);
    q.max_output_tokens = j.value("max_output_tokens", q.max_output_tokens);
    q.max_context_tokens = j.value("max_context_tokens", q.max_context_tokens);
    q.rate_limit_rpm = j.value("rate_limit_rpm", q.rate_limit_rpm);
    q.rate_limit_rph = j.value("rate_limit_rph", q.rate_limit_rph);
    q.rate_limit_burst = j.value("rate_limit_burst", q.rate_limit_burst);
    q.max_inference_requests = j.value("max_inference_requests", q.max_inference_requests);
    q.max_inference_input_chars = j.value("max_inference_input_chars", q.max_inference_input_chars);

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_number() && it.value().get<double>() < 0) {
            throw validation_error("quota " + it.key() + " must not be negative");
        }
    }
    return q;
}

json usage_to_json(const ResourceUsage& u) {
    return json{
        {"llm_calls", u.llm_calls},
        {"tool_calls", u.tool_calls},
        {"agent_hops", u.agent_hops},
        {"iterations", u.iterations},
        {"tokens_in", u.tokens_in},
        {"tokens_out", u.tokens_out},
        {"elapsed_seconds", u.elapsed_seconds},
        {"inference_requests", u.inference_requests},
        {"inference_input_chars", u.inference_input_chars}
    };
}

json budget_to_json(const RemainingBudget& b) {
    return json{
        {"llm_calls", b.llm_calls},
        {"tool_calls", b.tool_calls},
        {"agent_hops", b.agent_hops},
        {"iterations", b.iterations},
        {"tokens_in", b.tokens_in},
        {"tokens_out", b.tokens_out},
        {"time_seconds", b.time_seconds}
    };
}

json pcb_to_json(const ProcessControlBlock& pcb) {
    json j;
    j["pid"] = pcb.pid.str();
    j["request_id"] = pcb.request_id.str();
    j["user_id"] = pcb.user_id.str();
    j["session_id"] = pcb.session_id.str();
    j["state"] = process_state_to_string(pcb.state);
    j["priority"] = priority_to_string(pcb.priority);
    j["quota"] = quota_to_json(pcb.quota);
    j["usage"] = usage_to_json(pcb.usage);
    j["created_at"] = util::to_unix_seconds(pcb.created_at);
    j["started_at"] = optional_time(pcb.started_at);
    j["completed_at"] = optional_time(pcb.completed_at);
    j["last_scheduled_at"] = optional_time(pcb.last_scheduled_at);
    j["current_stage"] = pcb.current_stage ? json(*pcb.current_stage) : json(nullptr);
    j["pending_interrupt"] = pcb.pending_interrupt
        ? json(interrupt_kind_to_string(*pcb.pending_interrupt)) : json(nullptr);
    j["interrupt_data"] = pcb.interrupt_data;
    j["parent_pid"] = pcb.parent_pid ? json(pcb.parent_pid->str()) : json(nullptr);
    json children = json::array();
    for (const auto& child : pcb.child_pids) {
        children.push_back(child.str());
    }
    j["child_pids"] = children;
    return j;
}

} // namespace helm::kernel
