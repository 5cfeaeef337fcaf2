#include "kernel/orchestrator.hpp"
#include "kernel/error.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::kernel {

const char* instruction_kind_to_string(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::EXECUTE:   return "EXECUTE";
        case InstructionKind::WAIT:      return "WAIT";
        case InstructionKind::TERMINATE: return "TERMINATE";
    }
    return "EXECUTE";
}

const char* session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::INITIALIZED: return "INITIALIZED";
        case SessionStatus::RUNNING:     return "RUNNING";
        case SessionStatus::WAITING:     return "WAITING";
        case SessionStatus::TERMINATED:  return "TERMINATED";
    }
    return "INITIALIZED";
}

json Instruction::to_json() const {
    json j;
    j["kind"] = instruction_kind_to_string(kind);
    j["agent_name"] = agent_name;
    j["parallel_agents"] = parallel_agents;
    j["terminal_reason"] = terminal_reason
        ? json(terminal_reason_to_string(*terminal_reason)) : json(nullptr);
    j["message"] = message;
    j["interrupt"] = interrupt ? interrupt_to_json(*interrupt) : json(nullptr);
    return j;
}

json SessionState::to_json() const {
    json j;
    j["pid"] = pid;
    j["pipeline"] = pipeline;
    j["status"] = session_status_to_string(status);
    j["current_stage"] = current_stage;
    j["iteration"] = iteration;
    j["llm_call_count"] = llm_call_count;
    j["agent_hop_count"] = agent_hop_count;
    j["terminated"] = terminated;
    j["terminal_reason"] = terminal_reason
        ? json(terminal_reason_to_string(*terminal_reason)) : json(nullptr);
    j["edge_traversals"] = edge_traversals;
    j["created_at"] = util::to_unix_seconds(created_at);
    j["last_activity_at"] = util::to_unix_seconds(last_activity_at);
    return j;
}

// ============================================================================
// Sessions
// ============================================================================

SessionState Orchestrator::initialize_session(const std::string& pid, PipelineConfig config,
                                              Envelope& envelope, bool force, util::Timestamp now) {
    if (sessions_.count(pid) > 0) {
        if (!force) {
            throw validation_error("session already exists for process " + pid);
        }
        spdlog::warn("Replacing orchestration session for process {}", pid);
    }

    config.validate();
    envelope.ensure_mutable();

    envelope.max_iterations = config.max_iterations;
    envelope.max_llm_calls = config.max_llm_calls;
    envelope.max_agent_hops = config.max_agent_hops;
    envelope.stage_order = config.stage_order();
    if (!config.has_stage(envelope.current_stage)) {
        envelope.current_stage = config.stages.front().name;
    }

    Session session;
    session.pid = pid;
    session.config = std::move(config);
    session.created_at = now;
    session.last_activity_at = now;
    sessions_[pid] = std::move(session);

    const auto& stored = sessions_[pid];
    spdlog::info("Orchestration session initialized: pid={} pipeline={} stages={} first={}",
        pid, stored.config.name, stored.config.stages.size(), envelope.current_stage);
    return build_state(stored, envelope);
}

Instruction Orchestrator::get_next_instruction(const std::string& pid, Envelope& envelope,
                                               util::Timestamp now) {
    auto& session = require(pid);
    session.last_activity_at = now;

    if (session.status == SessionStatus::TERMINATED || envelope.terminated) {
        session.status = SessionStatus::TERMINATED;
        if (!session.terminal_reason) {
            session.terminal_reason = envelope.terminal_reason;
        }
        Instruction instruction;
        instruction.kind = InstructionKind::TERMINATE;
        instruction.terminal_reason = session.terminal_reason;
        instruction.message = envelope.termination_message;
        return instruction;
    }

    if (envelope.current_stage == kEndStage) {
        return terminate(session, envelope, TerminalReason::COMPLETED, "Pipeline completed");
    }

    if (envelope.interrupt_pending) {
        session.status = SessionStatus::WAITING;
        Instruction instruction;
        instruction.kind = InstructionKind::WAIT;
        instruction.interrupt = envelope.interrupt;
        instruction.message = "Waiting for interrupt resolution";
        return instruction;
    }

    if (auto reason = envelope.bounds_violation()) {
        return terminate(session, envelope, *reason, terminal_reason_to_string(*reason));
    }

    if (session.pending_failure) {
        auto failure = *session.pending_failure;
        session.pending_failure.reset();

        const auto* failed = session.config.get_stage(failure.stage);
        if (failed && !failed->error_next.empty()) {
            spdlog::info("Process {}: stage {} failed, routing to {}",
                pid, failure.stage, failed->error_next);
            envelope.current_stage = failed->error_next;
            return get_next_instruction(pid, envelope, now);
        }
        return terminate(session, envelope, TerminalReason::TOOL_FAILED_FATALLY, failure.error);
    }

    const auto* stage = session.config.get_stage(envelope.current_stage);
    if (!stage) {
        return terminate(session, envelope, TerminalReason::TOOL_FAILED_FATALLY,
                         "unknown stage: " + envelope.current_stage);
    }

    Instruction instruction;
    instruction.kind = InstructionKind::EXECUTE;
    instruction.agent_name = stage->name;

    // Asking again before a result arrives hands out the same work
    if (!envelope.is_stage_active(stage->name)) {
        envelope.start_stage(stage->name);
        envelope.add_processing_record(stage->name, stage->stage_order);
    }
    for (const auto& sibling_name : stage->runs_with) {
        const auto* sibling = session.config.get_stage(sibling_name);
        if (!envelope.is_stage_active(sibling_name)) {
            envelope.start_stage(sibling_name);
            envelope.add_processing_record(sibling_name, sibling ? sibling->stage_order : 0);
        }
        instruction.parallel_agents.push_back(sibling_name);
    }
    envelope.parallel_mode = !stage->runs_with.empty();

    session.status = SessionStatus::RUNNING;
    spdlog::debug("Process {}: execute {}", pid, stage->name);
    return instruction;
}

SessionState Orchestrator::report_agent_result(const std::string& pid, Envelope& envelope,
                                               const AgentExecutionMetrics& metrics,
                                               const AgentResult& result, util::Timestamp now) {
    auto& session = require(pid);

    if (metrics.llm_calls < 0 || metrics.tool_calls < 0 || metrics.tokens_in < 0 ||
        metrics.tokens_out < 0 || metrics.duration_ms < 0) {
        throw validation_error("agent metrics must be non-negative");
    }

    if (session.status == SessionStatus::TERMINATED || envelope.terminated) {
        spdlog::debug("Process {}: ignoring result for terminated session", pid);
        return build_state(session, envelope);
    }

    const std::string agent = result.agent_name.empty() ? envelope.current_stage : result.agent_name;
    const auto* stage = session.config.get_stage(agent);
    if (!stage) {
        throw validation_error("unknown agent for pipeline " + session.config.name + ": " + agent);
    }
    if (!result.output.is_null() && !result.output.is_object()) {
        throw validation_error("agent output must be an object");
    }

    session.last_activity_at = now;

    envelope.merge_output(stage->output_key, result.output);
    if (result.metadata.is_object()) {
        for (auto it = result.metadata.begin(); it != result.metadata.end(); ++it) {
            envelope.metadata[it.key()] = it.value();
        }
    }
    envelope.increment_llm_calls(metrics.llm_calls);
    envelope.increment_tool_calls(metrics.tool_calls);
    envelope.add_tokens(metrics.tokens_in, metrics.tokens_out);
    envelope.increment_agent_hops(1);

    if (!result.success) {
        std::string error = result.error.empty() ? "agent failed" : result.error;
        envelope.finish_processing_record(agent, "error", error, metrics.llm_calls);
        envelope.set_output(stage->output_key, "error", error);
        envelope.metadata["last_error"] = json{{"agent", agent}, {"error", error}};
        envelope.add_error(agent, error);
        envelope.fail_stage(agent, error);
        if (agent == envelope.current_stage) {
            session.pending_failure = PendingFailure{agent, error};
        }
        spdlog::warn("Process {}: agent {} failed: {}", pid, agent, error);
        return build_state(session, envelope);
    }

    envelope.finish_processing_record(agent, "success", std::nullopt, metrics.llm_calls);
    envelope.complete_stage(agent);

    // Results from parallel siblings never move the cursor
    if (agent != envelope.current_stage) {
        return build_state(session, envelope);
    }

    std::string to = evaluate_routing(session.config, *stage, result.output);
    if (to != kEndStage) {
        std::string edge = agent + "->" + to;
        int traversals = ++session.edge_traversals[edge];

        if (session.config.stage_index(to) <= session.config.stage_index(agent)) {
            envelope.iteration++;
            spdlog::info("Process {}: loop {} (iteration {})", pid, edge, envelope.iteration);
        }

        auto limit = session.config.edge_limits.find(edge);
        if (limit != session.config.edge_limits.end() && traversals > limit->second) {
            terminate(session, envelope, TerminalReason::MAX_ITERATIONS_EXCEEDED,
                      "edge limit exceeded: " + edge);
            return build_state(session, envelope);
        }
    }

    envelope.current_stage = to;
    envelope.parallel_mode = false;
    spdlog::debug("Process {}: {} -> {}", pid, agent, to);
    return build_state(session, envelope);
}

SessionState Orchestrator::get_session_state(const std::string& pid, const Envelope& envelope) const {
    return build_state(require(pid), envelope);
}

const PipelineConfig* Orchestrator::pipeline_for(const std::string& pid) const {
    auto it = sessions_.find(pid);
    return it == sessions_.end() ? nullptr : &it->second.config;
}

bool Orchestrator::cleanup_session(const std::string& pid) {
    return sessions_.erase(pid) > 0;
}

std::vector<std::string> Orchestrator::cleanup_stale_sessions(std::chrono::seconds retention,
                                                              util::Timestamp now) {
    auto cutoff = now - retention;
    std::vector<std::string> removed;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.last_activity_at < cutoff) {
            removed.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    if (!removed.empty()) {
        spdlog::info("Removed {} stale orchestration sessions", removed.size());
    }
    return removed;
}

// ============================================================================
// Internals
// ============================================================================

Orchestrator::Session& Orchestrator::require(const std::string& pid) {
    auto it = sessions_.find(pid);
    if (it == sessions_.end()) {
        throw not_found_error("orchestration session", pid);
    }
    return it->second;
}

const Orchestrator::Session& Orchestrator::require(const std::string& pid) const {
    auto it = sessions_.find(pid);
    if (it == sessions_.end()) {
        throw not_found_error("orchestration session", pid);
    }
    return it->second;
}

Instruction Orchestrator::terminate(Session& session, Envelope& envelope, TerminalReason reason,
                                    const std::string& message) {
    envelope.terminate(reason, message);
    session.status = SessionStatus::TERMINATED;
    session.terminal_reason = envelope.terminal_reason;
    session.pending_failure.reset();

    spdlog::info("Process {} terminated: {} ({})", session.pid,
        terminal_reason_to_string(*session.terminal_reason), envelope.termination_message);

    Instruction instruction;
    instruction.kind = InstructionKind::TERMINATE;
    instruction.terminal_reason = session.terminal_reason;
    instruction.message = envelope.termination_message;
    return instruction;
}

std::string Orchestrator::evaluate_routing(const PipelineConfig& config, const StageConfig& stage,
                                           const json& output) const {
    if (output.is_object()) {
        for (const auto& rule : stage.routing_rules) {
            auto it = output.find(rule.condition);
            if (it != output.end() && values_match(*it, rule.value)) {
                return rule.target;
            }
        }
    }
    if (!stage.default_next.empty()) {
        return stage.default_next;
    }
    // Without explicit routing the pipeline runs in stage order
    return config.next_in_order(stage.name);
}

bool Orchestrator::values_match(const json& actual, const json& expected) {
    if (actual.is_string() && expected.is_string()) {
        return actual.get<std::string>() == expected.get<std::string>();
    }
    if (actual.is_boolean() && expected.is_boolean()) {
        return actual.get<bool>() == expected.get<bool>();
    }
    if (actual.is_number() && expected.is_number()) {
        return actual.get<double>() == expected.get<double>();
    }
    return actual == expected;
}

SessionState Orchestrator::build_state(const Session& session, const Envelope& envelope) const {
    SessionState state;
    state.pid = session.pid;
    state.pipeline = session.config.name;
    state.status = session.status;
    state.current_stage = envelope.current_stage;
    state.iteration = envelope.iteration;
    state.llm_call_count = envelope.llm_call_count;
    state.agent_hop_count = envelope.agent_hop_count;
    state.terminated = session.status == SessionStatus::TERMINATED || envelope.terminated;
    state.terminal_reason = session.terminal_reason ? session.terminal_reason : envelope.terminal_reason;
    state.edge_traversals = session.edge_traversals;
    state.created_at = session.created_at;
    state.last_activity_at = session.last_activity_at;
    return state;
}

} // namespace helm::kernel
