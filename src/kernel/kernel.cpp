#include "kernel/kernel.hpp"
#include "kernel/lifecycle.hpp"
#include "util/ids.hpp"
#include "util/saturating.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::kernel {

json SystemStatus::to_json() const {
    json by_state = json::object();
    for (const auto& [state, count] : processes_by_state) {
        by_state[process_state_to_string(state)] = count;
    }
    return json{
        {"total_processes", total_processes},
        {"processes_by_state", by_state},
        {"ready_queue", ready_queue},
        {"envelopes", envelopes},
        {"sessions", sessions},
        {"interrupts", interrupt_stats_to_json(interrupts)},
        {"rate_limited_users", rate_limited_users},
        {"tracked_users", tracked_users},
        {"usage_totals", {
            {"llm_calls", usage_totals.llm_calls},
            {"tool_calls", usage_totals.tool_calls},
            {"tokens_in", usage_totals.tokens_in},
            {"tokens_out", usage_totals.tokens_out}
        }}
    };
}

Kernel::Kernel()
    : Kernel(Config{}) {}

Kernel::Kernel(const Config& config)
    : Kernel(config, Dependencies{}) {}

Kernel::Kernel(const Config& config, Dependencies deps)
    : config_(config)
{
    lifecycle_ = std::move(deps.lifecycle);
    resources_ = std::move(deps.resources);
    rate_limiter_ = std::move(deps.rate_limiter);
    interrupts_ = std::move(deps.interrupts);
    orchestrator_ = std::move(deps.orchestrator);

    if (!lifecycle_) {
        lifecycle_ = std::make_unique<LifecycleManager>(config_.default_quota);
    }
    if (!resources_) {
        resources_ = std::make_unique<ResourceTracker>();
    }
    if (!rate_limiter_) {
        rate_limiter_ = std::make_unique<RateLimiter>(config_.rate_limit);
    }
    if (!interrupts_) {
        interrupts_ = std::make_unique<InterruptService>();
    }
    if (!orchestrator_) {
        orchestrator_ = std::make_unique<Orchestrator>();
    }
}

Kernel::~Kernel() = default;

// ============================================================================
// Processes
// ============================================================================

ProcessControlBlock Kernel::create_process(const CreateProcessRequest& request) {
    return locked("create_process", [&]() {
        if (request.pid.empty()) {
            throw validation_error("pid is required");
        }
        if (auto* existing = lifecycle_->get(request.pid)) {
            return *existing;
        }

        std::string user = request.user_id.empty() ? "anonymous" : request.user_id;
        SubmitRequest submit{
            ProcessId(request.pid),
            RequestId(request.request_id.empty() ? util::generate_id("req_") : request.request_id),
            UserId(user),
            SessionId(request.session_id.empty() ? util::generate_id("sess_") : request.session_id),
            request.priority,
            request.quota,
            request.parent_pid ? std::optional<ProcessId>(ProcessId(*request.parent_pid)) : std::nullopt
        };

        rate_limiter_->check_rate_limit(user);

        lifecycle_->submit(submit);
        return lifecycle_->schedule(request.pid);
    });
}

ProcessControlBlock Kernel::get_process(const std::string& pid) {
    return locked("get_process", [&]() {
        auto& pcb = lifecycle_->require(pid);
        pcb.refresh_elapsed(util::now());
        return pcb;
    });
}

ProcessControlBlock Kernel::schedule_process(const std::string& pid) {
    return locked("schedule_process", [&]() { return lifecycle_->schedule(pid); });
}

std::optional<ProcessControlBlock> Kernel::get_next_runnable() {
    return locked("get_next_runnable", [&]() -> std::optional<ProcessControlBlock> {
        auto* pcb = lifecycle_->get_next_runnable();
        if (!pcb) {
            return std::nullopt;
        }
        return *pcb;
    });
}

ProcessControlBlock Kernel::start_process(const std::string& pid) {
    return locked("start_process", [&]() { return lifecycle_->start(pid); });
}

ProcessControlBlock Kernel::block_process(const std::string& pid, const std::string& reason) {
    return locked("block_process", [&]() { return lifecycle_->block(pid, reason); });
}

ProcessControlBlock Kernel::wait_process(const std::string& pid, InterruptKind kind) {
    return locked("wait_process", [&]() {
        ensure_no_pending_interrupt(pid);
        auto& pcb = lifecycle_->wait(pid, kind);
        auto* env = find_envelope(pid);

        CreateInterruptParams params;
        params.kind = kind;
        params.process_id = pid;
        params.request_id = pcb.request_id.str();
        params.user_id = pcb.user_id.str();
        params.session_id = pcb.session_id.str();
        if (env) {
            params.envelope_id = env->envelope_id;
        }
        auto& interrupt = interrupts_->create(params);

        if (env && !env->terminated) {
            env->set_interrupt(interrupt.flow);
        }
        return pcb;
    });
}

ProcessControlBlock Kernel::resume_process(const std::string& pid) {
    return locked("resume_process", [&]() {
        auto& pcb = lifecycle_->resume(pid);
        cancel_linked_interrupt(pid, "Process resumed");
        auto* env = find_envelope(pid);
        if (env && !env->terminated) {
            env->clear_interrupt();
        }
        return pcb;
    });
}

ProcessControlBlock Kernel::preempt_process(const std::string& pid) {
    return locked("preempt_process", [&]() { return lifecycle_->preempt(pid); });
}

ProcessControlBlock Kernel::transition_state(const std::string& pid, ProcessState target,
                                             const std::string& reason) {
    return locked("transition_state", [&]() {
        auto& pcb = lifecycle_->transition(pid, target, reason);
        if (target == ProcessState::READY || target == ProcessState::TERMINATED) {
            cancel_linked_interrupt(pid, reason.empty() ? "Process left the wait" : reason);
        }
        auto* env = find_envelope(pid);
        if (env && !env->terminated) {
            if (target == ProcessState::TERMINATED) {
                env->terminate(TerminalReason::USER_CANCELLED,
                               reason.empty() ? "Process terminated" : reason);
            } else if (target == ProcessState::READY) {
                env->clear_interrupt();
            }
        }
        return pcb;
    });
}

ProcessControlBlock Kernel::terminate_process(const std::string& pid, const std::string& reason) {
    return locked("terminate_process", [&]() {
        auto& pcb = lifecycle_->terminate(pid);
        cancel_linked_interrupt(pid, reason);
        auto* env = find_envelope(pid);
        if (env) {
            env->terminate(TerminalReason::USER_CANCELLED, reason);
        }
        return pcb;
    });
}

ProcessControlBlock Kernel::cleanup_process(const std::string& pid) {
    return locked("cleanup_process", [&]() { return lifecycle_->cleanup(pid); });
}

bool Kernel::remove_process(const std::string& pid) {
    return locked("remove_process", [&]() {
        if (!lifecycle_->get(pid)) {
            return false;
        }
        drop_process(pid);
        return true;
    });
}

std::vector<ProcessControlBlock> Kernel::list_processes(std::optional<ProcessState> state,
                                                        const std::optional<std::string>& user_id) {
    return locked("list_processes", [&]() {
        std::vector<ProcessControlBlock> result;
        auto now = util::now();
        for (auto* pcb : lifecycle_->list(state)) {
            if (user_id && pcb->user_id.str() != *user_id) {
                continue;
            }
            pcb->refresh_elapsed(now);
            result.push_back(*pcb);
        }
        return result;
    });
}

std::map<ProcessState, size_t> Kernel::process_counts() {
    return locked("process_counts", [&]() { return lifecycle_->count_by_state(); });
}

// ============================================================================
// Quota, usage and rate limits
// ============================================================================

QuotaCheck Kernel::check_quota(const std::string& pid) {
    return locked("check_quota", [&]() {
        auto& pcb = lifecycle_->require(pid);
        QuotaCheck check;
        check.violation = resources_->check_quota(pcb);
        check.within_bounds = !check.violation.has_value();
        check.usage = pcb.usage;
        check.quota = pcb.quota;
        return check;
    });
}

ResourceUsage Kernel::record_usage(const std::string& pid, const UsageDelta& delta) {
    return locked("record_usage", [&]() {
        if (delta.llm_calls < 0 || delta.tool_calls < 0 || delta.agent_hops < 0 ||
            delta.iterations < 0 || delta.tokens_in < 0 || delta.tokens_out < 0 ||
            delta.inference_requests < 0 || delta.inference_input_chars < 0) {
            throw validation_error("usage deltas must be non-negative");
        }

        auto& pcb = lifecycle_->require(pid);
        if (is_terminal(pcb.state)) {
            throw transition_error("cannot record usage for process " + pid + " in state " +
                                   process_state_to_string(pcb.state));
        }

        auto& usage = pcb.usage;
        util::add_saturating(usage.llm_calls, delta.llm_calls);
        util::add_saturating(usage.tool_calls, delta.tool_calls);
        util::add_saturating(usage.agent_hops, delta.agent_hops);
        util::add_saturating(usage.iterations, delta.iterations);
        util::add_saturating(usage.tokens_in, delta.tokens_in);
        util::add_saturating(usage.tokens_out, delta.tokens_out);
        util::add_saturating(usage.inference_requests, delta.inference_requests);
        util::add_saturating(usage.inference_input_chars, delta.inference_input_chars);
        pcb.refresh_elapsed(util::now());

        resources_->record_usage(pcb.user_id.str(), delta.llm_calls, delta.tool_calls,
                                 delta.tokens_in, delta.tokens_out);
        return usage;
    });
}

ResourceUsage Kernel::record_tool_call(const std::string& pid) {
    UsageDelta delta;
    delta.tool_calls = 1;
    return record_usage(pid, delta);
}

ResourceUsage Kernel::record_agent_hop(const std::string& pid) {
    UsageDelta delta;
    delta.agent_hops = 1;
    return record_usage(pid, delta);
}

RemainingBudget Kernel::get_remaining_budget(const std::string& pid) {
    return locked("get_remaining_budget", [&]() {
        auto& pcb = lifecycle_->require(pid);
        pcb.refresh_elapsed(util::now());
        return remaining_budget(pcb.quota, pcb.usage);
    });
}

std::optional<UserUsage> Kernel::get_user_usage(const std::string& user_id) {
    return locked("get_user_usage", [&]() -> std::optional<UserUsage> {
        const auto* usage = resources_->get_user_usage(user_id);
        if (!usage) {
            return std::nullopt;
        }
        return *usage;
    });
}

ResourceQuota Kernel::default_quota() {
    return locked("default_quota", [&]() { return lifecycle_->default_quota(); });
}

void Kernel::set_default_quota(const ResourceQuota& overrides) {
    locked("set_default_quota", [&]() { lifecycle_->set_default_quota(overrides); });
}

RateLimitResult Kernel::check_rate_limit(const std::string& user_id, bool record) {
    return locked("check_rate_limit", [&]() {
        if (user_id.empty()) {
            throw validation_error("user_id is required");
        }
        return rate_limiter_->check_and_record(user_id, record);
    });
}

void Kernel::set_user_rate_limits(const std::string& user_id, const RateLimitConfig& config) {
    locked("set_user_rate_limits", [&]() { rate_limiter_->set_user_limits(user_id, config); });
}

// ============================================================================
// Envelopes
// ============================================================================

Envelope Kernel::create_envelope(Envelope envelope, const std::optional<std::string>& pid) {
    return locked("create_envelope", [&]() {
        std::string key = envelope.envelope_id;
        if (pid) {
            if (pid->empty()) {
                throw validation_error("pid must not be empty");
            }
            key = *pid;
            if (const auto* pcb = lifecycle_->get(*pid)) {
                envelope.request_id = pcb->request_id.str();
                envelope.user_id = pcb->user_id.str();
                envelope.session_id = pcb->session_id.str();
            }
        }
        if (envelopes_.count(key) > 0) {
            throw validation_error("envelope already exists: " + key);
        }
        auto& stored = envelopes_.emplace(key, std::move(envelope)).first->second;
        spdlog::debug("Envelope created: key={} envelope_id={}", key, stored.envelope_id);
        return stored;
    });
}

Envelope Kernel::get_envelope(const std::string& key) {
    return locked("get_envelope", [&]() { return require_envelope(key); });
}

Envelope Kernel::update_envelope(const std::string& key, const json& update) {
    return locked("update_envelope", [&]() {
        if (!update.is_object()) {
            throw validation_error("envelope update must be an object");
        }
        auto& env = require_envelope(key);
        env.ensure_mutable();

        // Validate everything before touching the envelope
        if (update.contains("outputs") && !update["outputs"].is_object()) {
            throw validation_error("outputs must be an object");
        }
        if (update.contains("outputs")) {
            for (auto it = update["outputs"].begin(); it != update["outputs"].end(); ++it) {
                if (!it.value().is_object()) {
                    throw validation_error("outputs." + it.key() + " must be an object");
                }
            }
        }
        if (update.contains("metadata") && !update["metadata"].is_object()) {
            throw validation_error("metadata must be an object");
        }
        for (const char* field : {"raw_input", "current_stage"}) {
            if (update.contains(field) && !update[field].is_string()) {
                throw validation_error(std::string(field) + " must be a string");
            }
        }

        if (update.contains("raw_input")) {
            env.raw_input = update["raw_input"].get<std::string>();
        }
        if (update.contains("current_stage")) {
            env.current_stage = update["current_stage"].get<std::string>();
        }
        if (update.contains("outputs")) {
            for (auto it = update["outputs"].begin(); it != update["outputs"].end(); ++it) {
                env.merge_output(it.key(), it.value());
            }
        }
        if (update.contains("metadata")) {
            for (auto it = update["metadata"].begin(); it != update["metadata"].end(); ++it) {
                env.metadata[it.key()] = it.value();
            }
        }
        return env;
    });
}

BoundsCheck Kernel::check_bounds(const std::string& key) {
    return locked("check_bounds", [&]() {
        const auto& env = require_envelope(key);
        BoundsCheck check;
        check.terminal_reason = env.terminated ? env.terminal_reason : env.bounds_violation();
        check.can_continue = !env.terminated && !check.terminal_reason;
        check.llm_calls_remaining = std::max(0, env.max_llm_calls - env.llm_call_count);
        check.agent_hops_remaining = std::max(0, env.max_agent_hops - env.agent_hop_count);
        check.iterations_remaining = std::max(0, env.max_iterations - env.iteration);
        return check;
    });
}

Envelope Kernel::clone_envelope(const std::string& key, const std::optional<std::string>& new_key) {
    return locked("clone_envelope", [&]() {
        Envelope copy = require_envelope(key).clone();
        std::string target = new_key ? *new_key : copy.envelope_id;
        if (target.empty()) {
            throw validation_error("clone key must not be empty");
        }
        if (envelopes_.count(target) > 0) {
            throw validation_error("envelope already exists: " + target);
        }
        return envelopes_.emplace(target, std::move(copy)).first->second;
    });
}

bool Kernel::remove_envelope(const std::string& key) {
    return locked("remove_envelope", [&]() { return envelopes_.erase(key) > 0; });
}

// ============================================================================
// Interrupts
// ============================================================================

KernelInterrupt Kernel::create_interrupt(const CreateInterruptParams& params) {
    return locked("create_interrupt", [&]() {
        CreateInterruptParams resolved = params;
        ProcessControlBlock* pcb = nullptr;
        Envelope* env = nullptr;

        if (!params.process_id.empty()) {
            pcb = &lifecycle_->require(params.process_id);
            if (is_terminal(pcb->state)) {
                throw transition_error("process " + params.process_id + " is terminated");
            }
            ensure_no_pending_interrupt(params.process_id);
            env = find_envelope(params.process_id);
            if (env) {
                env->ensure_mutable();
            }
            if (resolved.request_id.empty()) resolved.request_id = pcb->request_id.str();
            if (resolved.user_id.empty()) resolved.user_id = pcb->user_id.str();
            if (resolved.session_id.empty()) resolved.session_id = pcb->session_id.str();
            if (resolved.envelope_id.empty() && env) resolved.envelope_id = env->envelope_id;
        }
        if (resolved.session_id.empty() && resolved.request_id.empty()) {
            throw validation_error("interrupt needs a session_id, request_id or process_id");
        }

        auto& interrupt = interrupts_->create(resolved);
        if (pcb && pcb->state == ProcessState::RUNNING) {
            lifecycle_->wait(params.process_id, interrupt.kind());
        }
        if (env) {
            env->set_interrupt(interrupt.flow);
        }
        return interrupt;
    });
}

bool Kernel::resolve_interrupt(const std::string& id, const InterruptResponse& response,
                               const std::optional<std::string>& user_id) {
    return locked("resolve_interrupt", [&]() {
        if (!interrupts_->resolve(id, response, user_id)) {
            return false;
        }
        const auto* interrupt = interrupts_->get(id);
        if (interrupt && !interrupt->process_id.empty()) {
            release_process(interrupt->process_id, id);
        }
        return true;
    });
}

bool Kernel::cancel_interrupt(const std::string& id, const std::string& reason) {
    return locked("cancel_interrupt", [&]() {
        if (!interrupts_->cancel(id, reason)) {
            return false;
        }
        const auto* interrupt = interrupts_->get(id);
        if (interrupt && !interrupt->process_id.empty()) {
            release_process(interrupt->process_id, id);
        }
        return true;
    });
}

KernelInterrupt Kernel::get_interrupt(const std::string& id) {
    return locked("get_interrupt", [&]() {
        const auto* interrupt = interrupts_->get(id);
        if (!interrupt) {
            throw not_found_error("interrupt", id);
        }
        return *interrupt;
    });
}

std::vector<KernelInterrupt> Kernel::get_pending_for_session(const std::string& session_id,
                                                             const std::set<InterruptKind>& kinds) {
    return locked("get_pending_for_session", [&]() {
        std::vector<KernelInterrupt> result;
        for (const auto* interrupt : interrupts_->get_pending_for_session(session_id, kinds)) {
            result.push_back(*interrupt);
        }
        return result;
    });
}

std::optional<KernelInterrupt> Kernel::get_pending_for_request(const std::string& request_id) {
    return locked("get_pending_for_request", [&]() -> std::optional<KernelInterrupt> {
        const auto* interrupt = interrupts_->get_pending_for_request(request_id);
        if (!interrupt) {
            return std::nullopt;
        }
        return *interrupt;
    });
}

// ============================================================================
// Orchestration
// ============================================================================

SessionState Kernel::initialize_orchestration(const std::string& pid, PipelineConfig config,
                                              const std::optional<Envelope>& envelope, bool force) {
    return locked("initialize_orchestration", [&]() {
        auto& env = begin_session(pid, std::move(config), envelope, force);
        return orchestrator_->get_session_state(pid, env);
    });
}

PipelineStart Kernel::execute_pipeline(const std::string& pid, PipelineConfig config,
                                       const std::optional<Envelope>& envelope, bool force) {
    return locked("execute_pipeline", [&]() {
        auto& env = begin_session(pid, std::move(config), envelope, force);

        PipelineStart start;
        start.instruction = orchestrator_->get_next_instruction(pid, env);
        sync_process_with_instruction(pid, start.instruction);
        start.state = orchestrator_->get_session_state(pid, env);
        return start;
    });
}

Instruction Kernel::get_next_instruction(const std::string& pid) {
    return locked("get_next_instruction", [&]() {
        auto& env = envelope_for_session(pid);
        auto instruction = orchestrator_->get_next_instruction(pid, env);
        sync_process_with_instruction(pid, instruction);
        return instruction;
    });
}

SessionState Kernel::report_agent_result(const std::string& pid, const AgentExecutionMetrics& metrics,
                                         const AgentResult& result) {
    return locked("report_agent_result", [&]() {
        auto& env = envelope_for_session(pid);
        bool was_terminated = orchestrator_->get_session_state(pid, env).terminated;

        auto state = orchestrator_->report_agent_result(pid, env, metrics, result);

        auto* pcb = lifecycle_->get(pid);
        if (!was_terminated && pcb && !is_terminal(pcb->state)) {
            auto& usage = pcb->usage;
            util::add_saturating(usage.llm_calls, metrics.llm_calls);
            util::add_saturating(usage.tool_calls, metrics.tool_calls);
            util::add_saturating(usage.tokens_in, metrics.tokens_in);
            util::add_saturating(usage.tokens_out, metrics.tokens_out);
            util::add_saturating(usage.agent_hops, 1);
            usage.iterations = std::max(usage.iterations, env.iteration);
            pcb->refresh_elapsed(util::now());
            resources_->record_usage(pcb->user_id.str(), metrics.llm_calls, metrics.tool_calls,
                                     metrics.tokens_in, metrics.tokens_out);
        }
        if (state.terminated && pcb && !is_terminal(pcb->state)) {
            lifecycle_->terminate(pid);
        }
        return state;
    });
}

SessionState Kernel::get_session_state(const std::string& pid) {
    return locked("get_session_state", [&]() {
        return orchestrator_->get_session_state(pid, envelope_for_session(pid));
    });
}

// ============================================================================
// Reclamation
// ============================================================================

size_t Kernel::cleanup_zombies(std::chrono::seconds retention, util::Timestamp now) {
    return locked("cleanup_zombies", [&]() {
        auto cutoff = now - retention;
        std::vector<std::string> expired;
        for (auto* pcb : lifecycle_->list()) {
            if (is_terminal(pcb->state) && pcb->completed_at && *pcb->completed_at < cutoff) {
                expired.push_back(pcb->pid.str());
            }
        }
        for (const auto& pid : expired) {
            auto* pcb = lifecycle_->get(pid);
            if (pcb && pcb->state == ProcessState::TERMINATED) {
                lifecycle_->cleanup(pid);
            }
            drop_process(pid);
        }
        if (!expired.empty()) {
            spdlog::info("Reclaimed {} finished processes", expired.size());
        }
        return expired.size();
    });
}

size_t Kernel::cleanup_stale_sessions(std::chrono::seconds retention, util::Timestamp now) {
    return locked("cleanup_stale_sessions", [&]() {
        auto removed = orchestrator_->cleanup_stale_sessions(retention, now);
        for (const auto& pid : removed) {
            envelopes_.erase(pid);
        }
        return removed.size();
    });
}

std::pair<size_t, size_t> Kernel::cleanup_interrupts(std::chrono::seconds retention, util::Timestamp now) {
    return locked("cleanup_interrupts", [&]() {
        std::vector<std::string> expired_ids;
        size_t expired = interrupts_->expire_pending(now, &expired_ids);

        // Nobody answered in time: the held process cannot continue
        for (const auto& id : expired_ids) {
            const auto* interrupt = interrupts_->get(id);
            if (!interrupt || interrupt->process_id.empty()) {
                continue;
            }
            const auto& pid = interrupt->process_id;
            auto* pcb = lifecycle_->get(pid);
            if (pcb && !is_terminal(pcb->state)) {
                lifecycle_->terminate(pid);
                spdlog::warn("Terminated process {}: interrupt {} expired", pid, id);
            }
            auto* env = find_envelope(pid);
            if (env && !env->terminated) {
                env->terminate(TerminalReason::USER_CANCELLED, "Interrupt " + id + " expired");
            }
        }

        size_t purged = interrupts_->cleanup_resolved(retention, now);
        return std::make_pair(expired, purged);
    });
}

std::pair<size_t, size_t> Kernel::cleanup_rate_limits_and_usage(size_t max_user_entries,
                                                                util::Timestamp now) {
    return locked("cleanup_rate_limits_and_usage", [&]() {
        size_t windows = rate_limiter_->cleanup_expired(now);

        std::set<std::string> active_users;
        for (auto* pcb : lifecycle_->list()) {
            if (!is_terminal(pcb->state)) {
                active_users.insert(pcb->user_id.str());
            }
        }
        size_t users = resources_->cleanup_stale_users(active_users, max_user_entries);
        return std::make_pair(windows, users);
    });
}

SystemStatus Kernel::system_status() {
    return locked("system_status", [&]() {
        SystemStatus status;
        status.total_processes = lifecycle_->count();
        status.processes_by_state = lifecycle_->count_by_state();
        status.ready_queue = lifecycle_->ready_queue_size();
        status.envelopes = envelopes_.size();
        status.sessions = orchestrator_->session_count();
        status.interrupts = interrupts_->stats();
        status.rate_limited_users = rate_limiter_->tracked_users();
        status.tracked_users = resources_->user_count();
        status.usage_totals = resources_->system_usage();
        return status;
    });
}

// ============================================================================
// Internals (called with the lock held)
// ============================================================================

Envelope& Kernel::require_envelope(const std::string& key) {
    auto* env = find_envelope(key);
    if (!env) {
        throw not_found_error("envelope", key);
    }
    return *env;
}

Envelope* Kernel::find_envelope(const std::string& key) {
    auto it = envelopes_.find(key);
    return it == envelopes_.end() ? nullptr : &it->second;
}

Envelope& Kernel::envelope_for_session(const std::string& pid) {
    if (!orchestrator_->has_session(pid)) {
        throw not_found_error("orchestration session", pid);
    }
    auto* env = find_envelope(pid);
    if (!env) {
        throw internal_error("orchestration session " + pid + " has no envelope");
    }
    return *env;
}

void Kernel::ensure_no_pending_interrupt(const std::string& pid) {
    if (const auto* pending = interrupts_->get_pending_for_process(pid)) {
        throw transition_error("process " + pid + " already has a pending interrupt: " + pending->id());
    }
}

void Kernel::cancel_linked_interrupt(const std::string& pid, const std::string& reason) {
    if (const auto* pending = interrupts_->get_pending_for_process(pid)) {
        std::string id = pending->id();
        if (interrupts_->cancel(id, reason)) {
            spdlog::debug("Cancelled interrupt {} held by process {}", id, pid);
        }
    }
}

void Kernel::release_process(const std::string& pid, const std::string& interrupt_id) {
    auto* pcb = lifecycle_->get(pid);
    if (pcb && (pcb->state == ProcessState::WAITING || pcb->state == ProcessState::BLOCKED)) {
        lifecycle_->resume(pid);
    }
    auto* env = find_envelope(pid);
    if (env && !env->terminated && env->interrupt && env->interrupt->id == interrupt_id) {
        env->clear_interrupt();
    }
}

void Kernel::sync_process_with_instruction(const std::string& pid, const Instruction& instruction) {
    auto* pcb = lifecycle_->get(pid);
    if (!pcb) {
        return;
    }

    switch (instruction.kind) {
        case InstructionKind::EXECUTE:
            if (pcb->state == ProcessState::NEW) {
                lifecycle_->schedule(pid);
            }
            if (pcb->state == ProcessState::READY) {
                lifecycle_->start(pid);
            }
            pcb->current_stage = instruction.agent_name;
            break;
        case InstructionKind::WAIT:
            if (pcb->state == ProcessState::RUNNING) {
                auto kind = instruction.interrupt ? instruction.interrupt->kind
                                                  : InterruptKind::CLARIFICATION;
                lifecycle_->wait(pid, kind);
            }
            break;
        case InstructionKind::TERMINATE:
            if (!is_terminal(pcb->state)) {
                lifecycle_->terminate(pid);
            }
            break;
    }
}

Envelope& Kernel::begin_session(const std::string& pid, PipelineConfig config,
                                const std::optional<Envelope>& envelope, bool force) {
    if (pid.empty()) {
        throw validation_error("pid is required");
    }

    Envelope env;
    if (envelope) {
        env = *envelope;
    } else if (auto* stored = find_envelope(pid)) {
        if (force) {
            // A forced restart keeps identity and input but drops progress
            env.envelope_id = stored->envelope_id;
            env.raw_input = stored->raw_input;
            env.received_at = stored->received_at;
            env.metadata = stored->metadata;
        } else {
            env = *stored;
        }
    }
    if (const auto* pcb = lifecycle_->get(pid)) {
        env.request_id = pcb->request_id.str();
        env.user_id = pcb->user_id.str();
        env.session_id = pcb->session_id.str();
    }

    // Works on a copy so a rejected initialization leaves the table untouched
    orchestrator_->initialize_session(pid, std::move(config), env, force);
    return envelopes_[pid] = std::move(env);
}

void Kernel::drop_process(const std::string& pid) {
    lifecycle_->remove(pid);
    envelopes_.erase(pid);
    orchestrator_->cleanup_session(pid);
    resources_->forget(pid);
}

} // namespace helm::kernel
