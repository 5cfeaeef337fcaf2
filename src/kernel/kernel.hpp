/**
 * Helm Kernel
 *
 * Composition root that owns every piece of mutable control-plane state:
 * - LifecycleManager (PCB table, ready queue)
 * - ResourceTracker (quota checks, per-user usage)
 * - RateLimiter (per-user sliding windows)
 * - InterruptService (human-in-the-loop records)
 * - Orchestrator (pipeline sessions)
 * - the envelope table
 *
 * Each public method takes the kernel lock for its whole duration and runs
 * inside the recovery boundary, so calls are strictly serialized.
 * Processes are the canonical identity: an envelope created for a process
 * is stored under its pid.
 */
#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/envelope.hpp"
#include "kernel/interrupts.hpp"
#include "kernel/orchestrator.hpp"
#include "kernel/rate_limiter.hpp"
#include "kernel/recovery.hpp"
#include "kernel/resources.hpp"
#include "kernel/types.hpp"

namespace helm::kernel {

class LifecycleManager;

struct CreateProcessRequest {
    std::string pid;
    std::string request_id;  // generated when empty
    std::string user_id;     // "anonymous" when empty
    std::string session_id;  // generated when empty
    SchedulingPriority priority = SchedulingPriority::NORMAL;
    std::optional<ResourceQuota> quota;
    std::optional<std::string> parent_pid;
};

// Increments applied to a process; every field must be non-negative
struct UsageDelta {
    int llm_calls = 0;
    int tool_calls = 0;
    int agent_hops = 0;
    int iterations = 0;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;
    int inference_requests = 0;
    int64_t inference_input_chars = 0;
};

struct QuotaCheck {
    bool within_bounds = true;
    std::optional<QuotaViolation> violation;
    ResourceUsage usage;
    ResourceQuota quota;
};

struct BoundsCheck {
    bool can_continue = true;
    std::optional<TerminalReason> terminal_reason;
    int llm_calls_remaining = 0;
    int agent_hops_remaining = 0;
    int iterations_remaining = 0;
};

struct PipelineStart {
    SessionState state;
    Instruction instruction;
};

struct SystemStatus {
    size_t total_processes = 0;
    std::map<ProcessState, size_t> processes_by_state;
    size_t ready_queue = 0;
    size_t envelopes = 0;
    size_t sessions = 0;
    InterruptStats interrupts;
    size_t rate_limited_users = 0;
    size_t tracked_users = 0;
    UserUsage usage_totals;

    nlohmann::json to_json() const;
};

class Kernel {
public:
    using Config = KernelConfig;

    struct Dependencies {
        std::unique_ptr<LifecycleManager> lifecycle;
        std::unique_ptr<ResourceTracker> resources;
        std::unique_ptr<RateLimiter> rate_limiter;
        std::unique_ptr<InterruptService> interrupts;
        std::unique_ptr<Orchestrator> orchestrator;
    };

    Kernel();
    explicit Kernel(const Config& config);
    Kernel(const Config& config, Dependencies deps);
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    const Config& get_config() const { return config_; }

    // ========================================================================
    // Processes
    // ========================================================================

    // Rate-limits the user, submits and schedules. An existing pid is
    // returned unchanged without consuming rate limit.
    ProcessControlBlock create_process(const CreateProcessRequest& request);
    ProcessControlBlock get_process(const std::string& pid);
    ProcessControlBlock schedule_process(const std::string& pid);
    std::optional<ProcessControlBlock> get_next_runnable();
    ProcessControlBlock start_process(const std::string& pid);
    ProcessControlBlock block_process(const std::string& pid, const std::string& reason);
    // Also records an interrupt of that kind and stamps it onto the process envelope
    ProcessControlBlock wait_process(const std::string& pid, InterruptKind kind);
    // Also clears the envelope interrupt
    ProcessControlBlock resume_process(const std::string& pid);
    ProcessControlBlock preempt_process(const std::string& pid);
    ProcessControlBlock transition_state(const std::string& pid, ProcessState target,
                                         const std::string& reason = "");
    // Also terminates the envelope as user_cancelled
    ProcessControlBlock terminate_process(const std::string& pid,
                                          const std::string& reason = "Process terminated");
    // TERMINATED -> ZOMBIE; the PCB stays readable until reclaimed
    ProcessControlBlock cleanup_process(const std::string& pid);
    // Drops the PCB, its envelope and its orchestration session
    bool remove_process(const std::string& pid);

    std::vector<ProcessControlBlock> list_processes(std::optional<ProcessState> state = std::nullopt,
                                                    const std::optional<std::string>& user_id = std::nullopt);
    std::map<ProcessState, size_t> process_counts();

    // ========================================================================
    // Quota, usage and rate limits
    // ========================================================================

    QuotaCheck check_quota(const std::string& pid);
    ResourceUsage record_usage(const std::string& pid, const UsageDelta& delta);
    ResourceUsage record_tool_call(const std::string& pid);
    ResourceUsage record_agent_hop(const std::string& pid);
    RemainingBudget get_remaining_budget(const std::string& pid);
    std::optional<UserUsage> get_user_usage(const std::string& user_id);

    ResourceQuota default_quota();
    void set_default_quota(const ResourceQuota& overrides);

    RateLimitResult check_rate_limit(const std::string& user_id, bool record = true);
    void set_user_rate_limits(const std::string& user_id, const RateLimitConfig& config);

    // ========================================================================
    // Envelopes
    // ========================================================================

    // Stored under pid when given, otherwise under the envelope id.
    // Identity fields are taken from the process when it exists.
    Envelope create_envelope(Envelope envelope, const std::optional<std::string>& pid = std::nullopt);
    Envelope get_envelope(const std::string& key);
    // Merges raw_input, outputs, metadata and current_stage
    Envelope update_envelope(const std::string& key, const nlohmann::json& update);
    BoundsCheck check_bounds(const std::string& key);
    Envelope clone_envelope(const std::string& key, const std::optional<std::string>& new_key = std::nullopt);
    bool remove_envelope(const std::string& key);

    // ========================================================================
    // Interrupts
    // ========================================================================

    // When params.process_id is set the interrupt is stamped on that
    // process envelope and a RUNNING process moves to WAITING
    KernelInterrupt create_interrupt(const CreateInterruptParams& params);
    // Resolving or cancelling releases a process waiting on the interrupt
    bool resolve_interrupt(const std::string& id, const InterruptResponse& response,
                           const std::optional<std::string>& user_id = std::nullopt);
    bool cancel_interrupt(const std::string& id, const std::string& reason);
    KernelInterrupt get_interrupt(const std::string& id);
    std::vector<KernelInterrupt> get_pending_for_session(const std::string& session_id,
                                                         const std::set<InterruptKind>& kinds = {});
    std::optional<KernelInterrupt> get_pending_for_request(const std::string& request_id);

    // ========================================================================
    // Orchestration
    // ========================================================================

    // Uses the given envelope, else the stored one, else a fresh envelope.
    // With force an existing session is replaced and stored progress is reset.
    SessionState initialize_orchestration(const std::string& pid, PipelineConfig config,
                                          const std::optional<Envelope>& envelope, bool force);
    // Initializes and returns the first instruction under one lock
    PipelineStart execute_pipeline(const std::string& pid, PipelineConfig config,
                                   const std::optional<Envelope>& envelope, bool force);
    Instruction get_next_instruction(const std::string& pid);
    SessionState report_agent_result(const std::string& pid, const AgentExecutionMetrics& metrics,
                                     const AgentResult& result);
    SessionState get_session_state(const std::string& pid);

    // ========================================================================
    // Reclamation, one lock acquisition per call
    // ========================================================================

    // Removes TERMINATED/ZOMBIE processes completed before now - retention
    size_t cleanup_zombies(std::chrono::seconds retention, util::Timestamp now = util::now());
    size_t cleanup_stale_sessions(std::chrono::seconds retention, util::Timestamp now = util::now());
    // Returns {expired, purged}
    std::pair<size_t, size_t> cleanup_interrupts(std::chrono::seconds retention,
                                                 util::Timestamp now = util::now());
    // Returns {rate limit windows dropped, user usage entries dropped}
    std::pair<size_t, size_t> cleanup_rate_limits_and_usage(size_t max_user_entries,
                                                            util::Timestamp now = util::now());

    SystemStatus system_status();

private:
    Config config_;
    std::mutex mutex_;

    std::unique_ptr<LifecycleManager> lifecycle_;
    std::unique_ptr<ResourceTracker> resources_;
    std::unique_ptr<RateLimiter> rate_limiter_;
    std::unique_ptr<InterruptService> interrupts_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unordered_map<std::string, Envelope> envelopes_;

    template <typename Op>
    auto locked(const char* name, Op&& op) -> decltype(op()) {
        std::lock_guard<std::mutex> lock(mutex_);
        return with_recovery(name, std::forward<Op>(op));
    }

    Envelope& require_envelope(const std::string& key);
    Envelope* find_envelope(const std::string& key);
    Envelope& envelope_for_session(const std::string& pid);
    // A process holds at most one pending interrupt
    void ensure_no_pending_interrupt(const std::string& pid);
    void cancel_linked_interrupt(const std::string& pid, const std::string& reason);
    void release_process(const std::string& pid, const std::string& interrupt_id);
    void sync_process_with_instruction(const std::string& pid, const Instruction& instruction);
    void drop_process(const std::string& pid);
    // Validates, binds the session and stores its envelope under pid
    Envelope& begin_session(const std::string& pid, PipelineConfig config,
                            const std::optional<Envelope>& envelope, bool force);
};

} // namespace helm::kernel
