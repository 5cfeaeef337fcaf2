/**
 * Process Lifecycle Manager
 *
 * Owns the PCB table and the ready queue. Every transition is checked
 * against the state matrix before anything is mutated.
 *
 *   NEW -> READY -> RUNNING -> {READY, WAITING, BLOCKED} -> ... -> TERMINATED -> ZOMBIE
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/types.hpp"

namespace helm::kernel {

struct SubmitRequest {
    ProcessId pid;
    RequestId request_id;
    UserId user_id;
    SessionId session_id;
    SchedulingPriority priority = SchedulingPriority::NORMAL;
    std::optional<ResourceQuota> quota;
    std::optional<ProcessId> parent_pid;
};

class LifecycleManager {
public:
    explicit LifecycleManager(ResourceQuota default_quota = ResourceQuota{});

    // Non-copyable
    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // Creates a PCB in NEW. Submitting an existing pid returns that PCB unchanged.
    ProcessControlBlock& submit(const SubmitRequest& request);

    ProcessControlBlock& schedule(const std::string& pid);
    ProcessControlBlock& start(const std::string& pid);
    ProcessControlBlock& block(const std::string& pid, const std::string& reason);
    ProcessControlBlock& wait(const std::string& pid, InterruptKind kind);
    ProcessControlBlock& resume(const std::string& pid);
    ProcessControlBlock& preempt(const std::string& pid);
    // No-op for processes that are already TERMINATED or ZOMBIE
    ProcessControlBlock& terminate(const std::string& pid);
    ProcessControlBlock& cleanup(const std::string& pid);

    // Generic transition used by the call surface; routes to the named operation
    ProcessControlBlock& transition(const std::string& pid, ProcessState target,
                                    const std::string& reason = "");

    bool remove(const std::string& pid);

    ProcessControlBlock* get(const std::string& pid);
    const ProcessControlBlock* get(const std::string& pid) const;
    ProcessControlBlock& require(const std::string& pid);

    // Pops the highest-priority READY process (FIFO within a priority band).
    // The returned process stays READY; the caller decides whether to start it.
    ProcessControlBlock* get_next_runnable();

    // Ordered by created_at
    std::vector<ProcessControlBlock*> list(std::optional<ProcessState> state = std::nullopt);
    size_t count() const { return processes_.size(); }
    std::map<ProcessState, size_t> count_by_state() const;
    size_t ready_queue_size() const { return queued_seq_.size(); }

    const ResourceQuota& default_quota() const { return default_quota_; }
    void set_default_quota(const ResourceQuota& overrides);

private:
    struct QueueEntry {
        int priority;
        util::Timestamp created_at;
        uint64_t seq;
        std::string pid;
    };

    struct QueueOrder {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            if (a.created_at != b.created_at) return a.created_at > b.created_at;
            return a.seq > b.seq;
        }
    };

    ResourceQuota default_quota_;
    std::unordered_map<std::string, std::unique_ptr<ProcessControlBlock>> processes_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, QueueOrder> ready_queue_;
    // Latest queue sequence per pid; older heap entries are stale
    std::unordered_map<std::string, uint64_t> queued_seq_;
    uint64_t next_seq_ = 0;

    void enqueue(const ProcessControlBlock& pcb);
    void check_transition(const ProcessControlBlock& pcb, ProcessState target) const;
    void set_state(ProcessControlBlock& pcb, ProcessState target);
};

} // namespace helm::kernel
