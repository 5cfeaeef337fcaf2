#include "kernel/lifecycle.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace helm::kernel {

LifecycleManager::LifecycleManager(ResourceQuota default_quota)
    : default_quota_(default_quota) {}

ProcessControlBlock& LifecycleManager::submit(const SubmitRequest& request) {
    auto it = processes_.find(request.pid.str());
    if (it != processes_.end()) {
        spdlog::debug("Process {} already submitted", request.pid.str());
        return *it->second;
    }

    auto pcb = std::make_unique<ProcessControlBlock>(
        request.pid, request.request_id, request.user_id, request.session_id);
    pcb->priority = request.priority;
    pcb->quota = request.quota ? *request.quota : default_quota_;
    pcb->parent_pid = request.parent_pid;

    if (request.parent_pid) {
        auto parent = processes_.find(request.parent_pid->str());
        if (parent != processes_.end()) {
            parent->second->child_pids.push_back(request.pid);
        }
    }

    auto& ref = *pcb;
    processes_.emplace(request.pid.str(), std::move(pcb));
    spdlog::info("Process submitted: pid={} user={} priority={}",
        ref.pid.str(), ref.user_id.str(), priority_to_string(ref.priority));
    return ref;
}

ProcessControlBlock& LifecycleManager::schedule(const std::string& pid) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::NEW) {
        throw transition_error("cannot schedule process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::READY);
    enqueue(pcb);
    return pcb;
}

ProcessControlBlock& LifecycleManager::start(const std::string& pid) {
    auto& pcb = require(pid);
    check_transition(pcb, ProcessState::RUNNING);
    set_state(pcb, ProcessState::RUNNING);
    queued_seq_.erase(pid);
    pcb.start(util::now());
    return pcb;
}

ProcessControlBlock& LifecycleManager::block(const std::string& pid, const std::string& reason) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::RUNNING) {
        throw transition_error("cannot block process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::BLOCKED);
    pcb.block(reason);
    return pcb;
}

ProcessControlBlock& LifecycleManager::wait(const std::string& pid, InterruptKind kind) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::RUNNING) {
        throw transition_error("cannot wait process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::WAITING);
    pcb.wait(kind);
    return pcb;
}

ProcessControlBlock& LifecycleManager::resume(const std::string& pid) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::WAITING && pcb.state != ProcessState::BLOCKED) {
        throw transition_error("cannot resume process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::READY);
    pcb.resume();
    enqueue(pcb);
    return pcb;
}

ProcessControlBlock& LifecycleManager::preempt(const std::string& pid) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::RUNNING) {
        throw transition_error("cannot preempt process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::READY);
    enqueue(pcb);
    return pcb;
}

ProcessControlBlock& LifecycleManager::terminate(const std::string& pid) {
    auto& pcb = require(pid);
    if (is_terminal(pcb.state)) {
        return pcb;
    }
    set_state(pcb, ProcessState::TERMINATED);
    queued_seq_.erase(pid);
    pcb.complete(util::now());
    spdlog::info("Process terminated: pid={} elapsed={:.3f}s", pid, pcb.usage.elapsed_seconds);
    return pcb;
}

ProcessControlBlock& LifecycleManager::cleanup(const std::string& pid) {
    auto& pcb = require(pid);
    if (pcb.state != ProcessState::TERMINATED) {
        throw transition_error("cannot clean up process " + pid + " in state " +
                               process_state_to_string(pcb.state));
    }
    set_state(pcb, ProcessState::ZOMBIE);
    return pcb;
}

ProcessControlBlock& LifecycleManager::transition(const std::string& pid, ProcessState target,
                                                  const std::string& reason) {
    auto& pcb = require(pid);
    check_transition(pcb, target);

    switch (target) {
        case ProcessState::READY:
            if (pcb.state == ProcessState::NEW) return schedule(pid);
            if (pcb.state == ProcessState::RUNNING) return preempt(pid);
            return resume(pid);
        case ProcessState::RUNNING:
            return start(pid);
        case ProcessState::WAITING:
            return wait(pid, InterruptKind::CLARIFICATION);
        case ProcessState::BLOCKED:
            return block(pid, reason.empty() ? "blocked" : reason);
        case ProcessState::TERMINATED:
            return terminate(pid);
        case ProcessState::ZOMBIE:
            return cleanup(pid);
        case ProcessState::NEW:
            break;
    }
    throw transition_error(std::string("invalid transition target ") +
                           process_state_to_string(target));
}

bool LifecycleManager::remove(const std::string& pid) {
    auto it = processes_.find(pid);
    if (it == processes_.end()) {
        return false;
    }

    const auto& pcb = *it->second;
    if (pcb.parent_pid) {
        auto parent = processes_.find(pcb.parent_pid->str());
        if (parent != processes_.end()) {
            auto& children = parent->second->child_pids;
            children.erase(std::remove(children.begin(), children.end(), pcb.pid), children.end());
        }
    }

    queued_seq_.erase(pid);
    processes_.erase(it);
    spdlog::debug("Process removed: pid={}", pid);
    return true;
}

ProcessControlBlock* LifecycleManager::get(const std::string& pid) {
    auto it = processes_.find(pid);
    return it == processes_.end() ? nullptr : it->second.get();
}

const ProcessControlBlock* LifecycleManager::get(const std::string& pid) const {
    auto it = processes_.find(pid);
    return it == processes_.end() ? nullptr : it->second.get();
}

ProcessControlBlock& LifecycleManager::require(const std::string& pid) {
    auto* pcb = get(pid);
    if (!pcb) {
        throw not_found_error("process", pid);
    }
    return *pcb;
}

ProcessControlBlock* LifecycleManager::get_next_runnable() {
    while (!ready_queue_.empty()) {
        QueueEntry entry = ready_queue_.top();
        ready_queue_.pop();

        auto seq = queued_seq_.find(entry.pid);
        if (seq == queued_seq_.end() || seq->second != entry.seq) {
            continue;
        }
        queued_seq_.erase(seq);

        auto* pcb = get(entry.pid);
        if (pcb && pcb->state == ProcessState::READY) {
            return pcb;
        }
    }
    return nullptr;
}

std::vector<ProcessControlBlock*> LifecycleManager::list(std::optional<ProcessState> state) {
    std::vector<ProcessControlBlock*> result;
    for (auto& [pid, pcb] : processes_) {
        if (!state || pcb->state == *state) {
            result.push_back(pcb.get());
        }
    }
    std::sort(result.begin(), result.end(),
        [](const ProcessControlBlock* a, const ProcessControlBlock* b) {
            if (a->created_at != b->created_at) return a->created_at < b->created_at;
            return a->pid < b->pid;
        });
    return result;
}

std::map<ProcessState, size_t> LifecycleManager::count_by_state() const {
    std::map<ProcessState, size_t> counts;
    for (const auto& [pid, pcb] : processes_) {
        counts[pcb->state]++;
    }
    return counts;
}

void LifecycleManager::set_default_quota(const ResourceQuota& overrides) {
    default_quota_.merge_overrides(overrides);
    spdlog::info("Default quota updated: max_llm_calls={} timeout={}s",
        default_quota_.max_llm_calls, default_quota_.timeout_seconds);
}

void LifecycleManager::enqueue(const ProcessControlBlock& pcb) {
    uint64_t seq = next_seq_++;
    queued_seq_[pcb.pid.str()] = seq;
    ready_queue_.push(QueueEntry{static_cast<int>(pcb.priority), pcb.created_at, seq, pcb.pid.str()});
}

void LifecycleManager::check_transition(const ProcessControlBlock& pcb, ProcessState target) const {
    if (!can_transition(pcb.state, target)) {
        throw transition_error(std::string("invalid transition ") +
            process_state_to_string(pcb.state) + " -> " + process_state_to_string(target) +
            " for process " + pcb.pid.str());
    }
}

void LifecycleManager::set_state(ProcessControlBlock& pcb, ProcessState target) {
    check_transition(pcb, target);
    spdlog::debug("Process {}: {} -> {}", pcb.pid.str(),
        process_state_to_string(pcb.state), process_state_to_string(target));
    pcb.state = target;
}

} // namespace helm::kernel
