#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/error.hpp"
#include "util/time.hpp"

namespace helm::kernel {

// ============================================================================
// Identity
// ============================================================================

// Non-empty string identifier, validated at construction
template <typename Tag>
class Identifier {
public:
    explicit Identifier(std::string value) : value_(std::move(value)) {
        if (value_.empty()) {
            throw validation_error(std::string(Tag::name) + " must not be empty");
        }
    }

    const std::string& str() const { return value_; }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
    bool operator<(const Identifier& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

struct ProcessIdTag { static constexpr const char* name = "process id"; };
struct RequestIdTag { static constexpr const char* name = "request id"; };
struct UserIdTag { static constexpr const char* name = "user id"; };
struct SessionIdTag { static constexpr const char* name = "session id"; };

using ProcessId = Identifier<ProcessIdTag>;
using RequestId = Identifier<RequestIdTag>;
using UserId = Identifier<UserIdTag>;
using SessionId = Identifier<SessionIdTag>;

// ============================================================================
// Process state and priority
// ============================================================================

enum class ProcessState {
    NEW,
    READY,
    RUNNING,
    WAITING,
    BLOCKED,
    TERMINATED,
    ZOMBIE
};

const char* process_state_to_string(ProcessState state);
std::optional<ProcessState> process_state_from_string(const std::string& s);

bool can_transition(ProcessState from, ProcessState to);
inline bool is_terminal(ProcessState state) {
    return state == ProcessState::TERMINATED || state == ProcessState::ZOMBIE;
}
inline bool can_schedule(ProcessState state) {
    return state == ProcessState::NEW || state == ProcessState::READY;
}

// Lower value runs first
enum class SchedulingPriority : int {
    REALTIME = 0,
    HIGH = 1,
    NORMAL = 2,
    LOW = 3,
    IDLE = 4
};

const char* priority_to_string(SchedulingPriority priority);
std::optional<SchedulingPriority> priority_from_string(const std::string& s);

// ============================================================================
// Quota and usage
// ============================================================================

// A non-positive limit means the dimension is unlimited
struct ResourceQuota {
    int max_llm_calls = 100;
    int max_tool_calls = 50;
    int max_agent_hops = 10;
    int max_iterations = 20;
    int timeout_seconds = 300;
    int soft_timeout_seconds = 240;
    int64_t max_input_tokens = 100000;
    int64_t max_output_tokens = 50000;
    int64_t max_context_tokens = 150000;
    int rate_limit_rpm = 60;
    int rate_limit_rph = 1000;
    int rate_limit_burst = 10;
    int max_inference_requests = 50;
    int64_t max_inference_input_chars = 500000;

    // Copies every positive field of overrides over this quota
    void merge_overrides(const ResourceQuota& overrides);
};

struct QuotaViolation {
    std::string dimension;
    double usage = 0;
    double limit = 0;
    std::string message;
};

struct ResourceUsage {
    int llm_calls = 0;
    int tool_calls = 0;
    int agent_hops = 0;
    int iterations = 0;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;
    double elapsed_seconds = 0.0;
    int inference_requests = 0;
    int64_t inference_input_chars = 0;

    // First exhausted dimension, evaluated in the order llm_calls,
    // tool_calls, agent_hops, iterations, tokens_in, tokens_out,
    // elapsed_seconds, inference_requests, inference_input_chars
    std::optional<QuotaViolation> exceeds_quota(const ResourceQuota& quota) const;
};

struct RemainingBudget {
    int llm_calls = 0;
    int tool_calls = 0;
    int agent_hops = 0;
    int iterations = 0;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;
    double time_seconds = 0.0;
};

RemainingBudget remaining_budget(const ResourceQuota& quota, const ResourceUsage& usage);

// ============================================================================
// Process Control Block
// ============================================================================

struct ProcessControlBlock {
    ProcessControlBlock(ProcessId pid, RequestId request_id, UserId user_id, SessionId session_id);

    ProcessId pid;
    RequestId request_id;
    UserId user_id;
    SessionId session_id;

    ProcessState state = ProcessState::NEW;
    SchedulingPriority priority = SchedulingPriority::NORMAL;

    ResourceQuota quota;
    ResourceUsage usage;

    util::Timestamp created_at;
    std::optional<util::Timestamp> started_at;
    std::optional<util::Timestamp> completed_at;
    std::optional<util::Timestamp> last_scheduled_at;

    std::optional<std::string> current_stage;
    std::optional<InterruptKind> pending_interrupt;
    nlohmann::json interrupt_data = nlohmann::json::object();

    std::optional<ProcessId> parent_pid;
    std::vector<ProcessId> child_pids;

    void start(util::Timestamp now);
    // Stamps completed_at and freezes elapsed time
    void complete(util::Timestamp now);
    void block(const std::string& reason);
    void wait(InterruptKind kind);
    void resume();

    // Recomputes elapsed_seconds while started and not yet completed
    void refresh_elapsed(util::Timestamp now);
};

// ============================================================================
// JSON views
// ============================================================================

nlohmann::json quota_to_json(const ResourceQuota& quota);
// Fields absent from j keep the value from base
ResourceQuota quota_from_json(const nlohmann::json& j, const ResourceQuota& base = ResourceQuota{});
nlohmann::json usage_to_json(const ResourceUsage& usage);
nlohmann::json budget_to_json(const RemainingBudget& budget);
nlohmann::json pcb_to_json(const ProcessControlBlock& pcb);

} // namespace helm::kernel
