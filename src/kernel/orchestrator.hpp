/**
 * Orchestrator
 *
 * Binds a pipeline configuration to a process and turns envelope state
 * into the next instruction. Envelopes are owned by the Kernel and
 * borrowed for the duration of each call.
 */
#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"
#include "kernel/pipeline_config.hpp"

namespace helm::kernel {

enum class InstructionKind {
    EXECUTE,
    WAIT,
    TERMINATE
};

const char* instruction_kind_to_string(InstructionKind kind);

struct Instruction {
    InstructionKind kind = InstructionKind::EXECUTE;
    std::string agent_name;
    std::vector<std::string> parallel_agents;
    std::optional<TerminalReason> terminal_reason;
    std::string message;
    std::optional<FlowInterrupt> interrupt;

    nlohmann::json to_json() const;
};

enum class SessionStatus {
    INITIALIZED,
    RUNNING,
    WAITING,
    TERMINATED
};

const char* session_status_to_string(SessionStatus status);

struct AgentExecutionMetrics {
    int llm_calls = 0;
    int tool_calls = 0;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;
    int64_t duration_ms = 0;
};

struct AgentResult {
    std::string agent_name;  // empty means the current stage
    bool success = true;
    std::string error;
    nlohmann::json output = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

struct SessionState {
    std::string pid;
    std::string pipeline;
    SessionStatus status = SessionStatus::INITIALIZED;
    std::string current_stage;
    int iteration = 0;
    int llm_call_count = 0;
    int agent_hop_count = 0;
    bool terminated = false;
    std::optional<TerminalReason> terminal_reason;
    std::map<std::string, int> edge_traversals;
    util::Timestamp created_at;
    util::Timestamp last_activity_at;

    nlohmann::json to_json() const;
};

class Orchestrator {
public:
    Orchestrator() = default;

    // Non-copyable
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Fails with VALIDATION when a session exists and force is false
    SessionState initialize_session(const std::string& pid, PipelineConfig config,
                                    Envelope& envelope, bool force,
                                    util::Timestamp now = util::now());

    // Decision order: terminated, end stage, pending interrupt, bounds
    // (llm calls, iterations, hops), unhandled failure, unknown stage, execute
    Instruction get_next_instruction(const std::string& pid, Envelope& envelope,
                                     util::Timestamp now = util::now());

    // Applies a worker's result. Failures are recorded and acted on by the
    // next get_next_instruction call.
    SessionState report_agent_result(const std::string& pid, Envelope& envelope,
                                     const AgentExecutionMetrics& metrics,
                                     const AgentResult& result,
                                     util::Timestamp now = util::now());

    SessionState get_session_state(const std::string& pid, const Envelope& envelope) const;

    bool has_session(const std::string& pid) const { return sessions_.count(pid) > 0; }
    const PipelineConfig* pipeline_for(const std::string& pid) const;
    bool cleanup_session(const std::string& pid);
    size_t session_count() const { return sessions_.size(); }

    // Removes sessions idle longer than retention, terminated or not.
    // Returns the affected process ids.
    std::vector<std::string> cleanup_stale_sessions(std::chrono::seconds retention,
                                                    util::Timestamp now = util::now());

private:
    struct PendingFailure {
        std::string stage;
        std::string error;
    };

    struct Session {
        std::string pid;
        PipelineConfig config;
        SessionStatus status = SessionStatus::INITIALIZED;
        std::map<std::string, int> edge_traversals;
        std::optional<TerminalReason> terminal_reason;
        std::optional<PendingFailure> pending_failure;
        util::Timestamp created_at;
        util::Timestamp last_activity_at;
    };

    std::unordered_map<std::string, Session> sessions_;

    Session& require(const std::string& pid);
    const Session& require(const std::string& pid) const;

    Instruction terminate(Session& session, Envelope& envelope, TerminalReason reason,
                          const std::string& message);
    std::string evaluate_routing(const PipelineConfig& config, const StageConfig& stage,
                                 const nlohmann::json& output) const;
    static bool values_match(const nlohmann::json& actual, const nlohmann::json& expected);
    SessionState build_state(const Session& session, const Envelope& envelope) const;
};

} // namespace helm::kernel
