/**
 * Envelope
 *
 * Per-request state container: identity, raw input, per-agent outputs,
 * pipeline cursor, bounds counters, interrupt slot and audit trail.
 * Once terminated, only the audit trail may change.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "util/time.hpp"

namespace helm::kernel {

using util::Timestamp;

enum class TerminalReason {
    COMPLETED,
    MAX_ITERATIONS_EXCEEDED,
    MAX_LLM_CALLS_EXCEEDED,
    MAX_AGENT_HOPS_EXCEEDED,
    USER_CANCELLED,
    TOOL_FAILED_FATALLY,
    LLM_FAILED_FATALLY,
    POLICY_VIOLATION
};

const char* terminal_reason_to_string(TerminalReason reason);
std::optional<TerminalReason> terminal_reason_from_string(const std::string& s);

enum class InterruptKind {
    CLARIFICATION,
    CONFIRMATION,
    AGENT_REVIEW,
    CHECKPOINT,
    RESOURCE_EXHAUSTED,
    TIMEOUT,
    SYSTEM_ERROR
};

const char* interrupt_kind_to_string(InterruptKind kind);
std::optional<InterruptKind> interrupt_kind_from_string(const std::string& s);

struct InterruptResponse {
    std::optional<std::string> text;
    std::optional<bool> approved;
    std::optional<std::string> decision;
    std::optional<nlohmann::json> data;
    Timestamp received_at = util::now();
};

struct FlowInterrupt {
    InterruptKind kind = InterruptKind::CLARIFICATION;
    std::string id;
    std::optional<std::string> question;
    std::optional<std::string> message;
    std::optional<nlohmann::json> data;
    std::optional<InterruptResponse> response;
    Timestamp created_at = util::now();
    std::optional<Timestamp> expires_at;

    bool is_expired(Timestamp now) const {
        return expires_at && *expires_at <= now;
    }
};

struct ProcessingRecord {
    std::string agent;
    int stage_order = 0;
    Timestamp started_at = util::now();
    std::optional<Timestamp> completed_at;
    int64_t duration_ms = 0;
    std::string status = "running";  // running, success, error, skipped
    std::optional<std::string> error;
    int llm_calls = 0;
};

struct ErrorRecord {
    std::string agent;
    std::string error;
    Timestamp timestamp = util::now();
};

class Envelope {
public:
    // Fresh envelope with generated ids and default bounds
    Envelope();

    // Identity
    std::string envelope_id;
    std::string request_id;
    std::string user_id = "anonymous";
    std::string session_id;

    // Input
    std::string raw_input;
    Timestamp received_at;

    // agent name -> output key -> value
    std::map<std::string, std::map<std::string, nlohmann::json>> outputs;

    // Pipeline cursor
    std::string current_stage = "start";
    std::vector<std::string> stage_order;
    int iteration = 0;
    int max_iterations = 3;

    // Stage bookkeeping, kept independent so a failure in one stage of a
    // parallel wave never hides a success in another
    std::set<std::string> active_stages;
    std::set<std::string> completed_stages;
    std::map<std::string, std::string> failed_stages;
    bool parallel_mode = false;

    // Bounds
    int llm_call_count = 0;
    int max_llm_calls = 10;
    int tool_call_count = 0;
    int agent_hop_count = 0;
    int max_agent_hops = 21;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;

    // Termination
    bool terminated = false;
    std::optional<TerminalReason> terminal_reason;
    std::string termination_message;
    std::optional<Timestamp> completed_at;

    // Interrupt slot
    bool interrupt_pending = false;
    std::optional<FlowInterrupt> interrupt;

    // Audit
    std::vector<ProcessingRecord> processing_history;
    std::vector<ErrorRecord> errors;
    Timestamp created_at;
    nlohmann::json metadata = nlohmann::json::object();

    // Stage bookkeeping
    void start_stage(const std::string& stage);
    void complete_stage(const std::string& stage);
    void fail_stage(const std::string& stage, const std::string& error);
    bool is_stage_active(const std::string& stage) const;
    bool is_stage_completed(const std::string& stage) const;
    bool is_stage_failed(const std::string& stage) const;

    // Outputs
    void set_output(const std::string& agent, const std::string& key, const nlohmann::json& value);
    // Merges every key of an object into outputs[agent]
    void merge_output(const std::string& agent, const nlohmann::json& output);
    std::optional<nlohmann::json> get_output(const std::string& agent, const std::string& key) const;

    // Bounds
    bool at_limit() const;
    // First breached bound in the order llm calls, iterations, agent hops
    std::optional<TerminalReason> bounds_violation() const;
    void increment_llm_calls(int count = 1);
    void increment_agent_hops(int count = 1);
    void increment_tool_calls(int count = 1);
    void add_tokens(int64_t in, int64_t out);

    // Audit trail, allowed after termination
    ProcessingRecord& add_processing_record(const std::string& agent, int stage_order);
    void finish_processing_record(const std::string& agent, const std::string& status,
                                  const std::optional<std::string>& error, int llm_calls);
    void add_error(const std::string& agent, const std::string& error);

    // Sets the terminal reason once; later calls return false and change nothing
    bool terminate(TerminalReason reason, const std::string& message);

    void set_interrupt(const FlowInterrupt& interrupt);
    void clear_interrupt();

    // Deep copy with a fresh envelope id
    Envelope clone() const;

    void ensure_mutable() const;

    nlohmann::json to_json() const;
    // Compact view used by state queries
    nlohmann::json to_state_json() const;
    static Envelope from_json(const nlohmann::json& j);
};

nlohmann::json interrupt_to_json(const FlowInterrupt& interrupt);
FlowInterrupt interrupt_from_json(const nlohmann::json& j);
nlohmann::json response_to_json(const InterruptResponse& response);
InterruptResponse response_from_json(const nlohmann::json& j);

} // namespace helm::kernel
