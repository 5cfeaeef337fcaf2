#include "kernel/envelope.hpp"
#include "kernel/error.hpp"
#include "util/ids.hpp"
#include "util/saturating.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace helm::kernel {

namespace {

json optional_time(const std::optional<Timestamp>& t) {
    return t ? json(util::to_unix_seconds(*t)) : json(nullptr);
}

std::optional<Timestamp> read_optional_time(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return util::from_unix_seconds(j[key].get<double>());
}

Timestamp read_time(const json& j, const char* key, Timestamp fallback) {
    auto t = read_optional_time(j, key);
    return t ? *t : fallback;
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace

const char* terminal_reason_to_string(TerminalReason reason) {
    switch (reason) {
        case TerminalReason::COMPLETED:               return "completed";
        case TerminalReason::MAX_ITERATIONS_EXCEEDED: return "max_iterations_exceeded";
        case TerminalReason::MAX_LLM_CALLS_EXCEEDED:  return "max_llm_calls_exceeded";
        case TerminalReason::MAX_AGENT_HOPS_EXCEEDED: return "max_agent_hops_exceeded";
        case TerminalReason::USER_CANCELLED:          return "user_cancelled";
        case TerminalReason::TOOL_FAILED_FATALLY:     return "tool_failed_fatally";
        case TerminalReason::LLM_FAILED_FATALLY:      return "llm_failed_fatally";
        case TerminalReason::POLICY_VIOLATION:        return "policy_violation";
    }
    return "completed";
}

std::optional<TerminalReason> terminal_reason_from_string(const std::string& s) {
    static const TerminalReason all[] = {
        TerminalReason::COMPLETED, TerminalReason::MAX_ITERATIONS_EXCEEDED,
        TerminalReason::MAX_LLM_CALLS_EXCEEDED, TerminalReason::MAX_AGENT_HOPS_EXCEEDED,
        TerminalReason::USER_CANCELLED, TerminalReason::TOOL_FAILED_FATALLY,
        TerminalReason::LLM_FAILED_FATALLY, TerminalReason::POLICY_VIOLATION};
    for (auto reason : all) {
        if (s == terminal_reason_to_string(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

const char* interrupt_kind_to_string(InterruptKind kind) {
    switch (kind) {
        case InterruptKind::CLARIFICATION:      return "clarification";
        case InterruptKind::CONFIRMATION:       return "confirmation";
        case InterruptKind::AGENT_REVIEW:       return "agent_review";
        case InterruptKind::CHECKPOINT:         return "checkpoint";
        case InterruptKind::RESOURCE_EXHAUSTED: return "resource_exhausted";
        case InterruptKind::TIMEOUT:            return "timeout";
        case InterruptKind::SYSTEM_ERROR:       return "system_error";
    }
    return "clarification";
}

std::optional<InterruptKind> interrupt_kind_from_string(const std::string& s) {
    static const InterruptKind all[] = {
        InterruptKind::CLARIFICATION, InterruptKind::CONFIRMATION,
        InterruptKind::AGENT_REVIEW, InterruptKind::CHECKPOINT,
        InterruptKind::RESOURCE_EXHAUSTED, InterruptKind::TIMEOUT,
        InterruptKind::SYSTEM_ERROR};
    for (auto kind : all) {
        if (s == interrupt_kind_to_string(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

Envelope::Envelope()
    : envelope_id(util::generate_id("env_")),
      request_id(util::generate_id("req_")),
      session_id(util::generate_id("sess_")),
      received_at(util::now()),
      created_at(received_at) {}

// ============================================================================
// Stage bookkeeping
// ============================================================================

void Envelope::start_stage(const std::string& stage) {
    ensure_mutable();
    active_stages.insert(stage);
}

void Envelope::complete_stage(const std::string& stage) {
    ensure_mutable();
    active_stages.erase(stage);
    completed_stages.insert(stage);
    failed_stages.erase(stage);
}

void Envelope::fail_stage(const std::string& stage, const std::string& error) {
    ensure_mutable();
    active_stages.erase(stage);
    failed_stages[stage] = error;
}

bool Envelope::is_stage_active(const std::string& stage) const {
    return active_stages.count(stage) > 0;
}

bool Envelope::is_stage_completed(const std::string& stage) const {
    return completed_stages.count(stage) > 0;
}

bool Envelope::is_stage_failed(const std::string& stage) const {
    return failed_stages.count(stage) > 0;
}

// ============================================================================
// Outputs
// ============================================================================

void Envelope::set_output(const std::string& agent, const std::string& key, const json& value) {
    ensure_mutable();
    outputs[agent][key] = value;
}

void Envelope::merge_output(const std::string& agent, const json& output) {
    ensure_mutable();
    if (output.is_null()) {
        outputs[agent];
        return;
    }
    if (!output.is_object()) {
        throw validation_error("output for agent '" + agent + "' must be an object");
    }
    auto& slot = outputs[agent];
    for (auto it = output.begin(); it != output.end(); ++it) {
        slot[it.key()] = it.value();
    }
}

std::optional<json> Envelope::get_output(const std::string& agent, const std::string& key) const {
    auto agent_it = outputs.find(agent);
    if (agent_it == outputs.end()) {
        return std::nullopt;
    }
    auto key_it = agent_it->second.find(key);
    if (key_it == agent_it->second.end()) {
        return std::nullopt;
    }
    return key_it->second;
}

// ============================================================================
// Bounds
// ============================================================================

bool Envelope::at_limit() const {
    return llm_call_count >= max_llm_calls || agent_hop_count >= max_agent_hops;
}

std::optional<TerminalReason> Envelope::bounds_violation() const {
    if (llm_call_count >= max_llm_calls) {
        return TerminalReason::MAX_LLM_CALLS_EXCEEDED;
    }
    if (iteration >= max_iterations) {
        return TerminalReason::MAX_ITERATIONS_EXCEEDED;
    }
    if (agent_hop_count >= max_agent_hops) {
        return TerminalReason::MAX_AGENT_HOPS_EXCEEDED;
    }
    return std::nullopt;
}

void Envelope::increment_llm_calls(int count) {
    ensure_mutable();
    util::add_saturating(llm_call_count, count);
}

void Envelope::increment_agent_hops(int count) {
    ensure_mutable();
    util::add_saturating(agent_hop_count, count);
}

void Envelope::increment_tool_calls(int count) {
    ensure_mutable();
    util::add_saturating(tool_call_count, count);
}

void Envelope::add_tokens(int64_t in, int64_t out) {
    ensure_mutable();
    util::add_saturating(tokens_in, in);
    util::add_saturating(tokens_out, out);
}

// ============================================================================
// Audit trail
// ============================================================================

ProcessingRecord& Envelope::add_processing_record(const std::string& agent, int order) {
    ProcessingRecord record;
    record.agent = agent;
    record.stage_order = order;
    processing_history.push_back(std::move(record));
    return processing_history.back();
}

void Envelope::finish_processing_record(const std::string& agent, const std::string& status,
                                        const std::optional<std::string>& error, int llm_calls) {
    auto now = util::now();
    auto it = std::find_if(processing_history.rbegin(), processing_history.rend(),
        [&agent](const ProcessingRecord& r) { return r.agent == agent && r.status == "running"; });

    ProcessingRecord* record = nullptr;
    if (it != processing_history.rend()) {
        record = &*it;
    } else {
        // Result reported without a matching start; record it as it lands
        record = &add_processing_record(agent, 0);
        record->started_at = now;
    }

    record->completed_at = now;
    record->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - record->started_at).count();
    record->status = status;
    record->error = error;
    record->llm_calls = llm_calls;
}

void Envelope::add_error(const std::string& agent, const std::string& error) {
    errors.push_back(ErrorRecord{agent, error, util::now()});
}

// ============================================================================
// Termination and interrupts
// ============================================================================

bool Envelope::terminate(TerminalReason reason, const std::string& message) {
    if (terminated) {
        return false;
    }
    terminated = true;
    terminal_reason = reason;
    termination_message = message;
    completed_at = util::now();
    active_stages.clear();
    return true;
}

void Envelope::set_interrupt(const FlowInterrupt& flow_interrupt) {
    ensure_mutable();
    interrupt = flow_interrupt;
    interrupt_pending = true;
}

void Envelope::clear_interrupt() {
    if (!interrupt_pending && !interrupt) {
        return;
    }
    ensure_mutable();
    interrupt_pending = false;
    interrupt.reset();
}

Envelope Envelope::clone() const {
    Envelope copy = *this;
    copy.envelope_id = util::generate_id("env_");
    return copy;
}

void Envelope::ensure_mutable() const {
    if (terminated) {
        throw transition_error("envelope " + envelope_id + " is terminated");
    }
}

// ============================================================================
// Serialization
// ============================================================================

json response_to_json(const InterruptResponse& response) {
    json j;
    j["text"] = response.text ? json(*response.text) : json(nullptr);
    j["approved"] = response.approved ? json(*response.approved) : json(nullptr);
    j["decision"] = response.decision ? json(*response.decision) : json(nullptr);
    j["data"] = response.data ? *response.data : json(nullptr);
    j["received_at"] = util::to_unix_seconds(response.received_at);
    return j;
}

InterruptResponse response_from_json(const json& j) {
    InterruptResponse response;
    response.text = read_optional_string(j, "text");
    if (j.contains("approved") && !j["approved"].is_null()) {
        response.approved = j["approved"].get<bool>();
    }
    response.decision = read_optional_string(j, "decision");
    if (j.contains("data") && !j["data"].is_null()) {
        response.data = j["data"];
    }
    response.received_at = read_time(j, "received_at", util::now());
    return response;
}

json interrupt_to_json(const FlowInterrupt& interrupt) {
    json j;
    j["id"] = interrupt.id;
    j["kind"] = interrupt_kind_to_string(interrupt.kind);
    j["question"] = interrupt.question ? json(*interrupt.question) : json(nullptr);
    j["message"] = interrupt.message ? json(*interrupt.message) : json(nullptr);
    j["data"] = interrupt.data ? *interrupt.data : json(nullptr);
    j["response"] = interrupt.response ? response_to_json(*interrupt.response) : json(nullptr);
    j["created_at"] = util::to_unix_seconds(interrupt.created_at);
    j["expires_at"] = optional_time(interrupt.expires_at);
    return j;
}

FlowInterrupt interrupt_from_json(const json& j) {
    FlowInterrupt interrupt;
    auto kind_name = j.value("kind", std::string("clarification"));
    auto kind = interrupt_kind_from_string(kind_name);
    if (!kind) {
        throw validation_error("unknown interrupt kind: " + kind_name);
    }
    interrupt.kind = *kind;
    interrupt.id = j.value("id", util::generate_id("int_"));
    interrupt.question = read_optional_string(j, "question");
    interrupt.message = read_optional_string(j, "message");
    if (j.contains("data") && !j["data"].is_null()) {
        interrupt.data = j["data"];
    }
    if (j.contains("response") && !j["response"].is_null()) {
        interrupt.response = response_from_json(j["response"]);
    }
    interrupt.created_at = read_time(j, "created_at", util::now());
    interrupt.expires_at = read_optional_time(j, "expires_at");
    return interrupt;
}

json Envelope::to_json() const {
    json j;
    j["envelope_id"] = envelope_id;
    j["request_id"] = request_id;
    j["user_id"] = user_id;
    j["session_id"] = session_id;
    j["raw_input"] = raw_input;
    j["received_at"] = util::to_unix_seconds(received_at);

    json outs = json::object();
    for (const auto& [agent, values] : outputs) {
        json agent_out = json::object();
        for (const auto& [key, value] : values) {
            agent_out[key] = value;
        }
        outs[agent] = agent_out;
    }
    j["outputs"] = outs;

    j["current_stage"] = current_stage;
    j["stage_order"] = stage_order;
    j["iteration"] = iteration;
    j["max_iterations"] = max_iterations;
    j["active_stages"] = active_stages;
    j["completed_stages"] = completed_stages;
    j["failed_stages"] = failed_stages;
    j["parallel_mode"] = parallel_mode;

    j["llm_call_count"] = llm_call_count;
    j["max_llm_calls"] = max_llm_calls;
    j["tool_call_count"] = tool_call_count;
    j["agent_hop_count"] = agent_hop_count;
    j["max_agent_hops"] = max_agent_hops;
    j["tokens_in"] = tokens_in;
    j["tokens_out"] = tokens_out;

    j["terminated"] = terminated;
    j["terminal_reason"] = terminal_reason
        ? json(terminal_reason_to_string(*terminal_reason)) : json(nullptr);
    j["termination_message"] = termination_message;
    j["completed_at"] = optional_time(completed_at);

    j["interrupt_pending"] = interrupt_pending;
    j["interrupt"] = interrupt ? interrupt_to_json(*interrupt) : json(nullptr);

    json history = json::array();
    for (const auto& record : processing_history) {
        history.push_back({
            {"agent", record.agent},
            {"stage_order", record.stage_order},
            {"started_at", util::to_unix_seconds(record.started_at)},
            {"completed_at", optional_time(record.completed_at)},
            {"duration_ms", record.duration_ms},
            {"status", record.status},
            {"error", record.error ? json(*record.error) : json(nullptr)},
            {"llm_calls", record.llm_calls}
        });
    }
    j["processing_history"] = history;

    json errs = json::array();
    for (const auto& e : errors) {
        errs.push_back({{"agent", e.agent}, {"error", e.error},
                        {"timestamp", util::to_unix_seconds(e.timestamp)}});
    }
    j["errors"] = errs;
    j["created_at"] = util::to_unix_seconds(created_at);
    j["metadata"] = metadata;
    return j;
}

json Envelope::to_state_json() const {
    json j;
    j["envelope_id"] = envelope_id;
    j["request_id"] = request_id;
    j["current_stage"] = current_stage;
    j["iteration"] = iteration;
    j["llm_call_count"] = llm_call_count;
    j["agent_hop_count"] = agent_hop_count;
    j["terminated"] = terminated;
    j["terminal_reason"] = terminal_reason
        ? json(terminal_reason_to_string(*terminal_reason)) : json(nullptr);
    j["interrupt_pending"] = interrupt_pending;
    j["completed_stages"] = completed_stages;
    j["failed_stages"] = failed_stages;
    return j;
}

Envelope Envelope::from_json(const json& j) {
    if (!j.is_object()) {
        throw validation_error("envelope must be an object");
    }

    Envelope env;
    env.envelope_id = j.value("envelope_id", env.envelope_id);
    env.request_id = j.value("request_id", env.request_id);
    env.user_id = j.value("user_id", env.user_id);
    env.session_id = j.value("session_id", env.session_id);
    env.raw_input = j.value("raw_input", std::string());
    env.received_at = read_time(j, "received_at", env.received_at);

    if (j.contains("outputs") && j["outputs"].is_object()) {
        for (auto it = j["outputs"].begin(); it != j["outputs"].end(); ++it) {
            auto& slot = env.outputs[it.key()];
            if (!it.value().is_object()) {
                throw validation_error("outputs." + it.key() + " must be an object");
            }
            for (auto kv = it.value().begin(); kv != it.value().end(); ++kv) {
                slot[kv.key()] = kv.value();
            }
        }
    }

    env.current_stage = j.value("current_stage", env.current_stage);
    env.stage_order = j.value("stage_order", std::vector<std::string>{});
    env.iteration = j.value("iteration", 0);
    env.max_iterations = j.value("max_iterations", env.max_iterations);
    env.active_stages = j.value("active_stages", std::set<std::string>{});
    env.completed_stages = j.value("completed_stages", std::set<std::string>{});
    env.failed_stages = j.value("failed_stages", std::map<std::string, std::string>{});
    env.parallel_mode = j.value("parallel_mode", false);

    env.llm_call_count = j.value("llm_call_count", 0);
    env.max_llm_calls = j.value("max_llm_calls", env.max_llm_calls);
    env.tool_call_count = j.value("tool_call_count", 0);
    env.agent_hop_count = j.value("agent_hop_count", 0);
    env.max_agent_hops = j.value("max_agent_hops", env.max_agent_hops);
    env.tokens_in = j.value("tokens_in", int64_t{0});
    env.tokens_out = j.value("tokens_out", int64_t{0});

    if (env.llm_call_count < 0 || env.agent_hop_count < 0 || env.tool_call_count < 0 ||
        env.tokens_in < 0 || env.tokens_out < 0 || env.iteration < 0) {
        throw validation_error("envelope counters must be non-negative");
    }

    if (j.value("terminated", false)) {
        auto reason_name = j.value("terminal_reason", std::string("completed"));
        auto reason = terminal_reason_from_string(reason_name);
        if (!reason) {
            throw validation_error("unknown terminal reason: " + reason_name);
        }
        env.terminated = true;
        env.terminal_reason = reason;
        env.termination_message = j.value("termination_message", std::string());
        env.completed_at = read_time(j, "completed_at", util::now());
    }

    if (j.contains("interrupt") && !j["interrupt"].is_null()) {
        env.interrupt = interrupt_from_json(j["interrupt"]);
        env.interrupt_pending = j.value("interrupt_pending", true);
    }

    if (j.contains("processing_history") && j["processing_history"].is_array()) {
        for (const auto& r : j["processing_history"]) {
            ProcessingRecord record;
            record.agent = r.value("agent", std::string());
            record.stage_order = r.value("stage_order", 0);
            record.started_at = read_time(r, "started_at", util::now());
            record.completed_at = read_optional_time(r, "completed_at");
            record.duration_ms = r.value("duration_ms", int64_t{0});
            record.status = r.value("status", std::string("running"));
            record.error = read_optional_string(r, "error");
            record.llm_calls = r.value("llm_calls", 0);
            env.processing_history.push_back(std::move(record));
        }
    }

    if (j.contains("errors") && j["errors"].is_array()) {
        for (const auto& e : j["errors"]) {
            env.errors.push_back(ErrorRecord{
                e.value("agent", std::string()), e.value("error", std::string()),
                read_time(e, "timestamp", util::now())});
        }
    }

    env.created_at = read_time(j, "created_at", env.created_at);
    if (j.contains("metadata") && j["metadata"].is_object()) {
        env.metadata = j["metadata"];
    }
    return env;
}

} // namespace helm::kernel
