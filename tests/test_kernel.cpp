#include <functional>
#include <limits>
#include <gtest/gtest.h>
#include "kernel/kernel.hpp"

using namespace helm::kernel;
using json = nlohmann::json;
namespace util = helm::util;

namespace {

KernelConfig relaxed_config() {
    KernelConfig config;
    config.rate_limit = RateLimitConfig{1000, 10000, 1000};
    return config;
}

CreateProcessRequest process_request(const std::string& pid, const std::string& user = "alice") {
    CreateProcessRequest request;
    request.pid = pid;
    request.request_id = "req-" + pid;
    request.user_id = user;
    request.session_id = "sess-" + pid;
    return request;
}

PipelineConfig two_stage_pipeline() {
    PipelineConfig config;
    config.name = "qa";
    StageConfig answer;
    answer.name = "answer";
    answer.stage_order = 0;
    StageConfig review;
    review.name = "review";
    review.stage_order = 1;
    config.stages = {answer, review};
    return config;
}

AgentResult success(const std::string& agent) {
    AgentResult result;
    result.agent_name = agent;
    result.output = json{{"text", agent + " output"}};
    return result;
}

ErrorKind error_kind_of(const std::function<void()>& call) {
    try {
        call();
    } catch (const KernelError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected KernelError";
    return ErrorKind::INTERNAL;
}

class KernelTest : public ::testing::Test {
protected:
    Kernel kernel{relaxed_config()};
};

} // namespace

// ============================================================================
// Processes
// ============================================================================

TEST_F(KernelTest, CreateProcessSchedulesIt) {
    auto pcb = kernel.create_process(process_request("p1"));
    EXPECT_EQ(pcb.state, ProcessState::READY);
    EXPECT_EQ(pcb.user_id.str(), "alice");
    EXPECT_EQ(pcb.request_id.str(), "req-p1");
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::READY);
}

TEST_F(KernelTest, CreateProcessFillsDefaults) {
    CreateProcessRequest request;
    request.pid = "p1";
    auto pcb = kernel.create_process(request);
    EXPECT_EQ(pcb.user_id.str(), "anonymous");
    EXPECT_EQ(pcb.request_id.str().rfind("req_", 0), 0u);
    EXPECT_EQ(pcb.session_id.str().rfind("sess_", 0), 0u);
}

TEST_F(KernelTest, CreateProcessIsIdempotent) {
    kernel.create_process(process_request("p1"));
    kernel.start_process("p1");

    auto again = kernel.create_process(process_request("p1", "bob"));
    EXPECT_EQ(again.state, ProcessState::RUNNING);
    EXPECT_EQ(again.user_id.str(), "alice");
    EXPECT_EQ(kernel.list_processes().size(), 1u);
}

TEST_F(KernelTest, CreateProcessRequiresPid) {
    EXPECT_EQ(error_kind_of([&] { kernel.create_process(CreateProcessRequest{}); }),
              ErrorKind::VALIDATION);
}

TEST(KernelRateLimitTest, CreateProcessConsumesRateLimit) {
    Kernel kernel;
    for (int i = 0; i < 10; i++) {
        kernel.create_process(process_request("p" + std::to_string(i)));
    }
    EXPECT_EQ(error_kind_of([&] { kernel.create_process(process_request("p10")); }),
              ErrorKind::QUOTA_EXCEEDED);
    EXPECT_NO_THROW(kernel.create_process(process_request("other", "bob")));

    // An existing pid does not count against the user
    EXPECT_NO_THROW(kernel.create_process(process_request("p0")));
}

TEST_F(KernelTest, HigherPriorityRunsFirst) {
    auto low = process_request("low");
    low.priority = SchedulingPriority::LOW;
    auto high = process_request("high");
    high.priority = SchedulingPriority::HIGH;
    kernel.create_process(low);
    kernel.create_process(high);

    auto next = kernel.get_next_runnable();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->pid.str(), "high");
    EXPECT_EQ(kernel.get_next_runnable()->pid.str(), "low");
    EXPECT_FALSE(kernel.get_next_runnable().has_value());
}

TEST_F(KernelTest, ParentPidLinksChild) {
    kernel.create_process(process_request("parent"));
    auto child = process_request("child");
    child.parent_pid = "parent";
    kernel.create_process(child);

    auto parent = kernel.get_process("parent");
    ASSERT_EQ(parent.child_pids.size(), 1u);
    EXPECT_EQ(parent.child_pids[0].str(), "child");
}

TEST_F(KernelTest, TransitionStateFollowsMatrix) {
    kernel.create_process(process_request("p1"));
    EXPECT_EQ(kernel.transition_state("p1", ProcessState::RUNNING).state, ProcessState::RUNNING);
    EXPECT_EQ(kernel.transition_state("p1", ProcessState::BLOCKED, "io").state, ProcessState::BLOCKED);
    EXPECT_EQ(error_kind_of([&] { kernel.transition_state("p1", ProcessState::RUNNING); }),
              ErrorKind::STATE_TRANSITION);
    EXPECT_EQ(kernel.transition_state("p1", ProcessState::READY).state, ProcessState::READY);
}

TEST_F(KernelTest, UnknownProcessIsNotFound) {
    EXPECT_EQ(error_kind_of([&] { kernel.get_process("ghost"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(error_kind_of([&] { kernel.check_quota("ghost"); }), ErrorKind::NOT_FOUND);
    EXPECT_FALSE(kernel.remove_process("ghost"));
}

TEST_F(KernelTest, ListProcessesFilters) {
    kernel.create_process(process_request("a", "alice"));
    kernel.create_process(process_request("b", "bob"));
    kernel.start_process("b");

    EXPECT_EQ(kernel.list_processes().size(), 2u);
    EXPECT_EQ(kernel.list_processes(ProcessState::RUNNING).size(), 1u);
    auto bobs = kernel.list_processes(std::nullopt, std::string("bob"));
    ASSERT_EQ(bobs.size(), 1u);
    EXPECT_EQ(bobs[0].pid.str(), "b");

    auto counts = kernel.process_counts();
    EXPECT_EQ(counts[ProcessState::READY], 1u);
    EXPECT_EQ(counts[ProcessState::RUNNING], 1u);
}

// ============================================================================
// Quota and usage
// ============================================================================

TEST_F(KernelTest, QuotaExhaustedAfterRecordedUsage) {
    auto request = process_request("p1");
    ResourceQuota quota;
    quota.max_llm_calls = 1;
    request.quota = quota;
    kernel.create_process(request);

    UsageDelta delta;
    delta.llm_calls = 1;
    auto usage = kernel.record_usage("p1", delta);
    EXPECT_EQ(usage.llm_calls, 1);

    auto check = kernel.check_quota("p1");
    EXPECT_FALSE(check.within_bounds);
    ASSERT_TRUE(check.violation.has_value());
    EXPECT_EQ(check.violation->dimension, "llm_calls");
    EXPECT_EQ(check.quota.max_llm_calls, 1);
}

TEST_F(KernelTest, RecordUsageAggregatesPerUser) {
    kernel.create_process(process_request("p1"));
    kernel.create_process(process_request("p2"));

    UsageDelta delta;
    delta.llm_calls = 2;
    delta.tokens_in = 100;
    kernel.record_usage("p1", delta);
    kernel.record_usage("p2", delta);
    kernel.record_tool_call("p1");
    kernel.record_agent_hop("p1");

    auto pcb = kernel.get_process("p1");
    EXPECT_EQ(pcb.usage.tool_calls, 1);
    EXPECT_EQ(pcb.usage.agent_hops, 1);

    auto user = kernel.get_user_usage("alice");
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->llm_calls, 4);
    EXPECT_EQ(user->tokens_in, 200);
    EXPECT_EQ(user->tool_calls, 1);
    EXPECT_FALSE(kernel.get_user_usage("nobody").has_value());

    auto budget = kernel.get_remaining_budget("p1");
    EXPECT_EQ(budget.llm_calls, ResourceQuota{}.max_llm_calls - 2);
}

TEST_F(KernelTest, RecordUsageRejectsNegativeAndTerminal) {
    kernel.create_process(process_request("p1"));

    UsageDelta negative;
    negative.tokens_out = -5;
    EXPECT_EQ(error_kind_of([&] { kernel.record_usage("p1", negative); }), ErrorKind::VALIDATION);
    EXPECT_EQ(kernel.get_process("p1").usage.tokens_out, 0);

    kernel.terminate_process("p1");
    EXPECT_EQ(error_kind_of([&] { kernel.record_tool_call("p1"); }), ErrorKind::STATE_TRANSITION);
}

TEST_F(KernelTest, UsageCountersSaturateInsteadOfWrapping) {
    kernel.create_process(process_request("p1"));

    UsageDelta delta;
    delta.llm_calls = std::numeric_limits<int>::max();
    delta.tokens_in = std::numeric_limits<int64_t>::max();
    kernel.record_usage("p1", delta);
    auto usage = kernel.record_usage("p1", delta);

    EXPECT_EQ(usage.llm_calls, std::numeric_limits<int>::max());
    EXPECT_EQ(usage.tokens_in, std::numeric_limits<int64_t>::max());

    auto user = kernel.get_user_usage("alice");
    ASSERT_TRUE(user.has_value());
    EXPECT_EQ(user->llm_calls, std::numeric_limits<int>::max());
    EXPECT_EQ(user->tokens_in, std::numeric_limits<int64_t>::max());
    EXPECT_FALSE(kernel.check_quota("p1").within_bounds);
}

TEST_F(KernelTest, AgentMetricsSaturateEnvelopeAndProcess) {
    kernel.create_process(process_request("p1"));
    kernel.execute_pipeline("p1", two_stage_pipeline(), std::nullopt, false);

    AgentExecutionMetrics metrics;
    metrics.llm_calls = std::numeric_limits<int>::max();
    kernel.report_agent_result("p1", metrics, success("answer"));

    EXPECT_EQ(kernel.get_envelope("p1").llm_call_count, std::numeric_limits<int>::max());
    EXPECT_EQ(kernel.get_process("p1").usage.llm_calls, std::numeric_limits<int>::max());
    EXPECT_GE(kernel.get_user_usage("alice")->llm_calls, 0);
}

TEST_F(KernelTest, DefaultQuotaAppliesToNewProcesses) {
    ResourceQuota overrides;
    overrides.max_agent_hops = 3;
    kernel.set_default_quota(overrides);

    EXPECT_EQ(kernel.default_quota().max_agent_hops, 3);
    EXPECT_EQ(kernel.create_process(process_request("p1")).quota.max_agent_hops, 3);
}

TEST_F(KernelTest, CheckRateLimitWithoutRecording) {
    kernel.set_user_rate_limits("carol", RateLimitConfig{60, 1000, 1});
    EXPECT_TRUE(kernel.check_rate_limit("carol", false).allowed);
    EXPECT_TRUE(kernel.check_rate_limit("carol").allowed);
    auto rejected = kernel.check_rate_limit("carol");
    EXPECT_FALSE(rejected.allowed);
    EXPECT_EQ(rejected.limit_type, "burst");
    EXPECT_EQ(error_kind_of([&] { kernel.check_rate_limit(""); }), ErrorKind::VALIDATION);
}

// ============================================================================
// Envelopes
// ============================================================================

TEST_F(KernelTest, EnvelopeForProcessTakesItsIdentity) {
    kernel.create_process(process_request("p1"));
    Envelope env;
    env.raw_input = "hello";
    kernel.create_envelope(env, std::string("p1"));

    auto stored = kernel.get_envelope("p1");
    EXPECT_EQ(stored.request_id, "req-p1");
    EXPECT_EQ(stored.user_id, "alice");
    EXPECT_EQ(stored.session_id, "sess-p1");
    EXPECT_EQ(stored.raw_input, "hello");

    EXPECT_EQ(error_kind_of([&] { kernel.create_envelope(Envelope{}, std::string("p1")); }),
              ErrorKind::VALIDATION);
}

TEST_F(KernelTest, EnvelopeWithoutProcessIsKeyedById) {
    Envelope env;
    auto created = kernel.create_envelope(env);
    EXPECT_EQ(kernel.get_envelope(created.envelope_id).envelope_id, env.envelope_id);
    EXPECT_EQ(error_kind_of([&] { kernel.get_envelope("missing"); }), ErrorKind::NOT_FOUND);
    EXPECT_TRUE(kernel.remove_envelope(created.envelope_id));
    EXPECT_FALSE(kernel.remove_envelope(created.envelope_id));
}

TEST_F(KernelTest, UpdateEnvelopeMergesFields) {
    auto created = kernel.create_envelope(Envelope{});
    const auto& key = created.envelope_id;

    kernel.update_envelope(key, json{{"outputs", {{"planner", {{"plan", "a"}}}}}});
    auto updated = kernel.update_envelope(key, json{
        {"raw_input", "new input"},
        {"current_stage", "executor"},
        {"outputs", {{"planner", {{"steps", 2}}}}},
        {"metadata", {{"trace", "t1"}}}
    });

    EXPECT_EQ(updated.raw_input, "new input");
    EXPECT_EQ(updated.current_stage, "executor");
    EXPECT_EQ(updated.get_output("planner", "plan").value(), json("a"));
    EXPECT_EQ(updated.get_output("planner", "steps").value(), json(2));
    EXPECT_EQ(updated.metadata["trace"], "t1");
}

TEST_F(KernelTest, UpdateEnvelopeValidatesBeforeWriting) {
    auto created = kernel.create_envelope(Envelope{});
    const auto& key = created.envelope_id;

    auto bad = json{{"raw_input", "changed"}, {"outputs", {{"planner", 5}}}};
    EXPECT_EQ(error_kind_of([&] { kernel.update_envelope(key, bad); }), ErrorKind::VALIDATION);
    EXPECT_EQ(kernel.get_envelope(key).raw_input, "");

    EXPECT_EQ(error_kind_of([&] { kernel.update_envelope(key, json{{"metadata", 1}}); }),
              ErrorKind::VALIDATION);
    EXPECT_EQ(error_kind_of([&] { kernel.update_envelope(key, json::array()); }),
              ErrorKind::VALIDATION);
}

TEST_F(KernelTest, UpdateEnvelopeRejectsNonStringScalars) {
    auto created = kernel.create_envelope(Envelope{});
    const auto& key = created.envelope_id;

    auto bad = json{{"raw_input", "changed"}, {"current_stage", 42}};
    EXPECT_EQ(error_kind_of([&] { kernel.update_envelope(key, bad); }), ErrorKind::VALIDATION);
    EXPECT_EQ(kernel.get_envelope(key).raw_input, "");

    EXPECT_EQ(error_kind_of([&] { kernel.update_envelope(key, json{{"raw_input", false}}); }),
              ErrorKind::VALIDATION);
}

TEST_F(KernelTest, CheckBoundsReportsRemaining) {
    Envelope env;
    env.max_llm_calls = 5;
    env.llm_call_count = 2;
    env.max_iterations = 3;
    auto created = kernel.create_envelope(env);

    auto bounds = kernel.check_bounds(created.envelope_id);
    EXPECT_TRUE(bounds.can_continue);
    EXPECT_FALSE(bounds.terminal_reason.has_value());
    EXPECT_EQ(bounds.llm_calls_remaining, 3);
    EXPECT_EQ(bounds.iterations_remaining, 3);

    Envelope spent;
    spent.max_llm_calls = 2;
    spent.llm_call_count = 2;
    auto exhausted = kernel.create_envelope(spent);
    auto check = kernel.check_bounds(exhausted.envelope_id);
    EXPECT_FALSE(check.can_continue);
    EXPECT_EQ(check.terminal_reason, TerminalReason::MAX_LLM_CALLS_EXCEEDED);
    EXPECT_EQ(check.llm_calls_remaining, 0);
}

TEST_F(KernelTest, CloneEnvelopeStoresCopy) {
    auto created = kernel.create_envelope(Envelope{});
    auto copy = kernel.clone_envelope(created.envelope_id, std::string("copy"));
    EXPECT_NE(copy.envelope_id, created.envelope_id);
    EXPECT_EQ(kernel.get_envelope("copy").envelope_id, copy.envelope_id);

    EXPECT_EQ(error_kind_of([&] { kernel.clone_envelope(created.envelope_id, std::string("copy")); }),
              ErrorKind::VALIDATION);
}

// ============================================================================
// Interrupts
// ============================================================================

TEST_F(KernelTest, InterruptSuspendsAndResolutionResumes) {
    kernel.create_process(process_request("p1"));
    kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);
    EXPECT_EQ(kernel.get_next_instruction("p1").kind, InstructionKind::EXECUTE);
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::RUNNING);

    CreateInterruptParams params;
    params.kind = InterruptKind::CLARIFICATION;
    params.process_id = "p1";
    params.question = "Which account?";
    auto interrupt = kernel.create_interrupt(params);

    EXPECT_EQ(interrupt.session_id, "sess-p1");
    EXPECT_EQ(interrupt.user_id, "alice");
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::WAITING);
    EXPECT_TRUE(kernel.get_envelope("p1").interrupt_pending);
    EXPECT_EQ(kernel.get_next_instruction("p1").kind, InstructionKind::WAIT);

    auto pending = kernel.get_pending_for_session("sess-p1");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id(), interrupt.id());
    EXPECT_TRUE(kernel.get_pending_for_request("req-p1").has_value());

    InterruptResponse response;
    response.text = "Savings";
    EXPECT_FALSE(kernel.resolve_interrupt(interrupt.id(), response, std::string("mallory")));
    EXPECT_TRUE(kernel.resolve_interrupt(interrupt.id(), response, std::string("alice")));
    EXPECT_FALSE(kernel.resolve_interrupt(interrupt.id(), response));

    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::READY);
    EXPECT_FALSE(kernel.get_envelope("p1").interrupt_pending);
    EXPECT_EQ(kernel.get_interrupt(interrupt.id()).status, InterruptStatus::RESOLVED);

    auto instruction = kernel.get_next_instruction("p1");
    EXPECT_EQ(instruction.kind, InstructionKind::EXECUTE);
    EXPECT_EQ(instruction.agent_name, "answer");
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::RUNNING);
}

TEST_F(KernelTest, CancelInterruptReleasesProcess) {
    kernel.create_process(process_request("p1"));
    kernel.start_process("p1");

    CreateInterruptParams params;
    params.kind = InterruptKind::CONFIRMATION;
    params.process_id = "p1";
    auto interrupt = kernel.create_interrupt(params);
    EXPECT_EQ(kernel.get_process("p1").pending_interrupt, InterruptKind::CONFIRMATION);

    EXPECT_TRUE(kernel.cancel_interrupt(interrupt.id(), "user left"));
    EXPECT_FALSE(kernel.cancel_interrupt(interrupt.id(), "again"));
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::READY);
    EXPECT_EQ(kernel.get_interrupt(interrupt.id()).status, InterruptStatus::CANCELLED);
}

TEST_F(KernelTest, InterruptNeedsAnOwner) {
    CreateInterruptParams params;
    EXPECT_EQ(error_kind_of([&] { kernel.create_interrupt(params); }), ErrorKind::VALIDATION);

    params.session_id = "sess-x";
    auto interrupt = kernel.create_interrupt(params);
    EXPECT_TRUE(interrupt.process_id.empty());

    EXPECT_EQ(error_kind_of([&] { kernel.get_interrupt("int_missing"); }), ErrorKind::NOT_FOUND);
}

TEST_F(KernelTest, InterruptOnTerminatedProcessIsRejected) {
    kernel.create_process(process_request("p1"));
    kernel.terminate_process("p1");

    CreateInterruptParams params;
    params.process_id = "p1";
    EXPECT_EQ(error_kind_of([&] { kernel.create_interrupt(params); }), ErrorKind::STATE_TRANSITION);
}

TEST_F(KernelTest, WaitAndResumeKeepEnvelopeInStep) {
    kernel.create_process(process_request("p1"));
    kernel.create_envelope(Envelope{}, std::string("p1"));
    kernel.start_process("p1");

    kernel.wait_process("p1", InterruptKind::CHECKPOINT);
    auto waiting = kernel.get_envelope("p1");
    EXPECT_TRUE(waiting.interrupt_pending);
    EXPECT_EQ(waiting.interrupt->kind, InterruptKind::CHECKPOINT);

    kernel.resume_process("p1");
    EXPECT_FALSE(kernel.get_envelope("p1").interrupt_pending);
    EXPECT_EQ(kernel.get_interrupt(waiting.interrupt->id).status, InterruptStatus::CANCELLED);
}

TEST_F(KernelTest, WaitProcessRecordsResolvableInterrupt) {
    kernel.create_process(process_request("p1"));
    kernel.create_envelope(Envelope{}, std::string("p1"));
    kernel.start_process("p1");

    kernel.wait_process("p1", InterruptKind::CONFIRMATION);
    auto env = kernel.get_envelope("p1");
    ASSERT_TRUE(env.interrupt.has_value());

    auto recorded = kernel.get_interrupt(env.interrupt->id);
    EXPECT_EQ(recorded.status, InterruptStatus::PENDING);
    EXPECT_EQ(recorded.process_id, "p1");
    EXPECT_EQ(recorded.session_id, "sess-p1");
    EXPECT_TRUE(kernel.get_pending_for_request("req-p1").has_value());

    EXPECT_TRUE(kernel.resolve_interrupt(env.interrupt->id, InterruptResponse{}));
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::READY);
    EXPECT_FALSE(kernel.get_envelope("p1").interrupt_pending);
}

TEST_F(KernelTest, ProcessHoldsOneInterruptAtATime) {
    kernel.create_process(process_request("p1"));
    kernel.create_envelope(Envelope{}, std::string("p1"));
    kernel.start_process("p1");

    CreateInterruptParams params;
    params.kind = InterruptKind::CLARIFICATION;
    params.process_id = "p1";
    auto first = kernel.create_interrupt(params);

    params.kind = InterruptKind::CONFIRMATION;
    EXPECT_EQ(error_kind_of([&] { kernel.create_interrupt(params); }), ErrorKind::STATE_TRANSITION);
    EXPECT_EQ(error_kind_of([&] { kernel.wait_process("p1", InterruptKind::CHECKPOINT); }),
              ErrorKind::STATE_TRANSITION);
    EXPECT_EQ(kernel.get_envelope("p1").interrupt->id, first.id());
    EXPECT_EQ(kernel.get_pending_for_session("sess-p1").size(), 1u);

    EXPECT_TRUE(kernel.resolve_interrupt(first.id(), InterruptResponse{}));
    kernel.start_process("p1");
    auto second = kernel.create_interrupt(params);
    EXPECT_NE(second.id(), first.id());
    EXPECT_EQ(kernel.get_envelope("p1").interrupt->id, second.id());
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::WAITING);
}

TEST_F(KernelTest, TerminateProcessCancelsItsInterrupt) {
    kernel.create_process(process_request("p1"));
    kernel.start_process("p1");

    CreateInterruptParams params;
    params.kind = InterruptKind::CLARIFICATION;
    params.process_id = "p1";
    auto interrupt = kernel.create_interrupt(params);

    kernel.terminate_process("p1");
    EXPECT_EQ(kernel.get_interrupt(interrupt.id()).status, InterruptStatus::CANCELLED);
    EXPECT_TRUE(kernel.get_pending_for_session("sess-p1").empty());
}

// ============================================================================
// Orchestration
// ============================================================================

TEST_F(KernelTest, PipelineRunsToCompletion) {
    kernel.create_process(process_request("p1"));
    Envelope input;
    input.raw_input = "What is the balance?";

    auto start = kernel.execute_pipeline("p1", two_stage_pipeline(), input, false);
    EXPECT_EQ(start.instruction.kind, InstructionKind::EXECUTE);
    EXPECT_EQ(start.instruction.agent_name, "answer");
    EXPECT_EQ(start.state.status, SessionStatus::RUNNING);
    EXPECT_EQ(kernel.get_process("p1").current_stage, std::string("answer"));

    AgentExecutionMetrics metrics;
    metrics.llm_calls = 1;
    metrics.tokens_in = 50;
    metrics.tokens_out = 20;
    kernel.report_agent_result("p1", metrics, success("answer"));
    EXPECT_EQ(kernel.get_next_instruction("p1").agent_name, "review");
    auto state = kernel.report_agent_result("p1", metrics, success("review"));
    EXPECT_EQ(state.current_stage, kEndStage);

    auto done = kernel.get_next_instruction("p1");
    EXPECT_EQ(done.kind, InstructionKind::TERMINATE);
    EXPECT_EQ(done.terminal_reason, TerminalReason::COMPLETED);

    auto pcb = kernel.get_process("p1");
    EXPECT_EQ(pcb.state, ProcessState::TERMINATED);
    EXPECT_EQ(pcb.usage.llm_calls, 2);
    EXPECT_EQ(pcb.usage.agent_hops, 2);
    EXPECT_EQ(pcb.usage.tokens_out, 40);

    auto env = kernel.get_envelope("p1");
    EXPECT_EQ(env.raw_input, "What is the balance?");
    EXPECT_EQ(env.user_id, "alice");
    EXPECT_EQ(env.get_output("review", "text").value(), json("review output"));
    EXPECT_EQ(kernel.get_user_usage("alice")->llm_calls, 2);
}

TEST_F(KernelTest, BoundsTerminationEndsTheProcess) {
    kernel.create_process(process_request("p1"));
    auto config = two_stage_pipeline();
    config.max_llm_calls = 1;
    kernel.execute_pipeline("p1", config, std::nullopt, false);

    AgentExecutionMetrics metrics;
    metrics.llm_calls = 1;
    kernel.report_agent_result("p1", metrics, success("answer"));

    auto instruction = kernel.get_next_instruction("p1");
    EXPECT_EQ(instruction.terminal_reason, TerminalReason::MAX_LLM_CALLS_EXCEEDED);
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::TERMINATED);

    // Late results are not charged again
    kernel.report_agent_result("p1", metrics, success("review"));
    EXPECT_EQ(kernel.get_process("p1").usage.llm_calls, 1);
}

TEST_F(KernelTest, InitializeTwiceNeedsForceAndForceResets) {
    kernel.create_process(process_request("p1"));
    Envelope input;
    input.raw_input = "original question";
    input.metadata["channel"] = "web";
    kernel.initialize_orchestration("p1", two_stage_pipeline(), input, false);
    auto envelope_id = kernel.get_envelope("p1").envelope_id;

    kernel.get_next_instruction("p1");
    kernel.report_agent_result("p1", AgentExecutionMetrics{}, success("answer"));
    EXPECT_EQ(kernel.get_session_state("p1").current_stage, "review");

    EXPECT_EQ(error_kind_of([&] {
        kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);
    }), ErrorKind::VALIDATION);
    EXPECT_EQ(kernel.get_session_state("p1").current_stage, "review");

    auto state = kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, true);
    EXPECT_EQ(state.current_stage, "answer");
    EXPECT_EQ(state.agent_hop_count, 0);

    auto env = kernel.get_envelope("p1");
    EXPECT_EQ(env.envelope_id, envelope_id);
    EXPECT_EQ(env.raw_input, "original question");
    EXPECT_EQ(env.metadata["channel"], "web");
    EXPECT_TRUE(env.outputs.empty());
    EXPECT_TRUE(env.completed_stages.empty());
}

TEST_F(KernelTest, TerminateProcessCancelsTheEnvelope) {
    kernel.create_process(process_request("p1"));
    kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);

    kernel.terminate_process("p1", "user closed the tab");
    auto env = kernel.get_envelope("p1");
    EXPECT_TRUE(env.terminated);
    EXPECT_EQ(env.terminal_reason, TerminalReason::USER_CANCELLED);
    EXPECT_EQ(env.termination_message, "user closed the tab");

    auto instruction = kernel.get_next_instruction("p1");
    EXPECT_EQ(instruction.kind, InstructionKind::TERMINATE);
    EXPECT_EQ(instruction.terminal_reason, TerminalReason::USER_CANCELLED);
}

TEST_F(KernelTest, OrchestrationWithoutSessionIsNotFound) {
    EXPECT_EQ(error_kind_of([&] { kernel.get_next_instruction("p1"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(error_kind_of([&] { kernel.get_session_state("p1"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(error_kind_of([&] {
        kernel.initialize_orchestration("", two_stage_pipeline(), std::nullopt, false);
    }), ErrorKind::VALIDATION);
}

TEST_F(KernelTest, RejectedInitializationLeavesNoEnvelope) {
    PipelineConfig empty;
    empty.name = "empty";
    EXPECT_EQ(error_kind_of([&] { kernel.initialize_orchestration("p1", empty, std::nullopt, false); }),
              ErrorKind::VALIDATION);
    EXPECT_EQ(error_kind_of([&] { kernel.get_envelope("p1"); }), ErrorKind::NOT_FOUND);
}

// ============================================================================
// Reclamation and status
// ============================================================================

TEST_F(KernelTest, CleanupZombiesRemovesFinishedProcesses) {
    kernel.create_process(process_request("done"));
    kernel.create_process(process_request("live"));
    kernel.initialize_orchestration("done", two_stage_pipeline(), std::nullopt, false);
    kernel.terminate_process("done");

    auto now = util::now();
    EXPECT_EQ(kernel.cleanup_zombies(std::chrono::seconds(60), now), 0u);
    EXPECT_EQ(kernel.cleanup_zombies(std::chrono::seconds(60), now + std::chrono::seconds(120)), 1u);

    EXPECT_EQ(error_kind_of([&] { kernel.get_process("done"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(error_kind_of([&] { kernel.get_envelope("done"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(kernel.get_process("live").state, ProcessState::READY);
    EXPECT_EQ(kernel.system_status().sessions, 0u);
}

TEST_F(KernelTest, CleanupStaleSessionsDropsEnvelopes) {
    kernel.create_process(process_request("p1"));
    kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);

    EXPECT_EQ(kernel.cleanup_stale_sessions(std::chrono::hours(1), util::now()), 0u);
    EXPECT_EQ(kernel.cleanup_stale_sessions(std::chrono::hours(1),
                                            util::now() + std::chrono::hours(2)), 1u);
    EXPECT_EQ(error_kind_of([&] { kernel.get_session_state("p1"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(error_kind_of([&] { kernel.get_envelope("p1"); }), ErrorKind::NOT_FOUND);
}

TEST_F(KernelTest, CleanupInterruptsExpiresThenPurges) {
    CreateInterruptParams params;
    params.session_id = "sess-x";
    params.ttl_seconds = 1;
    kernel.create_interrupt(params);

    auto later = util::now() + std::chrono::seconds(10);
    auto first = kernel.cleanup_interrupts(std::chrono::hours(1), later);
    EXPECT_EQ(first.first, 1u);
    EXPECT_EQ(first.second, 0u);

    auto second = kernel.cleanup_interrupts(std::chrono::hours(1), later + std::chrono::hours(2));
    EXPECT_EQ(second.first, 0u);
    EXPECT_EQ(second.second, 1u);
}

TEST_F(KernelTest, ExpiredInterruptTerminatesHeldProcess) {
    kernel.create_process(process_request("p1"));
    kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);
    EXPECT_EQ(kernel.get_next_instruction("p1").kind, InstructionKind::EXECUTE);

    CreateInterruptParams params;
    params.kind = InterruptKind::TIMEOUT;
    params.process_id = "p1";
    auto interrupt = kernel.create_interrupt(params);
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::WAITING);

    auto later = util::now() + std::chrono::hours(2);
    EXPECT_EQ(kernel.cleanup_interrupts(std::chrono::hours(24), later).first, 1u);

    EXPECT_EQ(kernel.get_interrupt(interrupt.id()).status, InterruptStatus::EXPIRED);
    EXPECT_EQ(kernel.get_process("p1").state, ProcessState::TERMINATED);
    EXPECT_TRUE(kernel.get_envelope("p1").terminated);
    EXPECT_EQ(kernel.get_next_instruction("p1").kind, InstructionKind::TERMINATE);
}

TEST_F(KernelTest, CleanupRateLimitsAndUsage) {
    kernel.create_process(process_request("p1", "alice"));
    kernel.create_process(process_request("p2", "bob"));
    kernel.record_tool_call("p1");
    kernel.record_tool_call("p2");
    kernel.terminate_process("p1");

    auto result = kernel.cleanup_rate_limits_and_usage(100, util::now() + std::chrono::hours(2));
    EXPECT_EQ(result.first, 2u);
    EXPECT_EQ(result.second, 1u);
    EXPECT_FALSE(kernel.get_user_usage("alice").has_value());
    EXPECT_TRUE(kernel.get_user_usage("bob").has_value());
}

TEST_F(KernelTest, SystemStatusSummarizesState) {
    kernel.create_process(process_request("p1"));
    kernel.create_process(process_request("p2", "bob"));
    kernel.initialize_orchestration("p1", two_stage_pipeline(), std::nullopt, false);
    kernel.record_tool_call("p2");

    CreateInterruptParams params;
    params.session_id = "sess-p2";
    kernel.create_interrupt(params);

    auto status = kernel.system_status();
    EXPECT_EQ(status.total_processes, 2u);
    EXPECT_EQ(status.processes_by_state[ProcessState::READY], 2u);
    EXPECT_EQ(status.ready_queue, 2u);
    EXPECT_EQ(status.envelopes, 1u);
    EXPECT_EQ(status.sessions, 1u);
    EXPECT_EQ(status.interrupts.pending, 1u);
    EXPECT_EQ(status.rate_limited_users, 2u);
    EXPECT_EQ(status.tracked_users, 1u);
    EXPECT_EQ(status.usage_totals.tool_calls, 1);

    json j = status.to_json();
    EXPECT_EQ(j["processes_by_state"]["READY"], 2);
    EXPECT_EQ(j["interrupts"]["pending"], 1);
}
