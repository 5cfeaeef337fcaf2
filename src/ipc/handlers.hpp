#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/router.hpp"
#include "kernel/context.hpp"
#include "kernel/envelope.hpp"
#include "kernel/pipeline_config.hpp"

namespace helm::ipc {

class KernelHandlers final : public ServiceModule {
public:
    explicit KernelHandlers(kernel::KernelContext& context) : context_(context) {}
    void register_methods(Router& router) override;
private:
    nlohmann::json handle_create_process(const nlohmann::json& body);
    nlohmann::json handle_get_process(const nlohmann::json& body);
    nlohmann::json handle_schedule_process(const nlohmann::json& body);
    nlohmann::json handle_get_next_runnable(const nlohmann::json& body);
    nlohmann::json handle_transition_state(const nlohmann::json& body);
    nlohmann::json handle_terminate_process(const nlohmann::json& body);
    nlohmann::json handle_check_quota(const nlohmann::json& body);
    nlohmann::json handle_record_usage(const nlohmann::json& body);
    nlohmann::json handle_check_rate_limit(const nlohmann::json& body);
    nlohmann::json handle_list_processes(const nlohmann::json& body);
    nlohmann::json handle_get_process_counts(const nlohmann::json& body);
    nlohmann::json handle_get_system_status(const nlohmann::json& body);
    kernel::KernelContext& context_;
};

class EngineHandlers final : public ServiceModule {
public:
    explicit EngineHandlers(kernel::KernelContext& context) : context_(context) {}
    void register_methods(Router& router) override;
private:
    nlohmann::json handle_create_envelope(const nlohmann::json& body);
    nlohmann::json handle_get_envelope(const nlohmann::json& body);
    nlohmann::json handle_update_envelope(const nlohmann::json& body);
    nlohmann::json handle_check_bounds(const nlohmann::json& body);
    nlohmann::json handle_execute_pipeline(const nlohmann::json& body);
    nlohmann::json handle_clone_envelope(const nlohmann::json& body);
    kernel::KernelContext& context_;
};

class OrchestrationHandlers final : public ServiceModule {
public:
    explicit OrchestrationHandlers(kernel::KernelContext& context) : context_(context) {}
    void register_methods(Router& router) override;
private:
    nlohmann::json handle_initialize_session(const nlohmann::json& body);
    nlohmann::json handle_get_next_instruction(const nlohmann::json& body);
    nlohmann::json handle_report_agent_result(const nlohmann::json& body);
    nlohmann::json handle_get_session_state(const nlohmann::json& body);
    kernel::KernelContext& context_;
};

class InterruptHandlers final : public ServiceModule {
public:
    explicit InterruptHandlers(kernel::KernelContext& context) : context_(context) {}
    void register_methods(Router& router) override;
private:
    nlohmann::json handle_create_interrupt(const nlohmann::json& body);
    nlohmann::json handle_resolve_interrupt(const nlohmann::json& body);
    nlohmann::json handle_cancel_interrupt(const nlohmann::json& body);
    nlohmann::json handle_get_interrupt(const nlohmann::json& body);
    nlohmann::json handle_get_pending_for_session(const nlohmann::json& body);
    kernel::KernelContext& context_;
};

// Registers all four services
void register_all(Router& router, kernel::KernelContext& context,
                  std::vector<std::unique_ptr<ServiceModule>>& modules);

// Shared body helpers; missing or mistyped fields throw validation errors
std::string require_string(const nlohmann::json& body, const char* field);
std::string optional_string(const nlohmann::json& body, const char* field,
                            const std::string& fallback = "");

// "pipeline" object, required
kernel::PipelineConfig pipeline_from_body(const nlohmann::json& body);
// "envelope" object, optional
std::optional<kernel::Envelope> envelope_from_body(const nlohmann::json& body);

} // namespace helm::ipc
