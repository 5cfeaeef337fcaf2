#include "ipc/handlers.hpp"
#include "kernel/error.hpp"

using json = nlohmann::json;

namespace helm::ipc {

void register_all(Router& router, kernel::KernelContext& context,
                  std::vector<std::unique_ptr<ServiceModule>>& modules) {
    modules.push_back(std::make_unique<KernelHandlers>(context));
    modules.push_back(std::make_unique<EngineHandlers>(context));
    modules.push_back(std::make_unique<OrchestrationHandlers>(context));
    modules.push_back(std::make_unique<InterruptHandlers>(context));
    for (auto& module : modules) {
        module->register_methods(router);
    }
}

std::string require_string(const json& body, const char* field) {
    auto it = body.find(field);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw kernel::validation_error(std::string(field) + " is required");
    }
    return it->get<std::string>();
}

std::string optional_string(const json& body, const char* field, const std::string& fallback) {
    auto it = body.find(field);
    if (it == body.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw kernel::validation_error(std::string(field) + " must be a string");
    }
    return it->get<std::string>();
}

kernel::PipelineConfig pipeline_from_body(const json& body) {
    if (!body.contains("pipeline") || !body["pipeline"].is_object()) {
        throw kernel::validation_error("pipeline is required");
    }
    return kernel::PipelineConfig::from_json(body["pipeline"]);
}

std::optional<kernel::Envelope> envelope_from_body(const json& body) {
    if (!body.contains("envelope") || body["envelope"].is_null()) {
        return std::nullopt;
    }
    return kernel::Envelope::from_json(body["envelope"]);
}

} // namespace helm::ipc
