#include "ipc/router.hpp"
#include "kernel/error.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::ipc {

void Router::register_handler(const std::string& service, const std::string& method,
                              MethodHandler handler) {
    handlers_[{service, method}] = std::move(handler);
    spdlog::debug("Registered {}.{}", service, method);
}

bool Router::has_handler(const std::string& service, const std::string& method) const {
    return handlers_.count({service, method}) > 0;
}

std::vector<std::pair<std::string, std::string>> Router::methods() const {
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(handlers_.size());
    for (const auto& [key, handler] : handlers_) {
        result.push_back(key);
    }
    return result;
}

json Router::dispatch(const std::string& service, const std::string& method, const json& body) const {
    auto it = handlers_.find({service, method});
    if (it == handlers_.end()) {
        throw kernel::not_found_error("method", service + "." + method);
    }
    return it->second(body);
}

Frame Router::handle(const Frame& request) const {
    if (request.type != MessageType::REQUEST) {
        return error_reply(nullptr, "INVALID_ARGUMENT",
            std::string("expected REQUEST frame, got ") + message_type_to_string(request.type));
    }

    json envelope;
    try {
        envelope = json::from_msgpack(request.payload);
    } catch (const json::exception& e) {
        return error_reply(nullptr, "INVALID_ARGUMENT", std::string("malformed request: ") + e.what());
    }
    if (!envelope.is_object()) {
        return error_reply(nullptr, "INVALID_ARGUMENT", "request must be a map");
    }

    json id = envelope.value("id", json());
    try {
        std::string service = envelope.at("service").get<std::string>();
        std::string method = envelope.at("method").get<std::string>();
        json body = envelope.value("body", json::object());
        if (body.is_null()) {
            body = json::object();
        }

        spdlog::debug("Request {}.{} id={}", service, method, id.dump());
        return reply(id, dispatch(service, method, body));
    } catch (const kernel::KernelError& e) {
        spdlog::warn("Request failed [{}]: {}", e.code(), e.what());
        return error_reply(id, e.code(), e.what());
    } catch (const json::exception& e) {
        spdlog::warn("Invalid request body: {}", e.what());
        return error_reply(id, "INVALID_ARGUMENT", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error in request: {}", e.what());
        return error_reply(id, "INTERNAL", e.what());
    }
}

Frame Router::reply(const json& id, const json& body) {
    json response = {{"id", id}, {"ok", true}, {"body", body}};
    return Frame(MessageType::RESPONSE, json::to_msgpack(response));
}

Frame Router::error_reply(const json& id, const std::string& code, const std::string& message) {
    json response = {
        {"id", id},
        {"ok", false},
        {"error", {{"code", code}, {"message", message}}}
    };
    return Frame(MessageType::ERROR, json::to_msgpack(response));
}

} // namespace helm::ipc
