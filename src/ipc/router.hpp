#pragma once
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "ipc/protocol.hpp"

namespace helm::ipc {

// body -> result body; errors are thrown as kernel::KernelError
using MethodHandler = std::function<nlohmann::json(const nlohmann::json& body)>;

class Router;

// A group of methods published under one service name
class ServiceModule {
public:
    virtual ~ServiceModule() = default;
    virtual void register_methods(Router& router) = 0;
};

// Decodes MessagePack requests {id, service, method, body} and encodes
// {id, ok, body} replies, or {id, ok: false, error: {code, message}} in
// an ERROR frame.
class Router {
public:
    Router() = default;

    // Non-copyable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    void register_handler(const std::string& service, const std::string& method, MethodHandler handler);
    bool has_handler(const std::string& service, const std::string& method) const;
    std::vector<std::pair<std::string, std::string>> methods() const;

    // Throws KernelError (NOT_FOUND) for unknown service or method
    nlohmann::json dispatch(const std::string& service, const std::string& method,
                            const nlohmann::json& body) const;

    // Never throws; every failure becomes an ERROR frame
    Frame handle(const Frame& request) const;

private:
    std::map<std::pair<std::string, std::string>, MethodHandler> handlers_;

    static Frame reply(const nlohmann::json& id, const nlohmann::json& body);
    static Frame error_reply(const nlohmann::json& id, const std::string& code, const std::string& message);
};

} // namespace helm::ipc
