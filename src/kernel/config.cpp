#include "kernel/config.hpp"
#include "kernel/error.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::kernel {

namespace {

const char* env_or_null(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

uint32_t parse_frame_bytes(const std::string& value) {
    try {
        long long n = std::stoll(value);
        if (n <= 0 || n > 0x7fffffffLL) {
            throw validation_error("max frame bytes out of range: " + value);
        }
        return static_cast<uint32_t>(n);
    } catch (const std::logic_error&) {
        throw validation_error("invalid max frame bytes: " + value);
    }
}

} // namespace

void apply_json(KernelConfig& config, const json& j) {
    if (!j.is_object()) {
        throw validation_error("config must be a JSON object");
    }

    config.log_level = j.value("log_level", config.log_level);

    if (j.contains("ipc")) {
        const auto& ipc = j["ipc"];
        config.ipc.socket_path = ipc.value("socket_path", config.ipc.socket_path);
        config.ipc.max_frame_bytes = ipc.value("max_frame_bytes", config.ipc.max_frame_bytes);
        config.ipc.max_connections = ipc.value("max_connections", config.ipc.max_connections);
    }

    if (j.contains("cleanup")) {
        const auto& c = j["cleanup"];
        config.cleanup.enabled = c.value("enabled", config.cleanup.enabled);
        config.cleanup.interval_seconds = c.value("interval_seconds", config.cleanup.interval_seconds);
        config.cleanup.process_retention_seconds =
            c.value("process_retention_seconds", config.cleanup.process_retention_seconds);
        config.cleanup.session_retention_seconds =
            c.value("session_retention_seconds", config.cleanup.session_retention_seconds);
        config.cleanup.interrupt_retention_seconds =
            c.value("interrupt_retention_seconds", config.cleanup.interrupt_retention_seconds);
        config.cleanup.max_user_usage_entries =
            c.value("max_user_usage_entries", config.cleanup.max_user_usage_entries);
    }

    if (j.contains("rate_limit")) {
        const auto& r = j["rate_limit"];
        config.rate_limit.requests_per_minute =
            r.value("requests_per_minute", config.rate_limit.requests_per_minute);
        config.rate_limit.requests_per_hour =
            r.value("requests_per_hour", config.rate_limit.requests_per_hour);
        config.rate_limit.burst_size = r.value("burst_size", config.rate_limit.burst_size);
    }

    if (j.contains("default_quota")) {
        config.default_quota = quota_from_json(j["default_quota"], config.default_quota);
    }
}

void apply_config_file(KernelConfig& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw validation_error("cannot open config file: " + path);
    }
    json j = json::parse(in);
    apply_json(config, j);
    spdlog::debug("Loaded config file {}", path);
}

void apply_env(KernelConfig& config) {
    if (const char* v = env_or_null("HELM_SOCKET_PATH")) {
        config.ipc.socket_path = v;
    }
    if (const char* v = env_or_null("HELM_LOG_LEVEL")) {
        config.log_level = v;
    }
    if (const char* v = env_or_null("HELM_MAX_FRAME_BYTES")) {
        config.ipc.max_frame_bytes = parse_frame_bytes(v);
    }
    if (const char* v = env_or_null("HELM_CLEANUP_INTERVAL")) {
        config.cleanup.interval_seconds = std::atoi(v);
    }
}

KernelConfig load_config(int argc, char** argv) {
    KernelConfig config;

    // The config file goes first so environment and flags can override it
    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            apply_config_file(config, argv[i + 1]);
        }
    }

    apply_env(config);

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw validation_error("missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            next();
        } else if (arg == "--log-level") {
            config.log_level = next();
        } else if (arg == "--max-frame-bytes") {
            config.ipc.max_frame_bytes = parse_frame_bytes(next());
        } else if (arg.rfind("--", 0) == 0) {
            throw validation_error("unknown option: " + arg);
        } else {
            config.ipc.socket_path = arg;
        }
    }

    if (config.cleanup.interval_seconds <= 0) {
        throw validation_error("cleanup interval must be positive");
    }
    if (config.ipc.socket_path.empty()) {
        throw validation_error("socket path must not be empty");
    }
    return config;
}

} // namespace helm::kernel
