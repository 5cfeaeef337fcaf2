#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "kernel/rate_limiter.hpp"
#include "kernel/types.hpp"

namespace helm::kernel {

// Transport configuration
struct IpcConfig {
    std::string socket_path = "/tmp/helm.sock";
    uint32_t max_frame_bytes = 16 * 1024 * 1024;
    size_t max_connections = 1024;
};

// Background reclamation schedule
struct CleanupConfig {
    bool enabled = true;
    int interval_seconds = 300;
    int process_retention_seconds = 86400;
    int session_retention_seconds = 3600;
    int interrupt_retention_seconds = 86400;
    size_t max_user_usage_entries = 10000;
};

// Kernel configuration
struct KernelConfig {
    IpcConfig ipc;
    CleanupConfig cleanup;
    RateLimitConfig rate_limit;
    ResourceQuota default_quota;
    std::string log_level = "info";
};

// Overrides fields present in a JSON document, e.g.
//   {"ipc": {"socket_path": "/run/helm.sock"}, "cleanup": {"interval_seconds": 60}}
void apply_json(KernelConfig& config, const nlohmann::json& j);

// Reads and applies a JSON config file; throws on I/O or parse errors
void apply_config_file(KernelConfig& config, const std::string& path);

// HELM_SOCKET_PATH, HELM_LOG_LEVEL, HELM_MAX_FRAME_BYTES, HELM_CLEANUP_INTERVAL
void apply_env(KernelConfig& config);

// Defaults, then --config file, then environment, then remaining flags:
//   helmd [--config path] [--log-level level] [--max-frame-bytes n] [socket_path]
KernelConfig load_config(int argc, char** argv);

} // namespace helm::kernel
