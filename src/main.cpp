#include <memory>
#include <spdlog/spdlog.h>
#include "ipc/ipc_server.hpp"
#include "kernel/cleanup.hpp"
#include "kernel/config.hpp"
#include "kernel/kernel.hpp"
#include "util/logger.hpp"

int main(int argc, char** argv) {
    helm::kernel::KernelConfig config;
    try {
        config = helm::kernel::load_config(argc, argv);
    } catch (const std::exception& e) {
        helm::util::init_logger();
        spdlog::error("Invalid configuration: {}", e.what());
        spdlog::error("Usage: helmd [--config path] [--log-level level] [--max-frame-bytes n] [socket_path]");
        return 2;
    }

    helm::util::init_logger(config.log_level);

    spdlog::info("=================================");
    spdlog::info("  Helm Kernel v0.1.0");
    spdlog::info("=================================");

    helm::kernel::Kernel kernel(config);

    std::unique_ptr<helm::kernel::CleanupService> cleanup;
    if (config.cleanup.enabled) {
        cleanup = std::make_unique<helm::kernel::CleanupService>(kernel, config.cleanup);
    }

    helm::kernel::KernelContext context{config, kernel, cleanup.get()};
    helm::ipc::IpcServer server(context);

    if (!server.init()) {
        spdlog::error("Failed to initialize IPC server");
        return 1;
    }

    if (cleanup) {
        cleanup->start();
    }

    // Run (blocks until Ctrl+C)
    server.run();

    if (cleanup) {
        cleanup->stop();
    }
    spdlog::info("Kernel stopped");
    return 0;
}
