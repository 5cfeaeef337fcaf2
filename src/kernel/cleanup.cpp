#include "kernel/cleanup.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"
#include <spdlog/spdlog.h>

namespace helm::kernel {

CleanupService::CleanupService(Kernel& kernel, CleanupConfig config)
    : kernel_(kernel), config_(config) {
    if (config_.interval_seconds <= 0) {
        throw validation_error("cleanup interval must be positive");
    }
}

CleanupService::~CleanupService() {
    stop();
}

CleanupStats CleanupService::run_cycle(util::Timestamp now) {
    auto started = std::chrono::steady_clock::now();
    CleanupStats stats;

    stats.processes_removed = kernel_.cleanup_zombies(
        std::chrono::seconds(config_.process_retention_seconds), now);

    stats.sessions_removed = kernel_.cleanup_stale_sessions(
        std::chrono::seconds(config_.session_retention_seconds), now);

    auto [expired, purged] = kernel_.cleanup_interrupts(
        std::chrono::seconds(config_.interrupt_retention_seconds), now);
    stats.interrupts_expired = expired;
    stats.interrupts_purged = purged;

    auto [windows, users] = kernel_.cleanup_rate_limits_and_usage(
        config_.max_user_usage_entries, now);
    stats.rate_windows_dropped = windows;
    stats.user_entries_dropped = users;

    stats.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();

    if (stats.total() > 0) {
        spdlog::info("Cleanup cycle: processes={} sessions={} interrupts={}/{} rate_windows={} users={} ({:.1f}ms)",
            stats.processes_removed, stats.sessions_removed,
            stats.interrupts_expired, stats.interrupts_purged,
            stats.rate_windows_dropped, stats.user_entries_dropped, stats.duration_ms);
    } else {
        spdlog::debug("Cleanup cycle: nothing to reclaim ({:.1f}ms)", stats.duration_ms);
    }
    return stats;
}

void CleanupService::start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    worker_ = std::thread(&CleanupService::worker_loop, this);
    spdlog::info("Cleanup service started (interval={}s)", config_.interval_seconds);
}

void CleanupService::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("Cleanup service stopped");
    }
}

void CleanupService::worker_loop() {
    auto interval = std::chrono::seconds(config_.interval_seconds);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval, [this]() { return stopping_; })) {
                break;
            }
        }

        try {
            run_cycle();
        } catch (const KernelError& e) {
            spdlog::error("Cleanup cycle failed [{}]: {}", e.code(), e.what());
        }
    }
}

} // namespace helm::kernel
