#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "kernel/config.hpp"
#include "util/time.hpp"

namespace helm::kernel {

class Kernel;

struct CleanupStats {
    size_t processes_removed = 0;
    size_t sessions_removed = 0;
    size_t interrupts_expired = 0;
    size_t interrupts_purged = 0;
    size_t rate_windows_dropped = 0;
    size_t user_entries_dropped = 0;
    double duration_ms = 0;

    size_t total() const {
        return processes_removed + sessions_removed + interrupts_expired +
               interrupts_purged + rate_windows_dropped + user_entries_dropped;
    }
};

// Periodic reclamation of finished processes, idle sessions, old
// interrupts and rate-limit state. Each phase takes the kernel lock
// separately so request handling interleaves with a cycle.
class CleanupService {
public:
    CleanupService(Kernel& kernel, CleanupConfig config);
    ~CleanupService();

    // Non-copyable
    CleanupService(const CleanupService&) = delete;
    CleanupService& operator=(const CleanupService&) = delete;

    // Runs all four phases once
    CleanupStats run_cycle(util::Timestamp now = util::now());

    // Background thread running a cycle every interval_seconds
    void start();
    void stop();
    bool is_running() const { return worker_.joinable(); }

    const CleanupConfig& config() const { return config_; }

private:
    Kernel& kernel_;
    CleanupConfig config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool stopping_ = false;

    void worker_loop();
};

} // namespace helm::kernel
