#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <unordered_map>

namespace helm::kernel {

// What a watched descriptor is interested in, and what fired
namespace interest {
constexpr uint32_t IN     = 0x001;  // EPOLLIN
constexpr uint32_t OUT    = 0x004;  // EPOLLOUT
constexpr uint32_t ERR    = 0x008;  // EPOLLERR
constexpr uint32_t HUP    = 0x010;  // EPOLLHUP
constexpr uint32_t CLIENT = IN | ERR | HUP;
}

// (fd, fired) -> void
using ReadyCallback = std::function<void(int fd, uint32_t fired)>;

// Single-threaded epoll loop. Every callback runs on the thread that
// called run(); only stop() may be called from elsewhere.
class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Creates the epoll set and its wakeup eventfd
    bool init();

    bool watch(int fd, uint32_t mask, ReadyCallback callback);
    bool rearm(int fd, uint32_t mask);
    // Safe from inside the fd's own callback
    bool unwatch(int fd);

    // One epoll_wait; returns the number of dispatched fds, -1 on failure
    int poll_once(int timeout_ms);

    // Blocks until stop()
    void run();

    // Async-signal-safe
    void stop();

    bool is_running() const { return running_.load(); }
    size_t watched() const { return callbacks_.size(); }

private:
    int epoll_fd_ = -1;
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::unordered_map<int, ReadyCallback> callbacks_;

    void drain_wakeups();
};

} // namespace helm::kernel
