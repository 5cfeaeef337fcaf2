#include "kernel/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace helm::kernel {

static_assert(interest::IN == EPOLLIN && interest::OUT == EPOLLOUT &&
              interest::ERR == EPOLLERR && interest::HUP == EPOLLHUP,
              "interest bits must match epoll");

Reactor::Reactor() = default;

Reactor::~Reactor() {
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("epoll_create1 failed: {}", strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        spdlog::error("eventfd failed: {}", strerror(errno));
        return false;
    }

    // The wakeup fd is registered directly so it never shows up in watched()
    struct epoll_event ev {};
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        spdlog::error("Cannot watch wakeup fd: {}", strerror(errno));
        return false;
    }

    spdlog::debug("Reactor ready (epoll_fd={}, wake_fd={})", epoll_fd_, wake_fd_);
    return true;
}

bool Reactor::watch(int fd, uint32_t mask, ReadyCallback callback) {
    struct epoll_event ev {};
    ev.events = mask;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Cannot watch fd {}: {}", fd, strerror(errno));
        return false;
    }
    callbacks_[fd] = std::move(callback);
    return true;
}

bool Reactor::rearm(int fd, uint32_t mask) {
    struct epoll_event ev {};
    ev.events = mask;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("Cannot rearm fd {}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::unwatch(int fd) {
    // ENOENT and EBADF mean the fd is already gone from the set
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0 &&
        errno != ENOENT && errno != EBADF) {
        spdlog::error("Cannot unwatch fd {}: {}", fd, strerror(errno));
        return false;
    }
    callbacks_.erase(fd);
    return true;
}

void Reactor::drain_wakeups() {
    uint64_t count = 0;
    while (read(wake_fd_, &count, sizeof(count)) > 0) {
    }
}

int Reactor::poll_once(int timeout_ms) {
    constexpr int BATCH = 64;
    struct epoll_event ready[BATCH];

    int n = epoll_wait(epoll_fd_, ready, BATCH, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    int dispatched = 0;
    for (int i = 0; i < n; i++) {
        int fd = ready[i].data.fd;
        if (fd == wake_fd_) {
            drain_wakeups();
            continue;
        }
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end()) {
            continue;  // unwatched earlier in this batch
        }
        ReadyCallback callback = it->second;
        callback(fd, ready[i].events);
        dispatched++;
    }
    return dispatched;
}

void Reactor::run() {
    running_ = true;
    spdlog::debug("Reactor loop started ({} fds)", callbacks_.size());

    while (!stop_requested_.load()) {
        if (poll_once(-1) < 0) {
            break;
        }
    }

    running_ = false;
    stop_requested_ = false;
    spdlog::debug("Reactor loop stopped");
}

void Reactor::stop() {
    stop_requested_ = true;
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        // Only fails when the counter would overflow, which still wakes the loop
        ssize_t written = write(wake_fd_, &one, sizeof(one));
        (void)written;
    }
}

} // namespace helm::kernel
