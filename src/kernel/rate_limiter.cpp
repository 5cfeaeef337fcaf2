#include "kernel/rate_limiter.hpp"
#include "kernel/error.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace helm::kernel {

namespace {

constexpr auto kHour = std::chrono::hours(1);
constexpr auto kMinute = std::chrono::minutes(1);
constexpr auto kBurst = std::chrono::seconds(10);

// Timestamps are appended in order, so counting from the back stops early
int count_since(const std::deque<util::Timestamp>& window, util::Timestamp since) {
    int count = 0;
    for (auto it = window.rbegin(); it != window.rend() && *it >= since; ++it) {
        count++;
    }
    return count;
}

// Seconds until the window drops back below limit
double retry_after(const std::deque<util::Timestamp>& window, util::Timestamp now,
                   util::Clock::duration span, int count, int limit) {
    size_t first_in_window = window.size() - static_cast<size_t>(count);
    size_t index = first_in_window + static_cast<size_t>(count - limit);
    if (index >= window.size()) {
        return 0.0;
    }
    return std::max(0.0, util::seconds_between(now, window[index] + span));
}

} // namespace

RateLimiter::RateLimiter(RateLimitConfig config)
    : default_config_(config) {}

RateLimitResult RateLimiter::check_and_record(const std::string& user_id, util::Timestamp now,
                                              bool record) {
    const auto& config = config_for(user_id);

    auto it = windows_.find(user_id);
    std::deque<util::Timestamp> scratch;
    std::deque<util::Timestamp>* window = &scratch;
    if (it != windows_.end()) {
        if (record) {
            window = &it->second;
        } else {
            scratch = it->second;
        }
    }
    evict(*window, now);

    RateLimitResult result;
    int hour_count = static_cast<int>(window->size());
    int minute_count = count_since(*window, now - kMinute);
    int burst_count = count_since(*window, now - kBurst);

    auto reject = [&](const char* type, int count, int limit, util::Clock::duration span,
                      const std::string& reason) {
        result.allowed = false;
        result.limit_type = type;
        result.current_count = count;
        result.limit = limit;
        result.retry_after_seconds = retry_after(*window, now, span, count, limit);
        result.remaining = 0;
        result.reason = reason;
        spdlog::warn("Rate limit for user {}: {}", user_id, reason);
        return result;
    };

    if (config.requests_per_hour > 0 && hour_count >= config.requests_per_hour) {
        return reject("hour", hour_count, config.requests_per_hour, kHour,
            "Rate limit exceeded: " + std::to_string(config.requests_per_hour) + " requests per hour");
    }
    if (config.requests_per_minute > 0 && minute_count >= config.requests_per_minute) {
        return reject("minute", minute_count, config.requests_per_minute, kMinute,
            "Rate limit exceeded: " + std::to_string(config.requests_per_minute) + " requests per minute");
    }
    if (config.burst_size > 0 && burst_count >= config.burst_size) {
        return reject("burst", burst_count, config.burst_size, kBurst,
            "Burst limit exceeded: " + std::to_string(config.burst_size) + " requests per 10 seconds");
    }

    if (record) {
        windows_[user_id].push_back(now);
        minute_count++;
    }

    result.allowed = true;
    result.current_count = minute_count;
    result.limit = config.requests_per_minute;
    result.remaining = config.requests_per_minute > 0
        ? std::max(0, config.requests_per_minute - minute_count) : 0;
    return result;
}

void RateLimiter::check_rate_limit(const std::string& user_id, util::Timestamp now) {
    auto result = check_and_record(user_id, now, true);
    if (!result.allowed) {
        throw quota_error(result.reason);
    }
}

int RateLimiter::get_current_rate(const std::string& user_id, util::Timestamp now) const {
    auto it = windows_.find(user_id);
    if (it == windows_.end()) {
        return 0;
    }
    return count_since(it->second, now - kMinute);
}

void RateLimiter::clear_user(const std::string& user_id) {
    windows_.erase(user_id);
}

void RateLimiter::set_user_limits(const std::string& user_id, const RateLimitConfig& config) {
    user_configs_[user_id] = config;
    spdlog::info("Rate limits for user {}: {}/min {}/hour burst {}",
        user_id, config.requests_per_minute, config.requests_per_hour, config.burst_size);
}

void RateLimiter::set_default_config(const RateLimitConfig& config) {
    default_config_ = config;
    windows_.clear();
    spdlog::info("Default rate limits: {}/min {}/hour burst {}",
        config.requests_per_minute, config.requests_per_hour, config.burst_size);
}

const RateLimitConfig& RateLimiter::config_for(const std::string& user_id) const {
    auto it = user_configs_.find(user_id);
    return it == user_configs_.end() ? default_config_ : it->second;
}

size_t RateLimiter::cleanup_expired(util::Timestamp now) {
    size_t removed = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        evict(it->second, now);
        if (it->second.empty()) {
            it = windows_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Dropped {} expired rate limit windows", removed);
    }
    return removed;
}

void RateLimiter::evict(std::deque<util::Timestamp>& window, util::Timestamp now) {
    auto cutoff = now - kHour;
    while (!window.empty() && window.front() < cutoff) {
        window.pop_front();
    }
}

} // namespace helm::kernel
