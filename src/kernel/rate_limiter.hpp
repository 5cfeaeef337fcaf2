#pragma once
#include <deque>
#include <string>
#include <unordered_map>
#include "util/time.hpp"

namespace helm::kernel {

// A non-positive ceiling disables that window
struct RateLimitConfig {
    int requests_per_minute = 60;
    int requests_per_hour = 1000;
    int burst_size = 10;
};

struct RateLimitResult {
    bool allowed = true;
    std::string limit_type;       // "hour", "minute", "burst" or empty
    int current_count = 0;
    int limit = 0;
    double retry_after_seconds = 0.0;
    int remaining = 0;            // left in the minute window
    std::string reason;
};

class RateLimiter {
public:
    explicit RateLimiter(RateLimitConfig config = RateLimitConfig{});

    // Non-copyable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Checks hour, minute and burst windows in that order and records the
    // request only when all three allow it. With record=false nothing is stored.
    RateLimitResult check_and_record(const std::string& user_id, util::Timestamp now,
                                     bool record = true);
    RateLimitResult check_and_record(const std::string& user_id, bool record = true) {
        return check_and_record(user_id, util::now(), record);
    }

    // Throws QUOTA_EXCEEDED with the rejection reason
    void check_rate_limit(const std::string& user_id, util::Timestamp now = util::now());

    // Requests in the last minute
    int get_current_rate(const std::string& user_id, util::Timestamp now = util::now()) const;

    void clear_user(const std::string& user_id);
    void set_user_limits(const std::string& user_id, const RateLimitConfig& config);

    // Replaces the default ceilings and clears every window
    void set_default_config(const RateLimitConfig& config);
    const RateLimitConfig& default_config() const { return default_config_; }
    const RateLimitConfig& config_for(const std::string& user_id) const;

    // Drops windows with no timestamp inside the last hour
    size_t cleanup_expired(util::Timestamp now = util::now());

    size_t tracked_users() const { return windows_.size(); }

private:
    RateLimitConfig default_config_;
    std::unordered_map<std::string, RateLimitConfig> user_configs_;
    std::unordered_map<std::string, std::deque<util::Timestamp>> windows_;

    static void evict(std::deque<util::Timestamp>& window, util::Timestamp now);
};

} // namespace helm::kernel
