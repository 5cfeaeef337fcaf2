#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include "kernel/types.hpp"

namespace helm::kernel {

// Per-user aggregate across all of a user's processes
struct UserUsage {
    int llm_calls = 0;
    int tool_calls = 0;
    int64_t tokens_in = 0;
    int64_t tokens_out = 0;
    int records = 0;
    util::Timestamp last_updated;
};

class ResourceTracker {
public:
    ResourceTracker() = default;

    // Non-copyable
    ResourceTracker(const ResourceTracker&) = delete;
    ResourceTracker& operator=(const ResourceTracker&) = delete;

    // Refreshes live elapsed time, then returns the first exhausted dimension
    std::optional<QuotaViolation> check_quota(ProcessControlBlock& pcb,
                                              util::Timestamp now = util::now());

    // Deltas are validated by the caller
    void record_usage(const std::string& user_id, int llm_calls, int tool_calls,
                      int64_t tokens_in, int64_t tokens_out,
                      util::Timestamp now = util::now());

    const UserUsage* get_user_usage(const std::string& user_id) const;
    UserUsage system_usage() const;
    size_t user_count() const { return users_.size(); }

    // Drops users without an active process, then the least recently
    // updated entries until at most max_entries remain. Returns the number dropped.
    size_t cleanup_stale_users(const std::set<std::string>& active_users, size_t max_entries);

    // Forget soft-limit warnings recorded for a removed process
    void forget(const std::string& pid);

private:
    std::unordered_map<std::string, UserUsage> users_;
    std::set<std::string> warned_;

    void warn_soft_limits(const ProcessControlBlock& pcb);
};

} // namespace helm::kernel
