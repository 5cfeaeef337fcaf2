#include "kernel/resources.hpp"
#include "util/saturating.hpp"
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

namespace helm::kernel {

std::optional<QuotaViolation> ResourceTracker::check_quota(ProcessControlBlock& pcb,
                                                           util::Timestamp now) {
    pcb.refresh_elapsed(now);
    warn_soft_limits(pcb);

    auto violation = pcb.usage.exceeds_quota(pcb.quota);
    if (violation) {
        spdlog::warn("Quota exhausted for process {}: {}", pcb.pid.str(), violation->message);
    }
    return violation;
}

void ResourceTracker::record_usage(const std::string& user_id, int llm_calls, int tool_calls,
                                   int64_t tokens_in, int64_t tokens_out, util::Timestamp now) {
    auto& usage = users_[user_id];
    util::add_saturating(usage.llm_calls, llm_calls);
    util::add_saturating(usage.tool_calls, tool_calls);
    util::add_saturating(usage.tokens_in, tokens_in);
    util::add_saturating(usage.tokens_out, tokens_out);
    usage.records++;
    usage.last_updated = now;
}

const UserUsage* ResourceTracker::get_user_usage(const std::string& user_id) const {
    auto it = users_.find(user_id);
    return it == users_.end() ? nullptr : &it->second;
}

UserUsage ResourceTracker::system_usage() const {
    UserUsage total;
    for (const auto& [user, usage] : users_) {
        util::add_saturating(total.llm_calls, usage.llm_calls);
        util::add_saturating(total.tool_calls, usage.tool_calls);
        util::add_saturating(total.tokens_in, usage.tokens_in);
        util::add_saturating(total.tokens_out, usage.tokens_out);
        util::add_saturating(total.records, usage.records);
        total.last_updated = std::max(total.last_updated, usage.last_updated);
    }
    return total;
}

size_t ResourceTracker::cleanup_stale_users(const std::set<std::string>& active_users,
                                            size_t max_entries) {
    size_t removed = 0;

    for (auto it = users_.begin(); it != users_.end();) {
        if (active_users.count(it->first) == 0) {
            it = users_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (users_.size() > max_entries) {
        std::vector<std::pair<util::Timestamp, std::string>> by_age;
        by_age.reserve(users_.size());
        for (const auto& [user, usage] : users_) {
            by_age.emplace_back(usage.last_updated, user);
        }
        std::sort(by_age.begin(), by_age.end());

        size_t excess = users_.size() - max_entries;
        for (size_t i = 0; i < excess; i++) {
            users_.erase(by_age[i].second);
            removed++;
        }
    }

    if (removed > 0) {
        spdlog::debug("Dropped {} stale user usage entries", removed);
    }
    return removed;
}

void ResourceTracker::forget(const std::string& pid) {
    warned_.erase(pid + ":llm_calls");
    warned_.erase(pid + ":soft_timeout");
}

void ResourceTracker::warn_soft_limits(const ProcessControlBlock& pcb) {
    const auto& quota = pcb.quota;
    const auto& usage = pcb.usage;

    // 80% of the LLM call budget
    if (quota.max_llm_calls > 0 && int64_t{usage.llm_calls} * 5 >= int64_t{quota.max_llm_calls} * 4 &&
        warned_.insert(pcb.pid.str() + ":llm_calls").second) {
        spdlog::warn("Process {} has used {}/{} LLM calls",
            pcb.pid.str(), usage.llm_calls, quota.max_llm_calls);
    }

    if (quota.soft_timeout_seconds > 0 && usage.elapsed_seconds >= quota.soft_timeout_seconds &&
        warned_.insert(pcb.pid.str() + ":soft_timeout").second) {
        spdlog::warn("Process {} passed soft timeout ({:.1f}s >= {}s)",
            pcb.pid.str(), usage.elapsed_seconds, quota.soft_timeout_seconds);
    }
}

} // namespace helm::kernel
