#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/envelope.hpp"

namespace helm::kernel {

enum class InterruptStatus {
    PENDING,
    RESOLVED,
    EXPIRED,
    CANCELLED
};

const char* interrupt_status_to_string(InterruptStatus status);

struct KernelInterrupt {
    FlowInterrupt flow;
    InterruptStatus status = InterruptStatus::PENDING;
    std::string request_id;
    std::string user_id;
    std::string session_id;
    std::string envelope_id;
    std::string process_id;  // empty when not tied to a process
    std::optional<util::Timestamp> resolved_at;

    const std::string& id() const { return flow.id; }
    InterruptKind kind() const { return flow.kind; }
};

struct CreateInterruptParams {
    InterruptKind kind = InterruptKind::CLARIFICATION;
    std::string request_id;
    std::string user_id;
    std::string session_id;
    std::string envelope_id;
    std::string process_id;
    std::optional<std::string> question;
    std::optional<std::string> message;
    std::optional<nlohmann::json> data;
    // Overrides the per-kind TTL; zero or negative means no expiry
    std::optional<double> ttl_seconds;
};

struct InterruptStats {
    size_t total = 0;
    size_t pending = 0;
    size_t resolved = 0;
    size_t cancelled = 0;
    size_t expired = 0;
    std::map<std::string, size_t> pending_by_kind;
};

nlohmann::json kernel_interrupt_to_json(const KernelInterrupt& interrupt);
nlohmann::json interrupt_stats_to_json(const InterruptStats& stats);

class InterruptService {
public:
    InterruptService();

    // Non-copyable
    InterruptService(const InterruptService&) = delete;
    InterruptService& operator=(const InterruptService&) = delete;

    KernelInterrupt& create(const CreateInterruptParams& params, util::Timestamp now = util::now());

    KernelInterrupt& create_clarification(const std::string& request_id, const std::string& user_id,
                                          const std::string& session_id, const std::string& envelope_id,
                                          const std::string& question,
                                          const std::optional<nlohmann::json>& context = std::nullopt);
    KernelInterrupt& create_confirmation(const std::string& request_id, const std::string& user_id,
                                         const std::string& session_id, const std::string& envelope_id,
                                         const std::string& message,
                                         const std::optional<nlohmann::json>& data = std::nullopt);
    KernelInterrupt& create_resource_exhausted(const std::string& request_id, const std::string& user_id,
                                               const std::string& session_id, const std::string& envelope_id,
                                               const std::string& resource, double retry_after_seconds);

    // True only when the interrupt exists, is pending, is not expired and,
    // when user_id is given, belongs to that user
    bool resolve(const std::string& id, const InterruptResponse& response,
                 const std::optional<std::string>& user_id = std::nullopt,
                 util::Timestamp now = util::now());

    // True only when the interrupt exists and is pending
    bool cancel(const std::string& id, const std::string& reason, util::Timestamp now = util::now());

    const KernelInterrupt* get(const std::string& id) const;

    // Most recent pending, unexpired interrupt for a request
    const KernelInterrupt* get_pending_for_request(const std::string& request_id,
                                                   util::Timestamp now = util::now()) const;

    // Pending, unexpired interrupts in creation order, optionally limited to kinds
    std::vector<const KernelInterrupt*> get_pending_for_session(
        const std::string& session_id,
        const std::set<InterruptKind>& kinds = {},
        util::Timestamp now = util::now()) const;

    // The interrupt a process is held on, if any; expiry is left to expire_pending
    const KernelInterrupt* get_pending_for_process(const std::string& process_id) const;

    // Marks overdue pending interrupts EXPIRED, appending their ids to expired_ids
    size_t expire_pending(util::Timestamp now = util::now(),
                          std::vector<std::string>* expired_ids = nullptr);

    // Purges non-pending interrupts created before now - retention
    size_t cleanup_resolved(std::chrono::seconds retention, util::Timestamp now = util::now());

    InterruptStats stats() const;
    size_t pending_count() const;
    size_t size() const { return interrupts_.size(); }

    // No value means interrupts of that kind never expire
    void set_ttl(InterruptKind kind, std::optional<std::chrono::seconds> ttl);
    std::optional<std::chrono::seconds> ttl_for(InterruptKind kind) const;

private:
    std::unordered_map<std::string, KernelInterrupt> interrupts_;
    std::unordered_map<std::string, std::vector<std::string>> by_session_;
    std::unordered_map<std::string, std::vector<std::string>> by_request_;
    std::map<InterruptKind, std::optional<std::chrono::seconds>> ttls_;

    static void unindex(std::unordered_map<std::string, std::vector<std::string>>& index,
                        const std::string& key, const std::string& id);
};

} // namespace helm::kernel
