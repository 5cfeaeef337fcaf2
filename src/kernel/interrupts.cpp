#include "kernel/interrupts.hpp"
#include "util/ids.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace helm::kernel {

using std::chrono::hours;
using std::chrono::minutes;
using std::chrono::seconds;

const char* interrupt_status_to_string(InterruptStatus status) {
    switch (status) {
        case InterruptStatus::PENDING:   return "pending";
        case InterruptStatus::RESOLVED:  return "resolved";
        case InterruptStatus::EXPIRED:   return "expired";
        case InterruptStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

json kernel_interrupt_to_json(const KernelInterrupt& interrupt) {
    json j = interrupt_to_json(interrupt.flow);
    j["status"] = interrupt_status_to_string(interrupt.status);
    j["request_id"] = interrupt.request_id;
    j["user_id"] = interrupt.user_id;
    j["session_id"] = interrupt.session_id;
    j["envelope_id"] = interrupt.envelope_id;
    if (!interrupt.process_id.empty()) {
        j["process_id"] = interrupt.process_id;
    }
    if (interrupt.resolved_at) {
        j["resolved_at"] = util::to_unix_seconds(*interrupt.resolved_at);
    }
    return j;
}

json interrupt_stats_to_json(const InterruptStats& stats) {
    return json{
        {"total", stats.total},
        {"pending", stats.pending},
        {"resolved", stats.resolved},
        {"cancelled", stats.cancelled},
        {"expired", stats.expired},
        {"pending_by_kind", stats.pending_by_kind}
    };
}

InterruptService::InterruptService() {
    ttls_[InterruptKind::CLARIFICATION] = hours(24);
    ttls_[InterruptKind::CONFIRMATION] = hours(1);
    ttls_[InterruptKind::AGENT_REVIEW] = minutes(30);
    ttls_[InterruptKind::CHECKPOINT] = std::nullopt;
    ttls_[InterruptKind::RESOURCE_EXHAUSTED] = minutes(5);
    ttls_[InterruptKind::TIMEOUT] = minutes(5);
    ttls_[InterruptKind::SYSTEM_ERROR] = hours(1);
}

KernelInterrupt& InterruptService::create(const CreateInterruptParams& params, util::Timestamp now) {
    KernelInterrupt interrupt;
    interrupt.flow.kind = params.kind;
    interrupt.flow.id = util::generate_id("int_");
    interrupt.flow.question = params.question;
    interrupt.flow.message = params.message;
    interrupt.flow.data = params.data;
    interrupt.flow.created_at = now;
    interrupt.request_id = params.request_id;
    interrupt.user_id = params.user_id;
    interrupt.session_id = params.session_id;
    interrupt.envelope_id = params.envelope_id;
    interrupt.process_id = params.process_id;

    if (params.ttl_seconds) {
        if (*params.ttl_seconds > 0) {
            interrupt.flow.expires_at = now + util::seconds(*params.ttl_seconds);
        }
    } else if (auto ttl = ttl_for(params.kind)) {
        interrupt.flow.expires_at = now + *ttl;
    }

    std::string id = interrupt.flow.id;
    if (!params.session_id.empty()) {
        by_session_[params.session_id].push_back(id);
    }
    if (!params.request_id.empty()) {
        by_request_[params.request_id].push_back(id);
    }

    auto& stored = interrupts_.emplace(id, std::move(interrupt)).first->second;
    spdlog::info("Interrupt created: id={} kind={} session={}",
        id, interrupt_kind_to_string(params.kind), params.session_id);
    return stored;
}

KernelInterrupt& InterruptService::create_clarification(
    const std::string& request_id, const std::string& user_id, const std::string& session_id,
    const std::string& envelope_id, const std::string& question,
    const std::optional<json>& context) {
    CreateInterruptParams params;
    params.kind = InterruptKind::CLARIFICATION;
    params.request_id = request_id;
    params.user_id = user_id;
    params.session_id = session_id;
    params.envelope_id = envelope_id;
    params.question = question;
    params.data = context;
    return create(params);
}

KernelInterrupt& InterruptService::create_confirmation(
    const std::string& request_id, const std::string& user_id, const std::string& session_id,
    const std::string& envelope_id, const std::string& message,
    const std::optional<json>& data) {
    CreateInterruptParams params;
    params.kind = InterruptKind::CONFIRMATION;
    params.request_id = request_id;
    params.user_id = user_id;
    params.session_id = session_id;
    params.envelope_id = envelope_id;
    params.message = message;
    params.data = data;
    return create(params);
}

KernelInterrupt& InterruptService::create_resource_exhausted(
    const std::string& request_id, const std::string& user_id, const std::string& session_id,
    const std::string& envelope_id, const std::string& resource, double retry_after_seconds) {
    CreateInterruptParams params;
    params.kind = InterruptKind::RESOURCE_EXHAUSTED;
    params.request_id = request_id;
    params.user_id = user_id;
    params.session_id = session_id;
    params.envelope_id = envelope_id;
    params.message = "Resource exhausted: " + resource;
    params.data = json{{"resource", resource}, {"retry_after_seconds", retry_after_seconds}};
    return create(params);
}

bool InterruptService::resolve(const std::string& id, const InterruptResponse& response,
                               const std::optional<std::string>& user_id, util::Timestamp now) {
    auto it = interrupts_.find(id);
    if (it == interrupts_.end()) {
        spdlog::debug("Resolve: interrupt {} not found", id);
        return false;
    }

    auto& interrupt = it->second;
    if (interrupt.status != InterruptStatus::PENDING) {
        spdlog::debug("Resolve: interrupt {} is {}", id, interrupt_status_to_string(interrupt.status));
        return false;
    }
    if (interrupt.flow.is_expired(now)) {
        interrupt.status = InterruptStatus::EXPIRED;
        spdlog::debug("Resolve: interrupt {} expired", id);
        return false;
    }
    if (user_id && !interrupt.user_id.empty() && *user_id != interrupt.user_id) {
        spdlog::warn("Resolve: user {} does not own interrupt {}", *user_id, id);
        return false;
    }

    interrupt.flow.response = response;
    interrupt.status = InterruptStatus::RESOLVED;
    interrupt.resolved_at = now;
    spdlog::info("Interrupt resolved: id={}", id);
    return true;
}

bool InterruptService::cancel(const std::string& id, const std::string& reason, util::Timestamp now) {
    auto it = interrupts_.find(id);
    if (it == interrupts_.end() || it->second.status != InterruptStatus::PENDING) {
        return false;
    }

    auto& interrupt = it->second;
    if (!interrupt.flow.data || !interrupt.flow.data->is_object()) {
        interrupt.flow.data = json::object();
    }
    (*interrupt.flow.data)["cancel_reason"] = reason;
    interrupt.status = InterruptStatus::CANCELLED;
    interrupt.resolved_at = now;
    spdlog::info("Interrupt cancelled: id={} reason={}", id, reason);
    return true;
}

const KernelInterrupt* InterruptService::get(const std::string& id) const {
    auto it = interrupts_.find(id);
    return it == interrupts_.end() ? nullptr : &it->second;
}

const KernelInterrupt* InterruptService::get_pending_for_request(const std::string& request_id,
                                                                 util::Timestamp now) const {
    auto idx = by_request_.find(request_id);
    if (idx == by_request_.end()) {
        return nullptr;
    }
    for (auto id = idx->second.rbegin(); id != idx->second.rend(); ++id) {
        const auto* interrupt = get(*id);
        if (interrupt && interrupt->status == InterruptStatus::PENDING &&
            !interrupt->flow.is_expired(now)) {
            return interrupt;
        }
    }
    return nullptr;
}

std::vector<const KernelInterrupt*> InterruptService::get_pending_for_session(
    const std::string& session_id, const std::set<InterruptKind>& kinds, util::Timestamp now) const {
    std::vector<const KernelInterrupt*> result;
    auto idx = by_session_.find(session_id);
    if (idx == by_session_.end()) {
        return result;
    }
    for (const auto& id : idx->second) {
        const auto* interrupt = get(id);
        if (!interrupt || interrupt->status != InterruptStatus::PENDING ||
            interrupt->flow.is_expired(now)) {
            continue;
        }
        if (!kinds.empty() && kinds.count(interrupt->kind()) == 0) {
            continue;
        }
        result.push_back(interrupt);
    }
    return result;
}

const KernelInterrupt* InterruptService::get_pending_for_process(const std::string& process_id) const {
    if (process_id.empty()) {
        return nullptr;
    }
    for (const auto& [id, interrupt] : interrupts_) {
        if (interrupt.status == InterruptStatus::PENDING && interrupt.process_id == process_id) {
            return &interrupt;
        }
    }
    return nullptr;
}

size_t InterruptService::expire_pending(util::Timestamp now, std::vector<std::string>* expired_ids) {
    size_t expired = 0;
    for (auto& [id, interrupt] : interrupts_) {
        if (interrupt.status == InterruptStatus::PENDING && interrupt.flow.is_expired(now)) {
            interrupt.status = InterruptStatus::EXPIRED;
            expired++;
            if (expired_ids) {
                expired_ids->push_back(id);
            }
        }
    }
    if (expired > 0) {
        spdlog::info("Expired {} pending interrupts", expired);
    }
    return expired;
}

size_t InterruptService::cleanup_resolved(std::chrono::seconds retention, util::Timestamp now) {
    auto cutoff = now - retention;
    size_t removed = 0;
    for (auto it = interrupts_.begin(); it != interrupts_.end();) {
        const auto& interrupt = it->second;
        if (interrupt.status != InterruptStatus::PENDING && interrupt.flow.created_at < cutoff) {
            unindex(by_session_, interrupt.session_id, it->first);
            unindex(by_request_, interrupt.request_id, it->first);
            it = interrupts_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        spdlog::debug("Purged {} finished interrupts", removed);
    }
    return removed;
}

InterruptStats InterruptService::stats() const {
    InterruptStats s;
    s.total = interrupts_.size();
    for (const auto& [id, interrupt] : interrupts_) {
        switch (interrupt.status) {
            case InterruptStatus::PENDING:
                s.pending++;
                s.pending_by_kind[interrupt_kind_to_string(interrupt.kind())]++;
                break;
            case InterruptStatus::RESOLVED:  s.resolved++; break;
            case InterruptStatus::CANCELLED: s.cancelled++; break;
            case InterruptStatus::EXPIRED:   s.expired++; break;
        }
    }
    return s;
}

size_t InterruptService::pending_count() const {
    return static_cast<size_t>(std::count_if(interrupts_.begin(), interrupts_.end(),
        [](const auto& entry) { return entry.second.status == InterruptStatus::PENDING; }));
}

void InterruptService::set_ttl(InterruptKind kind, std::optional<std::chrono::seconds> ttl) {
    ttls_[kind] = ttl;
}

std::optional<std::chrono::seconds> InterruptService::ttl_for(InterruptKind kind) const {
    auto it = ttls_.find(kind);
    if (it == ttls_.end()) {
        return hours(1);
    }
    return it->second;
}

void InterruptService::unindex(std::unordered_map<std::string, std::vector<std::string>>& index,
                               const std::string& key, const std::string& id) {
    auto it = index.find(key);
    if (it == index.end()) {
        return;
    }
    auto& ids = it->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) {
        index.erase(it);
    }
}

} // namespace helm::kernel
