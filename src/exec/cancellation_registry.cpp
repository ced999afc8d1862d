#include <conduit/exec/cancellation_registry.h>

#include <spdlog/spdlog.h>

namespace conduit::exec {

Result<CancellationToken> CancellationRegistry::registerRequest(const std::string& requestId) {
    if (requestId.empty()) {
        return Error{ErrorCode::InvalidArgument, "requestId must not be empty"};
    }
    std::lock_guard<std::mutex> lk(mutex_);
    auto [it, inserted] = entries_.try_emplace(requestId);
    if (!inserted) {
        spdlog::warn("[Registry] request '{}' is already in flight", requestId);
        return Error{ErrorCode::Conflict, "Request '" + requestId + "' is already in flight"};
    }
    it->second.source = std::make_shared<CancellationSource>();
    it->second.startedAt = std::chrono::steady_clock::now();
    spdlog::debug("[Registry] registered '{}' ({} active)", requestId, entries_.size());
    return it->second.source->token();
}

bool CancellationRegistry::cancel(const std::string& requestId) {
    std::shared_ptr<CancellationSource> source;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = entries_.find(requestId);
        if (it == entries_.end()) {
            spdlog::debug("[Registry] cancel '{}': not in flight", requestId);
            return false;
        }
        source = it->second.source;
    }
    // Callbacks may re-enter the registry, so they fire outside the lock.
    spdlog::info("[Registry] cancel requested for '{}'", requestId);
    source->cancel();
    return true;
}

void CancellationRegistry::release(const std::string& requestId) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (entries_.erase(requestId) > 0) {
        spdlog::debug("[Registry] released '{}' ({} active)", requestId, entries_.size());
    }
}

bool CancellationRegistry::contains(const std::string& requestId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.find(requestId) != entries_.end();
}

std::size_t CancellationRegistry::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return entries_.size();
}

std::vector<std::string> CancellationRegistry::activeIds() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        (void)entry;
        ids.push_back(id);
    }
    return ids;
}

std::optional<std::chrono::steady_clock::time_point>
CancellationRegistry::startedAt(const std::string& requestId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(requestId);
    if (it == entries_.end())
        return std::nullopt;
    return it->second.startedAt;
}

} // namespace conduit::exec
