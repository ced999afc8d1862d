#pragma once

#include <conduit/core/types.h>
#include <conduit/exec/cancellation.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit::exec {

/**
 * @brief Process-wide table mapping an in-flight request id to its cancellation source.
 *
 * The registry is the sole owner of every live source. Registering an id that is already
 * live is rejected with ErrorCode::Conflict; the caller must release() the id exactly once
 * when its request ends (RequestHandle does this).
 *
 * All operations are serialized by one internal mutex and are safe from any thread.
 */
class CancellationRegistry {
public:
    CancellationRegistry() = default;
    CancellationRegistry(const CancellationRegistry&) = delete;
    CancellationRegistry& operator=(const CancellationRegistry&) = delete;

    /// Create a source for @p requestId and return a token bound to it.
    Result<CancellationToken> registerRequest(const std::string& requestId);

    /// Signal the request's token. Returns false (no-op) when the id is not live.
    bool cancel(const std::string& requestId);

    /// Remove the entry unconditionally. Unknown ids are ignored.
    void release(const std::string& requestId);

    bool contains(const std::string& requestId) const;
    std::size_t size() const;
    std::vector<std::string> activeIds() const;
    std::optional<std::chrono::steady_clock::time_point>
    startedAt(const std::string& requestId) const;

private:
    struct Entry {
        std::shared_ptr<CancellationSource> source;
        std::chrono::steady_clock::time_point startedAt;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace conduit::exec
