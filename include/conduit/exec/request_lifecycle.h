#pragma once

#include <conduit/core/types.h>
#include <conduit/exec/cancellation_registry.h>
#include <conduit/exec/process_adapter.h>
#include <conduit/stream/stream_event.h>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include <string>

namespace conduit::exec {

enum class RequestState { Created, Running, Completed, Cancelled, Failed };

const char* toString(RequestState state) noexcept;

/**
 * @brief Ownership of one registry entry. Releases it exactly once: on release() or on
 * destruction, whichever comes first. Move-only.
 */
class RequestHandle {
public:
    RequestHandle() = default;
    RequestHandle(CancellationRegistry& registry, std::string requestId, CancellationToken token)
        : registry_(&registry), requestId_(std::move(requestId)), token_(std::move(token)) {}
    ~RequestHandle() { release(); }

    RequestHandle(const RequestHandle&) = delete;
    RequestHandle& operator=(const RequestHandle&) = delete;
    RequestHandle(RequestHandle&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr)),
          requestId_(std::move(other.requestId_)), token_(std::move(other.token_)) {}
    RequestHandle& operator=(RequestHandle&& other) noexcept {
        if (this != &other) {
            release();
            registry_ = std::exchange(other.registry_, nullptr);
            requestId_ = std::move(other.requestId_);
            token_ = std::move(other.token_);
        }
        return *this;
    }

    void release() {
        if (registry_) {
            registry_->release(requestId_);
            registry_ = nullptr;
        }
    }

    bool active() const noexcept { return registry_ != nullptr; }
    const std::string& requestId() const noexcept { return requestId_; }
    const CancellationToken& token() const noexcept { return token_; }

private:
    CancellationRegistry* registry_{nullptr};
    std::string requestId_;
    CancellationToken token_;
};

/**
 * @brief Binds a request id to an adapter run and guarantees its end-of-life bookkeeping.
 *
 * Created -> Running -> {Completed | Cancelled | Failed}. Exactly one terminal event reaches
 * the sink per run; events after it are discarded. The registry entry is released on every
 * path, including exceptions thrown by the adapter.
 */
class RequestLifecycleManager {
public:
    explicit RequestLifecycleManager(CancellationRegistry& registry) : registry_(registry) {}

    /// Register @p requestId. ErrorCode::Conflict when the id is already in flight.
    Result<RequestHandle> begin(const std::string& requestId);

    boost::asio::awaitable<RequestState> run(RequestHandle handle, ProcessAdapter& adapter,
                                             stream::EventSink& sink);

    /// begin() + run().
    boost::asio::awaitable<Result<RequestState>>
    start(std::string requestId, ProcessAdapter& adapter, stream::EventSink& sink);

    bool cancel(const std::string& requestId);

    CancellationRegistry& registry() noexcept { return registry_; }

private:
    CancellationRegistry& registry_;
};

} // namespace conduit::exec
