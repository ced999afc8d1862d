#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace conduit::exec {

namespace detail {

/**
 * @brief Shared state between a CancellationSource and its tokens.
 *
 * Callbacks run at most once, on the thread that calls cancel(). A callback registered
 * after cancellation runs immediately on the registering thread.
 */
class CancellationState {
public:
    CancellationState() = default;
    CancellationState(const CancellationState&) = delete;
    CancellationState& operator=(const CancellationState&) = delete;

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void cancel() {
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        std::vector<std::pair<std::size_t, std::function<void()>>> toRun;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            toRun = std::move(callbacks_);
            callbacks_.clear();
        }
        for (auto& [handle, cb] : toRun) {
            (void)handle;
            cb();
        }
    }

    std::size_t addCallback(std::function<void()> cb) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                std::size_t handle = nextHandle_++;
                callbacks_.emplace_back(handle, std::move(cb));
                return handle;
            }
        }
        cb();
        return 0;
    }

    void removeCallback(std::size_t handle) {
        if (handle == 0)
            return;
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->first == handle) {
                callbacks_.erase(it);
                return;
            }
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<std::pair<std::size_t, std::function<void()>>> callbacks_;
    std::size_t nextHandle_{1};
};

} // namespace detail

/**
 * @brief RAII registration of a cancellation callback. Unregisters on destruction.
 */
class CancellationCallback {
public:
    CancellationCallback() = default;
    CancellationCallback(std::shared_ptr<detail::CancellationState> state, std::size_t handle)
        : state_(std::move(state)), handle_(handle) {}
    ~CancellationCallback() { reset(); }

    CancellationCallback(const CancellationCallback&) = delete;
    CancellationCallback& operator=(const CancellationCallback&) = delete;
    CancellationCallback(CancellationCallback&& other) noexcept
        : state_(std::move(other.state_)), handle_(std::exchange(other.handle_, 0)) {}
    CancellationCallback& operator=(CancellationCallback&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            handle_ = std::exchange(other.handle_, 0);
        }
        return *this;
    }

    void reset() {
        if (state_ && handle_ != 0) {
            state_->removeCallback(handle_);
        }
        state_.reset();
        handle_ = 0;
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::size_t handle_{0};
};

/**
 * @brief Read-only view of a cancellation request.
 *
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const noexcept { return state_ && state_->isCancelled(); }
    bool isValid() const noexcept { return state_ != nullptr; }

    [[nodiscard]] CancellationCallback onCancel(std::function<void()> cb) const {
        if (!state_)
            return {};
        auto handle = state_->addCallback(std::move(cb));
        return CancellationCallback(state_, handle);
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner side of a cancellation request; creates tokens and signals them.
 */
class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) = default;
    CancellationSource& operator=(CancellationSource&&) = default;

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }

    void cancel() {
        if (state_)
            state_->cancel();
    }

    bool isCancelled() const noexcept { return state_ && state_->isCancelled(); }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace conduit::exec
