#pragma once

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace conduit::auth {

enum class ApprovalDecision { Approve, Reject, Expired };

const char* toString(ApprovalDecision decision) noexcept;

/**
 * @brief A once-resolvable approval decision with a paired deadline timer.
 *
 * The first resolve() wins; later calls return false and change nothing. Resolving cancels
 * the deadline and wakes the waiter. Both timers are touched only on the slot's executor,
 * so resolve() is safe from any thread.
 */
class PendingApproval : public std::enable_shared_from_this<PendingApproval> {
public:
    explicit PendingApproval(boost::asio::any_io_executor executor);

    PendingApproval(const PendingApproval&) = delete;
    PendingApproval& operator=(const PendingApproval&) = delete;

    /// Call @p onDeadline once @p timeout elapses unless the slot is resolved first.
    void armDeadline(std::chrono::steady_clock::duration timeout,
                     std::function<void()> onDeadline);

    bool resolve(ApprovalDecision decision);

    /// Suspends until resolve(); returns immediately if already resolved.
    boost::asio::awaitable<ApprovalDecision> wait();

    bool resolved() const noexcept { return ready_.load(std::memory_order_acquire); }

private:
    boost::asio::any_io_executor executor_;
    boost::asio::steady_timer signal_;
    boost::asio::steady_timer deadline_;
    std::atomic<bool> claimed_{false};
    std::atomic<bool> ready_{false};
    ApprovalDecision decision_{ApprovalDecision::Expired};
};

} // namespace conduit::auth
