#include <conduit/auth/pending_approval.h>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace conduit::auth {

const char* toString(ApprovalDecision decision) noexcept {
    switch (decision) {
        case ApprovalDecision::Approve: return "approve";
        case ApprovalDecision::Reject: return "reject";
        case ApprovalDecision::Expired: return "expired";
    }
    return "expired";
}

PendingApproval::PendingApproval(boost::asio::any_io_executor executor)
    : executor_(executor), signal_(executor), deadline_(executor) {
    signal_.expires_at(boost::asio::steady_timer::time_point::max());
}

void PendingApproval::armDeadline(std::chrono::steady_clock::duration timeout,
                                  std::function<void()> onDeadline) {
    deadline_.expires_after(timeout);
    std::weak_ptr<PendingApproval> weak = weak_from_this();
    deadline_.async_wait(
        [weak, onDeadline = std::move(onDeadline)](const boost::system::error_code& ec) {
            if (ec)
                return;
            auto self = weak.lock();
            if (self && !self->resolved())
                onDeadline();
        });
}

bool PendingApproval::resolve(ApprovalDecision decision) {
    bool expected = false;
    if (!claimed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        return false;
    decision_ = decision;
    ready_.store(true, std::memory_order_release);
    boost::asio::post(executor_, [self = shared_from_this()] {
        self->deadline_.cancel();
        self->signal_.cancel();
    });
    return true;
}

boost::asio::awaitable<ApprovalDecision> PendingApproval::wait() {
    boost::system::error_code ec;
    while (!ready_.load(std::memory_order_acquire)) {
        co_await signal_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return decision_;
}

} // namespace conduit::auth
