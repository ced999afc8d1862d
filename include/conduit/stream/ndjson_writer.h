#pragma once

#include <conduit/stream/stream_event.h>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <deque>
#include <string>

namespace conduit::stream {

/**
 * @brief Streams events to a connection as an NDJSON HTTP response body.
 *
 * emit() only queues; run() is the single writer that sends the response headers and then
 * one record per write, in emit order. After the first terminal event the writer is closed
 * and later emits are dropped. A failed write marks the peer disconnected: remaining and
 * future records are discarded silently so the producer can still run to completion.
 *
 * Must be used from the executor that owns @p stream.
 */
template <typename AsyncStream> class NdjsonStreamWriter : public EventSink {
public:
    explicit NdjsonStreamWriter(AsyncStream& stream, bool sendHeaders = true)
        : stream_(stream), sendHeaders_(sendHeaders), wake_(stream.get_executor()),
          finished_(stream.get_executor()) {
        wake_.expires_at(boost::asio::steady_timer::time_point::max());
        finished_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    void emit(StreamEvent event) override {
        if (closed_) {
            spdlog::debug("[NDJSON] dropping '{}' after terminal event", toString(event.type));
            return;
        }
        if (event.isTerminal())
            closed_ = true;
        if (disconnected_)
            return;
        queue_.push_back(encodeEvent(event));
        wake_.cancel();
    }

    boost::asio::awaitable<void> run() {
        boost::system::error_code ec;
        if (sendHeaders_) {
            static const std::string kHeaders = "HTTP/1.1 200 OK\r\n"
                                                "Content-Type: application/x-ndjson\r\n"
                                                "Cache-Control: no-cache\r\n"
                                                "Access-Control-Allow-Origin: *\r\n"
                                                "Connection: close\r\n\r\n";
            co_await boost::asio::async_write(stream_, boost::asio::buffer(kHeaders),
                                              boost::asio::redirect_error(
                                                  boost::asio::use_awaitable, ec));
            if (ec)
                markDisconnected(ec);
        }
        for (;;) {
            while (!queue_.empty()) {
                std::string line = std::move(queue_.front());
                queue_.pop_front();
                if (disconnected_)
                    continue;
                co_await boost::asio::async_write(stream_, boost::asio::buffer(line),
                                                  boost::asio::redirect_error(
                                                      boost::asio::use_awaitable, ec));
                if (ec) {
                    markDisconnected(ec);
                    continue;
                }
                ++written_;
            }
            if (closed_)
                break;
            wake_.expires_at(boost::asio::steady_timer::time_point::max());
            co_await wake_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        done_ = true;
        finished_.cancel();
    }

    /// Completes once run() has flushed the terminal record (or given up on the peer).
    boost::asio::awaitable<void> waitFinished() {
        boost::system::error_code ec;
        while (!done_) {
            co_await finished_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    bool closed() const noexcept { return closed_; }
    bool disconnected() const noexcept { return disconnected_; }
    bool finished() const noexcept { return done_; }
    std::size_t recordsWritten() const noexcept { return written_; }

private:
    void markDisconnected(const boost::system::error_code& ec) {
        if (!disconnected_) {
            spdlog::debug("[NDJSON] client went away: {}", ec.message());
        }
        disconnected_ = true;
        queue_.clear();
    }

    AsyncStream& stream_;
    bool sendHeaders_;
    boost::asio::steady_timer wake_;
    boost::asio::steady_timer finished_;
    std::deque<std::string> queue_;
    bool closed_{false};
    bool disconnected_{false};
    bool done_{false};
    std::size_t written_{0};
};

} // namespace conduit::stream
