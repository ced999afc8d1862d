#pragma once

#include <conduit/stream/stream_event.h>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace conduit::test {

/// Event sink that keeps everything it is given.
class RecordingSink : public stream::EventSink {
public:
    void emit(stream::StreamEvent event) override { events.push_back(std::move(event)); }

    std::size_t count(stream::EventType type) const {
        std::size_t n = 0;
        for (const auto& e : events)
            n += e.type == type ? 1 : 0;
        return n;
    }

    std::size_t terminalCount() const {
        std::size_t n = 0;
        for (const auto& e : events)
            n += e.isTerminal() ? 1 : 0;
        return n;
    }

    std::string text(stream::Channel channel) const {
        std::string out;
        for (const auto& e : events) {
            if (e.type == stream::EventType::Data && e.channel == channel)
                out += e.text;
        }
        return out;
    }

    std::vector<stream::StreamEvent> events;
};

inline void rethrowIfSet(std::exception_ptr e) {
    if (e)
        std::rethrow_exception(e);
}

/// Drive @p op to completion on @p io and return its value.
template <typename T> T runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<T> op) {
    std::optional<T> out;
    boost::asio::co_spawn(
        io,
        [&out, op = std::move(op)]() mutable -> boost::asio::awaitable<void> {
            out.emplace(co_await std::move(op));
        },
        [](std::exception_ptr e) { rethrowIfSet(e); });
    io.run();
    io.restart();
    if (!out)
        throw std::runtime_error("awaitable did not complete");
    return std::move(*out);
}

inline void runAwaitable(boost::asio::io_context& io, boost::asio::awaitable<void> op) {
    bool finished = false;
    boost::asio::co_spawn(
        io,
        [&finished, op = std::move(op)]() mutable -> boost::asio::awaitable<void> {
            co_await std::move(op);
            finished = true;
        },
        [](std::exception_ptr e) { rethrowIfSet(e); });
    io.run();
    io.restart();
    if (!finished)
        throw std::runtime_error("awaitable did not complete");
}

} // namespace conduit::test
