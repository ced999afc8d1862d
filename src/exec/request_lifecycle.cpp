#include <conduit/exec/request_lifecycle.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>

using conduit::stream::EventType;
using conduit::stream::StreamEvent;

namespace conduit::exec {

namespace {

// Forwards to the real sink until the first terminal event, then drops everything.
class TerminalGuardSink final : public stream::EventSink {
public:
    explicit TerminalGuardSink(stream::EventSink& inner) : inner_(inner) {}

    void emit(StreamEvent event) override {
        if (terminal_) {
            spdlog::debug("[Lifecycle] suppressing '{}' after terminal event",
                          stream::toString(event.type));
            return;
        }
        if (event.isTerminal())
            terminal_ = event.type;
        inner_.emit(std::move(event));
    }

    bool hasTerminal() const noexcept { return terminal_.has_value(); }
    std::optional<EventType> terminal() const noexcept { return terminal_; }

private:
    stream::EventSink& inner_;
    std::optional<EventType> terminal_;
};

RequestState stateFor(EventType terminal) {
    switch (terminal) {
        case EventType::Done:
        case EventType::Exit:
            return RequestState::Completed;
        case EventType::Aborted:
            return RequestState::Cancelled;
        default:
            return RequestState::Failed;
    }
}

} // namespace

const char* toString(RequestState state) noexcept {
    switch (state) {
        case RequestState::Created: return "created";
        case RequestState::Running: return "running";
        case RequestState::Completed: return "completed";
        case RequestState::Cancelled: return "cancelled";
        case RequestState::Failed: return "failed";
    }
    return "unknown";
}

Result<RequestHandle> RequestLifecycleManager::begin(const std::string& requestId) {
    auto token = registry_.registerRequest(requestId);
    if (!token)
        return token.error();
    return RequestHandle(registry_, requestId, std::move(token).value());
}

boost::asio::awaitable<RequestState>
RequestLifecycleManager::run(RequestHandle handle, ProcessAdapter& adapter,
                             stream::EventSink& sink) {
    const auto started = std::chrono::steady_clock::now();
    const std::string requestId = handle.requestId();
    TerminalGuardSink guard(sink);
    spdlog::debug("[Lifecycle] {} request '{}' running", adapter.kind(), requestId);

    std::string failure;
    try {
        co_await adapter.run(handle.token(), guard);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    if (!failure.empty()) {
        spdlog::error("[Lifecycle] request '{}' failed: {}", requestId, failure);
        guard.emit(StreamEvent::error(failure));
    }
    if (!guard.hasTerminal()) {
        spdlog::warn("[Lifecycle] {} adapter ended '{}' without a terminal event",
                     adapter.kind(), requestId);
        guard.emit(handle.token().isCancelled()
                       ? StreamEvent::aborted()
                       : StreamEvent::error("Request ended without a result"));
    }
    handle.release();

    const auto state = stateFor(*guard.terminal());
    spdlog::info("[Lifecycle] request '{}' {} in {} ms", requestId, toString(state),
                 std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - started)
                     .count());
    co_return state;
}

boost::asio::awaitable<Result<RequestState>>
RequestLifecycleManager::start(std::string requestId, ProcessAdapter& adapter,
                               stream::EventSink& sink) {
    auto handle = begin(requestId);
    if (!handle)
        co_return handle.error();
    auto state = co_await run(std::move(handle).value(), adapter, sink);
    co_return state;
}

bool RequestLifecycleManager::cancel(const std::string& requestId) {
    bool found = registry_.cancel(requestId);
    if (!found) {
        auto active = registry_.activeIds();
        std::string ids;
        for (const auto& id : active) {
            if (!ids.empty())
                ids += ", ";
            ids += id;
        }
        spdlog::debug("[Lifecycle] cancel '{}' not found; active: [{}]", requestId, ids);
    }
    return found;
}

} // namespace conduit::exec
