#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace conduit::stream {

enum class EventType { Start, Data, Error, Aborted, Exit, Done };

enum class Channel { Stdout, Stderr, Assistant };

const char* toString(EventType type) noexcept;
const char* toString(Channel channel) noexcept;

/**
 * @brief One message of a per-request output stream.
 *
 * Data events carry either plain text (stdout/stderr) or a structured JSON payload
 * (assistant). Error, Aborted, Exit and Done are terminal: exactly one of them ends
 * every stream.
 */
struct StreamEvent {
    EventType type{EventType::Start};
    Channel channel{Channel::Stdout};
    std::string text;
    nlohmann::json payload;
    int exitCode{0};

    static StreamEvent start();
    static StreamEvent data(Channel channel, std::string text);
    static StreamEvent assistant(nlohmann::json message);
    static StreamEvent error(std::string message);
    static StreamEvent aborted();
    static StreamEvent exit(int code);
    static StreamEvent done();

    bool isTerminal() const noexcept;
};

/// Wire representation: {"type":...} plus the type-specific fields.
nlohmann::json toJson(const StreamEvent& event);

/// One NDJSON record, newline terminated.
std::string encodeEvent(const StreamEvent& event);

/// Inverse of encodeEvent for a single line; nullopt on malformed input.
std::optional<StreamEvent> decodeEvent(std::string_view line);

/**
 * @brief Consumer of stream events for one request.
 *
 * Implementations are called from the io_context thread, in producer order.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(StreamEvent event) = 0;
};

} // namespace conduit::stream
