#include <conduit/stream/stream_event.h>

#include <spdlog/spdlog.h>

using nlohmann::json;

namespace conduit::stream {

const char* toString(EventType type) noexcept {
    switch (type) {
        case EventType::Start: return "start";
        case EventType::Data: return "data";
        case EventType::Error: return "error";
        case EventType::Aborted: return "aborted";
        case EventType::Exit: return "exit";
        case EventType::Done: return "done";
    }
    return "unknown";
}

const char* toString(Channel channel) noexcept {
    switch (channel) {
        case Channel::Stdout: return "stdout";
        case Channel::Stderr: return "stderr";
        case Channel::Assistant: return "assistant";
    }
    return "unknown";
}

StreamEvent StreamEvent::start() {
    return StreamEvent{};
}

StreamEvent StreamEvent::data(Channel channel, std::string text) {
    StreamEvent ev;
    ev.type = EventType::Data;
    ev.channel = channel;
    ev.text = std::move(text);
    return ev;
}

StreamEvent StreamEvent::assistant(json message) {
    StreamEvent ev;
    ev.type = EventType::Data;
    ev.channel = Channel::Assistant;
    ev.payload = std::move(message);
    return ev;
}

StreamEvent StreamEvent::error(std::string message) {
    StreamEvent ev;
    ev.type = EventType::Error;
    ev.text = std::move(message);
    return ev;
}

StreamEvent StreamEvent::aborted() {
    StreamEvent ev;
    ev.type = EventType::Aborted;
    return ev;
}

StreamEvent StreamEvent::exit(int code) {
    StreamEvent ev;
    ev.type = EventType::Exit;
    ev.exitCode = code;
    return ev;
}

StreamEvent StreamEvent::done() {
    StreamEvent ev;
    ev.type = EventType::Done;
    return ev;
}

bool StreamEvent::isTerminal() const noexcept {
    return type == EventType::Error || type == EventType::Aborted || type == EventType::Exit ||
           type == EventType::Done;
}

json toJson(const StreamEvent& event) {
    json j = {{"type", toString(event.type)}};
    switch (event.type) {
        case EventType::Data:
            j["channel"] = toString(event.channel);
            if (event.channel == Channel::Assistant)
                j["data"] = event.payload;
            else
                j["data"] = event.text;
            break;
        case EventType::Error:
            j["error"] = event.text;
            break;
        case EventType::Exit:
            j["exitCode"] = event.exitCode;
            break;
        default:
            break;
    }
    return j;
}

std::string encodeEvent(const StreamEvent& event) {
    // Invalid UTF-8 from a child process must not abort the stream.
    auto line = toJson(event).dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

std::optional<StreamEvent> decodeEvent(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
        line.remove_suffix(1);
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return std::nullopt;
    }
    const auto type = j["type"].get<std::string>();
    if (type == "start")
        return StreamEvent::start();
    if (type == "aborted")
        return StreamEvent::aborted();
    if (type == "done")
        return StreamEvent::done();
    if (type == "error")
        return StreamEvent::error(j.value("error", std::string{}));
    if (type == "exit")
        return StreamEvent::exit(j.value("exitCode", 0));
    if (type == "data") {
        const auto channel = j.value("channel", std::string{"stdout"});
        if (channel == "assistant")
            return StreamEvent::assistant(j.value("data", json::object()));
        if (!j.contains("data") || !j["data"].is_string())
            return std::nullopt;
        return StreamEvent::data(channel == "stderr" ? Channel::Stderr : Channel::Stdout,
                                 j["data"].get<std::string>());
    }
    spdlog::debug("[Stream] unknown event type '{}'", type);
    return std::nullopt;
}

} // namespace conduit::stream
