#include <conduit/exec/child_process.h>
#include <conduit/exec/error_hints.h>
#include <conduit/exec/output_decoder.h>
#include <conduit/exec/path_resolver.h>
#include <conduit/exec/process_adapter.h>

#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>

#include <unistd.h>

using conduit::stream::Channel;
using conduit::stream::StreamEvent;

namespace conduit::exec {

namespace {

struct ChildOutcome {
    int exitCode{0};
    bool cancelled{false};
    std::optional<std::string> fault;
};

// Spawn, tie the child to the token, run it to completion.
boost::asio::awaitable<Result<ChildOutcome>> runChild(ChildProcessConfig config,
                                                      CancellationToken token,
                                                      ChildProcess::OutputHandler onChunk) {
    auto ex = co_await boost::asio::this_coro::executor;
    auto spawned = ChildProcess::spawn(ex, std::move(config));
    if (!spawned)
        co_return spawned.error();
    std::shared_ptr<ChildProcess> child = std::move(spawned).value();

    // Cancel may be signalled from any thread; terminate on the child's executor.
    std::weak_ptr<ChildProcess> weak = child;
    auto registration = token.onCancel([ex, weak] {
        boost::asio::post(ex, [weak] {
            if (auto c = weak.lock())
                c->terminate();
        });
    });

    ChildOutcome outcome;
    outcome.exitCode = co_await child->run(std::move(onChunk));
    outcome.cancelled = token.isCancelled() || child->terminateRequested();
    outcome.fault = child->streamFault();
    co_return outcome;
}

Channel toChannel(OutputStream which) {
    return which == OutputStream::Stdout ? Channel::Stdout : Channel::Stderr;
}

} // namespace

// --- shell ---

ShellInvocation buildShellInvocation(const std::string& shell, const std::string& command) {
    if (shell == "sh" || shell == "zsh" || shell == "fish" || shell == "bash")
        return {shell, {"-c", command}};
    if (shell == "cmd")
        return {"cmd", {"/c", command}};
    if (shell == "powershell")
        return {"powershell", {"-c", command}};
    if (!shell.empty())
        spdlog::debug("[Shell] unknown shell '{}', using bash", shell);
    return {"bash", {"-c", command}};
}

std::vector<std::string> supportedShells() {
    return {"bash", "sh", "zsh", "fish"};
}

const char* defaultShell() noexcept {
    return "bash";
}

ShellCommandAdapter::ShellCommandAdapter(ShellRequest request, AdapterOptions options)
    : request_(std::move(request)), options_(options) {}

boost::asio::awaitable<void> ShellCommandAdapter::run(CancellationToken token,
                                                      stream::EventSink& sink) {
    sink.emit(StreamEvent::start());
    if (token.isCancelled()) {
        sink.emit(StreamEvent::aborted());
        co_return;
    }

    auto invocation = buildShellInvocation(request_.shell, request_.command);
    ChildProcessConfig config;
    config.executable = invocation.executable;
    config.args = std::move(invocation.args);
    config.terminationGrace = options_.terminationGrace;
    if (request_.workingDirectory && !request_.workingDirectory->empty()) {
        config.in_directory(
            resolveWorkingDirectory(request_.workingDirectory, options_.compatLayer));
    }
    if (options_.debug) {
        spdlog::debug("[Shell] executing '{}' via {} in '{}'", request_.command,
                      config.executable.string(),
                      config.workdir ? config.workdir->string() : std::string("."));
    }

    Utf8ChunkDecoder outDecoder;
    Utf8ChunkDecoder errDecoder;
    auto emitText = [&](OutputStream which, std::string text) {
        if (text.empty() || token.isCancelled())
            return;
        sink.emit(StreamEvent::data(toChannel(which), std::move(text)));
    };

    auto result = co_await runChild(std::move(config), token,
                                    [&](OutputStream which, std::string_view bytes) {
                                        auto& decoder = which == OutputStream::Stdout
                                                            ? outDecoder
                                                            : errDecoder;
                                        emitText(which, decoder.decode(bytes));
                                    });
    if (!result) {
        spdlog::warn("[Shell] launch failed: {}", result.error().message);
        sink.emit(StreamEvent::error(result.error().message));
        co_return;
    }
    const auto& outcome = result.value();
    if (outcome.cancelled) {
        sink.emit(StreamEvent::aborted());
        co_return;
    }
    emitText(OutputStream::Stdout, outDecoder.flush());
    emitText(OutputStream::Stderr, errDecoder.flush());
    if (outcome.fault) {
        sink.emit(StreamEvent::error("Output stream failed: " + *outcome.fault));
        co_return;
    }
    spdlog::debug("[Shell] '{}' exited with {}", request_.command, outcome.exitCode);
    sink.emit(StreamEvent::exit(outcome.exitCode));
}

// --- assistant ---

std::vector<std::string> buildAssistantArgs(const AssistantRequest& request) {
    std::vector<std::string> args{"--output-format", "stream-json", "--verbose"};
    if (request.sessionId && !request.sessionId->empty()) {
        args.push_back("--resume");
        args.push_back(*request.sessionId);
    }
    if (!request.allowedTools.empty()) {
        std::string joined;
        for (const auto& tool : request.allowedTools) {
            if (!joined.empty())
                joined += ',';
            joined += tool;
        }
        args.push_back("--allowedTools");
        args.push_back(joined);
    }
    if (request.thinkingBudget && *request.thinkingBudget > 0) {
        args.push_back("--max-thinking-tokens");
        args.push_back(std::to_string(*request.thinkingBudget));
    }
    std::string prompt = request.prompt;
    if (!prompt.empty() && prompt.front() == '/')
        prompt.erase(0, 1);
    args.push_back("--print");
    args.push_back("--");
    args.push_back(std::move(prompt));
    return args;
}

std::string locateExecutable(const std::string& configured, const std::string& name) {
    if (!configured.empty())
        return configured;
    if (const char* path = std::getenv("PATH"); path && *path) {
        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (dir.empty())
                continue;
            std::filesystem::path candidate = std::filesystem::path(dir) / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) &&
                ::access(candidate.c_str(), X_OK) == 0) {
                return candidate.string();
            }
        }
    }
    return name;
}

AssistantQueryAdapter::AssistantQueryAdapter(AssistantRequest request, std::string executable,
                                             AdapterOptions options)
    : request_(std::move(request)), executable_(std::move(executable)), options_(options) {}

boost::asio::awaitable<void> AssistantQueryAdapter::run(CancellationToken token,
                                                        stream::EventSink& sink) {
    if (token.isCancelled()) {
        sink.emit(StreamEvent::aborted());
        co_return;
    }

    ChildProcessConfig config;
    config.executable = executable_;
    config.args = buildAssistantArgs(request_);
    config.terminationGrace = options_.terminationGrace;
    if (request_.workingDirectory && !request_.workingDirectory->empty()) {
        config.in_directory(
            resolveWorkingDirectory(request_.workingDirectory, options_.compatLayer));
    }
    spdlog::info("[Assistant] starting query with session: {}",
                 request_.sessionId ? *request_.sessionId : std::string("new"));

    LineSplitter lines;
    std::string stderrTail;
    auto handleLine = [&](std::string line) {
        if (token.isCancelled())
            return;
        if (line.find_first_not_of(" \t") == std::string::npos)
            return;
        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            sink.emit(StreamEvent::data(Channel::Stdout, std::move(line)));
            return;
        }
        if (options_.debug)
            spdlog::debug("[Assistant] message: {}", message.dump(2));
        if (auto it = message.find("session_id"); it != message.end() && it->is_string()) {
            auto type = message.find("type");
            spdlog::debug("[Assistant] message type: {}, session_id: {}",
                          type != message.end() && type->is_string() ? type->get<std::string>()
                                                                     : std::string{"?"},
                          it->get<std::string>());
        }
        sink.emit(StreamEvent::assistant(std::move(message)));
    };

    auto result = co_await runChild(
        std::move(config), token, [&](OutputStream which, std::string_view bytes) {
            if (which == OutputStream::Stdout) {
                for (auto& line : lines.append(bytes))
                    handleLine(std::move(line));
                return;
            }
            stderrTail.append(bytes.data(), bytes.size());
            if (stderrTail.size() > kStderrTailBytes)
                stderrTail.erase(0, stderrTail.size() - kStderrTailBytes);
        });

    if (!result) {
        spdlog::error("[Assistant] {}", result.error().message);
        sink.emit(StreamEvent::error(formatFailure(result.error().message)));
        co_return;
    }
    const auto& outcome = result.value();
    if (outcome.cancelled) {
        spdlog::info("[Assistant] query aborted");
        sink.emit(StreamEvent::aborted());
        co_return;
    }
    handleLine(lines.remainder());
    if (outcome.fault) {
        sink.emit(StreamEvent::error("Assistant output stream failed: " + *outcome.fault));
        co_return;
    }
    if (outcome.exitCode != 0) {
        std::string message =
            "Assistant process exited with code " + std::to_string(outcome.exitCode);
        if (!stderrTail.empty())
            message += ": " + stderrTail;
        spdlog::error("[Assistant] {}", message);
        sink.emit(StreamEvent::error(formatFailure(message)));
        co_return;
    }
    spdlog::info("[Assistant] query completed successfully");
    sink.emit(StreamEvent::done());
}

} // namespace conduit::exec
