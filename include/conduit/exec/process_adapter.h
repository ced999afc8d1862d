#pragma once

#include <conduit/exec/cancellation.h>
#include <conduit/stream/stream_event.h>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace conduit::exec {

/**
 * @brief Runs one external process on behalf of a request and reports it as stream events.
 *
 * run() emits exactly one terminal event on every path it controls: aborted when the token
 * fires, exit/done on completion, error on launch or stream failure. After the token fires
 * no further data is emitted. Exceptions escaping run() are turned into an error event by
 * RequestLifecycleManager.
 */
class ProcessAdapter {
public:
    virtual ~ProcessAdapter() = default;
    virtual const char* kind() const noexcept = 0;
    virtual boost::asio::awaitable<void> run(CancellationToken token,
                                             stream::EventSink& sink) = 0;
};

struct ShellInvocation {
    std::string executable;
    std::vector<std::string> args;
};

/// bash (default), sh, zsh, fish: `<shell> -c cmd`; cmd: `cmd /c`; powershell: `-c`.
ShellInvocation buildShellInvocation(const std::string& shell, const std::string& command);

/// Shells offered to clients on this platform.
std::vector<std::string> supportedShells();
const char* defaultShell() noexcept;

struct ShellRequest {
    std::string command;
    std::string shell{"bash"};
    std::optional<std::string> workingDirectory;
};

struct AdapterOptions {
    bool compatLayer{false};
    std::chrono::milliseconds terminationGrace{2000};
    bool debug{false};
};

class ShellCommandAdapter final : public ProcessAdapter {
public:
    ShellCommandAdapter(ShellRequest request, AdapterOptions options);

    const char* kind() const noexcept override { return "shell"; }
    boost::asio::awaitable<void> run(CancellationToken token, stream::EventSink& sink) override;

private:
    ShellRequest request_;
    AdapterOptions options_;
};

struct AssistantRequest {
    std::string prompt;
    std::optional<std::string> sessionId;
    std::vector<std::string> allowedTools;
    std::optional<std::string> workingDirectory;
    std::optional<int> thinkingBudget;
};

/// Command-line arguments for the assistant CLI (everything after argv[0]).
std::vector<std::string> buildAssistantArgs(const AssistantRequest& request);

/**
 * Resolve the assistant executable: @p configured when non-empty, else the first
 * executable @p name on PATH, else the bare @p name.
 */
std::string locateExecutable(const std::string& configured, const std::string& name = "claude");

class AssistantQueryAdapter final : public ProcessAdapter {
public:
    AssistantQueryAdapter(AssistantRequest request, std::string executable,
                          AdapterOptions options);

    const char* kind() const noexcept override { return "assistant"; }
    boost::asio::awaitable<void> run(CancellationToken token, stream::EventSink& sink) override;

    static constexpr std::size_t kStderrTailBytes = 4096;

private:
    AssistantRequest request_;
    std::string executable_;
    AdapterOptions options_;
};

} // namespace conduit::exec
