#pragma once

#include <conduit/core/types.h>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace conduit::exec {

enum class OutputStream { Stdout, Stderr };

/**
 * @brief Spawn parameters for a child process.
 *
 * Example:
 * @code
 * ChildProcessConfig config{.executable = "bash", .args = {"-c", "ls -la"}};
 * config.in_directory("/tmp").with_env("LC_ALL", "C");
 * @endcode
 */
struct ChildProcessConfig {
    std::filesystem::path executable; ///< Resolved through PATH when not absolute
    std::vector<std::string> args;    ///< Arguments after argv[0]
    std::unordered_map<std::string, std::string> env; ///< Added to the inherited environment
    std::optional<std::filesystem::path> workdir;
    std::chrono::milliseconds terminationGrace{2000}; ///< SIGTERM -> SIGKILL delay
    std::chrono::milliseconds drainWindow{500}; ///< Output wait after exit before pipes close

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief A child process in its own process group with stdout/stderr on async pipes.
 *
 * Stdin is /dev/null. spawn() reports exec failures synchronously (through a close-on-exec
 * status pipe), so a missing executable is a LaunchFailure rather than exit code 127.
 * terminate() signals the whole group; the exit poll escalates to SIGKILL after the grace
 * period. The destructor kills and reaps a child that is still running.
 *
 * All members except terminate() must be used on the executor passed to spawn().
 */
class ChildProcess : public std::enable_shared_from_this<ChildProcess> {
public:
    using OutputHandler = std::function<void(OutputStream, std::string_view)>;

    static Result<std::shared_ptr<ChildProcess>> spawn(boost::asio::any_io_executor executor,
                                                       ChildProcessConfig config);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * Deliver output chunks to @p onChunk in arrival order until the process exits and both
     * pipes are drained. Returns the exit code (128 + signo for signal deaths).
     */
    boost::asio::awaitable<int> run(OutputHandler onChunk);

    /// SIGTERM to the process group. Idempotent.
    void terminate();

    pid_t pid() const noexcept { return pid_; }
    bool exited() const noexcept { return exited_; }
    bool terminateRequested() const noexcept { return termRequested_; }
    std::optional<int> exitCode() const noexcept {
        return exited_ ? std::optional<int>(exitCode_) : std::nullopt;
    }
    /// First read error on either pipe other than EOF / cancellation.
    const std::optional<std::string>& streamFault() const noexcept { return streamFault_; }

private:
    ChildProcess(boost::asio::any_io_executor executor, ChildProcessConfig config, pid_t pid,
                 int stdoutFd, int stderrFd);

    boost::asio::awaitable<void> readLoop(boost::asio::posix::stream_descriptor& pipe,
                                          OutputStream which, OutputHandler onChunk);
    boost::asio::awaitable<int> waitExit();
    bool reap(int options);
    void closeOutput();

    boost::asio::any_io_executor executor_;
    ChildProcessConfig config_;
    pid_t pid_{-1};
    boost::asio::posix::stream_descriptor stdout_;
    boost::asio::posix::stream_descriptor stderr_;
    bool exited_{false};
    int exitCode_{-1};
    bool termRequested_{false};
    bool killSent_{false};
    std::chrono::steady_clock::time_point termRequestedAt_{};
    std::optional<std::string> streamFault_;
};

} // namespace conduit::exec
