#include <conduit/exec/child_process.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>

#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/wait.h>

namespace conduit::exec {

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds{10};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls between fork() and exec().
[[noreturn]] void childFail(int statusFd) {
    int err = errno;
    ssize_t w = ::write(statusFd, &err, sizeof(err));
    (void)w;
    ::_exit(127);
}

void closeRange(unsigned first, unsigned last) {
    if (first > last)
        return;
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, first, last, 0) == 0)
        return;
#endif
    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0)
        maxFd = 1024;
    const unsigned end = std::min<unsigned long>(last, static_cast<unsigned long>(maxFd - 1));
    for (unsigned fd = first; fd <= end; ++fd)
        ::close(static_cast<int>(fd));
}

// Asio opens sockets without SOCK_CLOEXEC. Drop everything above stderr except the exec
// status pipe.
void closeInheritedFds(int keep) {
    const unsigned k = static_cast<unsigned>(keep);
    if (k > 3)
        closeRange(3, k - 1);
    closeRange(std::max(3u, k + 1), ~0U);
}

std::string describe(const ChildProcessConfig& config) {
    std::string cmd = config.executable.string();
    for (const auto& a : config.args) {
        cmd += ' ';
        cmd += a;
    }
    return cmd;
}

} // namespace

Result<std::shared_ptr<ChildProcess>> ChildProcess::spawn(boost::asio::any_io_executor executor,
                                                          ChildProcessConfig config) {
    // A child dying under us must not take the server down with SIGPIPE.
    std::signal(SIGPIPE, SIG_IGN);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) < 0 || ::pipe2(errPipe, O_CLOEXEC) < 0 ||
        ::pipe2(statusPipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Error{ErrorCode::LaunchFailure,
                     std::string("Failed to create pipes: ") + std::strerror(err)};
    }

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argStorage;
    argStorage.reserve(config.args.size() + 1);
    argStorage.push_back(config.executable.string());
    for (const auto& a : config.args)
        argStorage.push_back(a);
    std::vector<char*> argv;
    for (auto& a : argStorage)
        argv.push_back(a.data());
    argv.push_back(nullptr);
    const std::string workdir = config.workdir ? config.workdir->string() : std::string{};

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* p : {outPipe, errPipe, statusPipe}) {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        return Error{ErrorCode::LaunchFailure, std::string("fork() failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        std::signal(SIGPIPE, SIG_DFL);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (::dup2(outPipe[1], STDOUT_FILENO) < 0 || ::dup2(errPipe[1], STDERR_FILENO) < 0)
            childFail(statusPipe[1]);
        if (!workdir.empty() && ::chdir(workdir.c_str()) < 0)
            childFail(statusPipe[1]);
        closeInheritedFds(statusPipe[1]);
        for (const auto& [key, value] : config.env)
            ::setenv(key.c_str(), value.c_str(), 1);
        ::execvp(argv[0], argv.data());
        childFail(statusPipe[1]);
    }

    // Parent. Set the group here too so a kill before the child runs still targets it.
    ::setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        spdlog::warn("[ChildProcess] failed to start '{}': {}", describe(config),
                     std::strerror(childErrno));
        return Error{ErrorCode::LaunchFailure, "Failed to start '" + config.executable.string() +
                                                   "': " + std::strerror(childErrno)};
    }

    ::fcntl(outPipe[0], F_SETFL, ::fcntl(outPipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(errPipe[0], F_SETFL, ::fcntl(errPipe[0], F_GETFL) | O_NONBLOCK);

    spdlog::debug("[ChildProcess] spawned pid={} cmd='{}' cwd='{}'", pid, describe(config),
                  workdir.empty() ? std::string(".") : workdir);
    return std::shared_ptr<ChildProcess>(
        new ChildProcess(std::move(executor), std::move(config), pid, outPipe[0], errPipe[0]));
}

ChildProcess::ChildProcess(boost::asio::any_io_executor executor, ChildProcessConfig config,
                           pid_t pid, int stdoutFd, int stderrFd)
    : executor_(executor), config_(std::move(config)), pid_(pid), stdout_(executor, stdoutFd),
      stderr_(executor, stderrFd) {}

ChildProcess::~ChildProcess() {
    closeOutput();
    if (pid_ > 0 && !exited_) {
        spdlog::debug("[ChildProcess] killing process group {} on destruction", pid_);
        ::kill(-pid_, SIGKILL);
        reap(0);
    }
}

void ChildProcess::terminate() {
    if (pid_ <= 0 || exited_ || termRequested_)
        return;
    termRequested_ = true;
    termRequestedAt_ = std::chrono::steady_clock::now();
    spdlog::info("[ChildProcess] terminating process group {}", pid_);
    if (::kill(-pid_, SIGTERM) < 0 && errno == ESRCH) {
        // Group leader may have changed group; fall back to the pid itself.
        ::kill(pid_, SIGTERM);
    }
}

bool ChildProcess::reap(int options) {
    if (exited_)
        return true;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, options);
    } while (r < 0 && errno == EINTR);
    if (r == 0)
        return false;
    if (r < 0) {
        // ECHILD: someone else reaped it; report as a generic failure exit.
        spdlog::warn("[ChildProcess] waitpid({}) failed: {}", pid_, std::strerror(errno));
        exitCode_ = 1;
    } else if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    } else {
        return false;
    }
    exited_ = true;
    return true;
}

boost::asio::awaitable<int> ChildProcess::waitExit() {
    boost::asio::steady_timer poll(executor_);
    boost::system::error_code ec;
    while (!reap(WNOHANG)) {
        if (termRequested_ && !killSent_ &&
            std::chrono::steady_clock::now() - termRequestedAt_ >= config_.terminationGrace) {
            spdlog::warn("[ChildProcess] process group {} ignored SIGTERM; sending SIGKILL", pid_);
            ::kill(-pid_, SIGKILL);
            killSent_ = true;
        }
        poll.expires_after(kExitPollInterval);
        co_await poll.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    spdlog::debug("[ChildProcess] pid={} exited with {}", pid_, exitCode_);
    co_return exitCode_;
}

boost::asio::awaitable<void> ChildProcess::readLoop(boost::asio::posix::stream_descriptor& pipe,
                                                    OutputStream which, OutputHandler onChunk) {
    std::array<char, 8192> buf;
    boost::system::error_code ec;
    for (;;) {
        std::size_t n = co_await pipe.async_read_some(
            boost::asio::buffer(buf), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (n > 0)
            onChunk(which, std::string_view(buf.data(), n));
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted &&
                ec != boost::asio::error::bad_descriptor && !streamFault_) {
                streamFault_ = ec.message();
                spdlog::warn("[ChildProcess] read error on pid={}: {}", pid_, ec.message());
            }
            break;
        }
    }
}

void ChildProcess::closeOutput() {
    boost::system::error_code ec;
    if (stdout_.is_open())
        stdout_.close(ec);
    if (stderr_.is_open())
        stderr_.close(ec);
}

boost::asio::awaitable<int> ChildProcess::run(OutputHandler onChunk) {
    auto self = shared_from_this();
    boost::asio::steady_timer readersDone(executor_);
    readersDone.expires_at(boost::asio::steady_timer::time_point::max());
    int pending = 2;
    std::exception_ptr failure;
    auto finish = [&](std::exception_ptr e) {
        if (e && !failure)
            failure = e;
        if (--pending == 0)
            readersDone.cancel();
    };
    boost::asio::co_spawn(executor_, readLoop(stdout_, OutputStream::Stdout, onChunk), finish);
    boost::asio::co_spawn(executor_, readLoop(stderr_, OutputStream::Stderr, onChunk), finish);

    int code = co_await waitExit();

    // Background jobs can hold the pipes open past the exit of the main process.
    boost::system::error_code ec;
    auto deadline = std::chrono::steady_clock::now() + config_.drainWindow;
    bool forced = false;
    while (pending > 0) {
        readersDone.expires_at(forced ? boost::asio::steady_timer::time_point::max() : deadline);
        co_await readersDone.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (pending > 0 && !forced && std::chrono::steady_clock::now() >= deadline) {
            spdlog::debug("[ChildProcess] pid={} output still open after exit; closing", pid_);
            closeOutput();
            forced = true;
        }
    }
    if (failure)
        std::rethrow_exception(failure);
    co_return code;
}

} // namespace conduit::exec
