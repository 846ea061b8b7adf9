#include "delguard/infra/subprocess.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace delguard::infra {

namespace asio = boost::asio;
using asio::awaitable;
using asio::use_awaitable;

namespace {

struct CaptureState {
    pid_t pid = -1;
    std::size_t max_output = 0;
    std::string output;
    bool finished = false;
    bool timed_out = false;
    bool overflowed = false;
};

void kill_group(pid_t pid) {
    if (pid > 0) {
        ::kill(-pid, SIGKILL);
    }
}

auto read_output(asio::posix::stream_descriptor& pipe,
                 asio::steady_timer& deadline,
                 CaptureState& state) -> awaitable<void> {
    std::array<char, 4096> buf{};
    for (;;) {
        boost::system::error_code ec;
        auto n = co_await pipe.async_read_some(asio::buffer(buf),
                                               asio::redirect_error(use_awaitable, ec));
        if (n > 0) {
            if (state.output.size() + n > state.max_output) {
                state.overflowed = true;
                kill_group(state.pid);
                break;
            }
            state.output.append(buf.data(), n);
        }
        if (ec) break;  // EOF, or the pipe was closed by the deadline
    }
    state.finished = true;
    deadline.cancel();
}

auto enforce_deadline(asio::steady_timer& deadline,
                      asio::posix::stream_descriptor& pipe,
                      CaptureState& state) -> awaitable<void> {
    boost::system::error_code ec;
    co_await deadline.async_wait(asio::redirect_error(use_awaitable, ec));
    if (ec || state.finished) {
        co_return;
    }
    state.timed_out = true;
    kill_group(state.pid);
    boost::system::error_code close_ec;
    pipe.close(close_ec);
}

auto wait_for_child(pid_t pid) -> int {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

auto run_command(const std::vector<std::string>& argv,
                 const std::filesystem::path& cwd,
                 std::chrono::milliseconds timeout,
                 std::size_t max_output) -> Result<ProcessOutput> {
    if (argv.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Empty argv"));
    }

    int fds[2];
    if (::pipe(fds) != 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to create pipe", std::strerror(errno)));
    }

    // Everything the child needs is prepared before fork().
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);
    std::string dir = cwd.string();
    std::string cmd = utils::join(argv, " ");

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = std::string(std::strerror(errno));
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to fork", err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
            ::_exit(126);
        }
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    // Parent: also set the group from this side to close the race with kill().
    ::setpgid(pid, pid);
    ::close(fds[1]);

    CaptureState state;
    state.pid = pid;
    state.max_output = max_output;

    asio::io_context ioc;
    asio::posix::stream_descriptor pipe(ioc, fds[0]);
    asio::steady_timer deadline(ioc);
    deadline.expires_after(timeout);

    asio::co_spawn(ioc, read_output(pipe, deadline, state), asio::detached);
    asio::co_spawn(ioc, enforce_deadline(deadline, pipe, state), asio::detached);
    ioc.run();

    int exit_code = wait_for_child(pid);
    LOG_DEBUG("Subprocess '{}' exited with {} ({} bytes captured)",
              cmd, exit_code, state.output.size());

    if (state.timed_out) {
        return std::unexpected(make_error(ErrorCode::Timeout,
            "Command timed out",
            cmd + " (after " + std::to_string(timeout.count()) + " ms)"));
    }
    if (state.overflowed) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Command output exceeded limit",
            cmd + " (" + std::to_string(max_output) + " bytes)"));
    }

    return ProcessOutput{exit_code, std::move(state.output)};
}

} // namespace delguard::infra
