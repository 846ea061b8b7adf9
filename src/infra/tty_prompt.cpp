#include "delguard/infra/tty_prompt.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"

#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>

#ifndef _WIN32
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace delguard::infra {

namespace fs = std::filesystem;

auto default_tty_input() -> fs::path {
#ifdef _WIN32
    return "CONIN$";
#else
    return "/dev/tty";
#endif
}

auto default_tty_output() -> fs::path {
#ifdef _WIN32
    return "CONOUT$";
#else
    return "/dev/tty";
#endif
}

// ---------------------------------------------------------------------------
// AlarmLineReader
// ---------------------------------------------------------------------------

#ifndef _WIN32

namespace {

volatile sig_atomic_t g_alarm_fired = 0;

void on_alarm(int) {
    g_alarm_fired = 1;
}

} // anonymous namespace

AlarmLineReader::AlarmLineReader(fs::path device)
    : device_(std::move(device)) {}

auto AlarmLineReader::read_line(std::chrono::seconds timeout) -> std::optional<std::string> {
    // No SA_RESTART: the alarm must make open()/read() fail with EINTR.
    struct sigaction action{};
    struct sigaction previous{};
    action.sa_handler = on_alarm;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    ::sigaction(SIGALRM, &action, &previous);

    g_alarm_fired = 0;
    ::alarm(static_cast<unsigned>(timeout.count()));

    std::optional<std::string> result;
    int fd = ::open(device_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd >= 0) {
        std::string line;
        bool got_data = false;
        for (;;) {
            char c = 0;
            auto n = ::read(fd, &c, 1);
            if (n == 1) {
                got_data = true;
                if (c == '\n') break;
                line += c;
                continue;
            }
            if (n < 0 && errno == EINTR && !g_alarm_fired) {
                continue;
            }
            break;  // EOF, error, or alarm
        }
        ::close(fd);
        if (got_data && !g_alarm_fired) {
            result = std::move(line);
        }
    } else {
        LOG_DEBUG("Cannot open {} for reading", device_.string());
    }

    ::alarm(0);
    ::sigaction(SIGALRM, &previous, nullptr);

    if (g_alarm_fired) {
        LOG_INFO("Prompt timed out after {}s", timeout.count());
        return std::nullopt;
    }
    return result;
}

#endif

// ---------------------------------------------------------------------------
// ThreadLineReader
// ---------------------------------------------------------------------------

ThreadLineReader::ThreadLineReader(fs::path device)
    : device_(std::move(device)) {}

auto ThreadLineReader::read_line(std::chrono::seconds timeout) -> std::optional<std::string> {
    struct Shared {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<std::string> line;
    };

    // Shared state outlives a worker abandoned on timeout.
    auto shared = std::make_shared<Shared>();
    std::thread([shared, device = device_]() {
        std::optional<std::string> line;
        std::ifstream in(device);
        std::string text;
        if (in && std::getline(in, text)) {
            line = std::move(text);
        }
        {
            std::lock_guard lock(shared->mutex);
            shared->line = std::move(line);
            shared->done = true;
        }
        shared->cv.notify_all();
    }).detach();

    std::unique_lock lock(shared->mutex);
    if (!shared->cv.wait_for(lock, timeout, [&] { return shared->done; })) {
        LOG_INFO("Prompt timed out after {}s", timeout.count());
        return std::nullopt;
    }
    return shared->line;
}

auto make_line_reader(PromptStrategy strategy, fs::path device)
    -> std::unique_ptr<LineReader> {
#ifndef _WIN32
    if (strategy == PromptStrategy::Auto || strategy == PromptStrategy::Alarm) {
        return std::make_unique<AlarmLineReader>(std::move(device));
    }
#else
    if (strategy == PromptStrategy::Alarm) {
        LOG_WARN("SIGALRM prompt strategy unavailable on this platform, using a worker thread");
    }
#endif
    return std::make_unique<ThreadLineReader>(std::move(device));
}

// ---------------------------------------------------------------------------
// TtyPrompter
// ---------------------------------------------------------------------------

TtyPrompter::TtyPrompter(std::unique_ptr<LineReader> reader,
                         std::chrono::seconds timeout,
                         fs::path output_device)
    : reader_(std::move(reader))
    , timeout_(timeout)
    , output_device_(std::move(output_device)) {}

auto TtyPrompter::confirm(std::string_view message) -> bool {
    {
        std::ofstream out(output_device_);
        if (!out) {
            LOG_INFO("No terminal available at {}, denying", output_device_.string());
            return false;
        }
        out << message;
        out.flush();
        if (!out) {
            LOG_INFO("Failed to write prompt to {}, denying", output_device_.string());
            return false;
        }
    }

    auto answer = reader_->read_line(timeout_);
    if (!answer) {
        return false;
    }
    return is_affirmative(*answer);
}

auto is_affirmative(std::string_view answer) -> bool {
    return utils::to_lower(utils::trim(answer)) == "y";
}

} // namespace delguard::infra
