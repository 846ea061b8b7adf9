#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "delguard/core/config.hpp"

namespace delguard::infra {

/// Terminal device the prompt is written to and read from.
auto default_tty_input() -> std::filesystem::path;
auto default_tty_output() -> std::filesystem::path;

/// A blocking line read that gives up after a timeout.
class LineReader {
public:
    virtual ~LineReader() = default;

    /// Reads one line (without the newline). Returns nullopt on timeout,
    /// EOF before any data, or when the device cannot be opened.
    virtual auto read_line(std::chrono::seconds timeout) -> std::optional<std::string> = 0;
};

#ifndef _WIN32
/// Interrupts the blocking open/read with SIGALRM. The previous SIGALRM
/// disposition is restored before returning.
class AlarmLineReader : public LineReader {
public:
    explicit AlarmLineReader(std::filesystem::path device);
    auto read_line(std::chrono::seconds timeout) -> std::optional<std::string> override;

private:
    std::filesystem::path device_;
};
#endif

/// Performs the read on a detached worker thread while the caller waits
/// with a timeout. A worker still blocked after the timeout is abandoned.
class ThreadLineReader : public LineReader {
public:
    explicit ThreadLineReader(std::filesystem::path device);
    auto read_line(std::chrono::seconds timeout) -> std::optional<std::string> override;

private:
    std::filesystem::path device_;
};

/// Picks the reader for `strategy`. `Auto` means SIGALRM where the platform
/// has it and a worker thread elsewhere.
auto make_line_reader(PromptStrategy strategy,
                      std::filesystem::path device = default_tty_input())
    -> std::unique_ptr<LineReader>;

/// Asks a yes/no question.
class Prompter {
public:
    virtual ~Prompter() = default;

    /// True only on an explicit affirmative answer.
    virtual auto confirm(std::string_view message) -> bool = 0;
};

/// Prompter that talks to the controlling terminal directly, bypassing the
/// process's standard streams. No terminal, EOF and timeout all deny.
class TtyPrompter : public Prompter {
public:
    TtyPrompter(std::unique_ptr<LineReader> reader,
                std::chrono::seconds timeout,
                std::filesystem::path output_device = default_tty_output());

    auto confirm(std::string_view message) -> bool override;

private:
    std::unique_ptr<LineReader> reader_;
    std::chrono::seconds timeout_;
    std::filesystem::path output_device_;
};

/// True if `answer` is the single-letter affirmative (`y` or `Y`, with
/// surrounding whitespace ignored).
auto is_affirmative(std::string_view answer) -> bool;

} // namespace delguard::infra
