#pragma once

#include <CLI/CLI.hpp>

#include "delguard/cli/commands.hpp"

namespace delguard::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the `check`
/// hook or the `explain` subcommand. Any exception that escapes a
/// subcommand is reported on stderr and the command is allowed.
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 allow, 2 block).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto options() const -> const GlobalOptions&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    GlobalOptions options_;
};

} // namespace delguard::cli
