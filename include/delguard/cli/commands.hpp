#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "delguard/backup/store.hpp"
#include "delguard/core/config.hpp"
#include "delguard/core/error.hpp"
#include "delguard/guard/dry_run.hpp"
#include "delguard/infra/tty_prompt.hpp"

namespace delguard::cli {

/// Options shared by every subcommand, filled in by CLI11 before the
/// subcommand callback runs.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
    int exit_code = 0;
};

/// The pre-execution hook payload. Only `tool_name == "Bash"` is inspected.
struct HookInput {
    std::string tool_name;
    std::string command;
    std::string cwd;
};

/// Parses the hook's stdin JSON. Missing or non-string fields come back
/// empty.
///
/// Errors: ErrorCode::SerializationError for malformed JSON,
/// ErrorCode::InvalidArgument when the document is not an object.
[[nodiscard]] auto parse_hook_input(std::string_view raw) -> Result<HookInput>;

/// Loads the config named by `options` (or the default location) and
/// applies the log level, `--log-level` taking precedence.
auto load_effective_config(const GlobalOptions& options) -> Config;

/// Runs the hook on a raw stdin payload and returns the process exit code.
/// Block explanations go to `err`. Engine failures are logged and allowed.
auto run_check(std::string_view raw_input,
               const Config& config,
               infra::Prompter& prompter,
               backup::BackupStore& store,
               guard::DryRunDiscoverer& discoverer,
               std::ostream& err) -> int;

/// Register the `check` subcommand.
/// Reads the hook payload from stdin and exits 0 (allow) or 2 (block).
void register_check_command(CLI::App& app, GlobalOptions& options);

/// Register the `explain` subcommand.
/// Shows how a command would be classified without prompting or running it.
void register_explain_command(CLI::App& app, GlobalOptions& options);

} // namespace delguard::cli
