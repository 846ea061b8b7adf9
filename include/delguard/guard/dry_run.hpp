#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "delguard/core/error.hpp"
#include "delguard/infra/subprocess.hpp"

namespace delguard::guard {

enum class DiscoveryStatus {
    Found,        // ran and listed at least one target
    FoundNone,    // ran successfully and listed nothing
    CouldNotRun,  // not applicable, rewrite refused, spawn failure or timeout
};

auto discovery_status_to_string(DiscoveryStatus status) -> std::string_view;

struct DiscoveryResult {
    DiscoveryStatus status = DiscoveryStatus::CouldNotRun;
    std::vector<std::filesystem::path> targets;
};

/// Removes `-delete` and any `-exec rm ... ;|+` clause. Returns nullopt when
/// nothing was removed or nothing is left.
auto strip_find_deletion(std::string_view command) -> std::optional<std::string>;

/// Rewrites git clean force flags into dry-run flags: every `f` inside a
/// short flag cluster becomes `n` and `--force` becomes `-n`. Returns nullopt
/// when the command is unchanged.
auto rewrite_git_clean_dry_run(std::string_view command) -> std::optional<std::string>;

/// Turns a rewritten find command into an argv that can be executed without
/// a shell. Returns nullopt when the text chains other commands, redirects,
/// substitutes, does not start with `find`, or still carries a find action
/// with side effects (`-delete`, `-exec`, `-execdir`, `-ok`, `-okdir`,
/// `-fprint`, `-fprint0`, `-fprintf`, `-fls`).
auto find_dry_run_argv(std::string_view command) -> std::optional<std::vector<std::string>>;

/// Same for a rewritten git clean: only `git clean <options/paths>` with a
/// dry-run flag present is accepted. Global git options are refused.
auto git_clean_dry_run_argv(std::string_view command)
    -> std::optional<std::vector<std::string>>;

/// Tier 2: enumerates what `find -delete` or `git clean -f` would remove by
/// running a non-destructive rewrite of the command.
class DryRunDiscoverer {
public:
    explicit DryRunDiscoverer(std::chrono::seconds timeout = std::chrono::seconds(10));
    virtual ~DryRunDiscoverer() = default;

    /// Runs the rewritten command in `cwd`. Output paths are resolved
    /// against `cwd`. Commands that cannot be reduced to a single read-only
    /// find or git clean invocation are never executed.
    virtual auto discover(std::string_view command, const std::filesystem::path& cwd)
        -> DiscoveryResult;

protected:
    /// Executes an already vetted, non-destructive argv without a shell.
    virtual auto execute(const std::vector<std::string>& argv, const std::filesystem::path& cwd)
        -> Result<infra::ProcessOutput>;

private:
    auto discover_find(std::string_view command, const std::filesystem::path& cwd)
        -> DiscoveryResult;
    auto discover_git_clean(std::string_view command, const std::filesystem::path& cwd)
        -> DiscoveryResult;

    std::chrono::seconds timeout_;
};

} // namespace delguard::guard
