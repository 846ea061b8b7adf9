#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "delguard/backup/store.hpp"
#include "delguard/core/config.hpp"
#include "delguard/core/error.hpp"
#include "delguard/guard/dry_run.hpp"
#include "delguard/guard/zone.hpp"
#include "delguard/infra/tty_prompt.hpp"

namespace delguard::guard {

enum class Decision {
    Allow,
    AllowWithBackup,
    Block,
};

auto decision_to_string(Decision decision) -> std::string_view;

/// Hook exit codes.
static constexpr int kExitAllow = 0;
static constexpr int kExitBlock = 2;

/// A shell command as the host agent is about to run it.
struct Command {
    std::string text;
    std::filesystem::path cwd;
};

struct Verdict {
    Decision decision = Decision::Allow;
    int exit_code = kExitAllow;
    /// Explanation for stderr. Only set when blocking.
    std::string message;
    std::vector<std::filesystem::path> blocked;
    std::size_t backups = 0;
};

/// Static view of a command, computed without prompting, executing or
/// copying anything.
struct Analysis {
    bool deletion = false;
    bool unresolvable = false;
    std::vector<Target> targets;
};

/// Workspace, whitelist and temp roots for one invocation.
auto make_zone_roots(const Config& config, const std::filesystem::path& workspace) -> ZoneRoots;

/// Detection, extraction and classification only. Dry-run discovery is not
/// attempted, so `find -delete` style commands report no targets.
auto analyze_command(const Command& command, const ZoneRoots& roots) -> Analysis;

/// Decides whether a shell command may run.
///
/// Flow: detect deletion, route unresolvable constructs to the prompt,
/// extract the explicit targets of every deletion verb (falling back to
/// dry-run discovery for the first), classify every target, confirm
/// anything outside the trusted zones, and back up workspace and whitelist
/// targets grouped by their zone root.
class DecisionEngine {
public:
    DecisionEngine(Config config,
                   const std::filesystem::path& workspace,
                   infra::Prompter& prompter,
                   backup::BackupStore& store,
                   DryRunDiscoverer& discoverer);

    /// Errors: ErrorCode::InternalError when anything unexpected is thrown
    /// while evaluating; callers treat that as allow.
    [[nodiscard]] auto evaluate(const Command& command) -> Result<Verdict>;

    auto config() const -> const Config& { return config_; }
    auto roots() const -> const ZoneRoots& { return roots_; }

private:
    auto run(const Command& command) -> Verdict;
    auto confirm_unresolvable(const Command& command) -> Verdict;
    auto confirm_unenumerable(const Command& command) -> Verdict;
    auto dispatch_backups(const Command& command, const std::vector<Target>& targets)
        -> std::size_t;

    const Config config_;
    ZoneRoots roots_;
    infra::Prompter& prompter_;
    backup::BackupStore& store_;
    DryRunDiscoverer& discoverer_;
};

} // namespace delguard::guard
