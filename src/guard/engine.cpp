#include "delguard/guard/engine.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"
#include "delguard/guard/detector.hpp"
#include "delguard/guard/extractor.hpp"
#include "delguard/infra/paths.hpp"

namespace delguard::guard {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPromptSuffix = "Allow this deletion? [y/N] ";

auto block(std::string message, std::vector<fs::path> blocked = {}) -> Verdict {
    Verdict verdict;
    verdict.decision = Decision::Block;
    verdict.exit_code = kExitBlock;
    verdict.message = std::move(message);
    verdict.blocked = std::move(blocked);
    return verdict;
}

auto allow() -> Verdict {
    return Verdict{};
}

} // anonymous namespace

auto decision_to_string(Decision decision) -> std::string_view {
    switch (decision) {
        case Decision::Allow: return "allow";
        case Decision::AllowWithBackup: return "allow_with_backup";
        case Decision::Block: return "block";
    }
    return "allow";
}

auto make_zone_roots(const Config& config, const fs::path& workspace) -> ZoneRoots {
    ZoneRoots roots;
    roots.workspace = infra::resolve_path(workspace);
    roots.whitelist = resolve_whitelist_roots(config);
    roots.tmp = infra::temp_roots();
    return roots;
}

auto analyze_command(const Command& command, const ZoneRoots& roots) -> Analysis {
    Analysis analysis;
    analysis.deletion = has_deletion(command.text);
    if (!analysis.deletion) {
        return analysis;
    }
    analysis.unresolvable = has_unresolvable(command.text);
    if (analysis.unresolvable) {
        return analysis;
    }
    for (const auto& segment : extract_segments(command.text, command.cwd)) {
        for (const auto& path : segment) {
            analysis.targets.push_back(classify(path, roots));
        }
    }
    return analysis;
}

DecisionEngine::DecisionEngine(Config config,
                               const fs::path& workspace,
                               infra::Prompter& prompter,
                               backup::BackupStore& store,
                               DryRunDiscoverer& discoverer)
    : config_(std::move(config))
    , roots_(make_zone_roots(config_, workspace))
    , prompter_(prompter)
    , store_(store)
    , discoverer_(discoverer)
{
    LOG_DEBUG("Decision engine for workspace {} ({} whitelist root(s))",
              roots_.workspace.string(), roots_.whitelist.size());
}

auto DecisionEngine::evaluate(const Command& command) -> Result<Verdict> {
    try {
        return run(command);
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::InternalError,
                                          "Failed to evaluate command", e.what()));
    }
}

auto DecisionEngine::run(const Command& command) -> Verdict {
    if (!has_deletion(command.text)) {
        return allow();
    }
    LOG_INFO("Deletion command: {}", command.text);

    if (has_unresolvable(command.text)) {
        return confirm_unresolvable(command);
    }

    auto segments = extract_segments(command.text, command.cwd);
    std::vector<fs::path> paths;
    bool unenumerable = false;

    if (segments.empty() || segments.front().empty()) {
        auto discovered = discoverer_.discover(command.text, command.cwd);
        LOG_DEBUG("Dry-run discovery: {}", discovery_status_to_string(discovered.status));
        switch (discovered.status) {
            case DiscoveryStatus::Found:
                paths = std::move(discovered.targets);
                break;
            case DiscoveryStatus::FoundNone:
                LOG_INFO("Dry-run found nothing to delete");
                break;
            case DiscoveryStatus::CouldNotRun:
                unenumerable = true;
                break;
        }
    } else {
        paths = std::move(segments.front());
    }

    // Every later deleting command is checked as well.
    for (std::size_t i = 1; i < segments.size(); ++i) {
        if (segments[i].empty()) {
            unenumerable = true;
            continue;
        }
        std::ranges::move(segments[i], std::back_inserter(paths));
    }

    if (unenumerable) {
        auto verdict = confirm_unenumerable(command);
        if (verdict.decision == Decision::Block || paths.empty()) {
            return verdict;
        }
    }
    if (paths.empty()) {
        return allow();
    }

    std::vector<Target> targets;
    targets.reserve(paths.size());
    std::vector<fs::path> outside;
    for (const auto& path : paths) {
        auto target = classify(path, roots_);
        if (target.zone == Zone::Outside) {
            outside.push_back(target.path);
        }
        targets.push_back(std::move(target));
    }

    if (!outside.empty()) {
        std::string listing;
        for (const auto& p : outside) {
            listing += "  " + p.string() + "\n";
        }
        auto confirmed = prompter_.confirm(
            "\nDeletion guard: The following paths are outside the workspace:\n"
            + listing + "Allow deletion? [y/N] ");
        if (!confirmed) {
            std::vector<std::string> names;
            for (const auto& p : outside) names.push_back(p.string());
            LOG_WARN("Blocked deletion outside the workspace: {}", utils::join(names, ", "));
            return block(
                "Deletion guard: Deleting files outside the workspace or /tmp is not "
                "allowed and the user has not confirmed this operation.\nBlocked: "
                    + utils::join(names, ", "),
                std::move(outside));
        }
        LOG_INFO("User confirmed deletion of {} outside path(s)", outside.size());
    }

    auto stored = dispatch_backups(command, targets);
    Verdict verdict;
    verdict.backups = stored;
    bool dispatched = std::ranges::any_of(targets, [](const Target& t) {
        return t.zone == Zone::Workspace || t.zone == Zone::Whitelist;
    });
    verdict.decision = dispatched ? Decision::AllowWithBackup : Decision::Allow;
    return verdict;
}

auto DecisionEngine::confirm_unresolvable(const Command& command) -> Verdict {
    auto confirmed = prompter_.confirm(
        "\nDeletion guard: Command contains unresolvable paths:\n  " + command.text + "\n"
        + std::string(kPromptSuffix));
    if (!confirmed) {
        LOG_WARN("Blocked unresolvable deletion: {}", command.text);
        return block(
            "Deletion guard: Unable to verify whether target paths are inside the "
            "workspace or /tmp. Rewrite using explicit file paths (avoid $(...), "
            "backtick subshells, eval, or base64-piped commands).");
    }
    return allow();
}

auto DecisionEngine::confirm_unenumerable(const Command& command) -> Verdict {
    auto confirmed = prompter_.confirm(
        "\nDeletion guard: Cannot enumerate deletion targets for:\n  " + command.text + "\n"
        + std::string(kPromptSuffix));
    if (!confirmed) {
        LOG_WARN("Blocked deletion with unknown targets: {}", command.text);
        return block(
            "Deletion guard: Unable to verify whether target paths are inside the "
            "workspace or /tmp. Rewrite using explicit file paths.");
    }
    return allow();
}

auto DecisionEngine::dispatch_backups(const Command& command,
                                      const std::vector<Target>& targets) -> std::size_t {
    // Groups in first-seen order, one store call per zone root.
    std::vector<std::pair<fs::path, std::vector<fs::path>>> groups;
    for (const auto& target : targets) {
        if (target.zone != Zone::Workspace && target.zone != Zone::Whitelist) {
            continue;
        }
        auto it = std::ranges::find_if(groups, [&](const auto& group) {
            return group.first == target.backup_root;
        });
        if (it == groups.end()) {
            groups.emplace_back(target.backup_root, std::vector<fs::path>{});
            it = std::prev(groups.end());
        }
        it->second.push_back(target.path);
    }

    std::size_t stored = 0;
    for (const auto& [root, group] : groups) {
        auto records = store_.store(group, root, command.text);
        LOG_DEBUG("Backed up {} of {} target(s) under {}", records.size(), group.size(),
                  root.string());
        stored += records.size();
    }
    return stored;
}

} // namespace delguard::guard
