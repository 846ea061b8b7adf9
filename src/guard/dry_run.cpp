#include "delguard/guard/dry_run.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"
#include "delguard/guard/detector.hpp"
#include "delguard/infra/paths.hpp"
#include "delguard/infra/shell_lexer.hpp"

#include <algorithm>
#include <array>
#include <regex>

namespace delguard::guard {

namespace fs = std::filesystem;

namespace {

/// Replaces every match of `re` in `text` with what `fn` returns for it.
template <typename Fn>
auto replace_each(const std::string& text, const std::regex& re, Fn fn) -> std::string {
    std::string out;
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += fn(m);
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

/// Turns the output of a run into a tri-state result. A failing exit with
/// nothing on stdout tells us nothing.
auto to_result(int exit_code, std::vector<fs::path> targets) -> DiscoveryResult {
    if (!targets.empty()) {
        return {DiscoveryStatus::Found, std::move(targets)};
    }
    if (exit_code == 0) {
        return {DiscoveryStatus::FoundNone, {}};
    }
    return {DiscoveryStatus::CouldNotRun, {}};
}

constexpr std::array<std::string_view, 9> kFindSideEffects = {
    "-delete", "-exec", "-execdir", "-ok", "-okdir",
    "-fprint", "-fprint0", "-fprintf", "-fls",
};

/// Operators, redirections, substitutions and line breaks. Any of these
/// means the text is more than one plain invocation.
auto has_shell_syntax(std::string_view command) -> bool {
    if (command.find_first_of(";&|<>`\n\r") != std::string_view::npos) {
        return true;
    }
    return command.find("$(") != std::string_view::npos;
}

auto program_name(const std::string& token) -> std::string {
    return fs::path(token).filename().string();
}

/// Tokenizes strictly and expands `~` and `$VAR` the way the shell would
/// have. Nullopt on shell syntax or malformed quoting.
auto plain_argv(std::string_view command) -> std::optional<std::vector<std::string>> {
    if (has_shell_syntax(command)) {
        return std::nullopt;
    }
    auto tokens = infra::split_posix(command);
    if (!tokens || tokens->empty()) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < tokens->size(); ++i) {
        auto& token = (*tokens)[i];
        token = infra::expand_env_vars(infra::expand_user(token));
    }
    return std::move(*tokens);
}

auto is_dry_run_flag(std::string_view token) -> bool {
    if (token == "--dry-run") {
        return true;
    }
    return token.size() > 1 && token[0] == '-' && token[1] != '-'
        && token.find('n') != std::string_view::npos;
}

} // anonymous namespace

auto discovery_status_to_string(DiscoveryStatus status) -> std::string_view {
    switch (status) {
        case DiscoveryStatus::Found:       return "found";
        case DiscoveryStatus::FoundNone:   return "found_none";
        case DiscoveryStatus::CouldNotRun: return "could_not_run";
    }
    return "could_not_run";
}

auto strip_find_deletion(std::string_view command) -> std::optional<std::string> {
    static const std::regex delete_flag(R"(\s+-delete\b)");
    static const std::regex exec_rm(R"(\s+-exec(dir)?\s+rm\b[^;+]*[;+])");

    std::string original(command);
    auto stripped = std::regex_replace(original, delete_flag, "");
    stripped = utils::trim(std::regex_replace(stripped, exec_rm, ""));

    if (stripped.empty() || stripped == original) {
        return std::nullopt;
    }
    return stripped;
}

auto rewrite_git_clean_dry_run(std::string_view command) -> std::optional<std::string> {
    static const std::regex git_clean(R"(\bgit\s+clean\b)");
    // Whitespace-delimited words only, so `--no-force` and `a-f` stay put.
    static const std::regex short_cluster(R"((^|\s)-([a-zA-Z]*f[a-zA-Z]*)(?=\s|$))");
    static const std::regex long_force(R"((^|\s)--force(?=\s|$))");

    std::string original(command);
    std::smatch head;
    if (!std::regex_search(original, head, git_clean)) {
        return std::nullopt;
    }

    auto prefix = original.substr(0, static_cast<std::size_t>(head.position(0) + head.length(0)));
    auto args = original.substr(prefix.size());

    args = replace_each(args, long_force, [](const std::smatch& m) {
        return m[1].str() + "-n";
    });
    args = replace_each(args, short_cluster, [](const std::smatch& m) {
        auto cluster = m[2].str();
        for (auto& c : cluster) {
            if (c == 'f') c = 'n';
        }
        return m[1].str() + "-" + cluster;
    });

    auto rewritten = prefix + args;
    if (rewritten == original) {
        return std::nullopt;
    }
    return rewritten;
}

auto find_dry_run_argv(std::string_view command) -> std::optional<std::vector<std::string>> {
    auto argv = plain_argv(command);
    if (!argv || program_name(argv->front()) != "find") {
        return std::nullopt;
    }
    for (const auto& token : *argv) {
        auto action = std::string_view(token);
        if (std::ranges::find(kFindSideEffects, action) != kFindSideEffects.end()) {
            return std::nullopt;
        }
    }
    return argv;
}

auto git_clean_dry_run_argv(std::string_view command) -> std::optional<std::vector<std::string>> {
    auto argv = plain_argv(command);
    if (!argv || argv->size() < 3 || program_name(argv->front()) != "git"
        || (*argv)[1] != "clean") {
        return std::nullopt;
    }
    bool dry_run = false;
    for (std::size_t i = 2; i < argv->size(); ++i) {
        const auto& token = (*argv)[i];
        if (token == "--") break;
        if (is_dry_run_flag(token)) dry_run = true;
    }
    if (!dry_run) {
        return std::nullopt;
    }
    return argv;
}

DryRunDiscoverer::DryRunDiscoverer(std::chrono::seconds timeout)
    : timeout_(timeout) {}

auto DryRunDiscoverer::discover(std::string_view command, const fs::path& cwd)
    -> DiscoveryResult {
    if (is_find_delete(command)) {
        return discover_find(command, cwd);
    }
    if (is_git_clean_force(command)) {
        return discover_git_clean(command, cwd);
    }
    return {};
}

auto DryRunDiscoverer::execute(const std::vector<std::string>& argv, const fs::path& cwd)
    -> Result<infra::ProcessOutput> {
    return infra::run_command(
        argv, cwd, std::chrono::duration_cast<std::chrono::milliseconds>(timeout_));
}

auto DryRunDiscoverer::discover_find(std::string_view command, const fs::path& cwd)
    -> DiscoveryResult {
    auto stripped = strip_find_deletion(command);
    if (!stripped) {
        LOG_DEBUG("find command could not be made non-destructive");
        return {};
    }
    auto argv = find_dry_run_argv(*stripped);
    if (!argv) {
        LOG_WARN("Rewritten find command is not a plain read-only find, refusing to run it");
        return {};
    }

    auto output = execute(*argv, cwd);
    if (!output) {
        LOG_WARN("find dry-run failed: {}", output.error().what());
        return {};
    }

    std::vector<fs::path> targets;
    for (const auto& line : utils::split_lines(output->stdout_text)) {
        auto entry = utils::trim(line);
        if (entry.empty()) continue;
        targets.push_back(infra::resolve_path(entry, cwd));
    }
    LOG_DEBUG("find dry-run listed {} path(s), exit {}", targets.size(), output->exit_code);
    return to_result(output->exit_code, std::move(targets));
}

auto DryRunDiscoverer::discover_git_clean(std::string_view command, const fs::path& cwd)
    -> DiscoveryResult {
    static const std::regex would_remove(R"(^Would remove (.+)$)");

    auto rewritten = rewrite_git_clean_dry_run(command);
    if (!rewritten) {
        LOG_DEBUG("git clean command has no force flag to rewrite");
        return {};
    }
    auto argv = git_clean_dry_run_argv(*rewritten);
    if (!argv) {
        LOG_WARN("Rewritten git clean command is not a plain dry run, refusing to run it");
        return {};
    }

    auto output = execute(*argv, cwd);
    if (!output) {
        LOG_WARN("git clean dry-run failed: {}", output.error().what());
        return {};
    }

    std::vector<fs::path> targets;
    for (const auto& line : utils::split_lines(output->stdout_text)) {
        auto entry = utils::trim(line);
        std::smatch m;
        if (std::regex_match(entry, m, would_remove)) {
            targets.push_back(infra::resolve_path(m[1].str(), cwd));
        }
    }
    LOG_DEBUG("git clean dry-run listed {} path(s), exit {}", targets.size(), output->exit_code);
    return to_result(output->exit_code, std::move(targets));
}

} // namespace delguard::guard
