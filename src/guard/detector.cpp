#include "delguard/guard/detector.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"
#include "delguard/infra/shell_lexer.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <regex>
#include <vector>

namespace delguard::guard {

namespace {

constexpr std::array<std::string_view, 11> kDeletionVerbs = {
    // unix
    "rm", "rmdir", "unlink", "shred", "trash", "rimraf",
    // Windows cmd
    "del", "erase", "rd",
    // PowerShell
    "remove-item", "ri",
};

auto search(std::string_view text, const std::regex& re) -> bool {
    return std::regex_search(text.begin(), text.end(), re);
}

auto unresolvable_patterns() -> const std::vector<std::regex>& {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\$\()"),                      // $(...) substitution
        std::regex(R"(`)"),                         // backtick substitution
        std::regex(R"(\beval\b)"),
        std::regex(R"(base64.*\|\s*(ba)?sh)"),
        std::regex(R"(os\.remove\()"),              // python
        std::regex(R"(os\.unlink\()"),
        std::regex(R"(shutil\.rmtree\()"),
        std::regex(R"(\.unlink\(\))"),
        std::regex(R"(fs\.unlinkSync\()"),          // node
        std::regex(R"(fs\.rmdirSync\()"),
        std::regex(R"(fs\.rmSync\()"),
        std::regex(R"(fs\.promises\.unlink\()"),
    };
    return patterns;
}

} // anonymous namespace

auto is_deletion_verb(std::string_view token) -> bool {
    auto base = utils::to_lower(std::filesystem::path(std::string(token)).filename().string());
    return std::ranges::find(kDeletionVerbs, std::string_view(base)) != kDeletionVerbs.end();
}

auto is_find_delete(std::string_view command) -> bool {
    static const std::regex re(R"(\bfind\b.*(-delete|-exec(dir)?\s+rm\b))");
    return search(command, re);
}

auto is_git_clean_force(std::string_view command) -> bool {
    // A force cluster is a whitespace-delimited short-flag word containing f;
    // `-n` alone, or `--something-f`, is not one.
    static const std::regex re(R"(\bgit\s+clean\b.*(\s-[a-zA-Z]*f[a-zA-Z]*\b|\s--force\b))");
    return search(command, re);
}

auto is_xargs_delete(std::string_view command) -> bool {
    static const std::regex re(R"(\bxargs\s+(sudo\s+)?(rm|unlink)\b)");
    return search(command, re);
}

auto has_deletion(std::string_view command) -> bool {
    if (is_find_delete(command)) {
        LOG_DEBUG("Deletion detected: find -delete/-exec rm");
        return true;
    }
    if (is_git_clean_force(command)) {
        LOG_DEBUG("Deletion detected: git clean with force");
        return true;
    }
    if (is_xargs_delete(command)) {
        LOG_DEBUG("Deletion detected: xargs rm");
        return true;
    }

    auto tokens = infra::split_command(command);
    return std::ranges::any_of(tokens, [](const auto& token) {
        return is_deletion_verb(token);
    });
}

auto has_unresolvable(std::string_view command) -> bool {
    const auto& patterns = unresolvable_patterns();
    return std::ranges::any_of(patterns, [&](const auto& re) {
        return search(command, re);
    });
}

} // namespace delguard::guard
