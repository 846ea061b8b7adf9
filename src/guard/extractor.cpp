#include "delguard/guard/extractor.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"
#include "delguard/guard/detector.hpp"
#include "delguard/infra/glob.hpp"
#include "delguard/infra/paths.hpp"
#include "delguard/infra/shell_lexer.hpp"

#include <string>

namespace delguard::guard {

namespace fs = std::filesystem;

namespace {

auto takes_value(std::string_view flag) -> bool {
    return flag == "-t" || flag == "--target-directory";
}

auto changes_directory(std::string_view token) -> bool {
    return token == "cd" || token == "pushd" || token == "popd";
}

auto looks_like_flag(std::string_view token) -> bool {
#ifdef _WIN32
    return token.starts_with("-") || token.starts_with("/");
#else
    return token.starts_with("-");
#endif
}

void append_expanded(std::string_view token, const fs::path& cwd, std::vector<fs::path>& out) {
    auto expanded = infra::expand_env_vars(infra::expand_user(token));
    fs::path candidate(expanded);
    if (!candidate.is_absolute()) {
        candidate = cwd / candidate;
    }

    auto matches = infra::expand_glob(candidate);
    if (matches.empty()) {
        out.push_back(infra::resolve_path(candidate));
        return;
    }
    for (const auto& match : matches) {
        out.push_back(infra::resolve_path(match));
    }
}

} // anonymous namespace

auto is_shell_operator(std::string_view token) -> bool {
    return token == ";" || token == "&&" || token == "||" || token == "|" || token == "&";
}

auto extract_segments(std::string_view command, const fs::path& cwd)
    -> std::vector<std::vector<fs::path>> {
    auto tokens = infra::split_command(command);

    std::vector<std::vector<fs::path>> segments;
    std::vector<fs::path> paths;
    bool in_args = false;
    bool end_of_flags = false;
    bool skip_next = false;
    bool after_placeholder = false;
    bool cwd_lost = false;

    auto close_segment = [&] {
        if (in_args) {
            segments.push_back(std::move(paths));
            paths.clear();
        }
        in_args = false;
        end_of_flags = false;
        skip_next = false;
        after_placeholder = false;
    };

    for (auto token : tokens) {
        // The lexer leaves `;` attached: "a.txt;" ends the command after a.txt.
        bool ends_command = token.ends_with(';');
        while (!token.empty() && token.back() == ';') {
            token.pop_back();
        }

        if (!in_args) {
            if (changes_directory(token)) {
                LOG_DEBUG("Directory change before deletion verb, later targets unresolvable");
                cwd_lost = true;
            } else if (is_deletion_verb(token)) {
                in_args = true;
                if (ends_command) close_segment();  // verb with no arguments
            }
            // Operators before the verb just start the next command segment.
            continue;
        }

        if (token.empty()) {
            if (ends_command) close_segment();
            continue;
        }
        if (skip_next) {
            skip_next = false;
            if (ends_command) close_segment();
            continue;
        }
        if (is_shell_operator(token)) {
            close_segment();
            continue;
        }
        if (after_placeholder && token == "+") {
            // `-exec rm {} +` terminator; what follows belongs to find.
            close_segment();
            continue;
        }
        after_placeholder = false;

        if (token == "--" && !end_of_flags) {
            end_of_flags = true;
            if (ends_command) close_segment();
            continue;
        }
        if (!end_of_flags && looks_like_flag(token)) {
            if (takes_value(token)) {
                skip_next = true;
            }
            if (ends_command) close_segment();
            continue;
        }
        if (token == "{}") {
            // find -exec placeholder, not a literal path
            after_placeholder = true;
            if (ends_command) close_segment();
            continue;
        }

        if (!cwd_lost) {
            append_expanded(token, cwd, paths);
        }
        if (ends_command) close_segment();
    }
    close_segment();

    LOG_DEBUG("Extracted {} deleting segment(s) from command", segments.size());
    return segments;
}

auto extract_targets(std::string_view command, const fs::path& cwd) -> std::vector<fs::path> {
    auto segments = extract_segments(command, cwd);
    if (segments.empty()) {
        return {};
    }
    return std::move(segments.front());
}

} // namespace delguard::guard
