#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace delguard::guard {

/// Tier 1: explicit path arguments of the first deletion verb.
///
/// Tokenizes with shell quoting, skips everything up to the verb, then
/// collects its non-flag arguments until a shell operator or a token with a
/// trailing `;`. Arguments get `~` and `$VAR` expansion, are resolved
/// against `cwd` and glob-expanded; a pattern that matches nothing is kept
/// as its literal resolved path so it can still be classified.
///
/// A directory change (`cd`, `pushd`, `popd`) before the verb makes
/// relative arguments unresolvable, so nothing is returned in that case.
/// The `+` or `;` closing a `find -exec rm {}` clause ends the arguments.
auto extract_targets(std::string_view command, const std::filesystem::path& cwd)
    -> std::vector<std::filesystem::path>;

/// Targets of every deletion verb in the command, one entry per verb, in
/// command order. `extract_targets` is the first entry. An entry is empty
/// when its verb had no usable arguments, including every verb that follows
/// a directory change.
auto extract_segments(std::string_view command, const std::filesystem::path& cwd)
    -> std::vector<std::vector<std::filesystem::path>>;

/// `;`, `&&`, `||`, `|` or `&` as a standalone token.
auto is_shell_operator(std::string_view token) -> bool;

} // namespace delguard::guard
