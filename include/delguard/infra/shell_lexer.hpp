#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "delguard/core/error.hpp"

namespace delguard::infra {

/// POSIX word splitting: whitespace separates words, single quotes are
/// literal, double quotes honour `\"`, `\\`, and a bare backslash escapes the
/// next character. Shell operators are not split out of words, so
/// `a.txt;` stays one token.
///
/// Fails with ErrorCode::InvalidArgument on an unterminated quote or a
/// trailing backslash.
[[nodiscard]] auto split_posix(std::string_view input) -> Result<std::vector<std::string>>;

/// Lenient splitting used when quoting is malformed. Quotes are kept in the
/// token text, backslashes are literal, and an unterminated quote runs to
/// the end of input. Never fails.
auto split_permissive(std::string_view input) -> std::vector<std::string>;

/// split_posix(), falling back to split_permissive() on malformed quoting.
auto split_command(std::string_view input) -> std::vector<std::string>;

} // namespace delguard::infra
