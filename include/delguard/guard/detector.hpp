#pragma once

#include <string>
#include <string_view>

namespace delguard::guard {

/// Case-insensitive test of a token's base name against the known deletion
/// verbs (unix, Windows cmd and PowerShell).
auto is_deletion_verb(std::string_view token) -> bool;

/// `find ... -delete` or `find ... -exec rm`.
auto is_find_delete(std::string_view command) -> bool;

/// `git clean` with a force flag (`-f`, `-fd`, `-xfd`, `--force`).
auto is_git_clean_force(std::string_view command) -> bool;

/// `xargs [sudo] rm|unlink`.
auto is_xargs_delete(std::string_view command) -> bool;

/// True if the command deletes anything by any of the rules above.
auto has_deletion(std::string_view command) -> bool;

/// True if the command uses indirection that defeats static parsing:
/// command substitution, eval, base64-piped shells, or inline deletion calls
/// in another language.
auto has_unresolvable(std::string_view command) -> bool;

} // namespace delguard::guard
