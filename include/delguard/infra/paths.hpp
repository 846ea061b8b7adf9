#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace delguard::infra {

/// Returns the user's home directory.
auto home_dir() -> std::filesystem::path;

/// Returns the base data directory for delguard.
/// Linux: $XDG_DATA_HOME/delguard or ~/.local/share/delguard
/// macOS: ~/Library/Application Support/delguard
auto data_dir() -> std::filesystem::path;

/// Returns the configuration directory for delguard.
/// Linux: $XDG_CONFIG_HOME/delguard or ~/.config/delguard
/// macOS: ~/Library/Application Support/delguard
auto config_dir() -> std::filesystem::path;

/// Expands a leading `~` or `~user` the way a shell does. Unknown users
/// leave the input unchanged.
auto expand_user(std::string_view input) -> std::string;

/// Expands `$VAR` and `${VAR}` references. Unset variables are left as
/// written.
auto expand_env_vars(std::string_view input) -> std::string;

/// Makes `path` absolute against `base`, then resolves symlinks for the
/// existing prefix and normalizes `.`/`..`. Never fails: a path that cannot
/// be resolved comes back lexically normalized.
auto resolve_path(const std::filesystem::path& path,
                  const std::filesystem::path& base = {}) -> std::filesystem::path;

/// True when `path` equals `root` or lies beneath it. Both must already be
/// normalized; comparison is per component, so `/tmp2` is not inside `/tmp`.
auto is_inside(const std::filesystem::path& path,
               const std::filesystem::path& root) -> bool;

/// Resolved temp-directory roots for this platform.
auto temp_roots() -> std::vector<std::filesystem::path>;

} // namespace delguard::infra
