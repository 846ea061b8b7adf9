#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace delguard::infra {

/// True if the text contains `*`, `?` or `[`.
auto has_glob_magic(std::string_view text) -> bool;

/// Expands an absolute glob pattern against the filesystem.
///
/// Each component is matched with fnmatch(3); `*`, `?` and `[...]` never
/// match a leading dot. A `**` component matches zero or more directory
/// levels (without following directory symlinks). A pattern without magic
/// returns itself if it exists. Results are de-duplicated, each directory
/// listing is visited in sorted order, and an empty vector means no match.
auto expand_glob(const std::filesystem::path& pattern) -> std::vector<std::filesystem::path>;

} // namespace delguard::infra
