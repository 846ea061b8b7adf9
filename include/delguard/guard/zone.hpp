#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace delguard::guard {

enum class Zone {
    Workspace,
    Whitelist,
    Tmp,
    Outside,
};

auto zone_to_string(Zone zone) -> std::string_view;

/// The roots a path is classified against. Built once per invocation and
/// read-only afterwards; every path in here is already resolved.
struct ZoneRoots {
    std::filesystem::path workspace;
    std::vector<std::filesystem::path> whitelist;  // configured order
    std::vector<std::filesystem::path> tmp;
};

/// A deletion target after classification.
struct Target {
    std::filesystem::path path;      // resolved absolute form
    bool exists = false;
    Zone zone = Zone::Outside;
    /// Workspace root or the matching whitelist root. Empty for Tmp/Outside.
    std::filesystem::path backup_root;
};

/// Classifies `path` into a zone.
///
/// The workspace root itself is always Outside. Workspace descendants come
/// first, then the first whitelist root (in configured order) containing
/// the path, then temp roots. Everything else is Outside.
auto classify(const std::filesystem::path& path, const ZoneRoots& roots) -> Target;

} // namespace delguard::guard
