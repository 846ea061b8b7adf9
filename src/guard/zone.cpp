#include "delguard/guard/zone.hpp"

#include "delguard/core/logger.hpp"
#include "delguard/infra/paths.hpp"

namespace delguard::guard {

namespace fs = std::filesystem;

auto zone_to_string(Zone zone) -> std::string_view {
    switch (zone) {
        case Zone::Workspace: return "workspace";
        case Zone::Whitelist: return "whitelist";
        case Zone::Tmp: return "tmp";
        case Zone::Outside: return "outside";
    }
    return "outside";
}

auto classify(const fs::path& path, const ZoneRoots& roots) -> Target {
    Target target;
    target.path = infra::resolve_path(path, roots.workspace);

    std::error_code ec;
    target.exists = fs::exists(fs::symlink_status(target.path, ec));

    if (target.path == roots.workspace) {
        target.zone = Zone::Outside;
    } else if (infra::is_inside(target.path, roots.workspace)) {
        target.zone = Zone::Workspace;
        target.backup_root = roots.workspace;
    } else {
        target.zone = Zone::Outside;
        for (const auto& root : roots.whitelist) {
            if (infra::is_inside(target.path, root)) {
                target.zone = Zone::Whitelist;
                target.backup_root = root;
                break;
            }
        }
        if (target.zone == Zone::Outside) {
            for (const auto& root : roots.tmp) {
                if (infra::is_inside(target.path, root)) {
                    target.zone = Zone::Tmp;
                    break;
                }
            }
        }
    }

    LOG_DEBUG("Classified {} as {}", target.path.string(), zone_to_string(target.zone));
    return target;
}

} // namespace delguard::guard
