#include "delguard/core/config.hpp"
#include "delguard/core/logger.hpp"
#include "delguard/infra/paths.hpp"

#include <cstdlib>
#include <fstream>

namespace delguard {

namespace fs = std::filesystem;

auto load_config(const fs::path& path) -> Config {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_DEBUG("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            LOG_WARN("Config file {} is not a JSON object, using defaults", path.string());
            return default_config();
        }
        auto config = j.get<Config>();

        if (config.prompt_timeout_seconds <= 0) {
            LOG_WARN("Config: prompt_timeout_seconds must be positive, using 30");
            config.prompt_timeout_seconds = 30;
        }
        if (config.dry_run_timeout_seconds <= 0) {
            LOG_WARN("Config: dry_run_timeout_seconds must be positive, using 10");
            config.dry_run_timeout_seconds = 10;
        }
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

auto default_config_path() -> fs::path {
    if (const auto* val = std::getenv("DELGUARD_CONFIG"); val && *val) {
        return fs::path(infra::expand_user(val));
    }
    return infra::config_dir() / "config.json";
}

auto resolve_whitelist_roots(const Config& config) -> std::vector<fs::path> {
    std::vector<fs::path> roots;
    for (const auto& raw : config.whitelisted_folders) {
        if (raw.empty()) continue;
        auto expanded = infra::expand_env_vars(infra::expand_user(raw));
        roots.push_back(infra::resolve_path(expanded));
    }
    return roots;
}

auto resolve_backup_root(const Config& config) -> fs::path {
    if (config.backup_root && !config.backup_root->empty()) {
        auto expanded = infra::expand_env_vars(infra::expand_user(*config.backup_root));
        return infra::resolve_path(expanded);
    }
    return infra::resolve_path(infra::data_dir() / "backups");
}

auto resolve_workspace_root(std::string_view cwd) -> fs::path {
    for (const char* var : {"DELGUARD_WORKSPACE", "CLAUDE_PROJECT_DIR"}) {
        if (const auto* val = std::getenv(var); val && *val) {
            return infra::resolve_path(val);
        }
    }
    if (!cwd.empty()) {
        return infra::resolve_path(fs::path(std::string(cwd)));
    }
    return infra::resolve_path(fs::current_path());
}

} // namespace delguard
