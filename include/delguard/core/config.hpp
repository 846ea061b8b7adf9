#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace delguard {

using json = nlohmann::json;

enum class BackupMode {
    Centralized,
    PerFolder,
};

NLOHMANN_JSON_SERIALIZE_ENUM(BackupMode, {
    {BackupMode::Centralized, "centralized"},
    {BackupMode::PerFolder, "per_folder"},
})

enum class PromptStrategy {
    Auto,
    Alarm,
    Thread,
};

NLOHMANN_JSON_SERIALIZE_ENUM(PromptStrategy, {
    {PromptStrategy::Auto, "auto"},
    {PromptStrategy::Alarm, "alarm"},
    {PromptStrategy::Thread, "thread"},
})

/// Settings read once at startup and handed to the engine by value.
struct Config {
    std::vector<std::string> whitelisted_folders;
    BackupMode backup_mode = BackupMode::Centralized;
    std::optional<std::string> backup_root;
    std::string log_level = "warn";
    int prompt_timeout_seconds = 30;
    int dry_run_timeout_seconds = 10;
    PromptStrategy prompt_strategy = PromptStrategy::Auto;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, whitelisted_folders, backup_mode, backup_root,
                                                log_level, prompt_timeout_seconds,
                                                dry_run_timeout_seconds, prompt_strategy)

/// Loads a JSON config file. Missing or malformed files yield defaults.
auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// `DELGUARD_CONFIG` if set, otherwise `<config_dir>/config.json`.
auto default_config_path() -> std::filesystem::path;

/// Expands `~` and `${VAR}` in each whitelisted folder and resolves it.
/// Order is preserved; empty entries are dropped.
auto resolve_whitelist_roots(const Config& config) -> std::vector<std::filesystem::path>;

/// Where the centralized backup store lives.
auto resolve_backup_root(const Config& config) -> std::filesystem::path;

/// Workspace root: DELGUARD_WORKSPACE, then CLAUDE_PROJECT_DIR, then `cwd`,
/// then the process working directory.
auto resolve_workspace_root(std::string_view cwd) -> std::filesystem::path;

} // namespace delguard
