#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "delguard/core/config.hpp"
#include "delguard/core/error.hpp"

namespace delguard::backup {

using json = nlohmann::json;

/// Per-folder mode skips the whole batch above this many bytes.
static constexpr std::uint64_t kPerFolderSizeLimit = 10ULL * 1024 * 1024;
/// The centralized store warns once it grows past this many bytes.
static constexpr std::uint64_t kStoreWarnBytes = 500ULL * 1024 * 1024;

/// Name of the per-folder backup directory created inside a zone root.
inline constexpr std::string_view kPerFolderDirName = ".delguard-backups";

/// One line of manifest.jsonl. Written once per copied item, never updated.
struct BackupRecord {
    std::string id;
    std::string backup_filename;
    std::string original_path;
    std::string backed_up_at;
    std::string workspace;  // zone root the target belonged to
    bool is_dir = false;
    std::uint64_t size_bytes = 0;
    std::string command;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BackupRecord, id, backup_filename, original_path,
                                                backed_up_at, workspace, is_dir, size_bytes,
                                                command)

/// Durable copies of targets that are about to be deleted.
class BackupStore {
public:
    virtual ~BackupStore() = default;

    /// Copies every existing, non-skipped target and returns one record per
    /// copy that succeeded. Per-target failures are logged and do not stop
    /// the rest of the batch.
    virtual auto store(const std::vector<std::filesystem::path>& targets,
                       const std::filesystem::path& zone_root,
                       std::string_view command) -> std::vector<BackupRecord> = 0;
};

/// Keeps every backup under one root:
///   <root>/files/<stem>_<hex><ext>
///   <root>/manifest.jsonl
class CentralizedBackupStore : public BackupStore {
public:
    explicit CentralizedBackupStore(std::filesystem::path root,
                                    std::ostream& progress = std::cout);

    auto store(const std::vector<std::filesystem::path>& targets,
               const std::filesystem::path& zone_root,
               std::string_view command) -> std::vector<BackupRecord> override;

    auto root() const -> const std::filesystem::path& { return root_; }
    auto files_dir() const -> std::filesystem::path { return root_ / "files"; }
    auto manifest_path() const -> std::filesystem::path { return root_ / "manifest.jsonl"; }

private:
    auto store_one(const std::filesystem::path& target,
                   const std::filesystem::path& zone_root,
                   std::string_view command,
                   const std::string& now) -> Result<BackupRecord>;
    void warn_if_oversized();

    std::filesystem::path root_;
    std::ostream& progress_;
};

/// Keeps backups beside the data, one batch directory per invocation:
///   <zone_root>/.delguard-backups/<timestamp>_<pid>/<relative path>
/// and lists `.delguard-backups/` in the zone root's .gitignore.
class PerFolderBackupStore : public BackupStore {
public:
    explicit PerFolderBackupStore(std::ostream& progress = std::cout,
                                  std::uint64_t size_limit = kPerFolderSizeLimit);

    auto store(const std::vector<std::filesystem::path>& targets,
               const std::filesystem::path& zone_root,
               std::string_view command) -> std::vector<BackupRecord> override;

private:
    std::ostream& progress_;
    std::uint64_t size_limit_;
};

/// Store for the configured backup mode.
auto make_backup_store(const Config& config, std::ostream& progress = std::cout)
    -> std::unique_ptr<BackupStore>;

// ---------------------------------------------------------------------------
// Helpers shared by both stores
// ---------------------------------------------------------------------------

/// Dependency, VCS, cache and build-output directory names that are never
/// backed up, plus `*.egg-info` / `*.dist-info` packaging metadata.
auto is_skip_name(std::string_view name) -> bool;

/// True if any component of `path` below `zone_root` is a skip name. Paths
/// outside `zone_root` are checked in full.
auto has_skip_component(const std::filesystem::path& path,
                        const std::filesystem::path& zone_root) -> bool;

/// `stem_<hex>ext` for files, `name_<hex>` for directories.
auto make_backup_name(const std::filesystem::path& path, bool is_dir) -> std::string;

/// Recursively copies `src` to `dest`, leaving out skip-named entries.
/// Symlinks are copied as links.
auto copy_tree(const std::filesystem::path& src, const std::filesystem::path& dest)
    -> VoidResult;

/// Total size of regular files under `path` (or of `path` itself), not
/// counting skip-named entries.
auto tree_size(const std::filesystem::path& path) -> std::uint64_t;

/// Appends `record` as one JSON line.
auto append_manifest(const std::filesystem::path& manifest, const BackupRecord& record)
    -> VoidResult;

/// Makes sure `.delguard-backups/` is listed in `<root>/.gitignore`.
auto ensure_gitignore(const std::filesystem::path& root) -> VoidResult;

} // namespace delguard::backup
