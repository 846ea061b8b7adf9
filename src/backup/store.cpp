#include "delguard/backup/store.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include "delguard/core/logger.hpp"
#include "delguard/core/utils.hpp"
#include "delguard/infra/paths.hpp"

namespace delguard::backup {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 28> kSkipNames = {
    // version control
    ".git", ".svn", ".hg",
    // python
    "venv", ".venv", "env", "__pypackages__", "__pycache__",
    ".pytest_cache", ".mypy_cache", ".ruff_cache",
    // javascript and build output
    "node_modules", "dist", "build", "out", "target", ".output",
    ".next", ".nuxt", ".svelte-kit", ".astro",
    // mobile / jvm
    "Pods", ".gradle",
    // coverage
    "coverage", ".nyc_output",
    // scratch
    "tmp", "temp", ".tmp",
};

constexpr std::array<std::string_view, 2> kSkipSuffixes = {".egg-info", ".dist-info"};

auto current_pid() -> long {
#ifdef _WIN32
    return static_cast<long>(_getpid());
#else
    return static_cast<long>(::getpid());
#endif
}

auto exists_no_follow(const fs::path& p) -> bool {
    std::error_code ec;
    return fs::exists(fs::symlink_status(p, ec));
}

auto is_real_dir(const fs::path& p) -> bool {
    std::error_code ec;
    return fs::is_directory(fs::symlink_status(p, ec));
}

auto to_mb(std::uint64_t bytes) -> std::uint64_t {
    return bytes / (1024 * 1024);
}

/// Copies a single non-directory entry, keeping symlinks as links.
auto copy_entry(const fs::path& src, const fs::path& dest) -> VoidResult {
    std::error_code ec;
    auto status = fs::symlink_status(src, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to stat " + src.string(),
                                          ec.message()));
    }

    if (fs::is_symlink(status)) {
        fs::copy_symlink(src, dest, ec);
    } else {
        fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            auto mtime = fs::last_write_time(src, ec);
            if (!ec) fs::last_write_time(dest, mtime, ec);
        }
    }
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError, "Failed to copy " + src.string(),
                                          ec.message()));
    }
    return {};
}

/// Path of `target` relative to `root`, or just its file name when it is
/// not beneath `root`.
auto relative_or_name(const fs::path& target, const fs::path& root) -> fs::path {
    if (!root.empty() && infra::is_inside(target, root) && target != root) {
        return target.lexically_relative(root);
    }
    return target.filename();
}

auto copy_tree_impl(const fs::path& src, const fs::path& dest) -> VoidResult {
    if (!is_real_dir(src)) {
        return copy_entry(src, dest);
    }

    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to create " + dest.string(), ec.message()));
    }

    fs::directory_iterator it(src, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to list " + src.string(), ec.message()));
    }
    for (const auto& entry : it) {
        auto name = entry.path().filename();
        if (is_skip_name(name.string())) {
            continue;
        }
        auto result = copy_tree_impl(entry.path(), dest / name);
        if (!result) {
            return result;
        }
    }
    return {};
}

auto tree_size_impl(const fs::path& path) -> std::uint64_t {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) return 0;

    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : static_cast<std::uint64_t>(size);
    }
    if (!fs::is_directory(status)) {
        return 0;
    }

    std::uint64_t total = 0;
    fs::directory_iterator it(path, ec);
    if (ec) return 0;
    for (const auto& entry : it) {
        if (is_skip_name(entry.path().filename().string())) continue;
        total += tree_size_impl(entry.path());
    }
    return total;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

auto is_skip_name(std::string_view name) -> bool {
    if (std::ranges::find(kSkipNames, name) != kSkipNames.end()) {
        return true;
    }
    return std::ranges::any_of(kSkipSuffixes, [&](std::string_view suffix) {
        return name.ends_with(suffix);
    });
}

auto has_skip_component(const fs::path& path, const fs::path& zone_root) -> bool {
    auto relevant = path;
    if (!zone_root.empty() && infra::is_inside(path, zone_root)) {
        relevant = path.lexically_relative(zone_root);
    }
    for (const auto& part : relevant) {
        if (is_skip_name(part.string())) {
            return true;
        }
    }
    return false;
}

auto make_backup_name(const fs::path& path, bool is_dir) -> std::string {
    auto suffix = utils::random_hex(3);
    if (is_dir) {
        return path.filename().string() + "_" + suffix;
    }
    return path.stem().string() + "_" + suffix + path.extension().string();
}

auto copy_tree(const fs::path& src, const fs::path& dest) -> VoidResult {
    try {
        return copy_tree_impl(src, dest);
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to copy " + src.string(), e.what()));
    }
}

auto tree_size(const fs::path& path) -> std::uint64_t {
    try {
        return tree_size_impl(path);
    } catch (const fs::filesystem_error& e) {
        LOG_DEBUG("Size walk of {} stopped early: {}", path.string(), e.what());
        return 0;
    }
}

auto append_manifest(const fs::path& manifest, const BackupRecord& record) -> VoidResult {
    try {
        json j = record;
        std::ofstream out(manifest, std::ios::app);
        if (!out.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                                              "Failed to open manifest", manifest.string()));
        }
        out << j.dump() << '\n';
        if (!out) {
            return std::unexpected(make_error(ErrorCode::IoError,
                                              "Failed to append manifest record",
                                              manifest.string()));
        }
        return {};
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "Failed to serialize manifest record", e.what()));
    }
}

auto ensure_gitignore(const fs::path& root) -> VoidResult {
    auto gitignore = root / ".gitignore";
    const std::string entry = std::string(kPerFolderDirName) + "/";

    std::string content;
    std::error_code ec;
    if (fs::exists(gitignore, ec)) {
        std::ifstream in(gitignore);
        if (!in.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                                              "Failed to read .gitignore", gitignore.string()));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        content = ss.str();

        for (const auto& line : utils::split_lines(content)) {
            auto trimmed = utils::trim(line);
            if (trimmed == entry || trimmed == kPerFolderDirName) {
                return {};
            }
        }
    }

    while (!content.empty() && content.back() == '\n') {
        content.pop_back();
    }
    if (!content.empty()) content += '\n';
    content += entry + "\n";

    std::ofstream out(gitignore, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to write .gitignore", gitignore.string()));
    }
    out << content;
    return {};
}

// ---------------------------------------------------------------------------
// CentralizedBackupStore
// ---------------------------------------------------------------------------

CentralizedBackupStore::CentralizedBackupStore(fs::path root, std::ostream& progress)
    : root_(std::move(root))
    , progress_(progress) {}

auto CentralizedBackupStore::store(const std::vector<fs::path>& targets,
                                   const fs::path& zone_root,
                                   std::string_view command) -> std::vector<BackupRecord> {
    std::vector<BackupRecord> records;

    std::error_code ec;
    fs::create_directories(files_dir(), ec);
    if (ec) {
        LOG_ERROR("Failed to create backup directory {}: {}", files_dir().string(), ec.message());
        progress_ << "  Backup failed (" << ec.message() << "): " << files_dir().string() << "\n";
        return records;
    }

    auto now = utils::timestamp_local_iso();
    for (const auto& target : targets) {
        if (!exists_no_follow(target)) {
            LOG_DEBUG("Skipping nonexistent target {}", target.string());
            continue;
        }
        if (has_skip_component(target, zone_root)) {
            progress_ << "  Skip (skip list): " << target.string() << "\n";
            continue;
        }

        auto record = store_one(target, zone_root, command, now);
        if (!record) {
            LOG_WARN("Backup of {} failed: {}", target.string(), record.error().what());
            progress_ << "  Backup failed (" << record.error().what() << "): "
                      << target.string() << "\n";
            continue;
        }
        progress_ << "  Backed up: " << target.filename().string() << "  ->  "
                  << (files_dir() / record->backup_filename).string() << "\n";
        records.push_back(std::move(*record));
    }

    warn_if_oversized();
    return records;
}

auto CentralizedBackupStore::store_one(const fs::path& target,
                                       const fs::path& zone_root,
                                       std::string_view command,
                                       const std::string& now) -> Result<BackupRecord> {
    bool is_dir = is_real_dir(target);

    auto name = make_backup_name(target, is_dir);
    auto dest = files_dir() / name;
    while (exists_no_follow(dest)) {
        name = make_backup_name(target, is_dir);
        dest = files_dir() / name;
    }

    auto copied = copy_tree(target, dest);
    if (!copied) {
        std::error_code ec;
        fs::remove_all(dest, ec);
        return std::unexpected(copied.error());
    }

    BackupRecord record;
    auto underscore = name.rfind('_');
    record.id = name.substr(underscore + 1, 6);
    record.backup_filename = name;
    record.original_path = target.string();
    record.backed_up_at = now;
    record.workspace = zone_root.string();
    record.is_dir = is_dir;
    record.size_bytes = tree_size(dest);
    record.command = std::string(command);

    auto appended = append_manifest(manifest_path(), record);
    if (!appended) {
        return std::unexpected(appended.error());
    }
    LOG_INFO("Backed up {} as {}", record.original_path, record.backup_filename);
    return record;
}

void CentralizedBackupStore::warn_if_oversized() {
    auto total = tree_size(files_dir());
    if (total > kStoreWarnBytes) {
        LOG_WARN("Backup store {} holds {} MB", root_.string(), to_mb(total));
        progress_ << "\n  Backup folder is " << to_mb(total) << "MB (" << root_.string()
                  << ").\n  Remove old entries from " << files_dir().string()
                  << " to free space.\n";
    }
}

// ---------------------------------------------------------------------------
// PerFolderBackupStore
// ---------------------------------------------------------------------------

PerFolderBackupStore::PerFolderBackupStore(std::ostream& progress, std::uint64_t size_limit)
    : progress_(progress)
    , size_limit_(size_limit) {}

auto PerFolderBackupStore::store(const std::vector<fs::path>& targets,
                                 const fs::path& zone_root,
                                 std::string_view command) -> std::vector<BackupRecord> {
    std::vector<BackupRecord> records;

    std::uint64_t total = 0;
    for (const auto& target : targets) {
        if (!exists_no_follow(target) || has_skip_component(target, zone_root)) continue;
        total += tree_size(target);
    }
    if (total > size_limit_) {
        LOG_WARN("Per-folder backup of {} MB exceeds the limit, skipping", to_mb(total));
        progress_ << "  Skip (>" << to_mb(size_limit_) << "MB): total backup size "
                  << to_mb(total) << " MB, skipping backup\n";
        return records;
    }

    if (auto ignored = ensure_gitignore(zone_root); !ignored) {
        LOG_WARN("Could not update .gitignore: {}", ignored.error().what());
    }

    auto batch_dir = zone_root / std::string(kPerFolderDirName)
        / (utils::timestamp_local_compact() + "_" + std::to_string(current_pid()));
    auto manifest = batch_dir / "manifest.jsonl";
    auto now = utils::timestamp_local_iso();

    for (const auto& target : targets) {
        if (!exists_no_follow(target)) {
            continue;
        }
        if (has_skip_component(target, zone_root)) {
            progress_ << "  Skip (skip list): " << target.string() << "\n";
            continue;
        }

        auto rel = relative_or_name(target, zone_root);
        auto dest = batch_dir / rel;

        std::error_code ec;
        fs::create_directories(dest.parent_path(), ec);
        auto copied = ec ? VoidResult(std::unexpected(make_error(
                                ErrorCode::IoError, "Failed to create backup directory",
                                ec.message())))
                         : copy_tree(target, dest);
        if (!copied) {
            fs::remove_all(dest, ec);
            LOG_WARN("Backup of {} failed: {}", target.string(), copied.error().what());
            progress_ << "  Backup failed for " << rel.string() << ": "
                      << copied.error().what() << "\n";
            continue;
        }

        BackupRecord record;
        record.id = utils::random_hex(3);
        record.backup_filename = rel.generic_string();
        record.original_path = target.string();
        record.backed_up_at = now;
        record.workspace = zone_root.string();
        record.is_dir = is_real_dir(target);
        record.size_bytes = tree_size(dest);
        record.command = std::string(command);

        if (auto appended = append_manifest(manifest, record); !appended) {
            LOG_WARN("Manifest append failed: {}", appended.error().what());
        }

        progress_ << "  Backed up: " << rel.string() << "  ->  "
                  << dest.lexically_relative(zone_root).string() << "\n";
        records.push_back(std::move(record));
    }
    return records;
}

auto make_backup_store(const Config& config, std::ostream& progress)
    -> std::unique_ptr<BackupStore> {
    switch (config.backup_mode) {
        case BackupMode::PerFolder:
            return std::make_unique<PerFolderBackupStore>(progress);
        case BackupMode::Centralized:
            break;
    }
    return std::make_unique<CentralizedBackupStore>(resolve_backup_root(config), progress);
}

} // namespace delguard::backup
