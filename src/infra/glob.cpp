#include "delguard/infra/glob.hpp"

#include "delguard/core/logger.hpp"

#include <algorithm>
#include <set>
#include <string>

#include <fnmatch.h>

namespace delguard::infra {

namespace fs = std::filesystem;

namespace {

auto is_hidden(const fs::path& p) -> bool {
    auto name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

auto list_dir(const fs::path& dir) -> std::vector<fs::directory_entry> {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return entries;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    std::ranges::sort(entries, [](const auto& a, const auto& b) {
        return a.path().filename() < b.path().filename();
    });
    return entries;
}

auto is_real_dir(const fs::directory_entry& entry) -> bool {
    std::error_code ec;
    return entry.is_directory(ec) && !entry.is_symlink(ec);
}

class Walker {
public:
    explicit Walker(std::vector<std::string> parts) : parts_(std::move(parts)) {}

    void walk(const fs::path& base, size_t idx) {
        if (idx == parts_.size()) {
            emit(base);
            return;
        }

        const auto& part = parts_[idx];
        bool last = idx + 1 == parts_.size();

        if (part == "**") {
            if (last) {
                emit(base);
                emit_descendants(base);
                return;
            }
            walk(base, idx + 1);
            for (const auto& entry : list_dir(base)) {
                if (!is_hidden(entry.path()) && is_real_dir(entry)) {
                    walk(entry.path(), idx);
                }
            }
            return;
        }

        if (has_glob_magic(part)) {
            for (const auto& entry : list_dir(base)) {
                auto name = entry.path().filename().string();
                if (::fnmatch(part.c_str(), name.c_str(), FNM_PERIOD) != 0) {
                    continue;
                }
                std::error_code ec;
                if (last) {
                    emit(entry.path());
                } else if (entry.is_directory(ec)) {
                    walk(entry.path(), idx + 1);
                }
            }
            return;
        }

        auto next = base / part;
        std::error_code ec;
        if (last) {
            if (fs::exists(fs::symlink_status(next, ec))) {
                emit(next);
            }
        } else if (fs::is_directory(next, ec)) {
            walk(next, idx + 1);
        }
    }

    auto take() -> std::vector<fs::path> { return std::move(out_); }

private:
    void emit(const fs::path& p) {
        if (seen_.insert(p.string()).second) {
            out_.push_back(p);
        }
    }

    void emit_descendants(const fs::path& dir) {
        for (const auto& entry : list_dir(dir)) {
            if (is_hidden(entry.path())) continue;
            emit(entry.path());
            if (is_real_dir(entry)) {
                emit_descendants(entry.path());
            }
        }
    }

    std::vector<std::string> parts_;
    std::vector<fs::path> out_;
    std::set<std::string> seen_;
};

} // anonymous namespace

auto has_glob_magic(std::string_view text) -> bool {
    return text.find_first_of("*?[") != std::string_view::npos;
}

auto expand_glob(const fs::path& pattern) -> std::vector<fs::path> {
    std::error_code ec;
    if (!has_glob_magic(pattern.string())) {
        if (fs::exists(fs::symlink_status(pattern, ec))) {
            return {pattern};
        }
        return {};
    }

    fs::path base = pattern.is_absolute() ? pattern.root_path() : fs::current_path(ec);
    std::vector<std::string> parts;
    for (const auto& part : pattern.relative_path()) {
        if (!part.empty()) parts.push_back(part.string());
    }

    Walker walker(std::move(parts));
    walker.walk(base, 0);
    auto matches = walker.take();
    LOG_TRACE("Glob {} matched {} path(s)", pattern.string(), matches.size());
    return matches;
}

} // namespace delguard::infra
