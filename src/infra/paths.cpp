#include "delguard/infra/paths.hpp"
#include "delguard/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#include <pwd.h>
#include <unistd.h>
#endif

namespace delguard::infra {

namespace fs = std::filesystem;

auto home_dir() -> fs::path {
#ifdef _WIN32
    if (const auto* home = std::getenv("USERPROFILE"); home && *home) {
        return fs::path(home);
    }
    const auto* drive = std::getenv("HOMEDRIVE");
    const auto* hpath = std::getenv("HOMEPATH");
    if (drive && hpath) {
        return fs::path(std::string(drive) + hpath);
    }
    return fs::path("C:\\Users\\Default");
#else
    if (const auto* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }

    // Fall back to passwd entry
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }

    return fs::path("/tmp");
#endif
}

auto data_dir() -> fs::path {
#ifdef _WIN32
    if (const auto* appdata = std::getenv("LOCALAPPDATA"); appdata && *appdata) {
        return fs::path(appdata) / "delguard" / "data";
    }
    return home_dir() / "AppData" / "Local" / "delguard" / "data";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / "delguard";
#else
    if (const auto* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "delguard";
    }
    return home_dir() / ".local" / "share" / "delguard";
#endif
}

auto config_dir() -> fs::path {
#ifdef _WIN32
    if (const auto* appdata = std::getenv("LOCALAPPDATA"); appdata && *appdata) {
        return fs::path(appdata) / "delguard" / "config";
    }
    return home_dir() / "AppData" / "Local" / "delguard" / "config";
#elif defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / "delguard";
#else
    if (const auto* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "delguard";
    }
    return home_dir() / ".config" / "delguard";
#endif
}

auto expand_user(std::string_view input) -> std::string {
    if (input.empty() || input.front() != '~') {
        return std::string(input);
    }

    auto slash = input.find_first_of("/\\");
    auto user = input.substr(1, slash == std::string_view::npos ? std::string_view::npos : slash - 1);
    auto rest = slash == std::string_view::npos ? std::string_view{} : input.substr(slash);

    if (user.empty()) {
        return home_dir().string() + std::string(rest);
    }

#ifndef _WIN32
    if (const auto* pw = ::getpwnam(std::string(user).c_str()); pw && pw->pw_dir) {
        return std::string(pw->pw_dir) + std::string(rest);
    }
#endif
    return std::string(input);
}

auto expand_env_vars(std::string_view input) -> std::string {
    auto is_name_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '$' || i + 1 >= input.size()) {
            result += input[i++];
            continue;
        }

        if (input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close == std::string_view::npos) {
                result += input.substr(i);
                break;
            }
            auto name = std::string(input.substr(i + 2, close - i - 2));
            const auto* val = name.empty() ? nullptr : std::getenv(name.c_str());
            if (val) {
                result += val;
            } else {
                result += input.substr(i, close - i + 1);
            }
            i = close + 1;
            continue;
        }

        size_t end = i + 1;
        while (end < input.size() && is_name_char(input[end])) ++end;
        if (end == i + 1) {
            result += input[i++];
            continue;
        }
        auto name = std::string(input.substr(i + 1, end - i - 1));
        if (const auto* val = std::getenv(name.c_str())) {
            result += val;
        } else {
            result += input.substr(i, end - i);
        }
        i = end;
    }
    return result;
}

auto resolve_path(const fs::path& path, const fs::path& base) -> fs::path {
    std::error_code ec;
    fs::path absolute = path;
    if (!absolute.is_absolute()) {
        auto anchor = base.empty() ? fs::current_path(ec) : base;
        absolute = anchor / path;
    }

    auto resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        LOG_DEBUG("weakly_canonical failed for {}: {}", absolute.string(), ec.message());
        resolved = absolute.lexically_normal();
    }

    // Drop a trailing separator so "/a/b/" and "/a/b" compare equal.
    if (!resolved.has_filename() && resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

auto is_inside(const fs::path& path, const fs::path& root) -> bool {
    auto components = [](const fs::path& p) {
        std::vector<fs::path> parts;
        for (const auto& part : p) {
            if (!part.empty()) parts.push_back(part);
        }
        return parts;
    };

    auto path_parts = components(path);
    auto root_parts = components(root);
    if (root_parts.empty() || root_parts.size() > path_parts.size()) {
        return false;
    }
    return std::equal(root_parts.begin(), root_parts.end(), path_parts.begin());
}

auto temp_roots() -> std::vector<fs::path> {
    std::vector<std::string> candidates;
#ifdef _WIN32
    for (const char* var : {"TEMP", "TMP", "TMPDIR"}) {
        if (const auto* val = std::getenv(var); val && *val) {
            candidates.emplace_back(val);
        }
    }
#else
    candidates = {"/tmp", "/var/tmp", "/private/tmp"};
#endif

    std::error_code ec;
    auto sys_tmp = fs::temp_directory_path(ec);
    if (!ec) {
        candidates.push_back(sys_tmp.string());
    }

    std::vector<fs::path> roots;
    for (const auto& c : candidates) {
        auto resolved = resolve_path(c);
        if (std::ranges::find(roots, resolved) == roots.end()) {
            roots.push_back(std::move(resolved));
        }
    }
    return roots;
}

} // namespace delguard::infra
