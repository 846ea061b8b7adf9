#include "delguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

#include <openssl/rand.h>

namespace delguard::utils {

auto random_hex(std::size_t bytes) -> std::string {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        // OpenSSL could not seed; fall back to the standard engine.
        static thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : buf) {
            b = static_cast<unsigned char>(dist(rng));
        }
    }

    std::ostringstream oss;
    for (auto b : buf) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

namespace {

auto format_local_now(const char* fmt) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_val{};
#ifdef _WIN32
    localtime_s(&tm_val, &time);
#else
    localtime_r(&time, &tm_val);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_val, fmt);
    return oss.str();
}

} // anonymous namespace

auto timestamp_local_iso() -> std::string {
    return format_local_now("%Y-%m-%dT%H:%M:%S");
}

auto timestamp_local_compact() -> std::string {
    return format_local_now("%Y-%m-%d_%H-%M-%S");
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split_lines(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find('\n', pos);
        if (next == std::string_view::npos) {
            lines.emplace_back(s.substr(pos));
            break;
        }
        lines.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return lines;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace delguard::utils
