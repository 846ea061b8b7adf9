#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace delguard::utils {

/// Random lowercase hex string built from `bytes` bytes of CSPRNG output.
auto random_hex(std::size_t bytes = 6) -> std::string;
auto timestamp_ms() -> int64_t;
/// Local time as `YYYY-MM-DDTHH:MM:SS`.
auto timestamp_local_iso() -> std::string;
/// Local time as `YYYY-MM-DD_HH-MM-SS`, safe for directory names.
auto timestamp_local_compact() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split_lines(std::string_view s) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;

} // namespace delguard::utils
