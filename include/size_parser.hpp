#pragma once
#include <cstdint>
#include <expected>
#include <string_view>

#include "error.hpp"

namespace randfile {

constexpr std::int64_t BYTES_PER_MB = 1024LL * 1024LL;
constexpr std::int64_t BYTES_PER_GB = 1024LL * 1024LL * 1024LL;

// Parse a size expression into a byte count.
// Accepted forms (case-insensitive, surrounding whitespace ignored):
//   "<integer>"  raw bytes, e.g. "1000"
//   "<float>MB"  multiplied by 1024^2 and truncated, e.g. "1.5MB" -> 1572864
//   "<float>GB"  multiplied by 1024^3 and truncated, e.g. "2.5GB" -> 2684354560
// Negative and zero counts are returned unchanged.
auto parseSize(std::string_view size_str) -> std::expected<std::int64_t, Error>;

}  // namespace randfile
