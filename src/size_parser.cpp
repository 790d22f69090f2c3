#include "size_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace {

constexpr double INT64_LIMIT = 9223372036854775808.0;  // 2^63

auto trim(std::string_view str) -> std::string_view {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!str.empty() && is_space(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && is_space(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

auto normalize(std::string_view size_str) -> std::string {
  auto normalized = std::string(trim(size_str));
  std::ranges::transform(normalized, normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return normalized;
}

// "1_000" spells 1000; an underscore is only valid with a digit on each side
auto stripDigitSeparators(std::string_view str) -> std::optional<std::string> {
  auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto digits = std::string();
  digits.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] != '_') {
      digits.push_back(str[i]);
      continue;
    }
    if (i == 0 || i + 1 == str.size() || !is_digit(str[i - 1]) || !is_digit(str[i + 1])) {
      return std::nullopt;
    }
  }
  return digits;
}

// std::from_chars rejects a leading '+', which is still a valid way to spell a count
template <typename T>
auto parseNumber(std::string_view input) -> std::optional<T> {
  const auto digits = stripDigitSeparators(input);
  if (!digits) {
    return std::nullopt;
  }
  auto str = std::string_view(*digits);
  if (str.starts_with('+')) {
    str.remove_prefix(1);
    if (str.starts_with('-') || str.starts_with('+')) {
      return std::nullopt;
    }
  }

  T value{};
  const auto* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

auto scale(double value, std::int64_t multiplier) -> std::optional<std::int64_t> {
  const double bytes = value * static_cast<double>(multiplier);
  if (!std::isfinite(bytes) || bytes >= INT64_LIMIT || bytes < -INT64_LIMIT) {
    return std::nullopt;
  }
  // Truncation toward zero, never rounding: "2.5GB" must stay 2684354560
  return static_cast<std::int64_t>(bytes);
}

auto invalidSize(std::string_view input, std::string message) -> std::unexpected<randfile::Error> {
  return std::unexpected(randfile::Error{
      randfile::ErrorKind::InvalidSizeFormat, std::string(input), std::move(message)
  });
}

}  // namespace

auto randfile::parseSize(std::string_view size_str) -> std::expected<std::int64_t, Error> {
  const auto normalized = normalize(size_str);
  const auto view = std::string_view(normalized);

  for (auto [suffix, multiplier] : {std::pair{"GB", BYTES_PER_GB}, std::pair{"MB", BYTES_PER_MB}}) {
    if (!view.ends_with(suffix)) {
      continue;
    }
    auto value = parseNumber<double>(trim(view.substr(0, view.size() - 2)));
    auto bytes = value ? scale(*value, multiplier) : std::nullopt;
    if (!bytes) {
      return invalidSize(size_str, std::format("Invalid size format: {}", normalized));
    }
    return *bytes;
  }

  if (auto bytes = parseNumber<std::int64_t>(view)) {
    return *bytes;
  }
  return invalidSize(
      size_str,
      std::format(
          "Invalid size format: {}. Use format like '1MB', '2.5GB', or plain number for bytes",
          normalized
      )
  );
}
