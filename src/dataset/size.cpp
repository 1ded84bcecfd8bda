#include "zbench/dataset/size.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace zbench {
namespace {

struct Unit {
  std::string_view suffix;
  uint64_t multiplier;
};

// Longest suffix first so that "B" never matches inside "MB".
constexpr std::array<Unit, 5> kUnits{{
    {"TB", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
    {"GB", 1024ULL * 1024ULL * 1024ULL},
    {"MB", 1024ULL * 1024ULL},
    {"KB", 1024ULL},
    {"B", 1ULL},
}};

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

std::string_view skip_plus(std::string_view s) {
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
  }
  return s;
}

bool parse_scaled(std::string_view number, uint64_t multiplier, uint64_t& out) {
  number = skip_plus(number);
  if (number.empty()) {
    return false;
  }
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
  if (ec != std::errc{} || ptr != number.data() + number.size()) {
    return false;
  }
  if (!std::isfinite(value) || value < 0.0) {
    return false;
  }
  const double bytes = std::trunc(value * static_cast<double>(multiplier));
  // 2^64 is exactly representable; anything at or beyond it cannot fit.
  if (bytes >= 18446744073709551616.0) {
    return false;
  }
  out = static_cast<uint64_t>(bytes);
  return true;
}

bool parse_plain(std::string_view number, uint64_t& out) {
  number = skip_plus(number);
  if (number.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), out);
  return ec == std::errc{} && ptr == number.data() + number.size();
}

}  // namespace

Expected<uint64_t> parse_size(std::string_view text) {
  std::string upper(trim(text));
  for (char& c : upper) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  const std::string_view s(upper);

  uint64_t bytes = 0;
  for (const auto& unit : kUnits) {
    if (s.size() >= unit.suffix.size() && s.ends_with(unit.suffix)) {
      const auto number = trim(s.substr(0, s.size() - unit.suffix.size()));
      if (!parse_scaled(number, unit.multiplier, bytes)) {
        return fail(ErrorCode::InvalidSizeFormat, "Invalid size format: " + upper);
      }
      return bytes;
    }
  }

  if (!parse_plain(s, bytes)) {
    return fail(ErrorCode::InvalidSizeFormat, "Invalid size format: " + upper);
  }
  return bytes;
}

}  // namespace zbench
