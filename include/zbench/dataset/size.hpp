#pragma once

#include <cstdint>
#include <string_view>

#include "zbench/core/expected.hpp"

namespace zbench {

// Parses "<number>[TB|GB|MB|KB|B]" (case-insensitive, binary units) or a
// bare integer byte count. Fractional values are truncated toward zero.
Expected<uint64_t> parse_size(std::string_view text);

}  // namespace zbench
