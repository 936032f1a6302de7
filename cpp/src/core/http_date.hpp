#pragma once

#include <cstdint>
#include <string_view>

namespace javaidx::core::idx {

// Parses "<Wdy>, <DD> <Mon> <YYYY> <hh>:<mm>:<ss> <TZ>" (RFC 1123 style) into milliseconds since the
// Unix epoch. The zone must be GMT, UTC, UT or Z. Throws DateParseError.
[[nodiscard]] std::int64_t ParseHttpDate(std::string_view text);

}  // namespace javaidx::core::idx
