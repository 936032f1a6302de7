#pragma once

#include <cstdint>
#include <string>

namespace javaidx {

// Renders milliseconds since the Unix epoch as "YYYY-MM-DDThh:mm:ss.mmmZ".
[[nodiscard]] std::string FormatUtcTimestamp(std::int64_t unix_ms);

}  // namespace javaidx
