#pragma once

#include "javaidx/byte_source.hpp"
#include "javaidx/types.hpp"

#include <cstddef>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace javaidx {

inline constexpr std::string_view kHostedDescription = "File Hosted Date";
inline constexpr std::string_view kDownloadedDescription = "File Downloaded";

// Decodes one Java deployment cache index record starting at offset 0 of `source`.
// Throws IdxError on any failure; no partial record is ever produced.
[[nodiscard]] DecodedDownloadRecord DecodeIdx(ByteSource& source, const DecodeOptions& options = {});
[[nodiscard]] DecodedDownloadRecord DecodeIdx(std::span<const std::byte> bytes, const DecodeOptions& options = {});

// Same as DecodeIdx, but IdxError is returned as a DecodeFailure instead of thrown.
[[nodiscard]] DecodeResult TryDecodeIdx(ByteSource& source, const DecodeOptions& options = {});
[[nodiscard]] DecodeResult TryDecodeIdx(std::span<const std::byte> bytes, const DecodeOptions& options = {});
[[nodiscard]] DecodeResult TryDecodeIdxFile(const std::filesystem::path& path, const DecodeOptions& options = {});

[[nodiscard]] std::vector<TimelineEvent> ToTimelineEvents(const DecodedDownloadRecord& record,
                                                          const TimelineOptions& options = {});

}  // namespace javaidx
