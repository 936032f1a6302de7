#pragma once

#include "javaidx/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace javaidx {

inline constexpr std::string_view kDataType = "java:download:idx";
inline constexpr std::string_view kUnknownAddress = "Unknown";

enum class LastModifiedScaling {
  kNone,
  // Revision 605 stores the last-modified time in seconds; scale it to milliseconds.
  kScale605ByThousand,
};

struct DecodeOptions {
  LastModifiedScaling last_modified_scaling = LastModifiedScaling::kScale605ByThousand;
  bool collect_header_fields = true;
};

struct TimelineOptions {
  bool emit_hosted_event = true;
};

struct HeaderField {
  std::string name;
  std::string value;

  friend bool operator==(const HeaderField&, const HeaderField&) = default;
};

// All timestamps are milliseconds since the Unix epoch (UTC).
struct DecodedDownloadRecord {
  std::uint32_t format_version = 0;
  std::string url;
  std::string ip_address;
  std::int64_t last_modified_ms = 0;
  std::optional<std::int64_t> download_ms;

  std::uint32_t content_length = 0;
  std::int64_t expiration_ms = 0;
  std::optional<std::int64_t> validation_ms;
  std::optional<bool> known_to_be_signed;
  std::optional<std::string> version_string;
  std::optional<std::string> namespace_id;
  std::optional<std::string> codebase_ip_header;
  std::vector<HeaderField> header_fields{};

  friend bool operator==(const DecodedDownloadRecord&, const DecodedDownloadRecord&) = default;
};

struct DecodeFailure {
  IdxErrorKind kind = IdxErrorKind::kFormat;
  std::string message;
};

using DecodeResult = std::variant<DecodedDownloadRecord, DecodeFailure>;

struct TimelineEvent {
  std::int64_t timestamp_ms = 0;
  std::string description;
  std::string data_type;
};

}  // namespace javaidx
