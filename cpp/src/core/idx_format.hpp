#pragma once

#include "javaidx/byte_source.hpp"
#include "javaidx/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace javaidx::core::idx {

inline constexpr std::uint64_t kRecordHeaderSize = 6;
// Section 2 of revisions 603 and later always starts here, whatever section 1 declared.
inline constexpr std::uint64_t kSecondarySectionOffset = 128;

inline constexpr std::uint32_t kVersion602 = 602;
inline constexpr std::uint32_t kVersion603 = 603;
inline constexpr std::uint32_t kVersion604 = 604;
inline constexpr std::uint32_t kVersion605 = 605;

inline constexpr std::string_view kDateFieldName = "date";
inline constexpr std::string_view kCodebaseIpFieldName = "deploy_resource_codebase_ip";

enum class PrefixWidth {
  kU16,
  kU32,
};

// Big-endian reader over a borrowed ByteSource. Short reads raise TruncatedInputError.
class BigEndianCursor {
 public:
  explicit BigEndianCursor(ByteSource& source) : source_(source) {}

  std::uint8_t ReadU8(const char* context);
  std::uint16_t ReadU16(const char* context);
  std::uint32_t ReadU32(const char* context);
  std::uint64_t ReadU64(const char* context);
  std::int64_t ReadI64(const char* context);
  std::string ReadString(PrefixWidth width, const char* context);

  void SeekAbsolute(std::uint64_t offset, const char* context);
  [[nodiscard]] std::uint64_t position() const { return source_.Tell(); }

 private:
  void ReadExactly(std::span<std::byte> out, const char* context);

  ByteSource& source_;
};

struct RawRecordHeader {
  std::uint8_t busy = 0;
  std::uint8_t incomplete = 0;
  std::uint32_t format_version = 0;
};

struct PrimarySection602 {
  std::uint8_t shortcut = 0;
  std::uint32_t content_length = 0;
  std::int64_t last_modified = 0;
  std::int64_t expiration = 0;
  std::string version_string;
  std::string url;
  std::string namespace_id;
  std::uint32_t header_field_count = 0;
};

// Shared by 603/604 and 605; only the leading flag bytes differ on the wire.
struct PrimarySectionV6 {
  std::uint8_t shortcut = 0;
  std::uint32_t content_length = 0;
  std::int64_t last_modified = 0;
  std::int64_t expiration = 0;
  std::int64_t validation_date = 0;
  std::uint8_t known_to_be_signed = 0;
  std::uint32_t section_2_length = 0;
  std::uint32_t section_3_length = 0;
  std::uint32_t section_4_length = 0;
};

using PrimarySection = std::variant<PrimarySection602, PrimarySectionV6>;

struct SecondarySection {
  std::string url;
  std::string ip_address;
  std::uint32_t header_field_count = 0;
};

struct HeaderScan {
  std::optional<std::int64_t> download_ms;
  std::optional<std::string> codebase_ip;
  std::vector<HeaderField> fields{};
};

enum class LayoutKind {
  kV602,
  kV603604,
  kV605,
};

using PrimaryDecodeFn = PrimarySection (*)(BigEndianCursor&);

struct Layout {
  std::uint32_t version = 0;
  LayoutKind kind = LayoutKind::kV602;
  PrimaryDecodeFn decode_primary = nullptr;
  bool has_secondary_section = false;
  bool last_modified_in_seconds = false;
};

[[nodiscard]] RawRecordHeader ReadRecordHeader(BigEndianCursor& cursor);
[[nodiscard]] const Layout& SelectLayout(std::uint32_t format_version);
[[nodiscard]] std::span<const Layout> SupportedLayouts();

[[nodiscard]] PrimarySection DecodePrimary602(BigEndianCursor& cursor);
[[nodiscard]] PrimarySection DecodePrimary603604(BigEndianCursor& cursor);
[[nodiscard]] PrimarySection DecodePrimary605(BigEndianCursor& cursor);

[[nodiscard]] SecondarySection DecodeSecondarySection(BigEndianCursor& cursor);
[[nodiscard]] HeaderScan ScanHeaderFields(BigEndianCursor& cursor, std::uint32_t field_count, bool collect_fields);

}  // namespace javaidx::core::idx
