#include "idx_format.hpp"

#include "http_date.hpp"
#include "idx_errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <type_traits>

namespace javaidx::core::idx {
namespace {

template <typename T>
T DecodeBE(std::span<const std::byte> bytes) {
  static_assert(std::is_unsigned_v<T>, "DecodeBE requires unsigned type");
  T out = 0;
  for (const auto byte : bytes) {
    out = static_cast<T>((out << 8U) | std::to_integer<std::uint8_t>(byte));
  }
  return out;
}

constexpr std::array<Layout, 4> kLayouts = {{
    {.version = kVersion602,
     .kind = LayoutKind::kV602,
     .decode_primary = &DecodePrimary602,
     .has_secondary_section = false,
     .last_modified_in_seconds = false},
    {.version = kVersion603,
     .kind = LayoutKind::kV603604,
     .decode_primary = &DecodePrimary603604,
     .has_secondary_section = true,
     .last_modified_in_seconds = false},
    {.version = kVersion604,
     .kind = LayoutKind::kV603604,
     .decode_primary = &DecodePrimary603604,
     .has_secondary_section = true,
     .last_modified_in_seconds = false},
    {.version = kVersion605,
     .kind = LayoutKind::kV605,
     .decode_primary = &DecodePrimary605,
     .has_secondary_section = true,
     .last_modified_in_seconds = true},
}};

// Everything after the leading flag bytes is identical for 603, 604 and 605.
PrimarySectionV6 DecodePrimaryV6Tail(BigEndianCursor& cursor) {
  PrimarySectionV6 section{};
  section.shortcut = cursor.ReadU8("shortcut");
  section.content_length = cursor.ReadU32("content_length");
  section.last_modified = cursor.ReadI64("last_modified");
  section.expiration = cursor.ReadI64("expiration");
  section.validation_date = cursor.ReadI64("validation_date");
  section.known_to_be_signed = cursor.ReadU8("known_to_be_signed");
  section.section_2_length = cursor.ReadU32("section_2_length");
  section.section_3_length = cursor.ReadU32("section_3_length");
  section.section_4_length = cursor.ReadU32("section_4_length");
  return section;
}

}  // namespace

void BigEndianCursor::ReadExactly(std::span<std::byte> out, const char* context) {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto got = source_.Read(out.subspan(filled));
    if (got == 0) {
      throw TruncatedError(std::string("truncated input while reading ") + context);
    }
    filled += got;
  }
}

std::uint8_t BigEndianCursor::ReadU8(const char* context) {
  std::array<std::byte, 1> raw{};
  ReadExactly(raw, context);
  return std::to_integer<std::uint8_t>(raw[0]);
}

std::uint16_t BigEndianCursor::ReadU16(const char* context) {
  std::array<std::byte, 2> raw{};
  ReadExactly(raw, context);
  return DecodeBE<std::uint16_t>(raw);
}

std::uint32_t BigEndianCursor::ReadU32(const char* context) {
  std::array<std::byte, 4> raw{};
  ReadExactly(raw, context);
  return DecodeBE<std::uint32_t>(raw);
}

std::uint64_t BigEndianCursor::ReadU64(const char* context) {
  std::array<std::byte, 8> raw{};
  ReadExactly(raw, context);
  return DecodeBE<std::uint64_t>(raw);
}

std::int64_t BigEndianCursor::ReadI64(const char* context) {
  const auto value = ReadU64(context);
  std::int64_t out = 0;
  static_assert(sizeof(out) == sizeof(value));
  std::memcpy(&out, &value, sizeof(out));
  return out;
}

std::string BigEndianCursor::ReadString(PrefixWidth width, const char* context) {
  const std::uint64_t length = width == PrefixWidth::kU16 ? ReadU16(context) : ReadU32(context);
  const auto size = source_.Size();
  const auto position = source_.Tell();
  if (position > size || length > size - position) {
    throw TruncatedError(std::string("declared length of ") + context + " exceeds remaining input");
  }
  std::string out(static_cast<std::size_t>(length), '\0');
  ReadExactly(std::as_writable_bytes(std::span<char>(out)), context);
  return out;
}

void BigEndianCursor::SeekAbsolute(std::uint64_t offset, const char* context) {
  if (offset > source_.Size()) {
    throw TruncatedError(std::string("input ends before ") + context + " at offset " + std::to_string(offset));
  }
  source_.Seek(offset);
}

RawRecordHeader ReadRecordHeader(BigEndianCursor& cursor) {
  RawRecordHeader header{};
  header.busy = cursor.ReadU8("busy flag");
  header.incomplete = cursor.ReadU8("incomplete flag");
  header.format_version = cursor.ReadU32("format version");

  // 0 or 1 only. Anything else is not a deployment cache index at all.
  if (header.busy > 1 || header.incomplete > 1) {
    throw FormatError("not a Java IDX record (busy=" + std::to_string(header.busy) +
                      ", incomplete=" + std::to_string(header.incomplete) + ")");
  }
  return header;
}

const Layout& SelectLayout(std::uint32_t format_version) {
  const auto it = std::find_if(kLayouts.begin(), kLayouts.end(),
                               [&](const Layout& layout) { return layout.version == format_version; });
  if (it == kLayouts.end()) {
    throw UnsupportedVersionError("unsupported format version " + std::to_string(format_version));
  }
  return *it;
}

std::span<const Layout> SupportedLayouts() {
  return kLayouts;
}

PrimarySection DecodePrimary602(BigEndianCursor& cursor) {
  PrimarySection602 section{};
  (void)cursor.ReadU8("force_update");
  (void)cursor.ReadU8("no_href");
  section.shortcut = cursor.ReadU8("shortcut");
  section.content_length = cursor.ReadU32("content_length");
  section.last_modified = cursor.ReadI64("last_modified");
  section.expiration = cursor.ReadI64("expiration");
  section.version_string = cursor.ReadString(PrefixWidth::kU16, "version string");
  section.url = cursor.ReadString(PrefixWidth::kU16, "url");
  section.namespace_id = cursor.ReadString(PrefixWidth::kU16, "namespace");
  section.header_field_count = cursor.ReadU32("header field count");
  return section;
}

PrimarySection DecodePrimary603604(BigEndianCursor& cursor) {
  (void)cursor.ReadU8("force_update");
  (void)cursor.ReadU8("no_href");
  return DecodePrimaryV6Tail(cursor);
}

PrimarySection DecodePrimary605(BigEndianCursor& cursor) {
  return DecodePrimaryV6Tail(cursor);
}

SecondarySection DecodeSecondarySection(BigEndianCursor& cursor) {
  cursor.SeekAbsolute(kSecondarySectionOffset, "secondary section");
  SecondarySection section{};
  section.url = cursor.ReadString(PrefixWidth::kU32, "secondary url");
  section.ip_address = cursor.ReadString(PrefixWidth::kU32, "ip address");
  section.header_field_count = cursor.ReadU32("header field count");
  return section;
}

HeaderScan ScanHeaderFields(BigEndianCursor& cursor, std::uint32_t field_count, bool collect_fields) {
  HeaderScan scan{};
  for (std::uint32_t i = 0; i < field_count; ++i) {
    auto name = cursor.ReadString(PrefixWidth::kU16, "header field name");
    auto value = cursor.ReadString(PrefixWidth::kU16, "header field value");

    if (!scan.download_ms.has_value() && name == kDateFieldName) {
      scan.download_ms = ParseHttpDate(value);
    } else if (!scan.codebase_ip.has_value() && name == kCodebaseIpFieldName) {
      scan.codebase_ip = value;
    }
    if (collect_fields) {
      scan.fields.push_back(HeaderField{.name = std::move(name), .value = std::move(value)});
    }
  }
  return scan;
}

}  // namespace javaidx::core::idx
