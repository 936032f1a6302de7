#include "javaidx/idx_decoder.hpp"

#include "idx_errors.hpp"
#include "idx_format.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace javaidx {
namespace {

using core::idx::BigEndianCursor;
using core::idx::HeaderScan;
using core::idx::Layout;
using core::idx::PrimarySection602;
using core::idx::PrimarySectionV6;

std::int64_t ScaleLastModified(std::int64_t raw, const Layout& layout, const DecodeOptions& options) {
  if (layout.last_modified_in_seconds &&
      options.last_modified_scaling == LastModifiedScaling::kScale605ByThousand) {
    constexpr std::int64_t kScale = 1000;
    if (raw > std::numeric_limits<std::int64_t>::max() / kScale ||
        raw < std::numeric_limits<std::int64_t>::min() / kScale) {
      throw core::idx::FormatError("605 last-modified out of range: " + std::to_string(raw));
    }
    return raw * kScale;
  }
  return raw;
}

void ApplyHeaderScan(DecodedDownloadRecord& record, HeaderScan&& scan) {
  record.download_ms = scan.download_ms;
  record.codebase_ip_header = std::move(scan.codebase_ip);
  record.header_fields = std::move(scan.fields);
}

DecodedDownloadRecord Assemble602(BigEndianCursor& cursor,
                                  const Layout& layout,
                                  PrimarySection602&& primary,
                                  const DecodeOptions& options) {
  DecodedDownloadRecord record{};
  record.format_version = layout.version;
  record.url = std::move(primary.url);
  record.ip_address = std::string(kUnknownAddress);
  record.last_modified_ms = ScaleLastModified(primary.last_modified, layout, options);
  record.content_length = primary.content_length;
  record.expiration_ms = primary.expiration;
  record.version_string = std::move(primary.version_string);
  record.namespace_id = std::move(primary.namespace_id);

  ApplyHeaderScan(record,
                  core::idx::ScanHeaderFields(cursor, primary.header_field_count, options.collect_header_fields));
  return record;
}

DecodedDownloadRecord AssembleV6(BigEndianCursor& cursor,
                                 const Layout& layout,
                                 const PrimarySectionV6& primary,
                                 const DecodeOptions& options) {
  auto secondary = core::idx::DecodeSecondarySection(cursor);

  DecodedDownloadRecord record{};
  record.format_version = layout.version;
  record.url = std::move(secondary.url);
  record.ip_address = std::move(secondary.ip_address);
  record.last_modified_ms = ScaleLastModified(primary.last_modified, layout, options);
  record.content_length = primary.content_length;
  record.expiration_ms = primary.expiration;
  record.validation_ms = primary.validation_date;
  record.known_to_be_signed = primary.known_to_be_signed != 0;

  ApplyHeaderScan(record,
                  core::idx::ScanHeaderFields(cursor, secondary.header_field_count, options.collect_header_fields));
  return record;
}

}  // namespace

DecodedDownloadRecord DecodeIdx(ByteSource& source, const DecodeOptions& options) {
  source.Seek(0);
  BigEndianCursor cursor(source);

  const auto header = core::idx::ReadRecordHeader(cursor);
  const Layout& layout = core::idx::SelectLayout(header.format_version);
  auto primary = layout.decode_primary(cursor);

  auto record = std::visit(
      [&](auto&& section) -> DecodedDownloadRecord {
        using Section = std::decay_t<decltype(section)>;
        if constexpr (std::is_same_v<Section, PrimarySection602>) {
          return Assemble602(cursor, layout, std::move(section), options);
        } else {
          return AssembleV6(cursor, layout, section, options);
        }
      },
      std::move(primary));

  if (record.url.empty() || record.ip_address.empty()) {
    throw core::idx::FieldMissingError("URL not found in file");
  }
  return record;
}

DecodedDownloadRecord DecodeIdx(std::span<const std::byte> bytes, const DecodeOptions& options) {
  MemoryByteSource source(bytes);
  return DecodeIdx(source, options);
}

DecodeResult TryDecodeIdx(ByteSource& source, const DecodeOptions& options) {
  try {
    return DecodeIdx(source, options);
  } catch (const IdxError& ex) {
    return DecodeFailure{.kind = ex.kind(), .message = ex.what()};
  }
}

DecodeResult TryDecodeIdx(std::span<const std::byte> bytes, const DecodeOptions& options) {
  MemoryByteSource source(bytes);
  return TryDecodeIdx(source, options);
}

DecodeResult TryDecodeIdxFile(const std::filesystem::path& path, const DecodeOptions& options) {
  try {
    auto source = FileByteSource::Open(path);
    return DecodeIdx(source, options);
  } catch (const IdxError& ex) {
    return DecodeFailure{.kind = ex.kind(), .message = ex.what()};
  }
}

std::vector<TimelineEvent> ToTimelineEvents(const DecodedDownloadRecord& record, const TimelineOptions& options) {
  std::vector<TimelineEvent> events;
  if (options.emit_hosted_event) {
    events.push_back(TimelineEvent{
        .timestamp_ms = record.last_modified_ms,
        .description = std::string(kHostedDescription),
        .data_type = std::string(kDataType),
    });
  }
  if (record.download_ms.has_value()) {
    events.push_back(TimelineEvent{
        .timestamp_ms = *record.download_ms,
        .description = std::string(kDownloadedDescription),
        .data_type = std::string(kDataType),
    });
  }
  return events;
}

}  // namespace javaidx
