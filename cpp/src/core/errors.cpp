#include "javaidx/errors.hpp"

#include <string>

namespace javaidx {

std::string_view IdxErrorKindName(IdxErrorKind kind) {
  switch (kind) {
    case IdxErrorKind::kTruncatedInput:
      return "truncated_input";
    case IdxErrorKind::kFormat:
      return "format";
    case IdxErrorKind::kUnsupportedVersion:
      return "unsupported_version";
    case IdxErrorKind::kFieldMissing:
      return "field_missing";
    case IdxErrorKind::kDateParse:
      return "date_parse";
    case IdxErrorKind::kIo:
      return "io";
  }
  return "unknown";
}

IdxError::IdxError(IdxErrorKind kind, const std::string& message)
    : std::runtime_error("java idx " + std::string(IdxErrorKindName(kind)) + ": " + message), kind_(kind) {}

}  // namespace javaidx
