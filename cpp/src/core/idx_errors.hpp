#pragma once

#include "javaidx/errors.hpp"

#include <string>

namespace javaidx::core::idx {

inline IdxError TruncatedError(const std::string& message) {
  return IdxError(IdxErrorKind::kTruncatedInput, message);
}

inline IdxError FormatError(const std::string& message) {
  return IdxError(IdxErrorKind::kFormat, message);
}

inline IdxError UnsupportedVersionError(const std::string& message) {
  return IdxError(IdxErrorKind::kUnsupportedVersion, message);
}

inline IdxError FieldMissingError(const std::string& message) {
  return IdxError(IdxErrorKind::kFieldMissing, message);
}

inline IdxError DateParseError(const std::string& message) {
  return IdxError(IdxErrorKind::kDateParse, message);
}

inline IdxError IoError(const std::string& message) {
  return IdxError(IdxErrorKind::kIo, message);
}

}  // namespace javaidx::core::idx
