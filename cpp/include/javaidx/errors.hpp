#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace javaidx {

enum class IdxErrorKind {
  kTruncatedInput,
  kFormat,
  kUnsupportedVersion,
  kFieldMissing,
  kDateParse,
  kIo,
};

[[nodiscard]] std::string_view IdxErrorKindName(IdxErrorKind kind);

// Raised by every decode stage. The message already carries the kind prefix.
class IdxError : public std::runtime_error {
 public:
  IdxError(IdxErrorKind kind, const std::string& message);

  [[nodiscard]] IdxErrorKind kind() const { return kind_; }

 private:
  IdxErrorKind kind_;
};

}  // namespace javaidx
