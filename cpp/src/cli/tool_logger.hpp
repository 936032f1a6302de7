#pragma once

#include "../common/env_flag.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace javaidx::cli {

inline bool LoggingEnabled() {
  static const bool enabled = common::EnvFlagEnabled("JAVAIDX_LOG");
  return enabled;
}

inline void Log(std::string_view message) {
  if (!LoggingEnabled()) {
    return;
  }
  std::clog << "[javaidx] " << message << "\n";
}

// Failures are always reported; the env switch only silences progress output.
inline void LogError(std::string_view message) {
  std::cerr << "[javaidx] ERROR: " << message << "\n";
}

inline void LogKV(std::string_view key, std::string_view value) {
  if (!LoggingEnabled()) {
    return;
  }
  std::clog << "[javaidx] " << key << "=" << value << "\n";
}

inline void LogKV(std::string_view key, std::uint64_t value) {
  LogKV(key, std::string_view(std::to_string(value)));
}

}  // namespace javaidx::cli
