#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>

namespace javaidx::common {

inline bool IsTruthy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

inline std::optional<std::string> ReadEnv(const char* name) {
#if defined(_MSC_VER)
  char* env = nullptr;
  std::size_t len = 0;
  if (_dupenv_s(&env, &len, name) != 0 || env == nullptr) {
    return std::nullopt;
  }
  std::string value(env);
  std::free(env);
  return value;
#else
  const char* env = std::getenv(name);
  if (env == nullptr) {
    return std::nullopt;
  }
  return std::string(env);
#endif
}

// Unset means on in debug builds and off under NDEBUG.
inline bool EnvFlagEnabled(const char* name) {
#if defined(NDEBUG)
  constexpr bool kDefault = false;
#else
  constexpr bool kDefault = true;
#endif
  const auto value = ReadEnv(name);
  return value.has_value() ? IsTruthy(*value) : kDefault;
}

}  // namespace javaidx::common
