#include "javaidx/timestamp.hpp"

#include <chrono>
#include <cstdio>

namespace javaidx {

std::string FormatUtcTimestamp(std::int64_t unix_ms) {
  using namespace std::chrono;
  const sys_time<milliseconds> point{milliseconds{unix_ms}};
  const auto day_point = floor<days>(point);
  const year_month_day date{day_point};
  const hh_mm_ss<milliseconds> time{point - day_point};

  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()), static_cast<long long>(time.hours().count()),
                static_cast<long long>(time.minutes().count()), static_cast<long long>(time.seconds().count()),
                static_cast<long long>(time.subseconds().count()));
  return buffer;
}

}  // namespace javaidx
