#include "http_date.hpp"

#include "idx_errors.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <optional>
#include <string>

namespace javaidx::core::idx {
namespace {

constexpr std::array<std::string_view, 7> kWeekdayAbbrev = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
constexpr std::array<std::string_view, 7> kWeekdayFull = {
  "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday",
};
constexpr std::array<std::string_view, 12> kMonthAbbrev = {
  "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec",
};
constexpr std::array<std::string_view, 4> kUtcZones = {"gmt", "utc", "ut", "z"};

bool EqualsIgnoreCase(std::string_view lhs, std::string_view lower_rhs) {
  if (lhs.size() != lower_rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) != lower_rhs[i]) {
      return false;
    }
  }
  return true;
}

template <std::size_t N>
std::optional<std::size_t> FindName(const std::array<std::string_view, N>& names, std::string_view token) {
  for (std::size_t i = 0; i < N; ++i) {
    if (EqualsIgnoreCase(token, names[i])) {
      return i;
    }
  }
  return std::nullopt;
}

class DateScanner {
 public:
  explicit DateScanner(std::string_view text) : text_(text) {}

  std::string_view Letters(const char* field) {
    const auto start = pos_;
    while (pos_ < text_.size() && std::isalpha(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    if (pos_ == start) {
      throw Fail(std::string("expected ") + field);
    }
    return text_.substr(start, pos_ - start);
  }

  unsigned Digits(std::size_t min_count, std::size_t max_count, const char* field) {
    const auto start = pos_;
    unsigned value = 0;
    while (pos_ < text_.size() && pos_ - start < max_count &&
           std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      value = value * 10U + static_cast<unsigned>(text_[pos_] - '0');
      ++pos_;
    }
    const auto count = pos_ - start;
    if (count < min_count) {
      throw Fail(std::string("expected ") + field);
    }
    if (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      throw Fail(std::string("too many digits in ") + field);
    }
    return value;
  }

  void Expect(char ch) {
    if (pos_ >= text_.size() || text_[pos_] != ch) {
      throw Fail(std::string("expected '") + ch + "'");
    }
    ++pos_;
  }

  void Spaces() {
    const auto start = pos_;
    while (pos_ < text_.size() && text_[pos_] == ' ') {
      ++pos_;
    }
    if (pos_ == start) {
      throw Fail("expected space");
    }
  }

  void End() {
    if (pos_ != text_.size()) {
      throw Fail("unexpected trailing characters");
    }
  }

  IdxError Fail(const std::string& reason) const {
    return DateParseError("'" + std::string(text_) + "' does not match '%a, %d %b %Y %H:%M:%S %Z': " + reason);
  }

 private:
  std::string_view text_;
  std::size_t pos_ = 0;
};

std::string_view TrimSpaces(std::string_view text) {
  const auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::int64_t ParseHttpDate(std::string_view text) {
  const auto trimmed = TrimSpaces(text);
  DateScanner scanner(trimmed);

  const auto weekday = scanner.Letters("weekday");
  if (!FindName(kWeekdayAbbrev, weekday).has_value() && !FindName(kWeekdayFull, weekday).has_value()) {
    throw scanner.Fail("unknown weekday '" + std::string(weekday) + "'");
  }
  scanner.Expect(',');
  scanner.Spaces();

  const auto day = scanner.Digits(1, 2, "day");
  scanner.Spaces();

  const auto month_name = scanner.Letters("month");
  const auto month_index = FindName(kMonthAbbrev, month_name);
  if (!month_index.has_value()) {
    throw scanner.Fail("unknown month '" + std::string(month_name) + "'");
  }
  const auto month = static_cast<unsigned>(*month_index + 1);
  scanner.Spaces();

  const auto year = scanner.Digits(4, 4, "year");
  scanner.Spaces();

  const auto hour = scanner.Digits(1, 2, "hour");
  scanner.Expect(':');
  const auto minute = scanner.Digits(1, 2, "minute");
  scanner.Expect(':');
  const auto second = scanner.Digits(1, 2, "second");
  scanner.Spaces();

  const auto zone = scanner.Letters("timezone");
  if (!FindName(kUtcZones, zone).has_value()) {
    throw scanner.Fail("unsupported timezone '" + std::string(zone) + "'");
  }
  scanner.End();

  const std::chrono::year_month_day date{std::chrono::year{static_cast<int>(year)}, std::chrono::month{month},
                                         std::chrono::day{day}};
  if (!date.ok()) {
    throw scanner.Fail("day out of range");
  }
  if (hour > 23 || minute > 59 || second > 60) {
    throw scanner.Fail("time of day out of range");
  }

  const auto point = std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute} +
                     std::chrono::seconds{second};
  return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

}  // namespace javaidx::core::idx
