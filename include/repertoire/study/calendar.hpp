#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace repertoire::study
{
  using CalendarDate = std::chrono::sys_days;
  using Timestamp = std::chrono::system_clock::time_point;

  inline CalendarDate dateOf(Timestamp ts)
  {
    return std::chrono::floor<std::chrono::days>(ts);
  }

  inline CalendarDate addDays(CalendarDate d, int days)
  {
    return d + std::chrono::days{days};
  }

  CalendarDate makeDate(int year, unsigned month, unsigned day);

  // YYYY-MM-DD
  std::string formatDate(CalendarDate d);
  std::optional<CalendarDate> parseDate(std::string_view text);

  // YYYY-MM-DD HH:MM:SS, UTC, second precision
  std::string formatTimestamp(Timestamp ts);
  std::optional<Timestamp> parseTimestamp(std::string_view text);

} // namespace repertoire::study
