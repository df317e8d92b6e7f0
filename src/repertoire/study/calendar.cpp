#include "repertoire/study/calendar.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace repertoire::study
{
  namespace
  {
    bool readNumber(std::string_view s, std::size_t &pos, std::size_t width, int &out)
    {
      if (pos + width > s.size())
        return false;
      int v = 0;
      for (std::size_t i = 0; i < width; ++i)
      {
        const char c = s[pos + i];
        if (!std::isdigit((unsigned char)c))
          return false;
        v = v * 10 + (c - '0');
      }
      pos += width;
      out = v;
      return true;
    }

    bool expect(std::string_view s, std::size_t &pos, char c)
    {
      if (pos >= s.size() || s[pos] != c)
        return false;
      ++pos;
      return true;
    }
  } // namespace

  CalendarDate makeDate(int year, unsigned month, unsigned day)
  {
    return CalendarDate{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
  }

  std::string formatDate(CalendarDate d)
  {
    const std::chrono::year_month_day ymd{d};
    std::ostringstream os;
    os << std::setfill('0') << std::setw(4) << int(ymd.year()) << '-' << std::setw(2)
       << unsigned(ymd.month()) << '-' << std::setw(2) << unsigned(ymd.day());
    return os.str();
  }

  std::optional<CalendarDate> parseDate(std::string_view text)
  {
    std::size_t pos = 0;
    int y = 0, m = 0, d = 0;
    if (!readNumber(text, pos, 4, y) || !expect(text, pos, '-') || !readNumber(text, pos, 2, m) ||
        !expect(text, pos, '-') || !readNumber(text, pos, 2, d) || pos != text.size())
      return std::nullopt;

    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{unsigned(m)},
                                          std::chrono::day{unsigned(d)}};
    if (!ymd.ok())
      return std::nullopt;
    return CalendarDate{ymd};
  }

  std::string formatTimestamp(Timestamp ts)
  {
    const auto day = dateOf(ts);
    const std::chrono::hh_mm_ss tod{std::chrono::floor<std::chrono::seconds>(ts - day)};
    std::ostringstream os;
    os << formatDate(day) << ' ' << std::setfill('0') << std::setw(2) << tod.hours().count() << ':'
       << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count();
    return os.str();
  }

  std::optional<Timestamp> parseTimestamp(std::string_view text)
  {
    auto day = parseDate(text.substr(0, 10));
    if (!day)
      return std::nullopt;

    std::size_t pos = 10;
    if (pos == text.size())
      return Timestamp{*day};

    int h = 0, m = 0, s = 0;
    if (!(expect(text, pos, ' ') || expect(text, pos, 'T')) || !readNumber(text, pos, 2, h) ||
        !expect(text, pos, ':') || !readNumber(text, pos, 2, m) || !expect(text, pos, ':') ||
        !readNumber(text, pos, 2, s))
      return std::nullopt;
    if (h > 23 || m > 59 || s > 60)
      return std::nullopt;

    return Timestamp{*day} + std::chrono::hours{h} + std::chrono::minutes{m} + std::chrono::seconds{s};
  }

} // namespace repertoire::study
