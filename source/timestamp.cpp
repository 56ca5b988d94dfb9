#include <gitactivity/timestamp.hpp>

#include <fmt/format.h>

#include <ctime>
#include <regex>
#include <string>

namespace gitactivity {

static int to_int(const std::ssub_match &m, int fallback = 0) {
  if (!m.matched)
    return fallback;
  return std::stoi(m.str());
}

static bool leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static int days_in_month(int y, int m) {
  static const int d[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && leap(y)) ? 29 : d[m - 1];
}

std::optional<TimePoint> parse_timestamp(std::string_view text) {
  static const std::regex re(
      R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:[Tt ](\d{2}):(\d{2})(?::(\d{2})(?:[.,](\d+))?)?)?\s*(?:([Zz])|([+-])(\d{2}):?(\d{2}))?\s*$)");

  std::string s(text);
  std::smatch m;
  if (!std::regex_match(s, m, re))
    return std::nullopt;

  std::tm tm{};
  tm.tm_year = to_int(m[1]) - 1900;
  tm.tm_mon = to_int(m[2]) - 1;
  tm.tm_mday = to_int(m[3]);
  tm.tm_hour = to_int(m[4]);
  tm.tm_min = to_int(m[5]);
  tm.tm_sec = to_int(m[6]);

  int year = tm.tm_year + 1900;
  if (tm.tm_mon < 0 || tm.tm_mon > 11)
    return std::nullopt;
  if (tm.tm_mday < 1 || tm.tm_mday > days_in_month(year, tm.tm_mon + 1))
    return std::nullopt;
  if (tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
    return std::nullopt;

  long long millis = 0;
  if (m[7].matched) {
    std::string frac = m[7].str().substr(0, 3);
    while (frac.size() < 3)
      frac.push_back('0');
    millis = std::stoll(frac);
  }

  long long offset_sec = 0;
  if (m[9].matched) {
    int oh = to_int(m[10]);
    int om = to_int(m[11]);
    if (oh > 23 || om > 59)
      return std::nullopt;
    offset_sec = (oh * 3600LL + om * 60LL) * (m[9].str() == "-" ? -1 : 1);
  }

  using MilliPoint =
      std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;
  std::time_t t = ::timegm(&tm);
  MilliPoint tp = MilliPoint(std::chrono::seconds(t)) -
                  std::chrono::seconds(offset_sec) +
                  std::chrono::milliseconds(millis);

  // system_clock ticks in nanoseconds on libstdc++; later instants would wrap.
  static const MilliPoint lo =
      std::chrono::time_point_cast<std::chrono::milliseconds>(TimePoint::min());
  static const MilliPoint hi =
      std::chrono::time_point_cast<std::chrono::milliseconds>(TimePoint::max());
  if (tp < lo || tp > hi)
    return std::nullopt;
  return std::chrono::time_point_cast<TimePoint::duration>(tp);
}

static std::tm utc_tm(TimePoint tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(
      std::chrono::floor<std::chrono::seconds>(tp));
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  return tm;
}

std::string format_utc_date(TimePoint tp) {
  auto tm = utc_tm(tp);
  return fmt::format("{:04}-{:02}-{:02}", tm.tm_year + 1900, tm.tm_mon + 1,
                     tm.tm_mday);
}

std::string format_utc_time(TimePoint tp) {
  auto tm = utc_tm(tp);
  return fmt::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

std::string format_git_date(TimePoint tp) {
  auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
  return fmt::format("{} +0000", secs.count());
}

} // namespace gitactivity
