#include "gitpile/time.hpp"

#include <array>
#include <cstdio>

// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }

namespace gitpile::timeutil {

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  localtime_r(&t, &lt);
  gmtime_r(&t, &gt);
  // Both broken-down times read back as if they were UTC: the difference is the offset
  const std::time_t local_epoch = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long diff = local_epoch - utc_epoch; // seconds
  return static_cast<int>(diff / 60);        // minutes
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, hh, mm);
  return std::string(buf);
}

std::string rfc2822_date(std::time_t when, int tz_minutes) {
  static constexpr std::array<const char *, 7> kDays = {"Sun", "Mon", "Tue", "Wed",
                                                        "Thu", "Fri", "Sat"};
  static constexpr std::array<const char *, 12> kMonths = {"Jan", "Feb", "Mar", "Apr",
                                                           "May", "Jun", "Jul", "Aug",
                                                           "Sep", "Oct", "Nov", "Dec"};
  // Shift into the requested zone and format the fields as UTC
  const std::time_t shifted = when + static_cast<std::time_t>(tz_minutes) * 60;
  std::tm t{};
  gmtime_r(&shifted, &t);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s, %d %s %d %02d:%02d:%02d ", kDays[t.tm_wday], t.tm_mday,
                kMonths[t.tm_mon], t.tm_year + 1900, t.tm_hour, t.tm_min, t.tm_sec);
  return std::string(buf) + tz_offset_string(tz_minutes);
}

} // namespace gitpile::timeutil
