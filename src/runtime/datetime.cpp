#include "runtime/datetime.hpp"

#include "runtime/error.hpp"

#include <fmt/format.h>

#include <cstdlib>

namespace tomlenc {

static bool
is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static unsigned
days_in_month(int year, unsigned month) {
  static constexpr unsigned days[] = {31, 28, 31, 30, 31, 30,
                                      31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  else
    return days[month - 1];
}

local_date
make_date(int year, unsigned month, unsigned day) {
  if (year < 0 || year > 9999)
    throw make_error<configuration_error>("Year out of range: {}", year);
  if (month < 1 || month > 12)
    throw make_error<configuration_error>("Month out of range: {}", month);
  if (day < 1 || day > days_in_month(year, month))
    throw make_error<configuration_error>("Day out of range: {:04}-{:02}-{:02}",
                                          year, month, day);

  return local_date{year, month, day};
}

// The sign comes from hours, or from minutes when hours is zero, so -00:30 is
// make_offset(0, -30).
time_offset
make_offset(int hours, int minutes) {
  int min_minutes = hours == 0 ? -59 : 0;
  if (minutes < min_minutes || minutes > 59)
    throw make_error<configuration_error>("Offset minutes out of range: {}",
                                          minutes);

  int total = std::abs(hours) * 60 + std::abs(minutes);
  if (total >= 24 * 60)
    throw make_error<configuration_error>("Offset out of range: {}:{:02}",
                                          hours, minutes);

  return time_offset{hours < 0 || minutes < 0 ? -total : total};
}

local_time
make_time(unsigned hour, unsigned minute, unsigned second,
          unsigned microsecond) {
  if (hour > 23 || minute > 59 || second > 59)
    throw make_error<configuration_error>("Time out of range: {:02}:{:02}:{:02}",
                                          hour, minute, second);
  if (microsecond > 999'999)
    throw make_error<configuration_error>("Microseconds out of range: {}",
                                          microsecond);

  return local_time{hour, minute, second, microsecond, std::nullopt};
}

local_time
make_time(unsigned hour, unsigned minute, unsigned second,
          unsigned microsecond, time_offset offset) {
  local_time result = make_time(hour, minute, second, microsecond);
  if (std::abs(offset.minutes) >= 24 * 60)
    throw make_error<configuration_error>("Offset out of range: {} minutes",
                                          offset.minutes);

  result.offset = offset;
  return result;
}

date_time
make_date_time(local_date date, local_time time) {
  return date_time{date, time};
}

std::string
to_string(local_date const& d) {
  return fmt::format("{:04}-{:02}-{:02}", d.year, d.month, d.day);
}

std::string
to_string(time_offset offset) {
  int magnitude = std::abs(offset.minutes);
  return fmt::format("{}{:02}:{:02}",
                     offset.minutes < 0 ? '-' : '+',
                     magnitude / 60, magnitude % 60);
}

std::string
to_string(local_time const& t) {
  std::string result = fmt::format("{:02}:{:02}:{:02}",
                                   t.hour, t.minute, t.second);
  if (t.microsecond != 0)
    result += fmt::format(".{:06}", t.microsecond);

  if (t.offset)
    result += to_string(*t.offset);

  return result;
}

std::string
to_string(date_time const& dt) {
  return to_string(dt.date) + 'T' + to_string(dt.time);
}

} // namespace tomlenc
