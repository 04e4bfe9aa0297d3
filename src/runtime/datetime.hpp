#ifndef TOMLENC_RUNTIME_DATETIME_HPP
#define TOMLENC_RUNTIME_DATETIME_HPP

#include <optional>
#include <string>

namespace tomlenc {

struct local_date {
  int      year  = 1970;
  unsigned month = 1;
  unsigned day   = 1;

  bool
  operator == (local_date const&) const = default;
};

// Signed number of minutes east of UTC.
struct time_offset {
  int minutes = 0;

  bool
  operator == (time_offset const&) const = default;
};

struct local_time {
  unsigned                   hour        = 0;
  unsigned                   minute      = 0;
  unsigned                   second      = 0;
  unsigned                   microsecond = 0;
  std::optional<time_offset> offset;

  bool
  operator == (local_time const&) const = default;
};

struct date_time {
  local_date date;
  local_time time;

  bool
  operator == (date_time const&) const = default;
};

// The make_ functions validate their arguments and throw configuration_error
// for out-of-range fields.

local_date
make_date(int year, unsigned month, unsigned day);

time_offset
make_offset(int hours, int minutes = 0);

local_time
make_time(unsigned hour, unsigned minute, unsigned second,
          unsigned microsecond = 0);

local_time
make_time(unsigned hour, unsigned minute, unsigned second,
          unsigned microsecond, time_offset);

date_time
make_date_time(local_date, local_time);

// ISO 8601 text. Times and date-times include the offset (as +HH:MM) when
// they have one; fractional seconds are written only when non-zero.

std::string
to_string(local_date const&);

std::string
to_string(time_offset);

std::string
to_string(local_time const&);

std::string
to_string(date_time const&);

} // namespace tomlenc

#endif
