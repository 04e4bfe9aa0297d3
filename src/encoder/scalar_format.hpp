#ifndef TOMLENC_ENCODER_SCALAR_FORMAT_HPP
#define TOMLENC_ENCODER_SCALAR_FORMAT_HPP

#include "runtime/datetime.hpp"
#include "runtime/value.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace tomlenc {

// Double-quoted TOML basic string. Control characters become \uXXXX escapes
// (\n, \r and \t keep their short forms); a literal backslash followed by an
// x stays "\\x". Throws configuration_error if s is not valid UTF-8.
std::string
format_string(std::string_view s);

std::string
format_bool(bool);

std::string
format_integer(std::int64_t);

// Shortest representation that reads back as the same double, always with a
// fractional part or an exponent, and without a leading zero in the exponent.
std::string
format_float(double);

// As format_float, with the shortest digits that read back as the same float.
std::string
format_single_float(float);

std::string
format_decimal(decimal const&);

std::string
format_date(local_date const&);

// The offset, if any, is dropped: TOML local times don't carry one.
std::string
format_time(local_time const&);

// A zero offset is written as Z.
std::string
format_date_time(date_time const&);

// 1e-05 -> 1e-5, 1E+007 -> 1E+7. Text without an exponent is returned as is.
std::string
strip_exponent_zeros(std::string);

bool
is_bare_key(std::string_view);

std::string
format_key(std::string_view);

} // namespace tomlenc

#endif
