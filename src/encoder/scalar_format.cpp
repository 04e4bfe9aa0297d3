#include "encoder/scalar_format.hpp"

#include "runtime/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace tomlenc {

static std::size_t
utf8_code_point_byte_length(unsigned char first_byte) {
  if ((first_byte & 0b1000'0000) == 0)
    return 1;
  else if ((first_byte & 0b1110'0000) == 0b1100'0000)
    return 2;
  else if ((first_byte & 0b1111'0000) == 0b1110'0000)
    return 3;
  else if ((first_byte & 0b1111'1000) == 0b1111'0000)
    return 4;
  else
    return 0;
}

// Length of the well-formed UTF-8 sequence starting at s[pos], or 0 if there
// isn't one. Overlong forms, surrogates and code points past U+10FFFF are
// ill-formed.
static std::size_t
utf8_sequence_length(std::string_view s, std::size_t pos) {
  auto byte = [&] (std::size_t i) { return static_cast<unsigned char>(s[pos + i]); };

  std::size_t length = utf8_code_point_byte_length(byte(0));
  if (length == 0 || s.size() - pos < length)
    return 0;

  char32_t code_point = byte(0) & (0b0111'1111 >> length);
  for (std::size_t i = 1; i < length; ++i) {
    if ((byte(i) & 0b1100'0000) != 0b1000'0000)
      return 0;
    code_point = (code_point << 6) | (byte(i) & 0b0011'1111);
  }

  static constexpr char32_t smallest[] = {0, 0, 0x80, 0x800, 0x1'0000};
  if (code_point < smallest[length]
      || (code_point >= 0xD800 && code_point <= 0xDFFF)
      || code_point > 0x10'FFFF)
    return 0;

  return length;
}

// Backslash-escaped form of s: quotes and backslashes are escaped, \n, \r and
// \t use their short forms, other control bytes become \xNN. Non-ASCII text
// is copied through and must be valid UTF-8.
static std::string
escape_representation(std::string_view s) {
  std::string result;
  result.reserve(s.size());

  for (std::size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x80) {
      std::size_t length = utf8_sequence_length(s, i);
      if (length == 0)
        throw make_error<configuration_error>(
          "Invalid UTF-8 in string at byte {}: 0x{:02x}", i, byte
        );

      result += s.substr(i, length);
      i += length - 1;
    }
    else if (c == '"')
      result += R"(\")";
    else if (c == '\\')
      result += R"(\\)";
    else if (c == '\n')
      result += R"(\n)";
    else if (c == '\r')
      result += R"(\r)";
    else if (c == '\t')
      result += R"(\t)";
    else if (byte < 0x20 || byte == 0x7f)
      result += fmt::format(R"(\x{:02x})", byte);
    else
      result += c;
  }

  return result;
}

static std::size_t
trailing_backslashes(std::string const& s) {
  std::size_t last = s.find_last_not_of('\\');
  if (last == std::string::npos)
    return s.size();
  else
    return s.size() - last - 1;
}

// Every \x in an escaped representation is either a byte escape, which TOML
// spells \u00NN, or the tail of an escaped backslash followed by a literal x.
// An odd run of backslashes before the split point means the latter.
static std::string
rewrite_byte_escapes(std::string_view repr) {
  static constexpr std::string_view byte_escape = R"(\x)";

  std::string result;
  result.reserve(repr.size());

  std::size_t pos = 0;
  while (true) {
    std::size_t split = repr.find(byte_escape, pos);
    if (split == std::string_view::npos) {
      result += repr.substr(pos);
      break;
    }

    result += repr.substr(pos, split - pos);
    if (trailing_backslashes(result) % 2 == 1)
      result += byte_escape;
    else
      result += R"(\u00)";

    pos = split + byte_escape.size();
  }

  return result;
}

std::string
format_string(std::string_view s) {
  return '"' + rewrite_byte_escapes(escape_representation(s)) + '"';
}

std::string
format_bool(bool b) {
  return b ? "true" : "false";
}

std::string
format_integer(std::int64_t i) {
  return fmt::format("{}", i);
}

std::string
strip_exponent_zeros(std::string s) {
  std::size_t e = s.find_first_of("eE");
  if (e == std::string::npos)
    return s;

  std::size_t digits = e + 1;
  if (digits < s.size() && (s[digits] == '+' || s[digits] == '-'))
    ++digits;

  std::size_t first_nonzero = digits;
  while (first_nonzero + 1 < s.size() && s[first_nonzero] == '0')
    ++first_nonzero;

  s.erase(digits, first_nonzero - digits);
  return s;
}

template <typename T>
static std::string
format_floating_point(T f) {
  if (std::isnan(f))
    return "nan";
  else if (std::isinf(f))
    return f > 0 ? "inf" : "-inf";

  std::string result = fmt::format("{}", f);
  if (result.find_first_of(".e") == std::string::npos)
    result += ".0";

  return strip_exponent_zeros(std::move(result));
}

std::string
format_float(double d) {
  return format_floating_point(d);
}

std::string
format_single_float(float f) {
  return format_floating_point(f);
}

static bool
is_digit(char c) {
  return c >= '0' && c <= '9';
}

// Decimal text is syntactically valid but may use forms TOML doesn't accept:
// Infinity and NaN, ".5", "5.", leading zeros, or no fraction at all.
static std::string
normalize_decimal(std::string_view text) {
  std::string sign;
  if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
    sign = text[0];
    text.remove_prefix(1);
  }

  if (text == "inf" || text == "Inf" || text == "Infinity")
    return sign + "inf";
  else if (text == "nan" || text == "NaN")
    return sign + "nan";

  std::size_t exponent_start = text.find_first_of("eE");
  std::string_view mantissa = text.substr(0, exponent_start);
  std::string_view exponent = exponent_start == std::string_view::npos
                                ? std::string_view{}
                                : text.substr(exponent_start);

  std::size_t dot = mantissa.find('.');
  std::string_view integral = mantissa.substr(0, dot);
  std::string_view fraction = dot == std::string_view::npos
                                ? std::string_view{}
                                : mantissa.substr(dot + 1);

  while (integral.size() > 1 && integral[0] == '0')
    integral.remove_prefix(1);

  std::string result = sign;
  result += integral.empty() ? "0" : std::string(integral);

  if (!fraction.empty())
    result += '.' + std::string(fraction);
  else if (exponent.empty() || dot != std::string_view::npos)
    result += ".0";

  result += exponent;
  return result;
}

std::string
format_decimal(decimal const& d) {
  return strip_exponent_zeros(normalize_decimal(d.text()));
}

std::string
format_date(local_date const& d) {
  return to_string(d);
}

std::string
format_time(local_time const& t) {
  local_time local = t;
  local.offset.reset();
  return to_string(local);
}

std::string
format_date_time(date_time const& dt) {
  std::string result = to_string(dt.date) + 'T' + format_time(dt.time);
  if (auto offset = dt.time.offset) {
    if (offset->minutes == 0)
      result += 'Z';
    else
      result += to_string(*offset);
  }

  return result;
}

static bool
is_bare_key_char(char c) {
  return is_digit(c)
         || (c >= 'A' && c <= 'Z')
         || (c >= 'a' && c <= 'z')
         || c == '_' || c == '-';
}

bool
is_bare_key(std::string_view key) {
  return !key.empty() && std::ranges::all_of(key, is_bare_key_char);
}

std::string
format_key(std::string_view key) {
  if (is_bare_key(key))
    return std::string(key);
  else
    return format_string(key);
}

} // namespace tomlenc
