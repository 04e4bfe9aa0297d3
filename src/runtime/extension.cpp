#include "runtime/extension.hpp"

#include "runtime/error.hpp"

#include <fmt/format.h>

#include <charconv>

namespace tomlenc {

static std::uint8_t
parse_octet(std::string_view text, std::string_view whole) {
  if (text.empty() || text.size() > 3 || (text.size() > 1 && text[0] == '0'))
    throw make_error<configuration_error>("Invalid IPv4 address: \"{}\"", whole);

  unsigned result = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
  if (ec != std::errc{} || end != text.data() + text.size() || result > 255)
    throw make_error<configuration_error>("Invalid IPv4 address: \"{}\"", whole);

  return static_cast<std::uint8_t>(result);
}

ipv4_address
ipv4_address::parse(std::string_view text) {
  octets_type octets{};
  std::string_view rest = text;

  for (std::size_t i = 0; i < octets.size(); ++i) {
    std::size_t dot = rest.find('.');
    bool last = i + 1 == octets.size();

    if (last != (dot == std::string_view::npos))
      throw make_error<configuration_error>("Invalid IPv4 address: \"{}\"", text);

    octets[i] = parse_octet(rest.substr(0, dot), text);
    if (!last)
      rest.remove_prefix(dot + 1);
  }

  return ipv4_address{octets};
}

std::string
ipv4_address::to_string() const {
  return fmt::format("{}.{}.{}.{}", octets_[0], octets_[1], octets_[2], octets_[3]);
}

std::string
iterable_value::to_string() const {
  std::string result = "(";
  bool first = true;
  for (value const& v : elements()) {
    if (!first)
      result += ", ";
    result += tomlenc::to_string(v);
    first = false;
  }
  result += ')';
  return result;
}

} // namespace tomlenc
