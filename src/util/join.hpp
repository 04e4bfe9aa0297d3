#ifndef TOMLENC_UTIL_JOIN_HPP
#define TOMLENC_UTIL_JOIN_HPP

#include <string>
#include <string_view>

namespace tomlenc {

namespace detail {

  std::string
  make_string(auto x) { return std::to_string(x); }

  inline std::string const&
  make_string(std::string const& s) { return s; }

  inline std::string
  make_string(char const* s) { return std::string(s); }

} // namespace detail

std::string
join(auto&& range, std::string_view sep) {
  auto it = std::begin(range);
  auto end = std::end(range);

  std::string result;
  if (it != end)
    result += detail::make_string(*it++);

  for (; it != end; ++it) {
    result += sep;
    result += detail::make_string(*it);
  }

  return result;
}

// Dotted key path: "" and "b" give "b", "a" and "b" give "a.b".
inline std::string
qualify(std::string_view prefix, std::string_view key) {
  if (prefix.empty())
    return std::string(key);

  std::string result{prefix};
  result += '.';
  result += key;
  return result;
}

} // namespace tomlenc

#endif
