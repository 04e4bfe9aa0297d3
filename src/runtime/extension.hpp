#ifndef TOMLENC_RUNTIME_EXTENSION_HPP
#define TOMLENC_RUNTIME_EXTENSION_HPP

#include "runtime/value.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace tomlenc {

class path_value final : public custom_value {
public:
  explicit
  path_value(std::filesystem::path p) : path_{std::move(p)} { }

  std::filesystem::path const&
  path() const { return path_; }

  std::string
  to_string() const override { return path_.generic_string(); }

private:
  std::filesystem::path path_;
};

// A named enumerator carrying an underlying value. It is encoded through the
// underlying value's textual representation, not its name.
class enum_value : public custom_value {
public:
  enum_value(std::string name, value underlying)
    : name_{std::move(name)}
    , underlying_{std::move(underlying)}
  { }

  std::string const&
  name() const { return name_; }

  value const&
  underlying() const { return underlying_; }

  std::string
  to_string() const override { return name_; }

private:
  std::string name_;
  value       underlying_;
};

class ipv4_address final : public custom_value {
public:
  using octets_type = std::array<std::uint8_t, 4>;

  explicit
  ipv4_address(octets_type octets) : octets_{octets} { }

  // Dotted-quad text such as "127.0.0.1". Throws configuration_error on
  // anything else, including octets with leading zeros.
  static ipv4_address
  parse(std::string_view);

  octets_type const&
  octets() const { return octets_; }

  std::string
  to_string() const override;

private:
  octets_type octets_;
};

// Anything that can be enumerated. Encoded as an array.
class iterable_value : public custom_value {
public:
  virtual std::vector<value>
  elements() const = 0;

  std::string
  to_string() const override;
};

class value_tuple final : public iterable_value {
public:
  value_tuple(std::initializer_list<value> elements) : elements_(elements) { }

  explicit
  value_tuple(std::vector<value> elements) : elements_{std::move(elements)} { }

  std::vector<value>
  elements() const override { return elements_; }

private:
  std::vector<value> elements_;
};

// Fixed-width numbers from numeric code. Only the numeric encoder knows to
// write them as numbers; everywhere else they fall back to strings.
template <typename T>
requires std::is_arithmetic_v<T> && (!std::is_same_v<T, bool>)
class numeric_scalar final : public custom_value {
public:
  using value_type = T;

  explicit
  numeric_scalar(T v) : value_{v} { }

  T
  get() const { return value_; }

  std::string
  to_string() const override { return fmt::format("{}", value_); }

private:
  T value_;
};

template <typename T>
std::shared_ptr<numeric_scalar<T>>
make_numeric(T v) {
  return std::make_shared<numeric_scalar<T>>(v);
}

// A value together with the comment text that accompanied it in a source
// document. begins_line means the comment was on its own line before the
// value.
class commented_value final : public custom_value {
public:
  commented_value(value wrapped, std::string comment, bool begins_line = false)
    : wrapped_{std::move(wrapped)}
    , comment_{std::move(comment)}
    , begins_line_{begins_line}
  { }

  value const&
  wrapped() const { return wrapped_; }

  std::string const&
  comment() const { return comment_; }

  bool
  begins_line() const { return begins_line_; }

  std::string
  to_string() const override { return tomlenc::to_string(wrapped_); }

private:
  value       wrapped_;
  std::string comment_;
  bool        begins_line_;
};

} // namespace tomlenc

#endif
