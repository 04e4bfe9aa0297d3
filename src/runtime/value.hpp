#ifndef TOMLENC_RUNTIME_VALUE_HPP
#define TOMLENC_RUNTIME_VALUE_HPP

#include "runtime/datetime.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace tomlenc {

class array;
class table;

// Arbitrary-precision decimal number kept as its validated text, e.g. "3.25",
// "-1E+5" or "Infinity". Encoded as a float.
class decimal {
public:
  explicit
  decimal(std::string text);

  std::string const&
  text() const { return text_; }

  bool
  operator == (decimal const&) const = default;

private:
  std::string text_;
};

// Base for values outside the built-in TOML types. to_string is the textual
// representation used when no formatter claims the value.
class custom_value {
public:
  virtual
  ~custom_value() = default;

  virtual std::string
  to_string() const = 0;
};

class value {
public:
  using storage_type = std::variant<
    std::monostate,
    bool,
    std::int64_t,
    double,
    decimal,
    std::string,
    local_date,
    local_time,
    date_time,
    std::shared_ptr<table>,
    std::shared_ptr<array>,
    std::shared_ptr<custom_value>
  >;

  value() = default;

  value(std::nullptr_t) { }

  value(bool b) : storage_{b} { }

  // Unsigned values above INT64_MAX wrap.
  template <std::integral T>
  requires (!std::same_as<T, bool>)
  value(T i) : storage_{static_cast<std::int64_t>(i)} { }

  template <std::floating_point T>
  value(T f) : storage_{static_cast<double>(f)} { }

  value(char const* s) : storage_{std::string(s)} { }
  value(std::string s) : storage_{std::move(s)} { }
  value(std::string_view s) : storage_{std::string(s)} { }
  value(decimal d) : storage_{std::move(d)} { }
  value(local_date d) : storage_{d} { }
  value(local_time t) : storage_{std::move(t)} { }
  value(date_time dt) : storage_{std::move(dt)} { }

  // Null pointers produce a null value.
  template <std::derived_from<table> T>
  value(std::shared_ptr<T> t) {
    if (t)
      storage_ = std::shared_ptr<table>(std::move(t));
  }

  value(std::shared_ptr<array> a) {
    if (a)
      storage_ = std::move(a);
  }

  template <std::derived_from<custom_value> T>
  value(std::shared_ptr<T> c) {
    if (c)
      storage_ = std::shared_ptr<custom_value>(std::move(c));
  }

  bool
  is_null() const { return std::holds_alternative<std::monostate>(storage_); }

  // Scalar alternatives only; use as_table, as_array and as_custom for the
  // rest.
  template <typename T>
  T const*
  get_if() const { return std::get_if<T>(&storage_); }

  table*
  as_table() const;

  std::shared_ptr<table>
  table_ptr() const;

  array*
  as_array() const;

  custom_value*
  as_custom() const;

  template <std::derived_from<custom_value> T>
  T const*
  as_custom() const { return dynamic_cast<T const*>(as_custom()); }

  // Key for exact-type dispatch. All tables report table, all arrays array;
  // extension values report their dynamic type.
  std::type_index
  type() const;

  storage_type const&
  storage() const { return storage_; }

private:
  storage_type storage_;
};

// Textual representation of a value, used by the string fallback and by
// extension values describing themselves.
std::string
to_string(value const&);

// Ordered key/value mapping. Keys are unique and keep the position of their
// first insertion.
class table {
public:
  using entry = std::pair<std::string, value>;
  using const_iterator = std::vector<entry>::const_iterator;

  table() = default;
  table(std::initializer_list<entry>);

  table(table const&) = default;
  table(table&&) = default;

  table&
  operator = (table const&) = default;

  table&
  operator = (table&&) = default;

  virtual
  ~table() = default;

  // A new empty table of the same dynamic type.
  virtual std::shared_ptr<table>
  make_empty() const;

  // Inserts a null value if the key isn't present. The reference is
  // invalidated by the next insertion.
  value&
  operator [] (std::string const& key);

  void
  insert_or_assign(std::string key, value v);

  value const*
  find(std::string const& key) const;

  bool
  contains(std::string const& key) const { return index_.contains(key); }

  std::size_t
  size() const { return entries_.size(); }

  bool
  empty() const { return entries_.empty(); }

  const_iterator
  begin() const { return entries_.begin(); }

  const_iterator
  end() const { return entries_.end(); }

  bool
  is_inline() const { return inline_; }

  void
  set_inline(bool i = true) { inline_ = i; }

private:
  std::vector<entry>                           entries_;
  std::unordered_map<std::string, std::size_t> index_;
  bool                                         inline_ = false;
};

class array {
public:
  using const_iterator = std::vector<value>::const_iterator;

  array() = default;
  array(std::initializer_list<value>);

  void
  push_back(value v) { elements_.push_back(std::move(v)); }

  std::size_t
  size() const { return elements_.size(); }

  bool
  empty() const { return elements_.empty(); }

  value&
  operator [] (std::size_t i) { return elements_[i]; }

  value const&
  operator [] (std::size_t i) const { return elements_[i]; }

  const_iterator
  begin() const { return elements_.begin(); }

  const_iterator
  end() const { return elements_.end(); }

  std::vector<value> const&
  elements() const { return elements_; }

  // True if any element is a table, which makes this an array of tables when
  // it is a table entry.
  bool
  contains_table() const;

private:
  std::vector<value> elements_;
};

std::shared_ptr<table>
make_table();

std::shared_ptr<table>
make_table(std::initializer_list<table::entry>);

std::shared_ptr<table>
make_inline_table(std::initializer_list<table::entry>);

std::shared_ptr<array>
make_array();

std::shared_ptr<array>
make_array(std::initializer_list<value>);

} // namespace tomlenc

#endif
