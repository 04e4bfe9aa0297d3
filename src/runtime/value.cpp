#include "runtime/value.hpp"

#include "runtime/error.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <typeinfo>

namespace tomlenc {

static bool
is_digit(char c) {
  return c >= '0' && c <= '9';
}

static bool
is_special_decimal(std::string_view s) {
  static constexpr std::string_view specials[]
    = {"inf", "Inf", "Infinity", "nan", "NaN"};
  return std::ranges::find(specials, s) != std::end(specials);
}

// [+-]? (digits [. digits?] | . digits) ([eE] [+-]? digits)?
static bool
is_valid_decimal(std::string_view s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-'))
    ++i;

  if (is_special_decimal(s.substr(i)))
    return true;

  std::size_t integral_digits = 0;
  while (i < s.size() && is_digit(s[i])) {
    ++i;
    ++integral_digits;
  }

  std::size_t fraction_digits = 0;
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && is_digit(s[i])) {
      ++i;
      ++fraction_digits;
    }
  }

  if (integral_digits + fraction_digits == 0)
    return false;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
      ++i;

    std::size_t exponent_digits = 0;
    while (i < s.size() && is_digit(s[i])) {
      ++i;
      ++exponent_digits;
    }

    if (exponent_digits == 0)
      return false;
  }

  return i == s.size();
}

decimal::decimal(std::string text)
  : text_{std::move(text)}
{
  if (!is_valid_decimal(text_))
    throw make_error<configuration_error>("Invalid decimal: \"{}\"", text_);
}

table*
value::as_table() const {
  if (auto t = std::get_if<std::shared_ptr<table>>(&storage_))
    return t->get();
  else
    return nullptr;
}

std::shared_ptr<table>
value::table_ptr() const {
  if (auto t = std::get_if<std::shared_ptr<table>>(&storage_))
    return *t;
  else
    return {};
}

array*
value::as_array() const {
  if (auto a = std::get_if<std::shared_ptr<array>>(&storage_))
    return a->get();
  else
    return nullptr;
}

custom_value*
value::as_custom() const {
  if (auto c = std::get_if<std::shared_ptr<custom_value>>(&storage_))
    return c->get();
  else
    return nullptr;
}

std::type_index
value::type() const {
  return std::visit(
    [] <typename T> (T const& x) -> std::type_index {
      if constexpr (std::is_same_v<T, std::shared_ptr<table>>)
        return typeid(table);
      else if constexpr (std::is_same_v<T, std::shared_ptr<array>>)
        return typeid(array);
      else if constexpr (std::is_same_v<T, std::shared_ptr<custom_value>>) {
        custom_value const& c = *x;
        return typeid(c);
      }
      else
        return typeid(T);
    },
    storage_
  );
}

namespace {
  struct to_string_visitor {
    std::string
    operator () (std::monostate) const { return "null"; }

    std::string
    operator () (bool b) const { return b ? "true" : "false"; }

    std::string
    operator () (std::int64_t i) const { return fmt::format("{}", i); }

    std::string
    operator () (double d) const { return fmt::format("{}", d); }

    std::string
    operator () (decimal const& d) const { return d.text(); }

    std::string
    operator () (std::string const& s) const { return s; }

    std::string
    operator () (local_date const& d) const { return tomlenc::to_string(d); }

    std::string
    operator () (local_time const& t) const { return tomlenc::to_string(t); }

    std::string
    operator () (date_time const& dt) const { return tomlenc::to_string(dt); }

    std::string
    operator () (std::shared_ptr<table> const& t) const {
      return fmt::format("<table of {} entries>", t->size());
    }

    std::string
    operator () (std::shared_ptr<array> const& a) const {
      return fmt::format("<array of {} elements>", a->size());
    }

    std::string
    operator () (std::shared_ptr<custom_value> const& c) const {
      return c->to_string();
    }
  };
}

std::string
to_string(value const& v) {
  return std::visit(to_string_visitor{}, v.storage());
}

table::table(std::initializer_list<entry> entries) {
  for (entry const& e : entries)
    insert_or_assign(e.first, e.second);
}

std::shared_ptr<table>
table::make_empty() const {
  return std::make_shared<table>();
}

value&
table::operator [] (std::string const& key) {
  if (auto it = index_.find(key); it != index_.end())
    return entries_[it->second].second;

  index_.emplace(key, entries_.size());
  entries_.emplace_back(key, value{});
  return entries_.back().second;
}

void
table::insert_or_assign(std::string key, value v) {
  if (auto it = index_.find(key); it != index_.end()) {
    entries_[it->second].second = std::move(v);
    return;
  }

  index_.emplace(key, entries_.size());
  entries_.emplace_back(std::move(key), std::move(v));
}

value const*
table::find(std::string const& key) const {
  if (auto it = index_.find(key); it != index_.end())
    return &entries_[it->second].second;
  else
    return nullptr;
}

array::array(std::initializer_list<value> elements)
  : elements_(elements)
{ }

bool
array::contains_table() const {
  return std::ranges::any_of(elements_,
                             [] (value const& v) { return v.as_table() != nullptr; });
}

std::shared_ptr<table>
make_table() {
  return std::make_shared<table>();
}

std::shared_ptr<table>
make_table(std::initializer_list<table::entry> entries) {
  return std::make_shared<table>(entries);
}

std::shared_ptr<table>
make_inline_table(std::initializer_list<table::entry> entries) {
  auto result = make_table(entries);
  result->set_inline();
  return result;
}

std::shared_ptr<array>
make_array() {
  return std::make_shared<array>();
}

std::shared_ptr<array>
make_array(std::initializer_list<value> elements) {
  return std::make_shared<array>(elements);
}

} // namespace tomlenc
