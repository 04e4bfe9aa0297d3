#ifndef TOMLENC_ENCODER_ENCODER_HPP
#define TOMLENC_ENCODER_ENCODER_HPP

#include "encoder/dispatcher.hpp"
#include "runtime/value.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace tomlenc {

using table_factory = std::function<std::shared_ptr<table>()>;

struct encoder_config {
  // Builds the accumulators that collect deferred sub-tables. Empty means
  // make_table.
  table_factory make_table;

  // Write tables carrying the inline marker as { k = v, ... } instead of
  // giving them their own header.
  bool preserve_inline_tables = false;

  // Trace layer expansion on stderr.
  bool verbose = false;
};

// Result of flattening one table: the assignments that belong under its
// header, and the sub-tables that still need headers of their own, keyed by
// their quoted key relative to the table.
struct section_dump {
  std::string            text;
  std::shared_ptr<table> residual;
};

// Turns tables into TOML text. Scalars go through the dispatch table; the
// list and inline-table formatters are virtual so that variants can replace
// them without touching the flattening algorithm.
class encoder {
public:
  explicit
  encoder(encoder_config = {});

  virtual
  ~encoder() = default;

  encoder_config const&
  config() const { return config_; }

  dispatcher&
  dispatch_table() { return dispatch_; }

  dispatcher const&
  dispatch_table() const { return dispatch_; }

  std::shared_ptr<table>
  make_table() const;

  // [ a, b, c,]
  virtual std::string
  format_list(format_context&, std::span<value const>) const;

  // { a = 1, b = "x" }
  virtual std::string
  format_inline_table(format_context&, table const&) const;

  // Flatten one table found at the given dotted prefix. Array-of-tables
  // entries are expanded in full, with their own headers; plain sub-tables are
  // deferred to the residual.
  section_dump
  dump_sections(format_context&, table const&, std::string_view prefix) const;

private:
  encoder_config config_;
  dispatcher     dispatch_;

  std::string
  dump_table_array(format_context&, array const&, std::string const& path) const;

  std::string
  dump_table_array_element(format_context&, table const&, std::string const& path) const;
};

} // namespace tomlenc

#endif
