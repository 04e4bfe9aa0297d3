#include "encoder/encoder.hpp"

#include "encoder/cycle_guard.hpp"
#include "encoder/scalar_format.hpp"
#include "runtime/error.hpp"
#include "runtime/extension.hpp"
#include "util/join.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <vector>

namespace tomlenc {

static std::string
format_inline(format_context& ctx, table const& t) {
  open_container guard{ctx.open_containers(), &t};
  enclosing_scope scope{ctx, enclosing::inline_table};
  return ctx.enc().format_inline_table(ctx, t);
}

static std::string
format_array(format_context& ctx, value const& v) {
  array const* a = v.as_array();
  open_container guard{ctx.open_containers(), a};
  enclosing_scope scope{ctx, enclosing::list};
  return ctx.enc().format_list(ctx, a->elements());
}

static std::string
format_iterable(format_context& ctx, value const& v) {
  auto const* it = v.as_custom<iterable_value>();
  open_container guard{ctx.open_containers(), it};
  std::vector<value> elements = it->elements();
  enclosing_scope scope{ctx, enclosing::list};
  return ctx.enc().format_list(ctx, elements);
}

static void
register_default_formatters(dispatcher& d) {
  d.add_exact<std::string>([] (format_context&, value const& v) {
    return format_string(*v.get_if<std::string>());
  });
  d.add_exact<bool>([] (format_context&, value const& v) {
    return format_bool(*v.get_if<bool>());
  });
  d.add_exact<std::int64_t>([] (format_context&, value const& v) {
    return format_integer(*v.get_if<std::int64_t>());
  });
  d.add_exact<double>([] (format_context&, value const& v) {
    return format_float(*v.get_if<double>());
  });
  d.add_exact<decimal>([] (format_context&, value const& v) {
    return format_decimal(*v.get_if<decimal>());
  });
  d.add_exact<local_date>([] (format_context&, value const& v) {
    return format_date(*v.get_if<local_date>());
  });
  d.add_exact<local_time>([] (format_context&, value const& v) {
    return format_time(*v.get_if<local_time>());
  });
  d.add_exact<date_time>([] (format_context&, value const& v) {
    return format_date_time(*v.get_if<date_time>());
  });
  d.add_exact<array>(format_array);

  // Tables only get here from inside arrays and inline tables, where nothing
  // but the inline form is possible.
  d.add_exact<table>([] (format_context& ctx, value const& v) {
    return format_inline(ctx, *v.as_table());
  });

  d.add_capability<path_value>([] (format_context&, value const& v) {
    return format_string(v.as_custom<path_value>()->to_string());
  });
  d.add_capability<enum_value>([] (format_context&, value const& v) {
    return format_string(to_string(v.as_custom<enum_value>()->underlying()));
  });
  d.add_capability<ipv4_address>([] (format_context&, value const& v) {
    return format_string(v.as_custom<ipv4_address>()->to_string());
  });
  d.add_capability<iterable_value>(format_iterable);
}

encoder::encoder(encoder_config config)
  : config_{std::move(config)}
{
  register_default_formatters(dispatch_);
}

std::shared_ptr<table>
encoder::make_table() const {
  if (!config_.make_table)
    return tomlenc::make_table();

  std::shared_ptr<table> result = config_.make_table();
  if (!result)
    throw configuration_error{"Table factory returned a null table"};

  return result;
}

std::string
encoder::format_list(format_context& ctx, std::span<value const> elements) const {
  std::string result = "[";
  for (value const& v : elements)
    if (!v.is_null())
      result += " " + ctx.format(v) + ",";
  result += "]";
  return result;
}

std::string
encoder::format_inline_table(format_context& ctx, table const& t) const {
  std::vector<std::string> items;
  for (auto const& [key, v] : t)
    if (!v.is_null())
      items.push_back(format_key(key) + " = " + ctx.format(v));

  if (items.empty())
    return "{}";
  else
    return "{ " + join(items, ", ") + " }";
}

section_dump
encoder::dump_sections(format_context& ctx, table const& t,
                       std::string_view prefix) const {
  std::string text;
  std::string table_arrays;
  std::shared_ptr<table> residual = make_table();

  for (auto const& [key, v] : t) {
    std::string quoted = format_key(key);

    if (table const* sub = v.as_table()) {
      if (config_.preserve_inline_tables && sub->is_inline())
        text += quoted + " = " + format_inline(ctx, *sub) + '\n';
      else
        residual->insert_or_assign(std::move(quoted), v);
    } else if (array const* a = v.as_array(); a && a->contains_table())
      table_arrays += dump_table_array(ctx, *a, qualify(prefix, quoted));
    else if (!v.is_null())
      text += quoted + " = " + ctx.format(v) + '\n';
  }

  text += table_arrays;
  return {std::move(text), std::move(residual)};
}

std::string
encoder::dump_table_array(format_context& ctx, array const& a,
                          std::string const& path) const {
  if (config_.verbose)
    fmt::print(stderr, "toml: array of tables {}: {} element(s)\n", path, a.size());

  std::string result;
  for (value const& element : a) {
    if (element.is_null())
      continue;

    table const* t = element.as_table();
    if (!t)
      throw make_error<structural_error>(
        "Array of tables {} contains a non-table element: {}",
        path, to_string(element)
      );

    result += dump_table_array_element(ctx, *t, path);
  }

  return result;
}

// [[path]] followed by the element's own assignments, then its sub-tables
// expanded layer by layer, each under a [path.key] header.
std::string
encoder::dump_table_array_element(format_context& ctx, table const& element,
                                  std::string const& path) const {
  open_container guard{ctx.open_containers(), &element};

  std::string result = "[[" + path + "]]\n";
  std::string sub_tables = "\n";

  section_dump own = dump_sections(ctx, element, path);
  if (!own.text.empty() && own.text[0] == '[')
    sub_tables += own.text;
  else
    result += own.text;

  layer_history history{element};
  std::shared_ptr<table> sections = std::move(own.residual);
  while (!sections->empty()) {
    history.enter_layer(*sections);

    std::shared_ptr<table> next = make_table();
    for (auto const& [key, section] : *sections) {
      std::string section_path = path + '.' + key;
      section_dump d = dump_sections(ctx, *section.as_table(), section_path);

      if (!d.text.empty() || d.residual->empty())
        sub_tables += "[" + section_path + "]\n" + d.text;

      for (auto const& [sub_key, sub] : *d.residual)
        next->insert_or_assign(key + '.' + sub_key, sub);
    }

    sections = std::move(next);
  }

  return result + sub_tables;
}

} // namespace tomlenc
