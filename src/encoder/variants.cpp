#include "encoder/variants.hpp"

#include "encoder/scalar_format.hpp"
#include "runtime/error.hpp"
#include "runtime/extension.hpp"

#include <cstdint>

namespace tomlenc {

static encoder_config
with_inline_tables(encoder_config config) {
  config.preserve_inline_tables = true;
  return config;
}

inline_table_encoder::inline_table_encoder(encoder_config config)
  : encoder{with_inline_tables(std::move(config))}
{ }

static std::string
validate_separator(std::string separator) {
  constexpr char const* whitespace = " \t\n\r\f\v";
  constexpr char const* padding = " \t\n\r";

  if (separator.find_first_not_of(whitespace) == std::string::npos)
    return "," + separator;

  std::size_t comma = separator.find_first_not_of(padding);
  if (comma == std::string::npos
      || separator[comma] != ','
      || separator.find_first_not_of(padding, comma + 1) != std::string::npos)
    throw make_error<configuration_error>("Invalid separator for arrays: \"{}\"",
                                          separator);

  return separator;
}

array_separator_encoder::array_separator_encoder(std::string separator,
                                                 encoder_config config)
  : encoder{std::move(config)}
  , separator_{validate_separator(std::move(separator))}
{ }

std::string
array_separator_encoder::format_list(format_context& ctx,
                                     std::span<value const> elements) const {
  std::string result = "[";
  for (value const& v : elements)
    if (!v.is_null())
      result += " " + ctx.format(v) + separator_;
  result += "]";
  return result;
}

template <typename T>
static void
add_integer(dispatcher& d) {
  d.add_exact<numeric_scalar<T>>([] (format_context&, value const& v) {
    return format_integer(static_cast<std::int64_t>(v.as_custom<numeric_scalar<T>>()->get()));
  });
}

void
register_numeric_types(dispatcher& d) {
  add_integer<std::int16_t>(d);
  add_integer<std::int32_t>(d);
  add_integer<std::int64_t>(d);

  d.add_exact<numeric_scalar<float>>([] (format_context&, value const& v) {
    return format_single_float(v.as_custom<numeric_scalar<float>>()->get());
  });
  d.add_exact<numeric_scalar<double>>([] (format_context&, value const& v) {
    return format_float(v.as_custom<numeric_scalar<double>>()->get());
  });
}

numeric_encoder::numeric_encoder(encoder_config config)
  : encoder{std::move(config)}
{
  register_numeric_types(dispatch_table());
}

// The comment always follows the value, since it runs to the end of its line.
// Inside a list the line is ended before the separator; inline tables are
// single-line, so a comment inside one is dropped.
void
register_comment_formatter(dispatcher& d) {
  d.add_exact<commented_value>([] (format_context& ctx, value const& v) {
    auto const* c = v.as_custom<commented_value>();
    std::string text = ctx.format(c->wrapped());

    if (ctx.inside(enclosing::inline_table))
      return text;

    text += (c->begins_line() ? "\n" : " ") + c->comment();
    if (ctx.innermost() == enclosing::list)
      text += '\n';

    return text;
  });
}

comment_preserving_encoder::comment_preserving_encoder(encoder_config config)
  : encoder{std::move(config)}
{
  register_comment_formatter(dispatch_table());
}

} // namespace tomlenc
