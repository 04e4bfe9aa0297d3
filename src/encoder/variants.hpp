#ifndef TOMLENC_ENCODER_VARIANTS_HPP
#define TOMLENC_ENCODER_VARIANTS_HPP

#include "encoder/encoder.hpp"

#include <string>

namespace tomlenc {

// Keeps tables carrying the inline marker on one line.
class inline_table_encoder : public encoder {
public:
  explicit
  inline_table_encoder(encoder_config = {});
};

// Writes arrays as [ a<sep> b<sep>] with a caller-chosen separator. The
// separator is a single comma with optional whitespace around it; a
// whitespace-only separator gets a comma prepended.
class array_separator_encoder : public encoder {
public:
  explicit
  array_separator_encoder(std::string separator = ",", encoder_config = {});

  std::string const&
  separator() const { return separator_; }

  std::string
  format_list(format_context&, std::span<value const>) const override;

private:
  std::string separator_;
};

// numeric_scalar<T> for 16-, 32- and 64-bit integers, float and double, written
// as TOML integers and floats.
void
register_numeric_types(dispatcher&);

class numeric_encoder : public encoder {
public:
  explicit
  numeric_encoder(encoder_config = {});
};

// commented_value written as the wrapped value with its comment reattached.
void
register_comment_formatter(dispatcher&);

class comment_preserving_encoder : public encoder {
public:
  explicit
  comment_preserving_encoder(encoder_config = {});
};

} // namespace tomlenc

#endif
