#ifndef TOMLENC_IO_WRITE_HPP
#define TOMLENC_IO_WRITE_HPP

#include "runtime/value.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <variant>

namespace tomlenc {

class encoder;
class text_sink;

// A file name, a path, an open stream or a sink. Streams and sinks are
// borrowed.
using destination
  = std::variant<std::string, std::filesystem::path, std::ostream*, text_sink*>;

// TOML document for the given root table. Without an encoder, a default one
// is used whose residual tables are built by root.make_empty(). Throws
// structural_error if the tree contains a cycle.
std::string
render(table const& root, encoder const* enc = nullptr);

// Render the table and write the text to the destination. Nothing is written
// if rendering fails.
void
write(table const& root, destination const& out, encoder const* enc = nullptr);

} // namespace tomlenc

#endif
