#ifndef TOMLENC_RUNTIME_ERROR_HPP
#define TOMLENC_RUNTIME_ERROR_HPP

#include "util/named_runtime_error.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace tomlenc {

template <typename Error = std::runtime_error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)};
}

// The value tree can't be expressed as TOML: it contains a cycle, or an array
// of tables holds something other than tables.
using structural_error = named_runtime_error<class structural_error_tag>;

// The caller handed us something unusable: a bad separator, a null
// destination, an out-of-range date.
using configuration_error = named_runtime_error<class configuration_error_tag>;

// A destination couldn't be opened or written to.
using file_error = named_runtime_error<class file_error_tag>;

} // namespace tomlenc

#endif
