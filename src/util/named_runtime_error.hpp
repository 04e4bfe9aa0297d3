#ifndef TOMLENC_UTIL_NAMED_RUNTIME_ERROR_HPP
#define TOMLENC_UTIL_NAMED_RUNTIME_ERROR_HPP

#include <stdexcept>

namespace tomlenc {

// Distinct exception types that share std::runtime_error's interface. The tag
// is only used to tell the types apart.
template <typename>
class named_runtime_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace tomlenc

#endif
