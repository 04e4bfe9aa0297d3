#include "encoder/dispatcher.hpp"

#include "encoder/encoder.hpp"
#include "encoder/scalar_format.hpp"

#include <algorithm>

namespace tomlenc {

static std::string
format_fallback(format_context&, value const& v) {
  return format_string(to_string(v));
}

dispatcher::dispatcher()
  : fallback_{format_fallback}
{ }

void
dispatcher::add_exact(std::type_index t, formatter f) {
  exact_.insert_or_assign(t, std::move(f));
}

void
dispatcher::add_capability(capability c, formatter f) {
  capabilities_.emplace_back(std::move(c), std::move(f));
}

formatter const&
dispatcher::find(value const& v) const {
  if (auto it = exact_.find(v.type()); it != exact_.end())
    return it->second;

  auto cap = std::ranges::find_if(capabilities_,
                                  [&] (auto const& entry) { return entry.first(v); });
  if (cap != capabilities_.end())
    return cap->second;

  return fallback_;
}

std::string
dispatcher::format(format_context& ctx, value const& v) const {
  return find(v)(ctx, v);
}

std::string
format_context::format(value const& v) {
  return encoder_.dispatch_table().format(*this, v);
}

bool
format_context::inside(enclosing kind) const {
  return std::ranges::find(enclosing_, kind) != enclosing_.end();
}

std::optional<enclosing>
format_context::innermost() const {
  if (enclosing_.empty())
    return std::nullopt;
  else
    return enclosing_.back();
}

} // namespace tomlenc
