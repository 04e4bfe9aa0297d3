#include "encoder/cycle_guard.hpp"

#include "runtime/error.hpp"

#include <vector>

namespace tomlenc {

void
throw_circular_reference() {
  throw structural_error{"Circular reference detected"};
}

void
layer_history::enter_layer(table const& sections) {
  std::vector<void const*> layer;
  layer.reserve(sections.size());

  for (auto const& [key, section] : sections) {
    table const* t = section.as_table();
    if (seen_.contains(t))
      throw_circular_reference();

    layer.push_back(t);
  }

  seen_.insert(layer.begin(), layer.end());
}

open_container::open_container(std::unordered_set<void const*>& open,
                               void const* container)
  : open_{open}
  , container_{container}
{
  if (!open_.emplace(container_).second)
    throw_circular_reference();
}

open_container::~open_container() {
  open_.erase(container_);
}

} // namespace tomlenc
