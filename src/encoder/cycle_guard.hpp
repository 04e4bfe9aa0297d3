#ifndef TOMLENC_ENCODER_CYCLE_GUARD_HPP
#define TOMLENC_ENCODER_CYCLE_GUARD_HPP

#include "runtime/value.hpp"

#include <unordered_set>

namespace tomlenc {

// Identities of every table flattened by earlier layers of one layering loop.
// A table showing up again in a later layer can only come from a cycle.
class layer_history {
public:
  explicit
  layer_history(table const& root) { seen_.emplace(&root); }

  // Throws structural_error if any table in the layer was seen in an earlier
  // layer; otherwise records the whole layer. Tables repeated within the
  // layer itself are fine.
  void
  enter_layer(table const& sections);

  std::size_t
  size() const { return seen_.size(); }

private:
  std::unordered_set<void const*> seen_;
};

// Marks a container as being expanded for the lifetime of the guard. Entering
// a container that is already open means it contains itself.
class open_container {
public:
  open_container(std::unordered_set<void const*>& open, void const* container);

  open_container(open_container const&) = delete;

  open_container&
  operator = (open_container const&) = delete;

  ~open_container();

private:
  std::unordered_set<void const*>& open_;
  void const*                      container_;
};

[[noreturn]] void
throw_circular_reference();

} // namespace tomlenc

#endif
