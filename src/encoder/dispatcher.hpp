#ifndef TOMLENC_ENCODER_DISPATCHER_HPP
#define TOMLENC_ENCODER_DISPATCHER_HPP

#include "runtime/value.hpp"

#include <functional>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tomlenc {

class encoder;
class format_context;

using formatter = std::function<std::string(format_context&, value const&)>;
using capability = std::function<bool(value const&)>;

// Chooses a formatter for a value: first by exact type, then by the first
// capability the value satisfies, in registration order, and finally the
// string fallback, which never fails.
class dispatcher {
public:
  dispatcher();

  // Replaces any formatter previously registered for the same type.
  void
  add_exact(std::type_index, formatter);

  template <typename T>
  void
  add_exact(formatter f) { add_exact(std::type_index{typeid(T)}, std::move(f)); }

  // Appended after every existing capability.
  void
  add_capability(capability, formatter);

  // Capability satisfied by extension values deriving from T.
  template <typename T>
  void
  add_capability(formatter f) {
    add_capability([] (value const& v) { return v.as_custom<T>() != nullptr; },
                   std::move(f));
  }

  bool
  has_exact(std::type_index t) const { return exact_.contains(t); }

  std::size_t
  capability_count() const { return capabilities_.size(); }

  formatter const&
  find(value const&) const;

  std::string
  format(format_context&, value const&) const;

private:
  std::unordered_map<std::type_index, formatter> exact_;
  std::vector<std::pair<capability, formatter>>  capabilities_;
  formatter                                      fallback_;
};

// Kind of container a nested value is being formatted into.
enum class enclosing {
  list,
  inline_table
};

// State of one render: the encoder in use and the containers currently being
// expanded on the path from the root.
class format_context {
public:
  explicit
  format_context(encoder const& enc) : encoder_{enc} { }

  format_context(format_context const&) = delete;

  format_context&
  operator = (format_context const&) = delete;

  encoder const&
  enc() const { return encoder_; }

  // Dispatch a nested value through the encoder's table.
  std::string
  format(value const&);

  std::unordered_set<void const*>&
  open_containers() { return open_; }

  // True if the value being formatted ends up anywhere inside a container of
  // the given kind.
  bool
  inside(enclosing kind) const;

  // Innermost enclosing container, or nullopt for the right-hand side of a
  // key = value assignment.
  std::optional<enclosing>
  innermost() const;

private:
  friend class enclosing_scope;

  encoder const&                  encoder_;
  std::unordered_set<void const*> open_;
  std::vector<enclosing>          enclosing_;
};

// Records that values formatted during the scope's lifetime go into a
// container of the given kind.
class enclosing_scope {
public:
  enclosing_scope(format_context& ctx, enclosing kind)
    : ctx_{ctx}
  {
    ctx_.enclosing_.push_back(kind);
  }

  enclosing_scope(enclosing_scope const&) = delete;

  enclosing_scope&
  operator = (enclosing_scope const&) = delete;

  ~enclosing_scope() { ctx_.enclosing_.pop_back(); }

private:
  format_context& ctx_;
};

} // namespace tomlenc

#endif
