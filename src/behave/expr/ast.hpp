#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "behave/expr/value.hpp"

namespace behave::expr {

struct operator_meta;
struct node;

using node_list = std::vector<node>;

enum class ref_root : uint8_t {
  entity,
  config,
  payload,
  now,
  state,
  local,
  unbound,
};

struct literal {
  value val;
};

// `@root.a.b` split into its root and the remaining member path.
struct context_ref {
  ref_root root = ref_root::unbound;
  std::string name;
  std::vector<std::string> path;
  std::string text;
};

struct call {
  const operator_meta * op = nullptr;
  std::string name;
  node_list args;
};

struct array_form {
  node_list items;
};

struct object_form {
  std::vector<std::string> keys;
  node_list values;
};

struct node {
  std::variant<literal, context_ref, call, array_form, object_form> kind;
};

inline const call * as_call(const node & n) noexcept { return std::get_if<call>(&n.kind); }

inline const context_ref * as_ref(const node & n) noexcept {
  return std::get_if<context_ref>(&n.kind);
}

inline const literal * as_literal(const node & n) noexcept {
  return std::get_if<literal>(&n.kind);
}

inline const object_form * as_object(const node & n) noexcept {
  return std::get_if<object_form>(&n.kind);
}

inline const array_form * as_array(const node & n) noexcept {
  return std::get_if<array_form>(&n.kind);
}

// Depth-first walk over a tree; `fn` sees every node before its children.
template <class Fn>
void walk(const node & n, Fn && fn) {
  fn(n);
  if (const call * c = as_call(n)) {
    for (const node & arg : c->args) {
      walk(arg, fn);
    }
  } else if (const array_form * a = as_array(n)) {
    for (const node & item : a->items) {
      walk(item, fn);
    }
  } else if (const object_form * o = as_object(n)) {
    for (const node & v : o->values) {
      walk(v, fn);
    }
  }
}

}  // namespace behave::expr
