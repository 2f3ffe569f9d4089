#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/expr/ast.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"

namespace behave::expr {

inline constexpr int32_t k_max_eval_steps = 100000;
inline constexpr int32_t k_max_eval_depth = 128;

// Read-only binding environment for one evaluation.
struct context {
  const value * entity = nullptr;
  const value * config = nullptr;
  const value * payload = nullptr;
  int64_t now_ms = 0;
  std::string_view state = {};
};

struct scope_entry {
  std::string name;
  value val;
};

struct eval_frame {
  const context * ctx = nullptr;
  effect_sink * sink = nullptr;
  std::vector<scope_entry> locals = {};
  int32_t error = BEHAVE_OK;
  std::string error_message = {};
  int32_t steps_remaining = k_max_eval_steps;
  int32_t depth = 0;
};

inline value fault(eval_frame & frame, std::string message, const int32_t err = BEHAVE_ERR_ENGINE_FAULT) {
  if (frame.error == BEHAVE_OK) {
    frame.error = err;
    frame.error_message = std::move(message);
  }
  return make_undefined();
}

inline bool failed(const eval_frame & frame) noexcept { return frame.error != BEHAVE_OK; }

struct local_scope {
  eval_frame & frame;
  size_t mark;

  explicit local_scope(eval_frame & f) noexcept : frame(f), mark(f.locals.size()) {}
  ~local_scope() { frame.locals.resize(mark); }

  local_scope(const local_scope &) = delete;
  local_scope & operator=(const local_scope &) = delete;

  void bind(std::string name, value v) { frame.locals.push_back({std::move(name), std::move(v)}); }
};

inline const value * find_local(const eval_frame & frame, std::string_view name) noexcept {
  for (auto it = frame.locals.rbegin(); it != frame.locals.rend(); ++it) {
    if (it->name == name) {
      return &it->val;
    }
  }
  return nullptr;
}

inline bool parse_index(std::string_view text, size_t & out) noexcept {
  if (text.empty() || text.size() > 18) {
    return false;
  }
  size_t result = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    result = result * 10 + static_cast<size_t>(c - '0');
  }
  out = result;
  return true;
}

inline value walk_path(const value * base, const std::vector<std::string> & path) {
  if (base == nullptr) {
    return make_undefined();
  }
  const value * cur = base;
  for (const std::string & segment : path) {
    if (cur->is_object()) {
      const auto it = cur->find(segment);
      if (it == cur->end()) {
        return make_undefined();
      }
      cur = &*it;
    } else if (cur->is_array()) {
      if (segment == "length") {
        return value(static_cast<int64_t>(cur->size()));
      }
      size_t index = 0;
      if (!parse_index(segment, index) || index >= cur->size()) {
        return make_undefined();
      }
      cur = &(*cur)[index];
    } else if (cur->is_string() && segment == "length") {
      return value(static_cast<int64_t>(cur->get_ref<const std::string &>().size()));
    } else {
      return make_undefined();
    }
  }
  return *cur;
}

inline value resolve(const eval_frame & frame, const context_ref & ref) {
  const context & ctx = *frame.ctx;
  switch (ref.root) {
    case ref_root::entity:
      return walk_path(ctx.entity, ref.path);
    case ref_root::config:
      return walk_path(ctx.config, ref.path);
    case ref_root::payload:
      return walk_path(ctx.payload, ref.path);
    case ref_root::now:
      return ref.path.empty() ? value(ctx.now_ms) : make_undefined();
    case ref_root::state:
      return ref.path.empty() ? value(std::string(ctx.state)) : make_undefined();
    case ref_root::local:
    case ref_root::unbound:
      // unbound names still see bindings restored from the caller.
      return walk_path(find_local(frame, ref.name), ref.path);
    default:
      return make_undefined();
  }
}

inline value eval(eval_frame & frame, const node & n);

struct depth_guard {
  eval_frame & frame;
  explicit depth_guard(eval_frame & f) noexcept : frame(f) { frame.depth += 1; }
  ~depth_guard() { frame.depth -= 1; }

  depth_guard(const depth_guard &) = delete;
  depth_guard & operator=(const depth_guard &) = delete;
};

inline value eval_call(eval_frame & frame, const call & c) {
  if (c.op == nullptr) {
    return fault(frame, "Unknown operator '" + c.name + "'");
  }
  const operator_meta & op = *c.op;
  const int32_t argc = static_cast<int32_t>(c.args.size());
  if (argc < op.min_arity || (!op.variadic() && argc > op.max_arity)) {
    return fault(frame, "Operator '" + op.name + "' called with " + std::to_string(argc) +
                            " argument(s)");
  }
  if (op.kind == operator_kind::effect && frame.sink == nullptr) {
    return fault(frame, "Effect operator '" + op.name + "' cannot run in a guard");
  }
  if (op.form != nullptr) {
    return op.form(frame, c);
  }
  std::vector<value> args;
  args.reserve(c.args.size());
  for (const node & arg : c.args) {
    args.push_back(eval(frame, arg));
    if (failed(frame)) {
      return make_undefined();
    }
  }
  return op.eager(frame, args.data(), args.size());
}

inline value eval(eval_frame & frame, const node & n) {
  if (failed(frame)) {
    return make_undefined();
  }
  frame.steps_remaining -= 1;
  if (frame.steps_remaining < 0) {
    return fault(frame, "Evaluation step budget exhausted");
  }
  if (frame.depth >= k_max_eval_depth) {
    return fault(frame, "Expression nesting too deep");
  }
  depth_guard guard{frame};

  if (const literal * lit = as_literal(n)) {
    return lit->val;
  }
  if (const context_ref * ref = as_ref(n)) {
    return resolve(frame, *ref);
  }
  if (const call * c = as_call(n)) {
    return eval_call(frame, *c);
  }
  if (const array_form * arr = as_array(n)) {
    value out = value::array();
    for (const node & item : arr->items) {
      out.push_back(sanitize(eval(frame, item)));
    }
    return out;
  }
  if (const object_form * obj = as_object(n)) {
    value out = value::object();
    for (size_t i = 0; i < obj->keys.size(); ++i) {
      out[obj->keys[i]] = sanitize(eval(frame, obj->values[i]));
    }
    return out;
  }
  return fault(frame, "Malformed expression node");
}

inline bool is_lambda(const node & n) noexcept {
  const call * c = as_call(n);
  return c != nullptr && c->op != nullptr && c->op->name == "fn" && !c->args.empty();
}

/**
 * invokes a `fn` node with positional arguments.
 *
 * list parameters destructure the matching argument when it is an array.
 */
inline value call_lambda(eval_frame & frame, const node & fn_node, const value * args,
                         const size_t count) {
  if (!is_lambda(fn_node)) {
    return fault(frame, "Expected a fn lambda");
  }
  const call & fn = *as_call(fn_node);
  const size_t param_count = fn.args.size() - 1;
  local_scope scope{frame};
  for (size_t i = 0; i < param_count; ++i) {
    const value & param = as_literal(fn.args[i])->val;
    const value arg = i < count ? args[i] : make_undefined();
    if (param.is_string()) {
      scope.bind(param.get<std::string>(), arg);
    } else if (param.is_array()) {
      for (size_t j = 0; j < param.size(); ++j) {
        value item = arg.is_array() && j < arg.size() ? arg[j] : (j == 0 ? arg : make_undefined());
        scope.bind(param[j].get<std::string>(), std::move(item));
      }
    }
  }
  return eval(frame, fn.args.back());
}

inline value capture_locals(const eval_frame & frame) {
  value out = value::object();
  for (const scope_entry & entry : frame.locals) {
    out[entry.name] = sanitize(entry.val);
  }
  return out;
}

inline void restore_locals(eval_frame & frame, const value * locals) {
  if (locals == nullptr || !locals->is_object()) {
    return;
  }
  for (auto it = locals->begin(); it != locals->end(); ++it) {
    frame.locals.push_back({it.key(), it.value()});
  }
}

/**
 * evaluates a guard in pure mode.
 *
 * effect operators fault. a fault reports through `error_out` and the guard
 * counts as not satisfied.
 */
inline bool evaluate_guard(const node & guard, const context & ctx, int32_t * error_out,
                           std::string * message_out, const value * locals = nullptr) noexcept {
  eval_frame frame;
  frame.ctx = &ctx;
  bool result = false;
  try {
    restore_locals(frame, locals);
    result = truthy(eval(frame, guard));
  } catch (const std::exception & ex) {
    fault(frame, ex.what());
  }
  if (error_out != nullptr) {
    *error_out = frame.error;
  }
  if (message_out != nullptr && failed(frame)) {
    *message_out = frame.error_message;
  }
  return !failed(frame) && result;
}

// Evaluates a pure expression to a value; used for props and computed fields.
inline value evaluate_value(const node & expr, const context & ctx, int32_t * error_out,
                            std::string * message_out) noexcept {
  eval_frame frame;
  frame.ctx = &ctx;
  value out = value(nullptr);
  try {
    out = sanitize(eval(frame, expr));
  } catch (const std::exception & ex) {
    fault(frame, ex.what());
  }
  if (error_out != nullptr) {
    *error_out = frame.error;
  }
  if (message_out != nullptr && failed(frame)) {
    *message_out = frame.error_message;
  }
  return failed(frame) ? value(nullptr) : out;
}

// Runs one effect expression against `sink`; locals seed captured timer scope.
inline int32_t execute_effect(const node & effect, const context & ctx, effect_sink & sink,
                              const value * locals, std::string * message_out) noexcept {
  eval_frame frame;
  frame.ctx = &ctx;
  frame.sink = &sink;
  try {
    restore_locals(frame, locals);
    eval(frame, effect);
  } catch (const std::exception & ex) {
    fault(frame, ex.what());
  }
  if (message_out != nullptr && failed(frame)) {
    *message_out = frame.error_message;
  }
  return frame.error;
}

}  // namespace behave::expr
