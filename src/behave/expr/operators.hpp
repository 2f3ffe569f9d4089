#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>

#include "behave/behave.h"
#include "behave/expr/ast.hpp"
#include "behave/expr/value.hpp"

namespace behave::expr {

struct eval_frame;

enum class operator_kind : uint8_t {
  special_form,
  pure,
  effect,
};

enum class timer_kind : uint8_t {
  delay,
  interval,
  debounce,
};

// Upper bound for timer delays and tick intervals (one year).
inline constexpr int64_t k_max_timer_delay_ms = int64_t{365} * 24 * 60 * 60 * 1000;

// Arguments evaluated left to right before the call.
using eager_fn = value (*)(eval_frame & frame, const value * args, size_t count);
// Receives the unevaluated call and controls evaluation itself.
using form_fn = value (*)(eval_frame & frame, const call & expr);

struct operator_meta {
  std::string name;
  int32_t min_arity = 0;
  int32_t max_arity = -1;
  operator_kind kind = operator_kind::pure;
  bool accepts_lambda = false;
  eager_fn eager = nullptr;
  form_fn form = nullptr;

  bool pure() const noexcept { return kind != operator_kind::effect; }
  bool variadic() const noexcept { return max_arity < 0; }
};

/**
 * operator lookup table.
 *
 * parsed trees hold `const operator_meta *` into the table, so a table must
 * outlive every tree parsed against it. element addresses are stable across
 * inserts.
 */
class operator_table {
 public:
  int32_t add(operator_meta meta) {
    if (meta.name.empty() || (meta.eager == nullptr && meta.form == nullptr)) {
      return BEHAVE_ERR_INVALID_ARGUMENT;
    }
    if (!meta.variadic() && meta.max_arity < meta.min_arity) {
      return BEHAVE_ERR_INVALID_ARGUMENT;
    }
    std::string key = meta.name;
    const auto inserted = entries_.emplace(std::move(key), std::move(meta));
    return inserted.second ? BEHAVE_OK : BEHAVE_ERR_DUPLICATE;
  }

  const operator_meta * find(const std::string & name) const noexcept {
    const auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
  }

  bool contains(const std::string & name) const noexcept { return find(name) != nullptr; }

  size_t size() const noexcept { return entries_.size(); }

  template <class Fn>
  void for_each(Fn && fn) const {
    for (const auto & entry : entries_) {
      fn(entry.second);
    }
  }

 private:
  std::unordered_map<std::string, operator_meta> entries_;
};

/**
 * host side of effect operators.
 *
 * the evaluator never mutates state itself; every effect operator resolves
 * its arguments and forwards them here. values passed in are already
 * sanitized (no undefined sentinel). a non-OK return aborts the effect list.
 */
class effect_sink {
 public:
  virtual ~effect_sink() = default;

  virtual int32_t set(const context_ref & target, value v, std::string & message) = 0;
  virtual int32_t emit(const std::string & event_key, value payload) = 0;
  virtual int32_t render(const std::string & slot, const std::string & component,
                         value props) = 0;
  virtual int32_t persist(behave_persist_op op, const std::string & entity, value payload) = 0;
  virtual int32_t notify(behave_notify_kind kind, const std::string & message,
                         value action) = 0;
  virtual int32_t navigate(const std::string & path, value params) = 0;
  // `locals` and `payload` are captured so the effect replays with the same bindings.
  virtual int32_t schedule(timer_kind kind, int64_t delay_ms, const node * effect,
                           value locals, value payload) = 0;
};

}  // namespace behave::expr
