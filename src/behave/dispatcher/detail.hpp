#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/dispatcher/context.hpp"
#include "behave/expr/evaluator.hpp"
#include "behave/expr/operators.hpp"

namespace behave::dispatcher::action::detail {

inline void set_error(context & ctx, const int32_t err, std::string message) {
  if (ctx.phase_error != BEHAVE_OK) {
    return;
  }
  ctx.phase_error = err;
  ctx.last_error = err;
  ctx.error_message = std::move(message);
}

inline expr::context eval_context(const context & ctx) noexcept {
  expr::context out;
  out.entity = ctx.tgt->entity;
  out.config = ctx.tgt->config;
  out.payload = &ctx.payload;
  out.now_ms = ctx.tgt->now_ms;
  out.state = *ctx.tgt->state;
  return out;
}

// Writes `v` at `path` below `root`, creating objects for null links.
inline int32_t write_path(expr::value & root, const std::vector<std::string> & path,
                          expr::value v, const std::string & text, std::string & message) {
  expr::value * cur = &root;
  for (const std::string & segment : path) {
    if (cur->is_null()) {
      *cur = expr::value::object();
    }
    if (cur->is_object()) {
      cur = &(*cur)[segment];
      continue;
    }
    size_t index = 0;
    if (cur->is_array() && expr::parse_index(segment, index) && index < cur->size()) {
      cur = &(*cur)[index];
      continue;
    }
    message = "Cannot set " + text + ": '" + segment + "' is not reachable";
    return BEHAVE_ERR_ENGINE_FAULT;
  }
  *cur = std::move(v);
  return BEHAVE_OK;
}

/**
 * effect sink seen by the evaluator during dispatch.
 *
 * `set` writes the target entity and `emit` appends to the cascade queue;
 * the remaining effects go to the target host.
 */
struct effect_router final : public expr::effect_sink {
  context & ctx;

  explicit effect_router(context & c) noexcept : ctx(c) {}

  int32_t set(const expr::context_ref & ref, expr::value v, std::string & message) override {
    if (ref.root != expr::ref_root::entity) {
      message = "Cannot set " + ref.text + ": only @entity fields are writable";
      return BEHAVE_ERR_ENGINE_FAULT;
    }
    return write_path(*ctx.tgt->entity, ref.path, std::move(v), ref.text, message);
  }

  int32_t emit(const std::string & event_key, expr::value payload) override {
    if (ctx.report_out != nullptr) {
      ctx.report_out->emitted.push_back({event_key, payload});
    }
    ctx.queue.push_back({event_key, std::move(payload)});
    return BEHAVE_OK;
  }

  int32_t render(const std::string & slot, const std::string & component,
                 expr::value props) override {
    expr::effect_sink * host = ctx.tgt->host;
    return host == nullptr ? BEHAVE_OK : host->render(slot, component, std::move(props));
  }

  int32_t persist(const behave_persist_op op, const std::string & entity,
                  expr::value payload) override {
    expr::effect_sink * host = ctx.tgt->host;
    return host == nullptr ? BEHAVE_OK : host->persist(op, entity, std::move(payload));
  }

  int32_t notify(const behave_notify_kind kind, const std::string & message,
                 expr::value action) override {
    expr::effect_sink * host = ctx.tgt->host;
    return host == nullptr ? BEHAVE_OK : host->notify(kind, message, std::move(action));
  }

  int32_t navigate(const std::string & path, expr::value params) override {
    expr::effect_sink * host = ctx.tgt->host;
    return host == nullptr ? BEHAVE_OK : host->navigate(path, std::move(params));
  }

  int32_t schedule(const expr::timer_kind kind, const int64_t delay_ms, const expr::node * effect,
                   expr::value locals, expr::value payload) override {
    expr::effect_sink * host = ctx.tgt->host;
    return host == nullptr ? BEHAVE_OK
                           : host->schedule(kind, delay_ms, effect, std::move(locals),
                                            std::move(payload));
  }
};

inline void record_step(context & ctx, step_record step) {
  if (ctx.report_out != nullptr) {
    ctx.report_out->steps.push_back(std::move(step));
  }
}

/**
 * resolves the transition for `event_key` against the current state.
 *
 * candidates are visited in declaration order and the first whose guard
 * holds wins. returns nullptr on a miss or when a guard faults.
 */
inline const schema::transition_spec * select_transition(context & ctx,
                                                         const std::string & event_key,
                                                         size_t & index_out) {
  const schema::behavior_definition & def = *ctx.tgt->behavior;
  if (!def.machine) {
    return nullptr;
  }
  const expr::context eval_ctx = eval_context(ctx);
  const std::vector<schema::transition_spec> & transitions = def.machine->transitions;
  for (size_t i = 0; i < transitions.size(); ++i) {
    const schema::transition_spec & t = transitions[i];
    if (t.event != event_key || !t.matches_state(*ctx.tgt->state)) {
      continue;
    }
    bool satisfied = true;
    if (t.guard) {
      int32_t err = BEHAVE_OK;
      std::string message;
      satisfied = expr::evaluate_guard(*t.guard, eval_ctx, &err, &message);
      if (err != BEHAVE_OK) {
        set_error(ctx, err, "Guard of transition " + std::to_string(i) + " (" + event_key +
                                ") failed: " + message);
        return nullptr;
      }
    }
    if (satisfied) {
      index_out = i;
      return &t;
    }
  }
  return nullptr;
}

}  // namespace behave::dispatcher::action::detail
