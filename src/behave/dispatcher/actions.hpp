#pragma once

#include <exception>
#include <string>
#include <utility>

#include "behave/behave.h"
#include "behave/dispatcher/context.hpp"
#include "behave/dispatcher/detail.hpp"
#include "behave/dispatcher/events.hpp"

namespace behave::dispatcher::action {

namespace detail {

template <class Request>
void begin_request(const Request & ev, context & ctx) {
  ctx.phase_error = BEHAVE_OK;
  ctx.last_error = BEHAVE_OK;
  ctx.error_message.clear();
  ctx.tgt = ev.tgt;
  ctx.report_out = ev.report_out;
  ctx.error_out = ev.error_out;
  ctx.on_done = ev.dispatch_done;
  ctx.on_error = ev.dispatch_error;
  ctx.queue.clear();
  ctx.dispatches = 0;
  ctx.effects = nullptr;
  ctx.effect_count = 0;
  ctx.effect_index = 0;
  ctx.payload = expr::value::object();
  ctx.locals = nullptr;
  ctx.transitions = 0;
  ctx.misses = 0;
  ctx.effects_run = 0;
  if (ev.report_out != nullptr) {
    *ev.report_out = dispatch_report{};
  }
}

template <class Request>
void reject_request(const Request & ev, context & ctx) {
  ctx.phase_error = BEHAVE_ERR_INVALID_ARGUMENT;
  ctx.last_error = BEHAVE_ERR_INVALID_ARGUMENT;
  if (ev.error_out != nullptr) {
    *ev.error_out = BEHAVE_ERR_INVALID_ARGUMENT;
  }
  if (ev.dispatch_error) {
    ev.dispatch_error(events::dispatch_error{ev.tgt, BEHAVE_ERR_INVALID_ARGUMENT, {}});
  }
}

inline expr::value payload_or_empty(const expr::value * payload) {
  return payload != nullptr && !expr::is_nullish(*payload) ? expr::sanitize(*payload)
                                                           : expr::value::object();
}

}  // namespace detail

struct reject_invalid_dispatch {
  void operator()(const event::dispatch & ev, context & ctx) const noexcept {
    detail::reject_request(ev, ctx);
  }
};

struct reject_invalid_run_effects {
  void operator()(const event::run_effects & ev, context & ctx) const noexcept {
    detail::reject_request(ev, ctx);
  }
};

struct begin_dispatch {
  void operator()(const event::dispatch & ev, context & ctx) const noexcept {
    try {
      detail::begin_request(ev, ctx);
      ctx.queue.push_back({std::string(ev.event_key), detail::payload_or_empty(ev.payload)});
    } catch (const std::exception & ex) {
      detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT, ex.what());
    }
  }
};

struct begin_run_effects {
  void operator()(const event::run_effects & ev, context & ctx) const noexcept {
    try {
      detail::begin_request(ev, ctx);
      ctx.effects = ev.effects;
      ctx.effect_count = ev.effect_count;
      ctx.payload = detail::payload_or_empty(ev.payload);
      ctx.locals = ev.locals;
    } catch (const std::exception & ex) {
      detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT, ex.what());
    }
  }
};

/**
 * pops the next queued event and resolves its transition.
 *
 * a miss is recorded and leaves no effect work. a hit moves the target to
 * `to` (when set) before its effects run.
 */
struct select_next_event {
  void operator()(context & ctx) const noexcept {
    if (ctx.phase_error != BEHAVE_OK || ctx.queue.empty()) {
      return;
    }
    try {
      if (ctx.dispatches >= k_max_cascade) {
        detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT,
                          "Emit cascade exceeded " + std::to_string(k_max_cascade) +
                              " dispatches");
        ctx.queue.clear();
        return;
      }
      ctx.dispatches += 1;
      pending_event next = std::move(ctx.queue.front());
      ctx.queue.pop_front();
      ctx.payload = std::move(next.payload);
      ctx.locals = nullptr;
      ctx.effects = nullptr;
      ctx.effect_count = 0;
      ctx.effect_index = 0;

      step_record step;
      step.event = next.key;
      step.from = *ctx.tgt->state;
      size_t index = 0;
      const schema::transition_spec * t = detail::select_transition(ctx, next.key, index);
      if (ctx.phase_error != BEHAVE_OK) {
        return;
      }
      if (t == nullptr) {
        ctx.misses += 1;
        step.to = step.from;
        detail::record_step(ctx, std::move(step));
        return;
      }
      ctx.transitions += 1;
      if (t->to) {
        *ctx.tgt->state = *t->to;
      }
      step.to = *ctx.tgt->state;
      step.matched = true;
      step.transition_index = index;
      detail::record_step(ctx, std::move(step));
      ctx.effects = t->effects.data();
      ctx.effect_count = t->effects.size();
    } catch (const std::exception & ex) {
      detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT, ex.what());
    }
  }
};

struct apply_next_effect {
  void operator()(context & ctx) const noexcept {
    if (ctx.phase_error != BEHAVE_OK || ctx.effects == nullptr ||
        ctx.effect_index >= ctx.effect_count) {
      return;
    }
    const expr::node & effect = ctx.effects[ctx.effect_index];
    ctx.effect_index += 1;
    try {
      detail::effect_router router{ctx};
      std::string message;
      const int32_t err =
          expr::execute_effect(effect, detail::eval_context(ctx), router, ctx.locals, &message);
      ctx.effects_run += 1;
      if (err != BEHAVE_OK) {
        detail::set_error(ctx, err, std::move(message));
        ctx.queue.clear();
      }
    } catch (const std::exception & ex) {
      detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT, ex.what());
    }
  }
};

struct finalize_done {
  void operator()(context & ctx) const noexcept {
    if (ctx.report_out != nullptr) {
      ctx.report_out->transitions = ctx.transitions;
      ctx.report_out->misses = ctx.misses;
      ctx.report_out->effects = ctx.effects_run;
    }
    if (ctx.error_out != nullptr) {
      *ctx.error_out = BEHAVE_OK;
    }
    if (ctx.on_done) {
      ctx.on_done(events::dispatch_done{ctx.tgt, ctx.transitions, ctx.misses, ctx.effects_run});
    }
  }
};

struct finalize_error {
  void operator()(context & ctx) const noexcept {
    ctx.queue.clear();
    ctx.effects = nullptr;
    if (ctx.report_out != nullptr) {
      ctx.report_out->transitions = ctx.transitions;
      ctx.report_out->misses = ctx.misses;
      ctx.report_out->effects = ctx.effects_run;
      ctx.report_out->error_message = ctx.error_message;
    }
    if (ctx.error_out != nullptr) {
      *ctx.error_out = ctx.phase_error;
    }
    if (ctx.on_error) {
      ctx.on_error(events::dispatch_error{ctx.tgt, ctx.phase_error, ctx.error_message});
    }
  }
};

struct on_unexpected {
  template <class event>
  void operator()(const event &, context & ctx) const noexcept {
    ctx.phase_error = BEHAVE_ERR_ENGINE_FAULT;
    ctx.last_error = BEHAVE_ERR_ENGINE_FAULT;
  }
};

inline constexpr reject_invalid_dispatch reject_invalid_dispatch{};
inline constexpr reject_invalid_run_effects reject_invalid_run_effects{};
inline constexpr begin_dispatch begin_dispatch{};
inline constexpr begin_run_effects begin_run_effects{};
inline constexpr select_next_event select_next_event{};
inline constexpr apply_next_effect apply_next_effect{};
inline constexpr finalize_done finalize_done{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace behave::dispatcher::action
