#pragma once

#include "behave/dispatcher/context.hpp"
#include "behave/dispatcher/events.hpp"

namespace behave::dispatcher::guard {

inline bool valid_target(const target * tgt) noexcept {
  return tgt != nullptr && tgt->behavior != nullptr && tgt->state != nullptr &&
         tgt->entity != nullptr;
}

inline constexpr auto valid_dispatch = [](const event::dispatch & ev) noexcept {
  return valid_target(ev.tgt) && !ev.event_key.empty();
};

inline constexpr auto invalid_dispatch = [](const event::dispatch & ev) noexcept {
  return !valid_dispatch(ev);
};

inline constexpr auto valid_run_effects = [](const event::run_effects & ev) noexcept {
  return valid_target(ev.tgt) && (ev.effects != nullptr || ev.effect_count == 0);
};

inline constexpr auto invalid_run_effects = [](const event::run_effects & ev) noexcept {
  return !valid_run_effects(ev);
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == BEHAVE_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != BEHAVE_OK;
  }
};

struct has_pending_event {
  bool operator()(const action::context & ctx) const noexcept { return !ctx.queue.empty(); }
};

struct no_pending_event {
  bool operator()(const action::context & ctx) const noexcept { return ctx.queue.empty(); }
};

struct has_effect_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.effects != nullptr && ctx.effect_index < ctx.effect_count;
  }
};

struct no_effect_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.effects == nullptr || ctx.effect_index >= ctx.effect_count;
  }
};

}  // namespace behave::dispatcher::guard
