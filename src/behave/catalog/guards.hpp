#pragma once

#include "behave/catalog/context.hpp"
#include "behave/catalog/events.hpp"

namespace behave::catalog::guard {

inline constexpr auto valid_load = [](const event::load & ev) noexcept {
  return ev.document != nullptr && ev.operators != nullptr && ev.builder != nullptr;
};

inline constexpr auto invalid_load = [](const event::load & ev) noexcept {
  return !valid_load(ev);
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

struct has_entry_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.entries != nullptr && ctx.entry_index < ctx.entries->size();
  }
};

struct no_entry_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.entries == nullptr || ctx.entry_index >= ctx.entries->size();
  }
};

}  // namespace behave::catalog::guard
