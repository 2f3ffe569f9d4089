#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#include "behave/behave.h"
#include "behave/callback.hpp"
#include "behave/dispatcher/events.hpp"
#include "behave/expr/ast.hpp"
#include "behave/expr/value.hpp"

namespace behave::dispatcher::action {

inline constexpr size_t k_max_cascade = 256;

struct pending_event {
  std::string key;
  expr::value payload;
};

struct context {
  int32_t phase_error = BEHAVE_OK;
  int32_t last_error = BEHAVE_OK;
  std::string error_message = {};

  target * tgt = nullptr;
  dispatch_report * report_out = nullptr;
  int32_t * error_out = nullptr;
  callback<bool(const events::dispatch_done &)> on_done = {};
  callback<bool(const events::dispatch_error &)> on_error = {};

  std::deque<pending_event> queue = {};
  size_t dispatches = 0;

  // Effect list being applied and the bindings it sees.
  const expr::node * effects = nullptr;
  size_t effect_count = 0;
  size_t effect_index = 0;
  expr::value payload = {};
  const expr::value * locals = nullptr;

  size_t transitions = 0;
  size_t misses = 0;
  size_t effects_run = 0;
};

}  // namespace behave::dispatcher::action
