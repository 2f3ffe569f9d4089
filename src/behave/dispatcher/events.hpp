#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "behave/callback.hpp"
#include "behave/expr/ast.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::dispatcher {

/**
 * mutable view of one behavior instance for the duration of a request.
 *
 * `host` receives render, persist, notify, navigate and timer effects; when
 * it is null those effects are accepted and dropped. `set` and `emit` are
 * handled by the dispatcher itself.
 */
struct target {
  const schema::behavior_definition * behavior = nullptr;
  std::string * state = nullptr;
  expr::value * entity = nullptr;
  const expr::value * config = nullptr;
  expr::effect_sink * host = nullptr;
  int64_t now_ms = 0;
};

struct emitted_event {
  std::string key;
  expr::value payload;
};

// One processed event of a cascade, matched or not.
struct step_record {
  std::string event;
  std::string from;
  std::string to;
  bool matched = false;
  size_t transition_index = 0;
};

struct dispatch_report {
  std::vector<step_record> steps;
  std::vector<emitted_event> emitted;
  size_t transitions = 0;
  size_t misses = 0;
  size_t effects = 0;
  std::string error_message;
};

}  // namespace behave::dispatcher

namespace behave::dispatcher::events {

struct dispatch_done;
struct dispatch_error;

}  // namespace behave::dispatcher::events

namespace behave::dispatcher::event {

// Delivers one event to the target and drains everything it emits.
struct dispatch {
  target * tgt = nullptr;
  std::string_view event_key = {};
  const expr::value * payload = nullptr;
  dispatch_report * report_out = nullptr;
  int32_t * error_out = nullptr;
  ::behave::callback<bool(const ::behave::dispatcher::events::dispatch_done &)> dispatch_done = {};
  ::behave::callback<bool(const ::behave::dispatcher::events::dispatch_error &)> dispatch_error = {};
};

// Runs an effect list outside a transition (initial effects, ticks, fired timers).
struct run_effects {
  target * tgt = nullptr;
  const expr::node * effects = nullptr;
  size_t effect_count = 0;
  const expr::value * payload = nullptr;
  const expr::value * locals = nullptr;
  dispatch_report * report_out = nullptr;
  int32_t * error_out = nullptr;
  ::behave::callback<bool(const ::behave::dispatcher::events::dispatch_done &)> dispatch_done = {};
  ::behave::callback<bool(const ::behave::dispatcher::events::dispatch_error &)> dispatch_error = {};
};

}  // namespace behave::dispatcher::event

namespace behave::dispatcher::events {

struct dispatch_done {
  const target * tgt = nullptr;
  size_t transitions = 0;
  size_t misses = 0;
  size_t effects = 0;
};

struct dispatch_error {
  const target * tgt = nullptr;
  int32_t err = 0;
  std::string_view message = {};
};

}  // namespace behave::dispatcher::events
