#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "behave/expr/ast.hpp"
#include "behave/expr/value.hpp"

namespace behave::schema {

enum class category : uint8_t {
  ui_interaction,
  data_management,
  async,
  feedback,
  game_core,
  game_entity,
  game_ui,
};

inline constexpr size_t k_category_count = 7;

inline constexpr std::array<std::string_view, k_category_count> k_category_names = {
  "ui-interaction", "data-management", "async", "feedback",
  "game-core",      "game-entity",     "game-ui",
};

inline std::string_view category_name(const category c) noexcept {
  return k_category_names[static_cast<size_t>(c)];
}

inline bool parse_category(std::string_view text, category & out) noexcept {
  for (size_t i = 0; i < k_category_names.size(); ++i) {
    if (k_category_names[i] == text) {
      out = static_cast<category>(i);
      return true;
    }
  }
  return false;
}

inline bool is_game_category(const category c) noexcept {
  return c == category::game_core || c == category::game_entity || c == category::game_ui;
}

inline constexpr std::string_view k_name_prefix = "std/";
inline constexpr std::string_view k_wildcard_state = "*";

struct config_field {
  std::string name;
  std::string type;
  std::string description;
  std::optional<expr::value> default_value;
  std::vector<expr::value> allowed;
};

struct config_schema {
  std::vector<config_field> required;
  std::vector<config_field> optional;
};

struct state_spec {
  std::string name;
  bool is_initial = false;
  bool is_final = false;
  std::string description;
};

struct event_spec {
  std::string key;
  std::string name;
  std::string description;
};

enum class from_kind : uint8_t {
  any,
  single,
  list,
};

struct transition_spec {
  from_kind from = from_kind::any;
  std::vector<std::string> from_states;
  std::optional<std::string> to;
  std::string event;
  std::optional<expr::node> guard;
  // set when `guard` is a copy of a named guard
  std::string guard_name;
  expr::node_list effects;

  bool matches_state(std::string_view state) const noexcept {
    if (from == from_kind::any) {
      return true;
    }
    for (const std::string & name : from_states) {
      if (name == state) {
        return true;
      }
    }
    return false;
  }
};

// Reusable condition a transition can name instead of inlining it.
struct named_guard {
  std::string name;
  expr::node condition;
  std::string description;
};

struct state_machine_spec {
  std::string initial;
  std::vector<state_spec> states;
  std::vector<event_spec> events;
  std::vector<transition_spec> transitions;
  std::vector<named_guard> guards;

  bool has_state(std::string_view name) const noexcept {
    for (const state_spec & s : states) {
      if (s.name == name) {
        return true;
      }
    }
    return false;
  }

  bool has_event(std::string_view key) const noexcept {
    for (const event_spec & e : events) {
      if (e.key == key) {
        return true;
      }
    }
    return false;
  }
};

struct entity_field {
  std::string name;
  std::string type;
  expr::value default_value;
  bool required = false;
};

struct data_entity {
  std::string name;
  bool runtime = false;
  bool singleton = false;
  std::vector<entity_field> fields;
};

struct tick_spec {
  std::string name;
  bool every_frame = false;
  int64_t interval_ms = 0;
  int32_t priority = 0;
  std::optional<expr::node> guard;
  std::string guard_name;
  expr::node_list effects;
};

struct listener_spec {
  std::string event;
  std::string triggers;
  std::optional<expr::node> guard;
  std::string guard_name;
};

struct behavior_definition {
  std::string name;
  category kind = category::ui_interaction;
  std::string raw_category;
  std::string description;
  std::vector<std::string> suggested_for;
  std::vector<config_field> required_fields;
  config_schema config;
  std::optional<state_machine_spec> machine;
  std::vector<data_entity> data_entities;
  std::vector<tick_spec> ticks;
  std::vector<listener_spec> listens;
  expr::node_list initial_effects;
};

// Summary row used by listings and tooling.
struct behavior_metadata {
  std::string name;
  category kind = category::ui_interaction;
  std::string description;
  std::vector<std::string> suggested_for;
  std::vector<std::string> states;
  std::vector<std::string> events;
  size_t tick_count = 0;
  size_t transition_count = 0;
  bool has_data_entities = false;
};

inline behavior_metadata metadata_of(const behavior_definition & def) {
  behavior_metadata out;
  out.name = def.name;
  out.kind = def.kind;
  out.description = def.description;
  out.suggested_for = def.suggested_for;
  if (def.machine) {
    for (const state_spec & s : def.machine->states) {
      out.states.push_back(s.name);
    }
    for (const event_spec & e : def.machine->events) {
      out.events.push_back(e.key);
    }
    out.transition_count = def.machine->transitions.size();
  }
  out.tick_count = def.ticks.size();
  out.has_data_entities = !def.data_entities.empty();
  return out;
}

}  // namespace behave::schema
