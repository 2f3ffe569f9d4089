#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/expr/operators.hpp"
#include "behave/expr/parser.hpp"
#include "behave/expr/value.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::schema {

namespace detail {

using expr::value;

// Whole numbers only; integral floats such as 500.0 are accepted.
inline bool read_whole_number(const value & v, const int64_t lo, const int64_t hi,
                              int64_t & out) noexcept {
  if (v.is_number_unsigned()) {
    const uint64_t u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(hi)) {
      return false;
    }
    out = static_cast<int64_t>(u);
    return out >= lo;
  }
  if (v.is_number_integer()) {
    out = v.get<int64_t>();
    return out >= lo && out <= hi;
  }
  if (v.is_number_float()) {
    const double d = v.get<double>();
    if (!std::isfinite(d) || d != std::floor(d) || d < static_cast<double>(lo) ||
        d > static_cast<double>(hi)) {
      return false;
    }
    out = static_cast<int64_t>(d);
    return true;
  }
  return false;
}

struct decoder {
  const expr::operator_table & ops;
  std::vector<std::string> & errors;

  void error(std::string message) { errors.push_back(std::move(message)); }

  bool read_string(const value & obj, const char * key, std::string & out,
                   const std::string & where) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
      return false;
    }
    if (!it->is_string()) {
      error(where + " field '" + key + "' must be a string");
      return false;
    }
    out = it->get<std::string>();
    return true;
  }

  bool read_bool(const value & obj, const char * key, const std::string & where) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
      return false;
    }
    if (!it->is_boolean()) {
      error(where + " field '" + key + "' must be a boolean");
      return false;
    }
    return it->get<bool>();
  }

  // Returns the array under `key`, or nullptr when absent; a non-array is an error.
  const value * read_array(const value & obj, const char * key, const std::string & where) {
    const auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
      return nullptr;
    }
    if (!it->is_array()) {
      error(where + " field '" + key + "' must be a list");
      return nullptr;
    }
    return &*it;
  }

  void read_string_list(const value & obj, const char * key, std::vector<std::string> & out,
                        const std::string & where) {
    const value * list = read_array(obj, key, where);
    if (list == nullptr) {
      return;
    }
    for (const value & item : *list) {
      if (!item.is_string()) {
        error(where + " field '" + key + "' must contain only strings");
        continue;
      }
      out.push_back(item.get<std::string>());
    }
  }

  bool parse_expr(const value & src, expr::node & out, const std::string & where) {
    std::vector<std::string> local_errors;
    const int32_t err = expr::parse_expression(src, ops, out, local_errors);
    for (std::string & message : local_errors) {
      error(where + ": " + message);
    }
    return err == BEHAVE_OK;
  }

  void parse_effects(const value & obj, const char * key, expr::node_list & out,
                     const std::string & where) {
    const value * list = read_array(obj, key, where);
    if (list == nullptr) {
      return;
    }
    for (size_t i = 0; i < list->size(); ++i) {
      expr::node effect;
      parse_expr((*list)[i], effect, where + " effect " + std::to_string(i));
      out.push_back(std::move(effect));
    }
  }

  void decode_config_field(const value & src, config_field & out, const std::string & where) {
    if (!src.is_object()) {
      error(where + " must be an object");
      return;
    }
    read_string(src, "name", out.name, where);
    read_string(src, "type", out.type, where);
    read_string(src, "description", out.description, where);
    if (out.name.empty()) {
      error(where + " must have a name");
    }
    const auto def_it = src.find("default");
    if (def_it != src.end()) {
      out.default_value = *def_it;
    }
    const value * allowed = read_array(src, "enum", where);
    if (allowed != nullptr) {
      for (const value & option : *allowed) {
        out.allowed.push_back(option);
      }
    }
  }

  void decode_field_list(const value & obj, const char * key, std::vector<config_field> & out,
                         const std::string & where) {
    const value * list = read_array(obj, key, where);
    if (list == nullptr) {
      return;
    }
    for (size_t i = 0; i < list->size(); ++i) {
      config_field field;
      decode_config_field((*list)[i], field, where + " " + key + "[" + std::to_string(i) + "]");
      out.push_back(std::move(field));
    }
  }

  void decode_config(const value & src, config_schema & out) {
    if (!src.is_object()) {
      error("configSchema must be an object");
      return;
    }
    decode_field_list(src, "required", out.required, "configSchema");
    decode_field_list(src, "optional", out.optional, "configSchema");
  }

  void decode_guard(const value & src, const state_machine_spec & sm,
                    std::optional<expr::node> & out, std::string & name_out,
                    const std::string & where) {
    if (src.is_null()) {
      return;
    }
    if (src.is_string() && !expr::detail::is_reference_text(src)) {
      const std::string & name = src.get_ref<const std::string &>();
      for (const named_guard & g : sm.guards) {
        if (g.name == name) {
          out = g.condition;
          name_out = name;
          return;
        }
      }
      error(where + " references unknown guard '" + name + "'");
      return;
    }
    expr::node guard;
    parse_expr(src, guard, where);
    out = std::move(guard);
  }

  void decode_transition(const value & src, const size_t index, state_machine_spec & sm) {
    const std::string where = "Transition " + std::to_string(index);
    if (!src.is_object()) {
      error(where + " must be an object");
      return;
    }
    transition_spec t;
    if (!read_string(src, "event", t.event, where) || t.event.empty()) {
      error(where + " must have an event");
    }
    const auto from_it = src.find("from");
    if (from_it != src.end() && !from_it->is_null()) {
      if (from_it->is_string()) {
        const std::string & from = from_it->get_ref<const std::string &>();
        if (from != k_wildcard_state) {
          t.from = from_kind::single;
          t.from_states.push_back(from);
        }
      } else if (from_it->is_array()) {
        t.from = from_kind::list;
        for (const value & state : *from_it) {
          if (!state.is_string()) {
            error(where + " field 'from' must contain only state names");
            continue;
          }
          if (state.get_ref<const std::string &>() == k_wildcard_state) {
            t.from = from_kind::any;
          }
          t.from_states.push_back(state.get<std::string>());
        }
        if (t.from == from_kind::any) {
          t.from_states.clear();
        }
      } else {
        error(where + " field 'from' must be a state name or a list of state names");
      }
    }
    std::string to;
    if (read_string(src, "to", to, where)) {
      t.to = std::move(to);
    }
    const auto guard_it = src.find("guard");
    if (guard_it != src.end()) {
      decode_guard(*guard_it, sm, t.guard, t.guard_name, where + " guard");
    }
    parse_effects(src, "effects", t.effects, where);
    sm.transitions.push_back(std::move(t));
  }

  void decode_machine(const value & src, state_machine_spec & sm) {
    if (!src.is_object()) {
      error("stateMachine must be an object");
      return;
    }
    read_string(src, "initial", sm.initial, "stateMachine");

    if (const value * states = read_array(src, "states", "stateMachine")) {
      for (const value & item : *states) {
        state_spec s;
        if (item.is_string()) {
          s.name = item.get<std::string>();
        } else if (item.is_object()) {
          read_string(item, "name", s.name, "State");
          s.is_initial = read_bool(item, "isInitial", "State " + s.name);
          s.is_final = read_bool(item, "isFinal", "State " + s.name);
          read_string(item, "description", s.description, "State " + s.name);
        } else {
          error("State entries must be names or objects");
          continue;
        }
        if (s.name.empty()) {
          error("State entries must have a name");
          continue;
        }
        sm.states.push_back(std::move(s));
      }
    }

    if (const value * events = read_array(src, "events", "stateMachine")) {
      for (const value & item : *events) {
        event_spec e;
        if (item.is_string()) {
          e.key = item.get<std::string>();
        } else if (item.is_object()) {
          read_string(item, "key", e.key, "Event");
          read_string(item, "name", e.name, "Event " + e.key);
          read_string(item, "description", e.description, "Event " + e.key);
        } else {
          error("Event entries must be keys or objects");
          continue;
        }
        if (e.key.empty()) {
          error("Event entries must have a key");
          continue;
        }
        sm.events.push_back(std::move(e));
      }
    }

    if (const value * guards = read_array(src, "guards", "stateMachine")) {
      for (const value & item : *guards) {
        named_guard g;
        if (!item.is_object() || !read_string(item, "name", g.name, "Guard") ||
            item.find("condition") == item.end()) {
          error("Named guards must have a name and a condition");
          continue;
        }
        read_string(item, "description", g.description, "Guard " + g.name);
        parse_expr(item["condition"], g.condition, "Guard " + g.name);
        sm.guards.push_back(std::move(g));
      }
    }

    if (const value * transitions = read_array(src, "transitions", "stateMachine")) {
      for (size_t i = 0; i < transitions->size(); ++i) {
        decode_transition((*transitions)[i], i, sm);
      }
    }
  }

  void decode_entity(const value & src, data_entity & out, const size_t index) {
    const std::string where = "Data entity " + std::to_string(index);
    if (!src.is_object()) {
      error(where + " must be an object");
      return;
    }
    if (!read_string(src, "name", out.name, where) || out.name.empty()) {
      error(where + " must have a name");
    }
    out.runtime = read_bool(src, "runtime", where);
    out.singleton = read_bool(src, "singleton", where);
    const value * fields = read_array(src, "fields", where);
    if (fields == nullptr) {
      return;
    }
    for (const value & item : *fields) {
      entity_field f;
      if (!item.is_object() || !read_string(item, "name", f.name, where) || f.name.empty()) {
        error(where + " fields must be objects with a name");
        continue;
      }
      read_string(item, "type", f.type, where + " field " + f.name);
      f.required = read_bool(item, "required", where + " field " + f.name);
      const auto def_it = item.find("default");
      f.default_value = def_it != item.end() ? *def_it : value(nullptr);
      out.fields.push_back(std::move(f));
    }
  }

  void decode_tick(const value & src, tick_spec & out, const size_t index,
                   const state_machine_spec & sm) {
    const std::string where = "Tick " + std::to_string(index);
    if (!src.is_object()) {
      error(where + " must be an object");
      return;
    }
    read_string(src, "name", out.name, where);
    const auto interval_it = src.find("interval");
    const bool every_frame = interval_it != src.end() && interval_it->is_string() &&
                             interval_it->get_ref<const std::string &>() == "frame";
    if (every_frame) {
      out.every_frame = true;
    } else if (interval_it == src.end() ||
               !read_whole_number(*interval_it, 1, expr::k_max_timer_delay_ms, out.interval_ms)) {
      error(where + " interval must be 'frame' or a whole number of milliseconds between 1 and " +
            std::to_string(expr::k_max_timer_delay_ms));
    }
    const auto priority_it = src.find("priority");
    if (priority_it != src.end() && !priority_it->is_null()) {
      int64_t priority = 0;
      if (read_whole_number(*priority_it, std::numeric_limits<int32_t>::min(),
                            std::numeric_limits<int32_t>::max(), priority)) {
        out.priority = static_cast<int32_t>(priority);
      } else {
        error(where + " priority must be a whole number");
      }
    }
    const auto guard_it = src.find("guard");
    if (guard_it != src.end()) {
      decode_guard(*guard_it, sm, out.guard, out.guard_name, where + " guard");
    }
    parse_effects(src, "effects", out.effects, where);
  }

  void decode_listener(const value & src, listener_spec & out, const size_t index,
                       const state_machine_spec & sm) {
    const std::string where = "Listener " + std::to_string(index);
    if (!src.is_object()) {
      error(where + " must be an object");
      return;
    }
    if (!read_string(src, "event", out.event, where) || out.event.empty()) {
      error(where + " must name the event it listens for");
    }
    if (!read_string(src, "triggers", out.triggers, where) || out.triggers.empty()) {
      error(where + " must name the event it triggers");
    }
    const auto guard_it = src.find("guard");
    if (guard_it != src.end()) {
      decode_guard(*guard_it, sm, out.guard, out.guard_name, where + " guard");
    }
  }

  void decode(const value & doc, behavior_definition & def) {
    if (!doc.is_object()) {
      error("Behavior entry must be an object");
      return;
    }
    read_string(doc, "name", def.name, "Behavior");
    read_string(doc, "category", def.raw_category, "Behavior");
    parse_category(def.raw_category, def.kind);
    read_string(doc, "description", def.description, "Behavior");
    read_string_list(doc, "suggestedFor", def.suggested_for, "Behavior");
    decode_field_list(doc, "requiredFields", def.required_fields, "Behavior");

    const auto config_it = doc.find("configSchema");
    if (config_it != doc.end() && !config_it->is_null()) {
      decode_config(*config_it, def.config);
    }

    const auto sm_it = doc.find("stateMachine");
    if (sm_it != doc.end() && !sm_it->is_null()) {
      def.machine.emplace();
      decode_machine(*sm_it, *def.machine);
    }
    static const state_machine_spec k_no_machine{};
    const state_machine_spec & sm = def.machine ? *def.machine : k_no_machine;

    if (const value * entities = read_array(doc, "dataEntities", "Behavior")) {
      for (size_t i = 0; i < entities->size(); ++i) {
        data_entity entity;
        decode_entity((*entities)[i], entity, i);
        def.data_entities.push_back(std::move(entity));
      }
    }
    if (const value * ticks = read_array(doc, "ticks", "Behavior")) {
      for (size_t i = 0; i < ticks->size(); ++i) {
        tick_spec tick;
        decode_tick((*ticks)[i], tick, i, sm);
        def.ticks.push_back(std::move(tick));
      }
    }
    if (const value * listens = read_array(doc, "listens", "Behavior")) {
      for (size_t i = 0; i < listens->size(); ++i) {
        listener_spec listener;
        decode_listener((*listens)[i], listener, i, sm);
        def.listens.push_back(std::move(listener));
      }
    }
    parse_effects(doc, "initialEffects", def.initial_effects, "Initial");
  }
};

}  // namespace detail

/**
 * decodes one catalog entry into a definition.
 *
 * decoding is not fail-fast: every malformed field appends a message and the
 * rest of the entry is still read. returns BEHAVE_ERR_STRUCTURE when any
 * message was produced.
 */
inline int32_t decode_behavior(const expr::value & doc, const expr::operator_table & ops,
                               behavior_definition & out,
                               std::vector<std::string> & errors) noexcept {
  const size_t before = errors.size();
  try {
    detail::decoder d{ops, errors};
    d.decode(doc, out);
  } catch (const std::exception & ex) {
    errors.push_back(std::string("Malformed behavior entry: ") + ex.what());
    return BEHAVE_ERR_PARSE_FAILED;
  }
  return errors.size() == before ? BEHAVE_OK : BEHAVE_ERR_STRUCTURE;
}

}  // namespace behave::schema
