#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "behave/behave.h"
#include "behave/expr/stdlib.hpp"
#include "behave/schema/behavior.hpp"
#include "behave/schema/decode.hpp"
#include "behave/schema/validate.hpp"

namespace {

using behave::expr::value;
using behave::schema::behavior_definition;

int32_t decode_text(const char * text, behavior_definition & def,
                    std::vector<std::string> & errors) {
  return behave::schema::decode_behavior(value::parse(text), behave::expr::standard_operators(),
                                         def, errors);
}

bool contains(const std::vector<std::string> & messages, const std::string & needle) {
  for (const std::string & message : messages) {
    if (message == needle) {
      return true;
    }
  }
  return false;
}

constexpr const char * k_door = R"({
  "name": "std/Door",
  "category": "ui-interaction",
  "description": "Door that opens and locks",
  "suggestedFor": ["Gates"],
  "stateMachine": {
    "initial": "Closed",
    "states": ["Closed", {"name": "Open"}, {"name": "Locked", "isFinal": true}],
    "events": ["OPEN", {"key": "CLOSE", "name": "Close"}, "LOCK", "KNOCK"],
    "guards": [{"name": "hasKey", "condition": ["=", "@payload.key", "@config.key"]}],
    "transitions": [
      {"from": "Closed", "to": "Open", "event": "OPEN"},
      {"from": ["Open"], "to": "Closed", "event": "CLOSE"},
      {"from": "Closed", "to": "Locked", "event": "LOCK", "guard": "hasKey"},
      {"from": "*", "event": "KNOCK", "effects": [["notify", "info", "knock"]]},
      {"event": "KNOCK"}
    ]
  },
  "ticks": [{"name": "Creak", "interval": 500, "priority": 2, "effects": []}],
  "listens": [{"event": "ALARM", "triggers": "LOCK"}]
})";

}  // namespace

TEST_CASE("schema_decode_reads_complete_definition") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text(k_door, def, errors) == BEHAVE_OK);
  CHECK(errors.empty());

  CHECK(def.name == "std/Door");
  CHECK(def.kind == behave::schema::category::ui_interaction);
  CHECK(def.suggested_for.size() == 1);
  REQUIRE(def.machine.has_value());
  CHECK(def.machine->initial == "Closed");
  CHECK(def.machine->states.size() == 3);
  CHECK(def.machine->states[2].is_final);
  CHECK(def.machine->has_event("CLOSE"));
  CHECK(def.machine->events[1].name == "Close");
  REQUIRE(def.machine->transitions.size() == 5);

  const auto & transitions = def.machine->transitions;
  CHECK(transitions[0].from == behave::schema::from_kind::single);
  CHECK(transitions[1].from == behave::schema::from_kind::list);
  CHECK(transitions[2].guard.has_value());
  CHECK(transitions[3].from == behave::schema::from_kind::any);
  CHECK_FALSE(transitions[3].to.has_value());
  CHECK(transitions[3].effects.size() == 1);
  CHECK(transitions[4].from == behave::schema::from_kind::any);
  CHECK(transitions[4].matches_state("Locked"));
  CHECK_FALSE(transitions[0].matches_state("Open"));

  REQUIRE(def.ticks.size() == 1);
  CHECK(def.ticks[0].interval_ms == 500);
  CHECK_FALSE(def.ticks[0].every_frame);
  CHECK(def.ticks[0].priority == 2);
  REQUIRE(def.listens.size() == 1);
  CHECK(def.listens[0].triggers == "LOCK");
}

TEST_CASE("schema_decode_collects_every_malformed_field") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text(R"({
    "name": "std/Broken",
    "category": "feedback",
    "suggestedFor": "not a list",
    "stateMachine": {
      "initial": "A",
      "states": ["A"],
      "events": ["GO"],
      "transitions": [{"from": "A", "event": "GO", "guard": "missingGuard"}, {"from": "A"}]
    },
    "ticks": [{"name": "Bad", "interval": -5}],
    "listens": [{"event": "X"}]
  })", def, errors) == BEHAVE_ERR_STRUCTURE);

  CHECK(contains(errors, "Behavior field 'suggestedFor' must be a list"));
  CHECK(contains(errors, "Transition 0 guard references unknown guard 'missingGuard'"));
  CHECK(contains(errors, "Transition 1 must have an event"));
  CHECK(contains(errors, "Tick 0 interval must be 'frame' or a whole number of milliseconds between 1 and 31536000000"));
  CHECK(contains(errors, "Listener 0 must name the event it triggers"));
}

TEST_CASE("schema_decode_rejects_fractional_and_oversized_tick_numbers") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text(R"({
    "name": "std/Clock",
    "category": "game-core",
    "stateMachine": {"initial": "A", "states": ["A"], "events": ["GO"], "transitions": []},
    "ticks": [
      {"name": "Half", "interval": 0.5},
      {"name": "Huge", "interval": 1e30},
      {"name": "Odd", "interval": 100, "priority": 1.5},
      {"name": "Wide", "interval": 100, "priority": 3000000000},
      {"name": "Whole", "interval": 250.0, "priority": -3}
    ]
  })", def, errors) == BEHAVE_ERR_STRUCTURE);

  CHECK(errors.size() == 4);
  CHECK(contains(errors, "Tick 0 interval must be 'frame' or a whole number of milliseconds between 1 and 31536000000"));
  CHECK(contains(errors, "Tick 1 interval must be 'frame' or a whole number of milliseconds between 1 and 31536000000"));
  CHECK(contains(errors, "Tick 2 priority must be a whole number"));
  CHECK(contains(errors, "Tick 3 priority must be a whole number"));
}

TEST_CASE("schema_decode_accepts_integral_float_tick_interval") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text(R"({
    "name": "std/Clock",
    "category": "game-core",
    "stateMachine": {"initial": "A", "states": ["A"], "events": ["GO"], "transitions": []},
    "ticks": [{"name": "Whole", "interval": 250.0, "priority": -3}]
  })", def, errors) == BEHAVE_OK);
  REQUIRE(def.ticks.size() == 1);
  CHECK(def.ticks[0].interval_ms == 250);
  CHECK(def.ticks[0].priority == -3);
}

TEST_CASE("schema_decode_prefixes_expression_errors") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text(R"({
    "name": "std/Arity",
    "category": "async",
    "stateMachine": {
      "initial": "A", "states": ["A"], "events": ["GO"],
      "transitions": [{"event": "GO", "effects": [["emit"]]}]
    }
  })", def, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Transition 0 effect 0: Operator 'emit' requires at least 1 argument(s), got 0");
}

TEST_CASE("schema_decode_rejects_non_object_entries") {
  behavior_definition def;
  std::vector<std::string> errors;
  CHECK(decode_text("[1, 2]", def, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Behavior entry must be an object");
}

TEST_CASE("schema_validate_accepts_consistent_definition") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(k_door, def, errors) == BEHAVE_OK);
  CHECK(behave::schema::validate_definition(def).empty());
}

TEST_CASE("schema_validate_structure") {
  behavior_definition def;
  def.machine.emplace();
  std::vector<std::string> errors = behave::schema::validate_structure(def);
  CHECK(contains(errors, "Behavior must have a name"));
  CHECK(contains(errors, "Behavior must have a category"));
  CHECK(contains(errors, "State machine must have at least one state"));
  CHECK(contains(errors, "State machine must have an initial state"));

  def.name = "Door";
  def.raw_category = "furniture";
  def.machine->states.push_back({"A"});
  def.machine->initial = "B";
  errors = behave::schema::validate_structure(def);
  CHECK(contains(errors, "Behavior name should start with 'std/' (got: Door)"));
  CHECK(contains(errors, "Invalid category: furniture"));
  CHECK(contains(errors, "Initial state is not declared: B"));
}

TEST_CASE("schema_validate_reports_each_undeclared_event_once") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(R"({
    "name": "std/Events", "category": "async",
    "stateMachine": {
      "initial": "A", "states": ["A"], "events": ["GO"],
      "transitions": [{"event": "GO"}, {"event": "STOP"}, {"event": "STOP"}, {"event": "HALT"}]
    }
  })", def, errors) == BEHAVE_OK);
  const std::vector<std::string> found = behave::schema::validate_events(def);
  REQUIRE(found.size() == 2);
  CHECK(found[0] == "Transition uses undeclared event: STOP");
  CHECK(found[1] == "Transition uses undeclared event: HALT");
}

TEST_CASE("schema_validate_reports_undeclared_states") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(R"({
    "name": "std/States", "category": "async",
    "stateMachine": {
      "initial": "A", "states": ["A"], "events": ["GO"],
      "transitions": [{"from": ["A", "Ghost"], "to": "Nowhere", "event": "GO"}, {"from": "*", "to": "A", "event": "GO"}]
    }
  })", def, errors) == BEHAVE_OK);
  const std::vector<std::string> found = behave::schema::validate_states(def);
  REQUIRE(found.size() == 2);
  CHECK(found[0] == "Transition from undeclared state: Ghost");
  CHECK(found[1] == "Transition to undeclared state: Nowhere");
}

TEST_CASE("schema_validate_keeps_guards_pure") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(R"({
    "name": "std/Impure", "category": "game-core",
    "stateMachine": {
      "initial": "A", "states": ["A"], "events": ["GO"],
      "transitions": [{"event": "GO", "guard": ["and", true, ["emit", "SIDE"]]}]
    },
    "ticks": [{"name": "Frame", "interval": "frame", "guard": ["notify", "oops"], "effects": []}]
  })", def, errors) == BEHAVE_OK);
  const std::vector<std::string> found = behave::schema::validate_guards(def);
  REQUIRE(found.size() == 2);
  CHECK(found[0] == "Transition 0 (GO) guard uses effect operator 'emit'");
  CHECK(found[1] == "Tick 'Frame' guard uses effect operator 'notify'");
}

TEST_CASE("schema_validate_reports_named_guard_once") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(R"({
    "name": "std/SharedGuard", "category": "game-core",
    "stateMachine": {
      "initial": "A", "states": ["A", "B"], "events": ["GO", "BACK"],
      "guards": [{"name": "noisy", "condition": ["and", true, ["emit", "SIDE"]]}],
      "transitions": [
        {"from": "A", "to": "B", "event": "GO", "guard": "noisy"},
        {"from": "B", "to": "A", "event": "BACK", "guard": "noisy"}
      ]
    },
    "ticks": [{"name": "Frame", "interval": "frame", "guard": "noisy", "effects": []}],
    "listens": [{"event": "PING", "triggers": "GO", "guard": "noisy"}]
  })", def, errors) == BEHAVE_OK);
  REQUIRE(def.machine.has_value());
  CHECK(def.machine->transitions[0].guard_name == "noisy");
  CHECK(def.machine->transitions[0].guard.has_value());

  const std::vector<std::string> found = behave::schema::validate_guards(def);
  REQUIRE(found.size() == 1);
  CHECK(found[0] == "Guard 'noisy' guard uses effect operator 'emit'");
}

TEST_CASE("schema_validate_reports_unbound_references") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(R"({
    "name": "std/Unbound", "category": "feedback",
    "stateMachine": {
      "initial": "A", "states": ["A"], "events": ["GO"],
      "transitions": [{"event": "GO", "effects": [["let", [["x", 1]], ["set", "@entity.v", ["+", "@x", "@y"]]]]}]
    },
    "initialEffects": [["notify", "info", "@who"]]
  })", def, errors) == BEHAVE_OK);
  const std::vector<std::string> found = behave::schema::validate_bindings(def);
  REQUIRE(found.size() == 2);
  CHECK(found[0] == "Transition 0 (GO) references unbound name '@y'");
  CHECK(found[1] == "Initial effects references unbound name '@who'");
}

TEST_CASE("schema_metadata_summarizes_definition") {
  behavior_definition def;
  std::vector<std::string> errors;
  REQUIRE(decode_text(k_door, def, errors) == BEHAVE_OK);
  const behave::schema::behavior_metadata meta = behave::schema::metadata_of(def);
  CHECK(meta.name == "std/Door");
  CHECK(meta.states.size() == 3);
  CHECK(meta.events.size() == 4);
  CHECK(meta.transition_count == 5);
  CHECK(meta.tick_count == 1);
  CHECK_FALSE(meta.has_data_entities);
  CHECK(behave::schema::category_name(meta.kind) == "ui-interaction");
}

TEST_CASE("schema_category_names_round_trip") {
  for (const auto name : behave::schema::k_category_names) {
    behave::schema::category parsed = behave::schema::category::ui_interaction;
    CHECK(behave::schema::parse_category(name, parsed));
    CHECK(behave::schema::category_name(parsed) == name);
  }
  behave::schema::category parsed = behave::schema::category::ui_interaction;
  CHECK_FALSE(behave::schema::parse_category("arcade", parsed));
  CHECK(behave::schema::is_game_category(behave::schema::category::game_ui));
  CHECK_FALSE(behave::schema::is_game_category(behave::schema::category::async));
}
