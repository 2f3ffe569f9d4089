#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "behave/expr/ast.hpp"
#include "behave/expr/operators.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::schema {

inline std::vector<std::string> validate_structure(const behavior_definition & def) {
  std::vector<std::string> errors;
  if (def.name.empty()) {
    errors.push_back("Behavior must have a name");
  } else if (def.name.compare(0, k_name_prefix.size(), k_name_prefix) != 0) {
    errors.push_back("Behavior name should start with 'std/' (got: " + def.name + ")");
  }

  category parsed = category::ui_interaction;
  if (def.raw_category.empty()) {
    errors.push_back("Behavior must have a category");
  } else if (!parse_category(def.raw_category, parsed)) {
    errors.push_back("Invalid category: " + def.raw_category);
  }

  if (def.machine) {
    const state_machine_spec & sm = *def.machine;
    if (sm.states.empty()) {
      errors.push_back("State machine must have at least one state");
    }
    if (sm.initial.empty()) {
      errors.push_back("State machine must have an initial state");
    } else if (!sm.states.empty() && !sm.has_state(sm.initial)) {
      errors.push_back("Initial state is not declared: " + sm.initial);
    }
  }
  return errors;
}

// One message per distinct undeclared event, in first-use order.
inline std::vector<std::string> validate_events(const behavior_definition & def) {
  std::vector<std::string> errors;
  if (!def.machine) {
    return errors;
  }
  std::vector<std::string> reported;
  for (const transition_spec & t : def.machine->transitions) {
    if (t.event.empty() || def.machine->has_event(t.event)) {
      continue;
    }
    if (std::find(reported.begin(), reported.end(), t.event) != reported.end()) {
      continue;
    }
    reported.push_back(t.event);
    errors.push_back("Transition uses undeclared event: " + t.event);
  }
  return errors;
}

inline std::vector<std::string> validate_states(const behavior_definition & def) {
  std::vector<std::string> errors;
  if (!def.machine) {
    return errors;
  }
  const state_machine_spec & sm = *def.machine;
  for (const transition_spec & t : sm.transitions) {
    if (t.from != from_kind::any) {
      for (const std::string & state : t.from_states) {
        if (!sm.has_state(state)) {
          errors.push_back("Transition from undeclared state: " + state);
        }
      }
    }
    if (t.to && !sm.has_state(*t.to)) {
      errors.push_back("Transition to undeclared state: " + *t.to);
    }
  }
  return errors;
}

namespace detail {

inline void check_guard_purity(const expr::node & guard, const std::string & where,
                               std::vector<std::string> & errors) {
  expr::walk(guard, [&](const expr::node & n) {
    const expr::call * c = expr::as_call(n);
    if (c != nullptr && c->op != nullptr && !c->op->pure()) {
      errors.push_back(where + " guard uses effect operator '" + c->name + "'");
    }
  });
}

inline void check_bindings(const expr::node & root, const std::string & where,
                           std::vector<std::string> & errors) {
  expr::walk(root, [&](const expr::node & n) {
    const expr::context_ref * ref = expr::as_ref(n);
    if (ref != nullptr && ref->root == expr::ref_root::unbound) {
      errors.push_back(where + " references unbound name '" + ref->text + "'");
    }
  });
}

// Named guards are visited once under their own name, not again at each use.
template <class Fn>
void for_each_expression(const behavior_definition & def, Fn && fn) {
  if (def.machine) {
    for (const named_guard & g : def.machine->guards) {
      fn(g.condition, "Guard '" + g.name + "'", true);
    }
    for (size_t i = 0; i < def.machine->transitions.size(); ++i) {
      const transition_spec & t = def.machine->transitions[i];
      const std::string where = "Transition " + std::to_string(i) + " (" + t.event + ")";
      if (t.guard && t.guard_name.empty()) {
        fn(*t.guard, where, true);
      }
      for (const expr::node & effect : t.effects) {
        fn(effect, where, false);
      }
    }
  }
  for (const tick_spec & tick : def.ticks) {
    const std::string where = "Tick '" + tick.name + "'";
    if (tick.guard && tick.guard_name.empty()) {
      fn(*tick.guard, where, true);
    }
    for (const expr::node & effect : tick.effects) {
      fn(effect, where, false);
    }
  }
  for (size_t i = 0; i < def.listens.size(); ++i) {
    if (def.listens[i].guard && def.listens[i].guard_name.empty()) {
      fn(*def.listens[i].guard, "Listener " + std::to_string(i), true);
    }
  }
  for (const expr::node & effect : def.initial_effects) {
    fn(effect, std::string("Initial effects"), false);
  }
}

}  // namespace detail

// Guards must stay free of effect operators wherever they appear.
inline std::vector<std::string> validate_guards(const behavior_definition & def) {
  std::vector<std::string> errors;
  detail::for_each_expression(
      def, [&](const expr::node & n, const std::string & where, const bool is_guard) {
        if (is_guard) {
          detail::check_guard_purity(n, where, errors);
        }
      });
  return errors;
}

inline std::vector<std::string> validate_bindings(const behavior_definition & def) {
  std::vector<std::string> errors;
  detail::for_each_expression(
      def, [&](const expr::node & n, const std::string & where, bool) {
        detail::check_bindings(n, where, errors);
      });
  return errors;
}

inline std::vector<std::string> validate_definition(const behavior_definition & def) {
  using validator_fn = std::vector<std::string> (*)(const behavior_definition &);
  static constexpr validator_fn k_validators[] = {
    validate_events, validate_states, validate_guards, validate_bindings};
  std::vector<std::string> errors = validate_structure(def);
  for (const validator_fn validator : k_validators) {
    std::vector<std::string> more = validator(def);
    errors.insert(errors.end(), more.begin(), more.end());
  }
  return errors;
}

}  // namespace behave::schema
