#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "behave/expr/ast.hpp"
#include "behave/expr/value.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::affinity {

inline constexpr size_t k_max_names = 8;

// Fixed-capacity list of names; unused slots stay empty.
struct name_list {
  std::array<std::string_view, k_max_names> items = {};

  constexpr size_t size() const noexcept {
    size_t n = 0;
    while (n < items.size() && !items[n].empty()) {
      ++n;
    }
    return n;
  }

  constexpr bool contains(std::string_view name) const noexcept {
    if (name.empty()) {
      return false;
    }
    for (const std::string_view item : items) {
      if (item == name) {
        return true;
      }
    }
    return false;
  }

  std::vector<std::string> to_vector() const {
    std::vector<std::string> out;
    for (size_t i = 0; i < size(); ++i) {
      out.emplace_back(items[i]);
    }
    return out;
  }
};

struct action_affinity {
  std::string_view component;
  name_list valid;
  name_list invalid;
};

struct ui_event_info {
  std::string_view event;
  name_list emitted_by;
  std::string_view description;
};

struct component_group {
  std::string_view category;
  name_list components;
};

inline constexpr action_affinity k_action_affinity[] = {
  // display
  {"entity-table", {{"VIEW", "EDIT", "DELETE", "SELECT", "SORT", "PAGE"}},
   {{"SAVE", "CANCEL", "SUBMIT", "CREATE", "CLOSE"}}},
  {"entity-list", {{"VIEW", "EDIT", "DELETE", "SELECT"}},
   {{"SAVE", "CANCEL", "SUBMIT", "CREATE", "CLOSE"}}},
  {"entity-cards", {{"VIEW", "EDIT", "DELETE", "SELECT"}},
   {{"SAVE", "CANCEL", "SUBMIT", "CREATE", "CLOSE"}}},
  {"card-grid", {{"VIEW", "EDIT", "DELETE", "SELECT"}},
   {{"SAVE", "CANCEL", "SUBMIT", "CREATE", "CLOSE"}}},
  // header
  {"page-header", {{"CREATE", "REFRESH", "EXPORT", "IMPORT", "BACK", "FILTER"}},
   {{"SAVE", "VIEW", "EDIT", "DELETE", "SUBMIT"}}},
  // form
  {"form", {{"SAVE", "CANCEL", "SUBMIT", "CLOSE", "RESET", "FIELD_CHANGE", "FIELD_BLUR"}},
   {{"VIEW", "DELETE", "CREATE", "SELECT", "EDIT"}}},
  {"form-section", {{"FIELD_CHANGE", "FIELD_BLUR"}},
   {{"SAVE", "VIEW", "DELETE", "CREATE", "SELECT", "EDIT"}}},
  {"form-actions", {{"SAVE", "CANCEL", "SUBMIT", "RESET"}},
   {{"VIEW", "DELETE", "CREATE", "SELECT", "EDIT"}}},
  // detail
  {"detail-panel", {{"EDIT", "DELETE", "CLOSE", "BACK"}},
   {{"SAVE", "CREATE", "SELECT", "SUBMIT"}}},
  {"entity-detail", {{"EDIT", "DELETE", "CLOSE", "BACK"}},
   {{"SAVE", "CREATE", "SELECT", "SUBMIT"}}},
  // container
  {"modal", {{"CLOSE", "CONFIRM", "CANCEL"}}, {{"VIEW", "CREATE", "EDIT", "DELETE"}}},
  {"modal-container", {{"CLOSE", "CONFIRM", "CANCEL"}}, {{"VIEW", "CREATE", "EDIT", "DELETE"}}},
  {"drawer", {{"CLOSE"}}, {{"VIEW", "CREATE", "DELETE"}}},
  // navigation
  {"tabs", {{"SELECT_TAB"}}, {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"tab-bar", {{"SELECT_TAB"}}, {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"wizard-navigation", {{"NEXT", "PREV", "GO_TO", "COMPLETE"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"wizard-progress", {{"GO_TO"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT", "NEXT", "PREV"}}},
  // filter
  {"filter-group", {{"SET_FILTER", "CLEAR_FILTER", "CLEAR_ALL"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"search-bar", {{"SEARCH", "CLEAR_SEARCH"}}, {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"search-input", {{"SEARCH", "CLEAR_SEARCH"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  // pagination
  {"pagination", {{"NEXT_PAGE", "PREV_PAGE", "GO_TO_PAGE", "SET_PAGE_SIZE"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  // confirmation
  {"confirm-dialog", {{"CONFIRM", "CANCEL"}}, {{"VIEW", "CREATE", "EDIT", "DELETE", "SAVE"}}},
  // state
  {"empty-state", {{"CREATE"}}, {{"SAVE", "VIEW", "EDIT", "DELETE", "CANCEL"}}},
  {"loading-state", {}, {{"SAVE", "VIEW", "EDIT", "DELETE", "CREATE", "CANCEL"}}},
  // dashboard
  {"stats", {}, {{"SAVE", "VIEW", "EDIT", "DELETE", "CREATE", "CANCEL"}}},
  // game
  {"game-canvas", {{"INPUT", "PAUSE", "UNPAUSE"}}, {{"SAVE", "CREATE", "DELETE"}}},
  {"game-hud", {{"PAUSE"}}, {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"game-controls", {{"INPUT", "ACTION"}}, {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"game-menu", {{"START", "OPTIONS", "QUIT", "SELECT"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"game-pause-overlay", {{"RESUME", "QUIT", "OPTIONS"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
  {"game-over-screen", {{"RETRY", "QUIT", "MAIN_MENU"}},
   {{"SAVE", "CREATE", "DELETE", "VIEW", "EDIT"}}},
};

inline constexpr ui_event_info k_ui_events[] = {
  {"VIEW", {{"entity-table", "entity-list", "entity-cards", "card-grid"}}, "View item detail"},
  {"EDIT", {{"entity-table", "entity-list", "entity-cards", "detail-panel"}}, "Edit item"},
  {"DELETE", {{"entity-table", "entity-list", "entity-cards", "detail-panel"}}, "Delete item"},
  {"CREATE", {{"page-header", "empty-state"}}, "Create new item"},
  {"SAVE", {{"form", "form-actions"}}, "Save form data"},
  {"CANCEL", {{"form", "form-actions", "modal", "confirm-dialog"}}, "Cancel form/modal"},
  {"CLOSE", {{"modal", "drawer", "detail-panel"}}, "Close modal/drawer"},
  {"SELECT", {{"entity-table", "entity-list", "entity-cards"}}, "Selection change"},
  {"SEARCH", {{"search-bar", "search-input"}}, "Search filter"},
  {"CONFIRM", {{"modal", "confirm-dialog"}}, "Confirm action"},
  {"SELECT_TAB", {{"tabs", "tab-bar"}}, "Tab selection"},
  {"NEXT", {{"wizard-navigation"}}, "Wizard next step"},
  {"PREV", {{"wizard-navigation"}}, "Wizard previous step"},
};

inline constexpr component_group k_component_groups[] = {
  {"display", {{"entity-table", "entity-list", "entity-cards", "card-grid"}}},
  {"header", {{"page-header"}}},
  {"form", {{"form", "form-section", "form-actions"}}},
  {"detail", {{"detail-panel", "entity-detail"}}},
  {"container", {{"modal", "modal-container", "drawer"}}},
  {"navigation", {{"tabs", "tab-bar", "wizard-navigation", "wizard-progress"}}},
  {"filter", {{"filter-group", "search-bar", "search-input"}}},
  {"pagination", {{"pagination"}}},
  {"confirmation", {{"confirm-dialog"}}},
  {"state", {{"empty-state", "loading-state"}}},
  {"dashboard", {{"stats"}}},
  {"game", {{"game-canvas", "game-hud", "game-controls", "game-menu", "game-pause-overlay",
             "game-over-screen"}}},
};

inline const action_affinity * find_affinity(std::string_view component) noexcept {
  for (const action_affinity & entry : k_action_affinity) {
    if (entry.component == component) {
      return &entry;
    }
  }
  return nullptr;
}

inline const ui_event_info * find_ui_event(std::string_view event) noexcept {
  for (const ui_event_info & entry : k_ui_events) {
    if (entry.event == event) {
      return &entry;
    }
  }
  return nullptr;
}

// Unknown components accept everything; known ones reject only blacklisted actions.
inline bool is_action_valid_for_component(std::string_view action,
                                          std::string_view component) noexcept {
  const action_affinity * entry = find_affinity(component);
  if (entry == nullptr) {
    return true;
  }
  return entry->valid.contains(action) || !entry->invalid.contains(action);
}

inline bool is_action_invalid_for_component(std::string_view action,
                                            std::string_view component) noexcept {
  const action_affinity * entry = find_affinity(component);
  return entry != nullptr && entry->invalid.contains(action);
}

inline std::vector<std::string> valid_actions_for_component(std::string_view component) {
  const action_affinity * entry = find_affinity(component);
  return entry == nullptr ? std::vector<std::string>{} : entry->valid.to_vector();
}

inline std::vector<std::string> invalid_actions_for_component(std::string_view component) {
  const action_affinity * entry = find_affinity(component);
  return entry == nullptr ? std::vector<std::string>{} : entry->invalid.to_vector();
}

inline std::vector<std::string> components_for_event(std::string_view event) {
  const ui_event_info * entry = find_ui_event(event);
  return entry == nullptr ? std::vector<std::string>{} : entry->emitted_by.to_vector();
}

inline std::vector<std::string> all_known_components() {
  std::vector<std::string> out;
  for (const action_affinity & entry : k_action_affinity) {
    out.emplace_back(entry.component);
  }
  return out;
}

inline std::vector<std::pair<std::string, std::vector<std::string>>> components_by_category() {
  std::vector<std::pair<std::string, std::vector<std::string>>> out;
  for (const component_group & group : k_component_groups) {
    out.emplace_back(std::string(group.category), group.components.to_vector());
  }
  return out;
}

struct item_action {
  std::string label;
  std::string event;
};

inline std::string affinity_error(std::string_view action, const action_affinity & entry) {
  std::string out = "Action \"";
  out.append(action);
  out += "\" is not valid on \"";
  out.append(entry.component);
  out += "\". Valid actions: ";
  for (size_t i = 0; i < entry.valid.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out.append(entry.valid.items[i]);
  }
  return out;
}

inline std::vector<std::string> validate_actions_for_component(
    const std::vector<item_action> & actions, std::string_view component) {
  std::vector<std::string> errors;
  const action_affinity * entry = find_affinity(component);
  if (entry == nullptr) {
    return errors;
  }
  for (const item_action & action : actions) {
    if (entry->invalid.contains(action.event)) {
      errors.push_back(affinity_error(action.event, *entry));
    }
  }
  return errors;
}

// Accepts the authored form: a list of `{label?, event?}` objects.
inline std::vector<std::string> validate_actions_for_component(const expr::value & actions,
                                                               std::string_view component) {
  std::vector<item_action> parsed;
  if (actions.is_array()) {
    for (const expr::value & item : actions) {
      if (!item.is_object()) {
        continue;
      }
      item_action action;
      const auto label = item.find("label");
      if (label != item.end() && label->is_string()) {
        action.label = label->get<std::string>();
      }
      const auto event = item.find("event");
      if (event != item.end() && event->is_string()) {
        action.event = event->get<std::string>();
      }
      parsed.push_back(std::move(action));
    }
  }
  return validate_actions_for_component(parsed, component);
}

namespace detail {

// Literal value of `key` in a props node, or nullptr when it is not statically known.
inline const expr::value * literal_prop(const expr::node & props, std::string_view key) {
  if (const expr::literal * lit = expr::as_literal(props)) {
    if (!lit->val.is_object()) {
      return nullptr;
    }
    const auto it = lit->val.find(std::string(key));
    return it == lit->val.end() ? nullptr : &*it;
  }
  if (const expr::object_form * obj = expr::as_object(props)) {
    for (size_t i = 0; i < obj->keys.size(); ++i) {
      if (obj->keys[i] == key) {
        const expr::literal * lit = expr::as_literal(obj->values[i]);
        return lit == nullptr ? nullptr : &lit->val;
      }
    }
  }
  return nullptr;
}

inline void check_render(const expr::node & effect, const std::string & where,
                         std::vector<std::string> & errors) {
  expr::walk(effect, [&](const expr::node & n) {
    const expr::call * c = expr::as_call(n);
    if (c == nullptr) {
      return;
    }
    const expr::node * props = nullptr;
    std::string component;
    if (c->name == "render-ui" && c->args.size() == 2) {
      props = &c->args[1];
      const expr::value * type = literal_prop(*props, "type");
      if (type != nullptr && type->is_string()) {
        component = type->get<std::string>();
      }
    } else if (c->name == "render" && c->args.size() == 3) {
      const expr::literal * lit = expr::as_literal(c->args[1]);
      if (lit != nullptr && lit->val.is_string()) {
        component = lit->val.get<std::string>();
      }
      props = &c->args[2];
    }
    if (props == nullptr || component.empty()) {
      return;
    }
    for (const std::string_view key : {std::string_view("actions"), std::string_view("itemActions")}) {
      const expr::value * actions = literal_prop(*props, key);
      if (actions == nullptr) {
        continue;
      }
      for (std::string & message : validate_actions_for_component(*actions, component)) {
        errors.push_back(where + ": " + message);
      }
    }
  });
}

}  // namespace detail

/**
 * static Closed Circuit check over a definition.
 *
 * walks every effect list for render calls whose component type and action
 * lists are literals, and reports each action the component rejects.
 */
inline std::vector<std::string> validate_render_affinity(const schema::behavior_definition & def) {
  std::vector<std::string> errors;
  if (def.machine) {
    for (size_t i = 0; i < def.machine->transitions.size(); ++i) {
      const schema::transition_spec & t = def.machine->transitions[i];
      const std::string where = "Transition " + std::to_string(i) + " (" + t.event + ")";
      for (const expr::node & effect : t.effects) {
        detail::check_render(effect, where, errors);
      }
    }
  }
  for (const schema::tick_spec & tick : def.ticks) {
    for (const expr::node & effect : tick.effects) {
      detail::check_render(effect, "Tick '" + tick.name + "'", errors);
    }
  }
  for (const expr::node & effect : def.initial_effects) {
    detail::check_render(effect, "Initial effects", errors);
  }
  return errors;
}

}  // namespace behave::affinity
