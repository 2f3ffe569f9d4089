#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/schema/behavior.hpp"

namespace behave::registry {

using schema::behavior_definition;
using schema::behavior_metadata;
using schema::category;

inline constexpr size_t k_max_edit_distance = 3;

struct library_stats {
  size_t total_behaviors = 0;
  std::array<size_t, schema::k_category_count> by_category = {};
  size_t total_states = 0;
  size_t total_events = 0;
  size_t total_transitions = 0;
  size_t total_ticks = 0;
};

namespace detail {

inline std::string lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

// Lowercased with the first namespace prefix removed.
inline std::string normalize_name(std::string_view name) {
  std::string out = lower(name);
  const size_t pos = out.find(schema::k_name_prefix);
  if (pos != std::string::npos) {
    out.erase(pos, schema::k_name_prefix.size());
  }
  return out;
}

inline size_t levenshtein(std::string_view a, std::string_view b) {
  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) {
    prev[j] = j;
  }
  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

}  // namespace detail

class registry;

/**
 * mutable staging area for a registry.
 *
 * definitions are owned from registration on; the pointer handed back stays
 * valid in the built registry.
 */
class builder {
 public:
  int32_t register_behavior(behavior_definition def,
                            const behavior_definition ** registered_out = nullptr) {
    if (def.name.empty()) {
      return BEHAVE_ERR_INVALID_ARGUMENT;
    }
    if (index_.find(def.name) != index_.end()) {
      return BEHAVE_ERR_DUPLICATE;
    }
    auto owned = std::make_unique<const behavior_definition>(std::move(def));
    const behavior_definition * ptr = owned.get();
    index_.emplace(ptr->name, entries_.size());
    entries_.push_back(std::move(owned));
    if (registered_out != nullptr) {
      *registered_out = ptr;
    }
    return BEHAVE_OK;
  }

  bool has(const std::string & name) const noexcept { return index_.find(name) != index_.end(); }

  size_t size() const noexcept { return entries_.size(); }

  registry build() &&;

 private:
  std::vector<std::unique_ptr<const behavior_definition>> entries_;
  std::unordered_map<std::string, size_t> index_;
};

class registry {
 public:
  registry() = default;

  const behavior_definition * get(const std::string & name) const noexcept {
    const auto it = index_.find(name);
    return it == index_.end() ? nullptr : entries_[it->second].get();
  }

  bool has(const std::string & name) const noexcept { return get(name) != nullptr; }

  size_t size() const noexcept { return entries_.size(); }

  // Registration order.
  std::vector<std::string> list() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto & entry : entries_) {
      out.push_back(entry->name);
    }
    return out;
  }

  const std::vector<const behavior_definition *> & list_by_category(const category c) const noexcept {
    return by_category_[static_cast<size_t>(c)];
  }

  std::vector<const behavior_definition *> get_all() const {
    std::vector<const behavior_definition *> out;
    out.reserve(entries_.size());
    for (const auto & entry : entries_) {
      out.push_back(entry.get());
    }
    return out;
  }

  // Case-insensitive containment in either direction against `suggested_for`.
  std::vector<const behavior_definition *> find_behaviors_for_use_case(std::string_view use_case) const {
    const std::string needle = detail::lower(use_case);
    return filter([&needle](const behavior_definition & def) {
      for (const std::string & suggestion : def.suggested_for) {
        const std::string hint = detail::lower(suggestion);
        if (hint.find(needle) != std::string::npos || needle.find(hint) != std::string::npos) {
          return true;
        }
      }
      return false;
    });
  }

  std::vector<const behavior_definition *> behaviors_for_event(std::string_view event) const {
    return filter([event](const behavior_definition & def) {
      return def.machine && def.machine->has_event(event);
    });
  }

  std::vector<const behavior_definition *> behaviors_with_state(std::string_view state) const {
    return filter([state](const behavior_definition & def) {
      return def.machine && def.machine->has_state(state);
    });
  }

  std::optional<behavior_metadata> metadata(const std::string & name) const {
    const behavior_definition * def = get(name);
    if (def == nullptr) {
      return std::nullopt;
    }
    return schema::metadata_of(*def);
  }

  std::vector<behavior_metadata> all_metadata() const {
    std::vector<behavior_metadata> out;
    out.reserve(entries_.size());
    for (const auto & entry : entries_) {
      out.push_back(schema::metadata_of(*entry));
    }
    return out;
  }

  std::vector<std::string> similar_names(std::string_view name) const {
    const std::string input = detail::normalize_name(name);
    std::vector<std::string> out;
    for (const auto & entry : entries_) {
      const std::string candidate = detail::normalize_name(entry->name);
      if (candidate.find(input) != std::string::npos || input.find(candidate) != std::string::npos ||
          detail::levenshtein(input, candidate) <= k_max_edit_distance) {
        out.push_back(entry->name);
      }
    }
    return out;
  }

  /**
   * checks a behavior reference.
   *
   * returns nothing for a registered name, otherwise a message; unknown names
   * carry "did you mean" suggestions when any are close enough.
   */
  std::optional<std::string> validate_behavior_reference(const std::string & name) const {
    if (name.compare(0, schema::k_name_prefix.size(), schema::k_name_prefix) != 0) {
      return "Behavior name must start with 'std/': " + name;
    }
    if (has(name)) {
      return std::nullopt;
    }
    const std::vector<std::string> suggestions = similar_names(name);
    if (suggestions.empty()) {
      return "Unknown behavior: " + name;
    }
    std::string message = "Unknown behavior '" + name + "'. Did you mean: ";
    for (size_t i = 0; i < suggestions.size(); ++i) {
      if (i > 0) {
        message += ", ";
      }
      message += suggestions[i];
    }
    message += "?";
    return message;
  }

  library_stats stats() const noexcept {
    library_stats out;
    out.total_behaviors = entries_.size();
    for (const auto & entry : entries_) {
      out.by_category[static_cast<size_t>(entry->kind)] += 1;
      if (entry->machine) {
        out.total_states += entry->machine->states.size();
        out.total_events += entry->machine->events.size();
        out.total_transitions += entry->machine->transitions.size();
      }
      out.total_ticks += entry->ticks.size();
    }
    return out;
  }

 private:
  friend class builder;

  template <class Pred>
  std::vector<const behavior_definition *> filter(Pred && pred) const {
    std::vector<const behavior_definition *> out;
    for (const auto & entry : entries_) {
      if (pred(*entry)) {
        out.push_back(entry.get());
      }
    }
    return out;
  }

  std::vector<std::unique_ptr<const behavior_definition>> entries_;
  std::unordered_map<std::string, size_t> index_;
  std::array<std::vector<const behavior_definition *>, schema::k_category_count> by_category_;
};

inline registry builder::build() && {
  registry out;
  out.entries_ = std::move(entries_);
  out.index_ = std::move(index_);
  for (const auto & entry : out.entries_) {
    out.by_category_[static_cast<size_t>(entry->kind)].push_back(entry.get());
  }
  entries_.clear();
  index_.clear();
  return out;
}

}  // namespace behave::registry
