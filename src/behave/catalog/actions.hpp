#pragma once

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "behave/affinity/affinity.hpp"
#include "behave/behave.h"
#include "behave/catalog/context.hpp"
#include "behave/catalog/events.hpp"
#include "behave/schema/decode.hpp"
#include "behave/schema/validate.hpp"

namespace behave::catalog::action {

namespace detail {

inline void set_error(context & ctx, const int32_t err) noexcept {
  ctx.phase_error = err;
  ctx.last_error = err;
}

inline std::string entry_name(const expr::value & entry) {
  if (!entry.is_object()) {
    return std::string();
  }
  const auto it = entry.find("name");
  return it != entry.end() && it->is_string() ? it->get<std::string>() : std::string();
}

inline void reject_entry(context & ctx, const size_t index, std::string name,
                         std::vector<std::string> errors) {
  ctx.rejected += 1;
  if (ctx.request->report_out != nullptr) {
    ctx.request->report_out->rejected.push_back({index, std::move(name), std::move(errors)});
  }
}

// An entry that threw is rejected on its own; the load only fails if reporting it throws too.
inline void reject_failed_entry(context & ctx, const expr::value & entry, const size_t index,
                                const char * what) noexcept {
  try {
    reject_entry(ctx, index, entry_name(entry), {std::string("Failed to load entry: ") + what});
  } catch (const std::exception &) {
    set_error(ctx, BEHAVE_ERR_PARSE_FAILED);
  }
}

inline void load_entry(context & ctx, const expr::value & entry, const size_t index) {
  const event::load & ev = *ctx.request;
  std::vector<std::string> errors;
  schema::behavior_definition def;
  if (schema::decode_behavior(entry, *ev.operators, def, errors) == BEHAVE_OK) {
    errors = schema::validate_definition(def);
  }
  if (!errors.empty()) {
    std::string name = def.name.empty() ? entry_name(entry) : def.name;
    reject_entry(ctx, index, std::move(name), std::move(errors));
    return;
  }

  std::vector<std::string> warnings = affinity::validate_render_affinity(def);
  std::string name = def.name;
  const int32_t err = ev.builder->register_behavior(std::move(def));
  if (err != BEHAVE_OK) {
    reject_entry(ctx, index, name, {"Duplicate behavior name: " + name});
    return;
  }
  ctx.accepted += 1;
  if (ev.report_out != nullptr) {
    ev.report_out->loaded.push_back(name);
    for (std::string & warning : warnings) {
      ev.report_out->warnings.push_back(name + ": " + warning);
    }
  }
}

}  // namespace detail

struct reject_invalid_load {
  void operator()(const event::load & ev, context & ctx) const noexcept {
    detail::set_error(ctx, BEHAVE_ERR_INVALID_ARGUMENT);
    if (ev.error_out != nullptr) {
      *ev.error_out = BEHAVE_ERR_INVALID_ARGUMENT;
    }
    if (ev.dispatch_error) {
      ev.dispatch_error(events::loading_error{&ev, BEHAVE_ERR_INVALID_ARGUMENT});
    }
  }
};

struct begin_load {
  void operator()(const event::load & ev, context & ctx) const noexcept {
    ctx.request = &ev;
    ctx.entries = nullptr;
    ctx.entry_index = 0;
    ctx.accepted = 0;
    ctx.rejected = 0;
    ctx.phase_error = BEHAVE_OK;
    ctx.last_error = BEHAVE_OK;
  }
};

// Accepts a bare array of entries or an object wrapping one under "behaviors".
struct locate_entries {
  void operator()(context & ctx) const noexcept {
    const expr::value & doc = *ctx.request->document;
    const expr::value * entries = nullptr;
    if (doc.is_array()) {
      entries = &doc;
    } else if (doc.is_object()) {
      const auto it = doc.find(k_behaviors_key);
      if (it != doc.end() && it->is_array()) {
        entries = &*it;
      }
    }
    if (entries == nullptr || entries->size() > k_max_entries) {
      detail::set_error(ctx, BEHAVE_ERR_STRUCTURE);
      return;
    }
    ctx.entries = entries;
  }
};

struct load_next_entry {
  void operator()(context & ctx) const noexcept {
    if (ctx.phase_error != BEHAVE_OK || ctx.entries == nullptr) {
      return;
    }
    const size_t index = ctx.entry_index;
    ctx.entry_index += 1;
    const expr::value & entry = (*ctx.entries)[index];
    try {
      detail::load_entry(ctx, entry, index);
    } catch (const std::exception & ex) {
      detail::reject_failed_entry(ctx, entry, index, ex.what());
    }
  }
};

struct finalize_done {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    if (ev->error_out != nullptr) {
      *ev->error_out = BEHAVE_OK;
    }
    if (ev->dispatch_done) {
      ev->dispatch_done(events::loading_done{ev, ctx.accepted, ctx.rejected});
    }
  }
};

struct finalize_error {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    if (ev->error_out != nullptr) {
      *ev->error_out = ctx.phase_error;
    }
    if (ev->dispatch_error) {
      ev->dispatch_error(events::loading_error{ev, ctx.phase_error});
    }
  }
};

struct on_unexpected {
  template <class event>
  void operator()(const event &, context & ctx) const noexcept {
    detail::set_error(ctx, BEHAVE_ERR_ENGINE_FAULT);
  }
};

inline constexpr reject_invalid_load reject_invalid_load{};
inline constexpr begin_load begin_load{};
inline constexpr locate_entries locate_entries{};
inline constexpr load_next_entry load_next_entry{};
inline constexpr finalize_done finalize_done{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace behave::catalog::action
