#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "behave/dispatcher/sm.hpp"
#include "behave/expr/ast.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"
#include "behave/runtime/hooks.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::runtime {

// Data entity shared by every instance of one behavior.
struct singleton_cell {
  std::mutex mutex;
  expr::value data = expr::value::object();
};

struct timer_entry {
  uint64_t id = 0;
  expr::timer_kind kind = expr::timer_kind::delay;
  int64_t due_ms = 0;
  int64_t interval_ms = 0;
  const expr::node * effect = nullptr;
  expr::value locals = {};
  expr::value payload = {};
};

struct instance {
  instance_id id = k_invalid_instance;
  const schema::behavior_definition * behavior = nullptr;

  std::mutex mutex;
  bool destroyed = false;
  std::string state = {};
  expr::value entity = expr::value::object();
  expr::value config = expr::value::object();
  // Sorted by address; locked in that order after `mutex`.
  std::vector<std::shared_ptr<singleton_cell>> cells = {};

  std::vector<timer_entry> timers = {};
  uint64_t next_timer_id = 1;
  std::vector<int64_t> tick_last_ms = {};

  dispatcher::action::context dispatch_ctx = {};
  dispatcher::sm machine{dispatch_ctx};
};

/**
 * holds an instance and its singleton cells for one dispatch.
 *
 * the instance lock is taken first and cells follow in address order, so two
 * instances sharing cells never wait on each other in opposite orders.
 */
class instance_lock {
 public:
  explicit instance_lock(instance & inst) : instance_(inst.mutex) {
    cells_.reserve(inst.cells.size());
    for (const std::shared_ptr<singleton_cell> & cell : inst.cells) {
      cells_.emplace_back(cell->mutex);
    }
  }

 private:
  std::unique_lock<std::mutex> instance_;
  std::vector<std::unique_lock<std::mutex>> cells_;
};

// Instance fields overlaid with the current singleton values.
inline expr::value merged_entity(const instance & inst) {
  expr::value view = inst.entity;
  for (const std::shared_ptr<singleton_cell> & cell : inst.cells) {
    for (auto it = cell->data.begin(); it != cell->data.end(); ++it) {
      view[it.key()] = it.value();
    }
  }
  return view;
}

inline void write_back(instance & inst, expr::value view) {
  for (const std::shared_ptr<singleton_cell> & cell : inst.cells) {
    for (auto it = cell->data.begin(); it != cell->data.end(); ++it) {
      const auto found = view.find(it.key());
      if (found != view.end()) {
        it.value() = *found;
      }
    }
  }
  inst.entity = std::move(view);
}

}  // namespace behave::runtime
