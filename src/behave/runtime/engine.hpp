#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/dispatcher/sm.hpp"
#include "behave/expr/evaluator.hpp"
#include "behave/registry/registry.hpp"
#include "behave/runtime/config.hpp"
#include "behave/runtime/hooks.hpp"
#include "behave/runtime/instance.hpp"

namespace behave::runtime {

struct engine_options {
  size_t max_instances = 4096;
  size_t max_timers_per_instance = 64;
  // Listener deliveries allowed per ingress call, cascades included.
  size_t max_broadcasts = 256;
  int64_t min_interval_ms = 1;
};

namespace detail {

enum class host_call_kind : uint8_t {
  render,
  persist,
  notify,
  navigate,
};

// One hook invocation queued while the instance lock is held.
struct host_call {
  host_call_kind kind = host_call_kind::render;
  // slot, entity, message or path
  std::string target;
  std::string component;
  int32_t code = 0;
  expr::value data;
};

/**
 * host-facing effect sink for one locked instance.
 *
 * queues render/persist/notify/navigate for the engine to hand to its hooks
 * once the lock is released, and records timers on the instance. set and
 * emit never reach it.
 */
class instance_host final : public expr::effect_sink {
 public:
  instance_host(instance & inst, std::vector<host_call> & calls, const engine_options & options,
                const int64_t now_ms) noexcept
      : inst_(inst), calls_(calls), options_(options), now_ms_(now_ms) {}

  int32_t set(const expr::context_ref &, expr::value, std::string & message) override {
    message = "Entity writes are handled by the dispatcher";
    return BEHAVE_ERR_INVALID_ARGUMENT;
  }

  int32_t emit(const std::string &, expr::value) override { return BEHAVE_ERR_INVALID_ARGUMENT; }

  int32_t render(const std::string & slot, const std::string & component,
                 expr::value props) override {
    calls_.push_back({host_call_kind::render, slot, component, 0, std::move(props)});
    return BEHAVE_OK;
  }

  int32_t persist(const behave_persist_op op, const std::string & entity,
                  expr::value payload) override {
    calls_.push_back(
        {host_call_kind::persist, entity, std::string(), static_cast<int32_t>(op), std::move(payload)});
    return BEHAVE_OK;
  }

  int32_t notify(const behave_notify_kind kind, const std::string & message,
                 expr::value action) override {
    calls_.push_back(
        {host_call_kind::notify, message, std::string(), static_cast<int32_t>(kind), std::move(action)});
    return BEHAVE_OK;
  }

  int32_t navigate(const std::string & path, expr::value params) override {
    calls_.push_back({host_call_kind::navigate, path, std::string(), 0, std::move(params)});
    return BEHAVE_OK;
  }

  int32_t schedule(const expr::timer_kind kind, const int64_t delay_ms, const expr::node * effect,
                   expr::value locals, expr::value payload) override {
    if (effect == nullptr) {
      return BEHAVE_ERR_INVALID_ARGUMENT;
    }
    const int64_t due = now_ms_ + delay_ms;
    if (kind == expr::timer_kind::debounce) {
      for (timer_entry & pending : inst_.timers) {
        if (pending.kind == kind && pending.effect == effect) {
          pending.due_ms = due;
          pending.locals = std::move(locals);
          pending.payload = std::move(payload);
          return BEHAVE_OK;
        }
      }
    }
    if (inst_.timers.size() >= options_.max_timers_per_instance) {
      return BEHAVE_ERR_INVALID_ARGUMENT;
    }
    timer_entry entry;
    entry.id = inst_.next_timer_id++;
    entry.kind = kind;
    entry.due_ms = due;
    entry.interval_ms =
        kind == expr::timer_kind::interval ? std::max(delay_ms, options_.min_interval_ms) : 0;
    entry.effect = effect;
    entry.locals = std::move(locals);
    entry.payload = std::move(payload);
    inst_.timers.push_back(std::move(entry));
    return BEHAVE_OK;
  }

 private:
  instance & inst_;
  std::vector<host_call> & calls_;
  const engine_options & options_;
  int64_t now_ms_;
};

inline int32_t check_guard(const expr::node & guard, const instance & inst,
                           const expr::value & payload, const int64_t now_ms, bool & satisfied,
                           std::string & message) {
  const expr::value view = merged_entity(inst);
  expr::context ctx;
  ctx.entity = &view;
  ctx.config = &inst.config;
  ctx.payload = &payload;
  ctx.now_ms = now_ms;
  ctx.state = inst.state;
  int32_t err = BEHAVE_OK;
  satisfied = expr::evaluate_guard(guard, ctx, &err, &message);
  return err;
}

// Removes due one-shot timers and re-arms due intervals; returns copies ordered by due time.
inline std::vector<timer_entry> take_due_timers(instance & inst, const int64_t now_ms) {
  std::vector<timer_entry> due;
  std::vector<timer_entry> keep;
  for (timer_entry & t : inst.timers) {
    if (t.due_ms > now_ms) {
      keep.push_back(std::move(t));
      continue;
    }
    due.push_back(t);
    if (t.kind == expr::timer_kind::interval) {
      t.due_ms += t.interval_ms;
      if (t.due_ms <= now_ms) {
        t.due_ms = now_ms + t.interval_ms;
      }
      keep.push_back(std::move(t));
    }
  }
  inst.timers = std::move(keep);
  std::stable_sort(due.begin(), due.end(), [](const timer_entry & a, const timer_entry & b) {
    return a.due_ms != b.due_ms ? a.due_ms < b.due_ms : a.id < b.id;
  });
  return due;
}

inline void merge_report(dispatcher::dispatch_report & into, dispatcher::dispatch_report && from) {
  for (dispatcher::step_record & step : from.steps) {
    into.steps.push_back(std::move(step));
  }
  for (dispatcher::emitted_event & ev : from.emitted) {
    into.emitted.push_back(std::move(ev));
  }
  into.transitions += from.transitions;
  into.misses += from.misses;
  into.effects += from.effects;
  if (into.error_message.empty()) {
    into.error_message = std::move(from.error_message);
  }
}

}  // namespace detail

/**
 * runtime over an immutable registry.
 *
 * owns behavior instances and singleton data; every state change goes
 * through a dispatcher machine held by the instance, under the instance
 * lock. hooks and the clock are only called with no instance lock held, so
 * they may call back into the engine. the registry must outlive the engine.
 */
class engine {
 public:
  explicit engine(const registry::registry & reg, hooks h = {}, engine_options options = {})
      : registry_(reg), hooks_(h), options_(options) {}

  engine(const engine &) = delete;
  engine & operator=(const engine &) = delete;

  int64_t now() const { return hooks_.clock ? hooks_.clock() : system_clock_ms(); }

  /**
   * creates an instance of `behavior_name` linked to `subject`.
   *
   * config is resolved against the config schema, required subject fields are
   * checked, data entities are allocated with their defaults and the initial
   * effects run. any failure leaves no instance behind.
   */
  int32_t activate(const std::string & behavior_name, const expr::value & subject,
                   const expr::value & config, instance_id * id_out,
                   std::string * message_out = nullptr) {
    std::string message;
    const int32_t err = activate_impl(behavior_name, subject, config, id_out, message);
    if (message_out != nullptr) {
      *message_out = std::move(message);
    }
    return err;
  }

  int32_t deliver(const instance_id id, const std::string & event_key,
                  const expr::value & payload, dispatcher::dispatch_report * report_out = nullptr) {
    std::shared_ptr<instance> inst = find(id);
    if (!inst) {
      return BEHAVE_ERR_NOT_FOUND;
    }
    dispatcher::dispatch_report local;
    dispatcher::dispatch_report & report = report_out != nullptr ? *report_out : local;
    const int64_t now_ms = now();
    std::vector<detail::host_call> calls;
    int32_t err = BEHAVE_OK;
    {
      instance_lock lock(*inst);
      if (inst->destroyed) {
        return BEHAVE_ERR_NOT_FOUND;
      }
      dispatcher::event::dispatch request{
        .event_key = event_key,
        .payload = &payload,
        .report_out = &report,
      };
      err = run_request(*inst, request, now_ms, calls);
    }
    const int32_t hook_err = flush_host_calls(id, calls);
    if (err != BEHAVE_OK) {
      return err;
    }
    if (hook_err != BEHAVE_OK) {
      return hook_err;
    }
    return broadcast(id, report.emitted);
  }

  // Runs frame ticks, and interval ticks whose interval elapsed, highest priority first.
  int32_t run_ticks(const instance_id id, size_t * ran_out = nullptr,
                    dispatcher::dispatch_report * report_out = nullptr) {
    std::shared_ptr<instance> inst = find(id);
    if (!inst) {
      return BEHAVE_ERR_NOT_FOUND;
    }
    dispatcher::dispatch_report local;
    dispatcher::dispatch_report & report = report_out != nullptr ? *report_out : local;
    report = dispatcher::dispatch_report{};
    size_t ran = 0;
    const int64_t now_ms = now();
    std::vector<detail::host_call> calls;
    int32_t err = BEHAVE_OK;
    {
      instance_lock lock(*inst);
      if (inst->destroyed) {
        return BEHAVE_ERR_NOT_FOUND;
      }
      const std::vector<schema::tick_spec> & ticks = inst->behavior->ticks;
      std::vector<size_t> order(ticks.size());
      for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
      }
      std::stable_sort(order.begin(), order.end(), [&ticks](const size_t a, const size_t b) {
        return ticks[a].priority > ticks[b].priority;
      });
      const expr::value empty_payload = expr::value::object();
      for (const size_t i : order) {
        const schema::tick_spec & tick = ticks[i];
        if (!tick.every_frame && now_ms - inst->tick_last_ms[i] < tick.interval_ms) {
          continue;
        }
        if (tick.guard) {
          bool satisfied = false;
          std::string message;
          err = detail::check_guard(*tick.guard, *inst, empty_payload, now_ms, satisfied, message);
          if (err != BEHAVE_OK) {
            report.error_message = "Tick '" + tick.name + "' guard failed: " + message;
            break;
          }
          if (!satisfied) {
            continue;
          }
        }
        inst->tick_last_ms[i] = now_ms;
        dispatcher::dispatch_report tick_report;
        dispatcher::event::run_effects request{
          .effects = tick.effects.data(),
          .effect_count = tick.effects.size(),
          .report_out = &tick_report,
        };
        err = run_request(*inst, request, now_ms, calls);
        detail::merge_report(report, std::move(tick_report));
        ran += 1;
        if (err != BEHAVE_OK) {
          break;
        }
      }
    }
    if (ran_out != nullptr) {
      *ran_out = ran;
    }
    const int32_t hook_err = flush_host_calls(id, calls);
    if (err != BEHAVE_OK) {
      return err;
    }
    if (hook_err != BEHAVE_OK) {
      return hook_err;
    }
    return broadcast(id, report.emitted);
  }

  /**
   * fires every timer due at the current clock.
   *
   * delays and debounces fire once; intervals re-arm. instances are visited
   * in id order and each fired effect runs through that instance's dispatcher.
   */
  int32_t advance(size_t * fired_out = nullptr) {
    const int64_t now_ms = now();
    size_t fired = 0;
    int32_t first_err = BEHAVE_OK;
    for (const std::shared_ptr<instance> & inst : snapshot()) {
      std::vector<dispatcher::emitted_event> emitted;
      std::vector<detail::host_call> calls;
      int32_t inst_err = BEHAVE_OK;
      {
        instance_lock lock(*inst);
        if (inst->destroyed) {
          continue;
        }
        std::vector<timer_entry> due = detail::take_due_timers(*inst, now_ms);
        for (const timer_entry & t : due) {
          dispatcher::dispatch_report report;
          dispatcher::event::run_effects request{
            .effects = t.effect,
            .effect_count = 1,
            .payload = &t.payload,
            .locals = &t.locals,
            .report_out = &report,
          };
          const int32_t err = run_request(*inst, request, now_ms, calls);
          fired += 1;
          for (dispatcher::emitted_event & ev : report.emitted) {
            emitted.push_back(std::move(ev));
          }
          if (err != BEHAVE_OK && inst_err == BEHAVE_OK) {
            inst_err = err;
          }
        }
      }
      const int32_t hook_err = flush_host_calls(inst->id, calls);
      if (inst_err == BEHAVE_OK) {
        inst_err = hook_err;
      }
      if (inst_err == BEHAVE_OK) {
        inst_err = broadcast(inst->id, std::move(emitted));
      }
      if (first_err == BEHAVE_OK) {
        first_err = inst_err;
      }
    }
    if (fired_out != nullptr) {
      *fired_out = fired;
    }
    return first_err;
  }

  int32_t destroy(const instance_id id) {
    std::shared_ptr<instance> inst;
    {
      std::lock_guard<std::mutex> lock(instances_mutex_);
      const auto it = instances_.find(id);
      if (it == instances_.end()) {
        return BEHAVE_ERR_NOT_FOUND;
      }
      inst = std::move(it->second);
      instances_.erase(it);
    }
    instance_lock lock(*inst);
    inst->destroyed = true;
    inst->timers.clear();
    return BEHAVE_OK;
  }

  int32_t current_state(const instance_id id, std::string & out) const {
    std::shared_ptr<instance> inst = find(id);
    if (!inst) {
      return BEHAVE_ERR_NOT_FOUND;
    }
    std::lock_guard<std::mutex> lock(inst->mutex);
    out = inst->state;
    return BEHAVE_OK;
  }

  int32_t entity_snapshot(const instance_id id, expr::value & out) const {
    std::shared_ptr<instance> inst = find(id);
    if (!inst) {
      return BEHAVE_ERR_NOT_FOUND;
    }
    instance_lock lock(*inst);
    out = merged_entity(*inst);
    return BEHAVE_OK;
  }

  size_t pending_timers(const instance_id id) const {
    std::shared_ptr<instance> inst = find(id);
    if (!inst) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(inst->mutex);
    return inst->timers.size();
  }

  size_t instance_count() const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    return instances_.size();
  }

 private:
  std::shared_ptr<instance> find(const instance_id id) const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    const auto it = instances_.find(id);
    return it == instances_.end() ? nullptr : it->second;
  }

  std::vector<std::shared_ptr<instance>> snapshot() const {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    std::vector<std::shared_ptr<instance>> out;
    out.reserve(instances_.size());
    for (const auto & entry : instances_) {
      out.push_back(entry.second);
    }
    return out;
  }

  std::shared_ptr<singleton_cell> singleton_for(const schema::behavior_definition & def,
                                                const schema::data_entity & entity) {
    std::lock_guard<std::mutex> lock(instances_mutex_);
    std::shared_ptr<singleton_cell> & cell = singletons_[def.name + "#" + entity.name];
    if (!cell) {
      cell = std::make_shared<singleton_cell>();
      for (const schema::entity_field & field : entity.fields) {
        cell->data[field.name] = field.default_value;
      }
    }
    return cell;
  }

  // Caller holds the instance lock; host effects are appended to `calls`.
  template <class Request>
  int32_t run_request(instance & inst, Request & request, const int64_t now_ms,
                      std::vector<detail::host_call> & calls) {
    expr::value view = merged_entity(inst);
    detail::instance_host host{inst, calls, options_, now_ms};
    dispatcher::target tgt;
    tgt.behavior = inst.behavior;
    tgt.state = &inst.state;
    tgt.entity = &view;
    tgt.config = &inst.config;
    tgt.host = &host;
    tgt.now_ms = now_ms;
    int32_t err = BEHAVE_OK;
    request.tgt = &tgt;
    request.error_out = &err;
    if (!inst.machine.process_event(request) && err == BEHAVE_OK) {
      err = BEHAVE_ERR_ENGINE_FAULT;
    }
    write_back(inst, std::move(view));
    return err;
  }

  /**
   * hands queued host effects to the hooks in order.
   *
   * no lock may be held by the caller. stops at the first non-OK hook status
   * and returns it; the calls after it are dropped.
   */
  int32_t flush_host_calls(const instance_id id, std::vector<detail::host_call> & calls) {
    int32_t err = BEHAVE_OK;
    for (const detail::host_call & call : calls) {
      switch (call.kind) {
        case detail::host_call_kind::render:
          err = hooks_.render(id, call.target, call.component, call.data);
          break;
        case detail::host_call_kind::persist:
          err = hooks_.persist(id, static_cast<behave_persist_op>(call.code), call.target,
                               call.data);
          break;
        case detail::host_call_kind::notify:
          err = hooks_.notify(id, static_cast<behave_notify_kind>(call.code), call.target,
                              call.data);
          break;
        case detail::host_call_kind::navigate:
          err = hooks_.navigate(id, call.target, call.data);
          break;
      }
      if (err != BEHAVE_OK) {
        break;
      }
    }
    calls.clear();
    return err;
  }

  int32_t activate_impl(const std::string & name, const expr::value & subject,
                        const expr::value & config, instance_id * id_out,
                        std::string & message) {
    const schema::behavior_definition * def = registry_.get(name);
    if (def == nullptr) {
      message = registry_.validate_behavior_reference(name).value_or("Unknown behavior: " + name);
      return BEHAVE_ERR_NOT_FOUND;
    }
    if (!expr::is_nullish(subject) && !subject.is_object()) {
      message = "Subject for " + name + " must be an object";
      return BEHAVE_ERR_CONFIG;
    }
    auto inst = std::make_shared<instance>();
    int32_t err = resolve_config(*def, config, inst->config, message);
    if (err == BEHAVE_OK) {
      err = check_required_fields(*def, subject, message);
    }
    if (err != BEHAVE_OK) {
      return err;
    }

    inst->behavior = def;
    inst->state = def->machine ? def->machine->initial : std::string();
    inst->entity = subject.is_object() ? subject : expr::value::object();
    for (const schema::data_entity & entity : def->data_entities) {
      if (entity.singleton) {
        inst->cells.push_back(singleton_for(*def, entity));
        continue;
      }
      for (const schema::entity_field & field : entity.fields) {
        if (!inst->entity.contains(field.name)) {
          inst->entity[field.name] = field.default_value;
        }
      }
    }
    std::sort(inst->cells.begin(), inst->cells.end(),
              [](const std::shared_ptr<singleton_cell> & a,
                 const std::shared_ptr<singleton_cell> & b) {
                return std::less<singleton_cell *>{}(a.get(), b.get());
              });
    const int64_t now_ms = now();
    inst->tick_last_ms.assign(def->ticks.size(), now_ms);

    instance_id id = k_invalid_instance;
    {
      std::lock_guard<std::mutex> lock(instances_mutex_);
      if (instances_.size() >= options_.max_instances) {
        message = "Instance limit reached (" + std::to_string(options_.max_instances) + ")";
        return BEHAVE_ERR_INVALID_ARGUMENT;
      }
      id = next_id_++;
      inst->id = id;
      instances_.emplace(id, inst);
    }

    dispatcher::dispatch_report report;
    std::vector<detail::host_call> calls;
    if (!def->initial_effects.empty()) {
      instance_lock lock(*inst);
      dispatcher::event::run_effects request{
        .effects = def->initial_effects.data(),
        .effect_count = def->initial_effects.size(),
        .report_out = &report,
      };
      err = run_request(*inst, request, now_ms, calls);
    }
    if (err != BEHAVE_OK) {
      message = report.error_message;
      destroy(id);
      return err;
    }
    err = flush_host_calls(id, calls);
    if (err != BEHAVE_OK) {
      message = std::string("Host rejected initial effects of ") + name + ": " + status_name(err);
      destroy(id);
      return err;
    }
    if (id_out != nullptr) {
      *id_out = id;
    }
    return broadcast(id, report.emitted);
  }

  /**
   * delivers emitted events to listening instances.
   *
   * runs after the emitter's lock is released; each delivery may emit again,
   * which is queued behind the current ones. bounded by `max_broadcasts`.
   * a listener's hooks run as soon as its own lock is released.
   */
  int32_t broadcast(const instance_id source, std::vector<dispatcher::emitted_event> emitted) {
    struct pending {
      instance_id source;
      dispatcher::emitted_event ev;
    };
    std::deque<pending> queue;
    for (dispatcher::emitted_event & ev : emitted) {
      queue.push_back({source, std::move(ev)});
    }
    size_t budget = options_.max_broadcasts;
    while (!queue.empty()) {
      pending next = std::move(queue.front());
      queue.pop_front();
      for (const std::shared_ptr<instance> & listener : snapshot()) {
        if (listener->id == next.source) {
          continue;
        }
        for (const schema::listener_spec & spec : listener->behavior->listens) {
          if (spec.event != next.ev.key) {
            continue;
          }
          if (budget == 0) {
            return BEHAVE_ERR_ENGINE_FAULT;
          }
          budget -= 1;
          const int64_t now_ms = now();
          dispatcher::dispatch_report report;
          std::vector<detail::host_call> calls;
          int32_t err = BEHAVE_OK;
          {
            instance_lock lock(*listener);
            if (listener->destroyed) {
              break;
            }
            if (spec.guard) {
              bool satisfied = false;
              std::string message;
              err = detail::check_guard(*spec.guard, *listener, next.ev.payload, now_ms,
                                        satisfied, message);
              if (err == BEHAVE_OK && !satisfied) {
                continue;
              }
            }
            if (err == BEHAVE_OK) {
              dispatcher::event::dispatch request{
                .event_key = spec.triggers,
                .payload = &next.ev.payload,
                .report_out = &report,
              };
              err = run_request(*listener, request, now_ms, calls);
            }
          }
          const int32_t hook_err = flush_host_calls(listener->id, calls);
          if (err != BEHAVE_OK) {
            return err;
          }
          if (hook_err != BEHAVE_OK) {
            return hook_err;
          }
          for (dispatcher::emitted_event & ev : report.emitted) {
            queue.push_back({listener->id, std::move(ev)});
          }
        }
      }
    }
    return BEHAVE_OK;
  }

  const registry::registry & registry_;
  hooks hooks_;
  engine_options options_;

  mutable std::mutex instances_mutex_;
  std::map<instance_id, std::shared_ptr<instance>> instances_;
  std::map<std::string, std::shared_ptr<singleton_cell>> singletons_;
  instance_id next_id_ = 1;
};

}  // namespace behave::runtime
