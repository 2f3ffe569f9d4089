#pragma once

#include <cstdint>

#include "behave/dispatcher/actions.hpp"
#include "behave/dispatcher/events.hpp"
#include "behave/dispatcher/guards.hpp"
#include "behave/sm.hpp"

namespace behave::dispatcher {

struct initialized {};
struct selecting {};
struct applying {};
struct dispatch_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * transition dispatcher orchestration model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a dispatch or run_effects request.
 * - `selecting`: pop the next queued event and resolve its transition.
 * - `applying`: run the selected effect list one effect per step.
 * - `dispatch_decision`: branch on the phase result once the queue is empty.
 * - `done`/`errored`: terminal outcomes; both accept the next request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_*`/`invalid_*` validate the target view and request fields.
 * - `phase_*` guards observe errors set by actions.
 * - `has_*`/`no_*` guards drive the queue and effect cursors.
 *
 * action side effects:
 * - `begin_dispatch` seeds the queue with the ingress event.
 * - `begin_run_effects` seeds the effect cursor directly.
 * - `select_next_event` counts the cascade budget and applies `to`.
 * - `apply_next_effect` evaluates one effect through the router; `emit`
 *   appends to the queue, which drains after the current list.
 * - `finalize_*` write the report and dispatch completion callbacks.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::dispatch>[guard::valid_dispatch] /
                                       action::begin_dispatch = sml::state<selecting>,
        sml::state<initialized> + sml::event<event::dispatch>[guard::invalid_dispatch] /
                                      action::reject_invalid_dispatch = sml::state<errored>,
        sml::state<initialized> + sml::event<event::run_effects>[guard::valid_run_effects] /
                                      action::begin_run_effects = sml::state<applying>,
        sml::state<initialized> +
            sml::event<event::run_effects>[guard::invalid_run_effects] /
                action::reject_invalid_run_effects = sml::state<errored>,

        sml::state<done> + sml::event<event::dispatch>[guard::valid_dispatch] /
                               action::begin_dispatch = sml::state<selecting>,
        sml::state<done> + sml::event<event::dispatch>[guard::invalid_dispatch] /
                               action::reject_invalid_dispatch = sml::state<errored>,
        sml::state<done> + sml::event<event::run_effects>[guard::valid_run_effects] /
                               action::begin_run_effects = sml::state<applying>,
        sml::state<done> + sml::event<event::run_effects>[guard::invalid_run_effects] /
                               action::reject_invalid_run_effects = sml::state<errored>,

        sml::state<errored> + sml::event<event::dispatch>[guard::valid_dispatch] /
                                  action::begin_dispatch = sml::state<selecting>,
        sml::state<errored> + sml::event<event::dispatch>[guard::invalid_dispatch] /
                                  action::reject_invalid_dispatch = sml::state<errored>,
        sml::state<errored> + sml::event<event::run_effects>[guard::valid_run_effects] /
                                  action::begin_run_effects = sml::state<applying>,
        sml::state<errored> + sml::event<event::run_effects>[guard::invalid_run_effects] /
                                  action::reject_invalid_run_effects = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::dispatch>[guard::valid_dispatch] /
                                     action::begin_dispatch = sml::state<selecting>,
        sml::state<unexpected> + sml::event<event::dispatch>[guard::invalid_dispatch] /
                                     action::reject_invalid_dispatch = sml::state<unexpected>,
        sml::state<unexpected> + sml::event<event::run_effects>[guard::valid_run_effects] /
                                     action::begin_run_effects = sml::state<applying>,
        sml::state<unexpected> +
            sml::event<event::run_effects>[guard::invalid_run_effects] /
                action::reject_invalid_run_effects = sml::state<unexpected>,

        sml::state<selecting>[guard::phase_failed{}] = sml::state<dispatch_decision>,
        sml::state<selecting>[guard::has_pending_event{}] / action::select_next_event =
            sml::state<applying>,
        sml::state<selecting>[guard::no_pending_event{}] = sml::state<dispatch_decision>,

        sml::state<applying>[guard::phase_failed{}] = sml::state<dispatch_decision>,
        sml::state<applying>[guard::has_effect_work{}] / action::apply_next_effect =
            sml::state<applying>,
        sml::state<applying>[guard::no_effect_work{}] = sml::state<selecting>,

        sml::state<dispatch_decision>[guard::phase_ok{}] / action::finalize_done =
            sml::state<done>,
        sml::state<dispatch_decision>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<selecting> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<applying> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<dispatch_decision> + sml::unexpected_event<sml::_> /
                                            action::on_unexpected = sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>);
  }
};

struct sm : public behave::sm<model> {
  using base_type = behave::sm<model>;
  using base_type::base_type;
  using base_type::process_event;
};

}  // namespace behave::dispatcher
