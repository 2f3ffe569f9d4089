#pragma once

#include <cstdint>

#include "behave/catalog/actions.hpp"
#include "behave/catalog/events.hpp"
#include "behave/catalog/guards.hpp"
#include "behave/sm.hpp"

namespace behave::catalog {

struct initialized {};
struct locating {};
struct loading {};
struct load_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * catalog loader orchestration model.
 *
 * state purposes:
 * - `initialized`: idle state awaiting a load request.
 * - `locating`: find the entry array inside the document.
 * - `loading`: decode, validate and register one entry per step.
 * - `load_decision`: branch on the phase result.
 * - `done`/`errored`: terminal outcomes; both accept the next load.
 * - `unexpected`: sequencing contract violation.
 *
 * a rejected entry is recorded in the report and does not fail the load;
 * only an unusable document or an internal fault ends in `errored`.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::load>[guard::valid_load] /
                                       action::begin_load = sml::state<locating>,
        sml::state<initialized> + sml::event<event::load>[guard::invalid_load] /
                                      action::reject_invalid_load = sml::state<errored>,

        sml::state<done> + sml::event<event::load>[guard::valid_load] / action::begin_load =
            sml::state<locating>,
        sml::state<done> + sml::event<event::load>[guard::invalid_load] /
                               action::reject_invalid_load = sml::state<errored>,

        sml::state<errored> + sml::event<event::load>[guard::valid_load] /
                                  action::begin_load = sml::state<locating>,
        sml::state<errored> + sml::event<event::load>[guard::invalid_load] /
                                  action::reject_invalid_load = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::load>[guard::valid_load] /
                                     action::begin_load = sml::state<locating>,
        sml::state<unexpected> + sml::event<event::load>[guard::invalid_load] /
                                     action::reject_invalid_load = sml::state<unexpected>,

        sml::state<locating> / action::locate_entries = sml::state<loading>,

        sml::state<loading>[guard::phase_failed{}] = sml::state<load_decision>,
        sml::state<loading>[guard::has_entry_work{}] / action::load_next_entry =
            sml::state<loading>,
        sml::state<loading>[guard::no_entry_work{}] = sml::state<load_decision>,

        sml::state<load_decision>[guard::phase_ok{}] / action::finalize_done =
            sml::state<done>,
        sml::state<load_decision>[guard::phase_failed{}] / action::finalize_error =
            sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<locating> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<loading> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<load_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
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

}  // namespace behave::catalog
