#include <cstdio>
#include <optional>
#include <string>
#include <utility>

#include <boost/sml.hpp>
#include <doctest/doctest.h>

#include "behave/behave.h"
#include "behave/catalog/file.hpp"
#include "behave/catalog/sm.hpp"
#include "behave/expr/stdlib.hpp"
#include "behave/registry/registry.hpp"

namespace {

using behave::expr::value;

std::string catalog_path() { return std::string(BEHAVE_CATALOG_DIR) + "/std_core.json"; }

struct load_recorder {
  int done_calls = 0;
  int error_calls = 0;
  size_t accepted = 0;
  size_t rejected = 0;
  int32_t err = BEHAVE_OK;

  bool on_done(const behave::catalog::events::loading_done & ev) {
    done_calls += 1;
    accepted = ev.accepted;
    rejected = ev.rejected;
    return true;
  }

  bool on_error(const behave::catalog::events::loading_error & ev) {
    error_calls += 1;
    err = ev.err;
    return true;
  }
};

behave::catalog::event::load make_request(const value & document,
                                          behave::registry::builder & builder,
                                          behave::catalog::load_report & report, int32_t & err,
                                          load_recorder & recorder) {
  using done_cb = behave::callback<bool(const behave::catalog::events::loading_done &)>;
  using error_cb = behave::callback<bool(const behave::catalog::events::loading_error &)>;
  return behave::catalog::event::load{
    .document = &document,
    .operators = &behave::expr::standard_operators(),
    .builder = &builder,
    .report_out = &report,
    .error_out = &err,
    .dispatch_done = done_cb::bind<load_recorder, &load_recorder::on_done>(&recorder),
    .dispatch_error = error_cb::bind<load_recorder, &load_recorder::on_error>(&recorder),
  };
}

}  // namespace

TEST_CASE("catalog_loader_starts_initialized") {
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};
  CHECK(machine.is(boost::sml::state<behave::catalog::initialized>));
}

TEST_CASE("catalog_loader_loads_sample_catalog") {
  behave::registry::builder builder;
  behave::catalog::load_report report;
  const int32_t err = behave::catalog::load_file(catalog_path(), behave::expr::standard_operators(),
                                                 builder, report);
  CHECK(err == BEHAVE_OK);
  CHECK(report.rejected.empty());
  CHECK(report.warnings.empty());
  REQUIRE(report.loaded.size() == 6);
  CHECK(report.loaded[0] == "std/List");
  CHECK(report.loaded[5] == "std/Score");

  const behave::registry::registry reg = std::move(builder).build();
  CHECK(reg.size() == 6);
  CHECK(reg.has("std/Poll"));
  CHECK(reg.list_by_category(behave::schema::category::game_core).size() == 1);
  CHECK(reg.validate_behavior_reference("std/Lst") ==
        std::optional<std::string>("Unknown behavior 'std/Lst'. Did you mean: std/List?"));
}

TEST_CASE("catalog_loader_rejects_bad_entries_and_keeps_going") {
  const value document = value::parse(R"([
    {"name": "std/Good", "category": "async",
     "stateMachine": {"initial": "A", "states": ["A"], "events": ["GO"],
                      "transitions": [{"event": "GO"}]}},
    {"name": "std/Undeclared", "category": "async",
     "stateMachine": {"initial": "A", "states": ["A"], "events": [],
                      "transitions": [{"event": "GO"}]}},
    {"name": "std/Good", "category": "feedback"},
    "not an entry",
    {"name": "std/Warned", "category": "ui-interaction",
     "stateMachine": {"initial": "A", "states": ["A"], "events": ["INIT"],
                      "transitions": [{"event": "INIT", "effects": [
                        ["render-ui", "main", {"type": "entity-table",
                                               "itemActions": [{"event": "SAVE"}]}]]}]}}
  ])");
  behave::registry::builder builder;
  behave::catalog::load_report report;
  int32_t err = BEHAVE_ERR_ENGINE_FAULT;
  load_recorder recorder;
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};

  CHECK(machine.process_event(make_request(document, builder, report, err, recorder)));
  CHECK(machine.is(boost::sml::state<behave::catalog::done>));
  CHECK(err == BEHAVE_OK);
  CHECK(recorder.done_calls == 1);
  CHECK(recorder.error_calls == 0);
  CHECK(recorder.accepted == 2);
  CHECK(recorder.rejected == 3);

  REQUIRE(report.loaded.size() == 2);
  CHECK(report.loaded[0] == "std/Good");
  CHECK(report.loaded[1] == "std/Warned");

  REQUIRE(report.rejected.size() == 3);
  CHECK(report.rejected[0].index == 1);
  CHECK(report.rejected[0].name == "std/Undeclared");
  REQUIRE(report.rejected[0].errors.size() == 1);
  CHECK(report.rejected[0].errors[0] == "Transition uses undeclared event: GO");
  CHECK(report.rejected[1].index == 2);
  REQUIRE(report.rejected[1].errors.size() == 1);
  CHECK(report.rejected[1].errors[0] == "Duplicate behavior name: std/Good");
  CHECK(report.rejected[2].index == 3);
  CHECK(report.rejected[2].name.empty());
  CHECK(report.rejected[2].errors[0] == "Behavior entry must be an object");

  REQUIRE(report.warnings.size() == 1);
  CHECK(report.warnings[0] ==
        "std/Warned: Transition 0 (INIT): Action \"SAVE\" is not valid on \"entity-table\". "
        "Valid actions: VIEW, EDIT, DELETE, SELECT, SORT, PAGE");

  CHECK(builder.size() == 2);
  CHECK(std::move(builder).build().get("std/Good")->kind == behave::schema::category::async);
}

TEST_CASE("catalog_loader_accepts_wrapped_document") {
  const value document = value::parse(R"({"behaviors": [{"name": "std/Only", "category": "feedback"}]})");
  behave::registry::builder builder;
  behave::catalog::load_report report;
  int32_t err = BEHAVE_ERR_ENGINE_FAULT;
  load_recorder recorder;
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};

  CHECK(machine.process_event(make_request(document, builder, report, err, recorder)));
  CHECK(err == BEHAVE_OK);
  CHECK(builder.has("std/Only"));
}

TEST_CASE("catalog_loader_rejects_document_without_entries") {
  const value document = value::parse(R"({"items": []})");
  behave::registry::builder builder;
  behave::catalog::load_report report;
  int32_t err = BEHAVE_OK;
  load_recorder recorder;
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};

  CHECK(machine.process_event(make_request(document, builder, report, err, recorder)));
  CHECK(machine.is(boost::sml::state<behave::catalog::errored>));
  CHECK(err == BEHAVE_ERR_STRUCTURE);
  CHECK(recorder.error_calls == 1);
  CHECK(recorder.err == BEHAVE_ERR_STRUCTURE);
  CHECK(recorder.done_calls == 0);
}

TEST_CASE("catalog_loader_rejects_invalid_request") {
  const value document = value::array();
  behave::registry::builder builder;
  behave::catalog::load_report report;
  int32_t err = BEHAVE_OK;
  load_recorder recorder;
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};

  behave::catalog::event::load request = make_request(document, builder, report, err, recorder);
  request.builder = nullptr;
  CHECK(machine.process_event(request));
  CHECK(machine.is(boost::sml::state<behave::catalog::errored>));
  CHECK(err == BEHAVE_ERR_INVALID_ARGUMENT);
  CHECK(recorder.error_calls == 1);
}

TEST_CASE("catalog_loader_accepts_next_load_after_error") {
  const value bad = value::parse("42");
  const value good = value::parse(R"([{"name": "std/After", "category": "async"}])");
  behave::registry::builder builder;
  behave::catalog::load_report report;
  int32_t err = BEHAVE_OK;
  load_recorder recorder;
  behave::catalog::action::context ctx{};
  behave::catalog::sm machine{ctx};

  CHECK(machine.process_event(make_request(bad, builder, report, err, recorder)));
  CHECK(machine.is(boost::sml::state<behave::catalog::errored>));
  CHECK(machine.process_event(make_request(good, builder, report, err, recorder)));
  CHECK(machine.is(boost::sml::state<behave::catalog::done>));
  CHECK(err == BEHAVE_OK);
  CHECK(builder.has("std/After"));
}

TEST_CASE("catalog_loader_reports_file_errors") {
  behave::registry::builder builder;
  behave::catalog::load_report report;
  CHECK(behave::catalog::load_file("/nonexistent/behave/catalog.json",
                                   behave::expr::standard_operators(), builder,
                                   report) == BEHAVE_ERR_IO);

  const std::string path = "behave_loader_malformed.json";
  std::FILE * file = std::fopen(path.c_str(), "wb");
  REQUIRE(file != nullptr);
  std::fputs("{\"behaviors\": [", file);
  std::fclose(file);
  CHECK(behave::catalog::load_file(path, behave::expr::standard_operators(), builder, report) ==
        BEHAVE_ERR_PARSE_FAILED);
  std::remove(path.c_str());
  CHECK(builder.size() == 0);
}
