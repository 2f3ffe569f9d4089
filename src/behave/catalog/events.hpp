#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "behave/callback.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"
#include "behave/registry/registry.hpp"

namespace behave::catalog {

struct rejected_entry {
  size_t index = 0;
  std::string name;
  std::vector<std::string> errors;
};

// Outcome of one catalog load. Rejections never abort the remaining entries.
struct load_report {
  std::vector<std::string> loaded;
  std::vector<rejected_entry> rejected;
  std::vector<std::string> warnings;
};

}  // namespace behave::catalog

namespace behave::catalog::events {

struct loading_done;
struct loading_error;

}  // namespace behave::catalog::events

namespace behave::catalog::event {

struct load {
  const expr::value * document = nullptr;
  const expr::operator_table * operators = nullptr;
  registry::builder * builder = nullptr;
  load_report * report_out = nullptr;
  int32_t * error_out = nullptr;
  ::behave::callback<bool(const ::behave::catalog::events::loading_done &)> dispatch_done = {};
  ::behave::callback<bool(const ::behave::catalog::events::loading_error &)> dispatch_error = {};
};

}  // namespace behave::catalog::event

namespace behave::catalog::events {

struct loading_done {
  const event::load * request = nullptr;
  size_t accepted = 0;
  size_t rejected = 0;
};

struct loading_error {
  const event::load * request = nullptr;
  int32_t err = 0;
};

}  // namespace behave::catalog::events
