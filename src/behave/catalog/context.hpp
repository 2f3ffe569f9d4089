#pragma once

#include <cstddef>
#include <cstdint>

#include "behave/behave.h"
#include "behave/expr/value.hpp"

namespace behave::catalog::event {
struct load;
}  // namespace behave::catalog::event

namespace behave::catalog::action {

inline constexpr size_t k_max_entries = 4096;
inline constexpr const char * k_behaviors_key = "behaviors";

struct context {
  int32_t phase_error = BEHAVE_OK;
  int32_t last_error = BEHAVE_OK;
  const event::load * request = nullptr;
  const expr::value * entries = nullptr;
  size_t entry_index = 0;
  size_t accepted = 0;
  size_t rejected = 0;
};

}  // namespace behave::catalog::action
