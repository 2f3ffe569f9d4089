#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "behave/behave.h"
#include "behave/callback.hpp"
#include "behave/expr/value.hpp"

namespace behave::runtime {

using instance_id = uint64_t;

inline constexpr instance_id k_invalid_instance = 0;

/**
 * host collaborators for a runtime engine.
 *
 * every hook is optional; unset hooks accept the request and do nothing.
 * hooks are called after the instance lock is released, in effect order, so
 * they may query or deliver to the engine. a non-OK status stops the
 * remaining hook calls of that request and is returned by the engine call
 * that ran it; entity and state changes already made stay applied.
 */
struct hooks {
  // props == null clears the slot.
  callback<int32_t(instance_id, const std::string & slot, const std::string & component,
                   const expr::value & props)>
      render = {};
  callback<int32_t(instance_id, behave_persist_op, const std::string & entity,
                   const expr::value & payload)>
      persist = {};
  callback<int32_t(instance_id, behave_notify_kind, const std::string & message,
                   const expr::value & action)>
      notify = {};
  callback<int32_t(instance_id, const std::string & path, const expr::value & params)>
      navigate = {};
  // Milliseconds; the system clock is used when unset.
  callback<int64_t()> clock = {};
};

inline int64_t system_clock_ms() noexcept {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

}  // namespace behave::runtime
