#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace behave::expr {

// Literal values, payloads, entity data and config all share the json model.
using value = nlohmann::json;

/**
 * undefined sentinel.
 *
 * an unresolved context path evaluates to a discarded json value; it is never
 * stored (set writes null) and never handed to a host hook (see sanitize).
 */
inline value make_undefined() { return value(value::value_t::discarded); }

inline bool is_undefined(const value & v) noexcept { return v.is_discarded(); }

inline bool is_nullish(const value & v) noexcept { return v.is_null() || v.is_discarded(); }

inline bool truthy(const value & v) noexcept {
  switch (v.type()) {
    case value::value_t::null:
    case value::value_t::discarded:
      return false;
    case value::value_t::boolean:
      return v.get<bool>();
    case value::value_t::number_integer:
      return v.get<int64_t>() != 0;
    case value::value_t::number_unsigned:
      return v.get<uint64_t>() != 0;
    case value::value_t::number_float: {
      const double d = v.get<double>();
      return d != 0.0 && !std::isnan(d);
    }
    case value::value_t::string:
      return !v.get_ref<const std::string &>().empty();
    default:
      return true;
  }
}

inline bool parse_number(std::string_view text, double & out) noexcept {
  if (text.empty() || text.size() > 64) {
    return false;
  }
  char buffer[65] = {};
  text.copy(buffer, text.size());
  char * end = nullptr;
  const double parsed = std::strtod(buffer, &end);
  if (end != buffer + text.size()) {
    return false;
  }
  out = parsed;
  return true;
}

// Numeric coercion used by arithmetic and math/*.
inline double to_number(const value & v) noexcept {
  switch (v.type()) {
    case value::value_t::boolean:
      return v.get<bool>() ? 1.0 : 0.0;
    case value::value_t::number_integer:
      return static_cast<double>(v.get<int64_t>());
    case value::value_t::number_unsigned:
      return static_cast<double>(v.get<uint64_t>());
    case value::value_t::number_float:
      return v.get<double>();
    case value::value_t::string: {
      double parsed = 0.0;
      if (parse_number(v.get_ref<const std::string &>(), parsed)) {
        return parsed;
      }
      return 0.0;
    }
    default:
      return 0.0;
  }
}

// Integral results stay integers so they compare and print like authored literals.
inline value make_number(const double d) {
  if (!std::isfinite(d)) {
    return value(nullptr);
  }
  constexpr double k_int_limit = 9007199254740992.0;  // 2^53
  if (std::trunc(d) == d && std::fabs(d) <= k_int_limit) {
    return value(static_cast<int64_t>(d));
  }
  return value(d);
}

inline std::string to_text(const value & v) {
  switch (v.type()) {
    case value::value_t::null:
    case value::value_t::discarded:
      return {};
    case value::value_t::string:
      return v.get<std::string>();
    case value::value_t::boolean:
      return v.get<bool>() ? "true" : "false";
    case value::value_t::number_integer:
      return std::to_string(v.get<int64_t>());
    case value::value_t::number_unsigned:
      return std::to_string(v.get<uint64_t>());
    case value::value_t::number_float: {
      const value normalized = make_number(v.get<double>());
      if (normalized.is_number_integer()) {
        return std::to_string(normalized.get<int64_t>());
      }
      char buffer[32] = {};
      std::snprintf(buffer, sizeof(buffer), "%.15g", v.get<double>());
      return buffer;
    }
    default:
      return v.dump();
  }
}

inline bool loose_equal(const value & a, const value & b) {
  if (is_nullish(a) || is_nullish(b)) {
    return is_nullish(a) && is_nullish(b);
  }
  if (a.is_number() && b.is_number()) {
    return to_number(a) == to_number(b);
  }
  return a == b;
}

// Replaces nested undefined sentinels with null before data leaves the evaluator.
inline value sanitize(const value & v) {
  if (v.is_discarded()) {
    return value(nullptr);
  }
  if (v.is_array()) {
    value out = value::array();
    for (const value & item : v) {
      out.push_back(sanitize(item));
    }
    return out;
  }
  if (v.is_object()) {
    value out = value::object();
    for (auto it = v.begin(); it != v.end(); ++it) {
      out[it.key()] = sanitize(it.value());
    }
    return out;
  }
  return v;
}

}  // namespace behave::expr
