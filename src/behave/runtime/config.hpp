#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "behave/behave.h"
#include "behave/expr/value.hpp"
#include "behave/schema/behavior.hpp"

namespace behave::runtime {

namespace detail {

inline std::string_view json_type_name(const expr::value & v) noexcept {
  if (v.is_boolean()) {
    return "boolean";
  }
  if (v.is_number()) {
    return "number";
  }
  if (v.is_string()) {
    return "string";
  }
  if (v.is_array()) {
    return "array";
  }
  if (v.is_object()) {
    return "object";
  }
  return "null";
}

// Type tags outside the JSON kinds ("entity", "event", ...) accept any value.
inline bool type_matches(const std::string & type, const expr::value & v) noexcept {
  if (type == "string" || type == "number" || type == "boolean" || type == "array" ||
      type == "object") {
    return json_type_name(v) == type;
  }
  return true;
}

inline bool allowed_contains(const schema::config_field & field, const expr::value & v) {
  for (const expr::value & allowed : field.allowed) {
    if (allowed == v) {
      return true;
    }
  }
  return false;
}

inline int32_t check_field(const schema::behavior_definition & def,
                           const schema::config_field & field, const bool required,
                           expr::value & resolved, std::string & message) {
  auto it = resolved.find(field.name);
  if (it == resolved.end() || it->is_null()) {
    if (field.default_value) {
      resolved[field.name] = *field.default_value;
      return BEHAVE_OK;
    }
    if (required) {
      message = "Missing required config field '" + field.name + "' for " + def.name;
      return BEHAVE_ERR_CONFIG;
    }
    return BEHAVE_OK;
  }
  if (!field.type.empty() && !type_matches(field.type, *it)) {
    message = "Config field '" + field.name + "' for " + def.name + " must be " + field.type +
              " (got: " + std::string(json_type_name(*it)) + ")";
    return BEHAVE_ERR_CONFIG;
  }
  if (!field.allowed.empty() && !allowed_contains(field, *it)) {
    std::string options;
    for (const expr::value & allowed : field.allowed) {
      if (!options.empty()) {
        options += ", ";
      }
      options += allowed.is_string() ? allowed.get<std::string>() : allowed.dump();
    }
    message = "Config field '" + field.name + "' for " + def.name + " must be one of: " + options;
    return BEHAVE_ERR_CONFIG;
  }
  return BEHAVE_OK;
}

}  // namespace detail

/**
 * validates activation config against a behavior's config schema.
 *
 * `resolved` receives the supplied object with declared defaults filled in;
 * fields the schema does not name are kept as given.
 */
inline int32_t resolve_config(const schema::behavior_definition & def,
                              const expr::value & supplied, expr::value & resolved,
                              std::string & message) {
  if (expr::is_nullish(supplied)) {
    resolved = expr::value::object();
  } else if (supplied.is_object()) {
    resolved = supplied;
  } else {
    message = "Config for " + def.name + " must be an object";
    return BEHAVE_ERR_CONFIG;
  }
  for (const schema::config_field & field : def.config.required) {
    const int32_t err = detail::check_field(def, field, true, resolved, message);
    if (err != BEHAVE_OK) {
      return err;
    }
  }
  for (const schema::config_field & field : def.config.optional) {
    const int32_t err = detail::check_field(def, field, false, resolved, message);
    if (err != BEHAVE_OK) {
      return err;
    }
  }
  return BEHAVE_OK;
}

// Fields the linked subject must carry; their values seed the entity data.
inline int32_t check_required_fields(const schema::behavior_definition & def,
                                     const expr::value & subject, std::string & message) {
  for (const schema::config_field & field : def.required_fields) {
    const auto it = subject.find(field.name);
    if (it == subject.end() || it->is_null()) {
      message = "Missing required entity field '" + field.name + "' for " + def.name;
      return BEHAVE_ERR_CONFIG;
    }
    if (!field.type.empty() && !detail::type_matches(field.type, *it)) {
      message = "Entity field '" + field.name + "' for " + def.name + " must be " + field.type +
                " (got: " + std::string(detail::json_type_name(*it)) + ")";
      return BEHAVE_ERR_CONFIG;
    }
  }
  return BEHAVE_OK;
}

}  // namespace behave::runtime
