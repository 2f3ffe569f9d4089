#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/expr/ast.hpp"
#include "behave/expr/evaluator.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"

namespace behave::expr::stdlib {

inline const value & undefined_value() {
  static const value k_undefined = make_undefined();
  return k_undefined;
}

inline const value & arg(const value * args, const size_t count, const size_t i) {
  return i < count ? args[i] : undefined_value();
}

inline const value & array_or_empty(const value & v) {
  static const value k_empty = value::array();
  return v.is_array() ? v : k_empty;
}

inline const value & object_or_empty(const value & v) {
  static const value k_empty = value::object();
  return v.is_object() ? v : k_empty;
}

// JS-style slice bounds: negatives count from the end, results are clamped.
inline void slice_bounds(const size_t size, const value & start_v, const value & end_v,
                         size_t & begin, size_t & end) {
  const auto clamp_index = [size](const double raw) {
    const double n = static_cast<double>(size);
    double idx = std::trunc(raw);
    if (idx < 0) {
      idx = std::max(0.0, n + idx);
    }
    return static_cast<size_t>(std::min(idx, n));
  };
  begin = is_nullish(start_v) ? 0 : clamp_index(to_number(start_v));
  end = is_nullish(end_v) ? size : clamp_index(to_number(end_v));
  if (end < begin) {
    end = begin;
  }
}

// ---- arithmetic, comparison, logic ----

inline value op_add(eval_frame &, const value * args, const size_t count) {
  double total = 0.0;
  for (size_t i = 0; i < count; ++i) {
    total += to_number(args[i]);
  }
  return make_number(total);
}

inline value op_sub(eval_frame &, const value * args, const size_t count) {
  if (count == 1) {
    return make_number(-to_number(args[0]));
  }
  double total = to_number(args[0]);
  for (size_t i = 1; i < count; ++i) {
    total -= to_number(args[i]);
  }
  return make_number(total);
}

inline value op_mul(eval_frame &, const value * args, const size_t count) {
  double total = 1.0;
  for (size_t i = 0; i < count; ++i) {
    total *= to_number(args[i]);
  }
  return make_number(total);
}

inline value op_div(eval_frame &, const value * args, const size_t) {
  const double divisor = to_number(args[1]);
  if (divisor == 0.0) {
    return value(nullptr);
  }
  return make_number(to_number(args[0]) / divisor);
}

inline value op_mod(eval_frame &, const value * args, const size_t) {
  const double divisor = to_number(args[1]);
  if (divisor == 0.0) {
    return value(nullptr);
  }
  return make_number(std::fmod(to_number(args[0]), divisor));
}

inline value op_eq(eval_frame &, const value * args, const size_t) {
  return value(loose_equal(args[0], args[1]));
}

inline value op_ne(eval_frame &, const value * args, const size_t) {
  return value(!loose_equal(args[0], args[1]));
}

enum class ordering : uint8_t { lt, gt, le, ge };

inline bool compare(const value & a, const value & b, const ordering ord) {
  if (is_nullish(a) || is_nullish(b)) {
    return false;
  }
  int cmp = 0;
  if (a.is_string() && b.is_string()) {
    cmp = a.get_ref<const std::string &>().compare(b.get_ref<const std::string &>());
  } else {
    const double x = to_number(a);
    const double y = to_number(b);
    cmp = x < y ? -1 : (x > y ? 1 : 0);
  }
  switch (ord) {
    case ordering::lt:
      return cmp < 0;
    case ordering::gt:
      return cmp > 0;
    case ordering::le:
      return cmp <= 0;
    case ordering::ge:
    default:
      return cmp >= 0;
  }
}

template <ordering Ord>
value op_compare(eval_frame &, const value * args, const size_t) {
  return value(compare(args[0], args[1], Ord));
}

inline value op_not(eval_frame &, const value * args, const size_t) {
  return value(!truthy(args[0]));
}

// ---- special forms ----

inline value form_if(eval_frame & frame, const call & c) {
  const value cond = eval(frame, c.args[0]);
  if (failed(frame)) {
    return make_undefined();
  }
  if (truthy(cond)) {
    return eval(frame, c.args[1]);
  }
  return c.args.size() > 2 ? eval(frame, c.args[2]) : value(nullptr);
}

inline value form_when(eval_frame & frame, const call & c) {
  const value cond = eval(frame, c.args[0]);
  if (failed(frame) || !truthy(cond)) {
    return value(nullptr);
  }
  return eval(frame, c.args[1]);
}

inline value form_do(eval_frame & frame, const call & c) {
  value last = value(nullptr);
  for (const node & step : c.args) {
    last = eval(frame, step);
    if (failed(frame)) {
      break;
    }
  }
  return last;
}

inline value form_let(eval_frame & frame, const call & c) {
  const array_form * bindings = as_array(c.args[0]);
  if (bindings == nullptr) {
    return fault(frame, "Operator 'let' bindings are malformed");
  }
  local_scope scope{frame};
  for (const node & binding : bindings->items) {
    const array_form * pair = as_array(binding);
    if (pair == nullptr || pair->items.size() != 2 || as_literal(pair->items[0]) == nullptr) {
      return fault(frame, "Operator 'let' bindings are malformed");
    }
    value bound = eval(frame, pair->items[1]);
    if (failed(frame)) {
      return make_undefined();
    }
    scope.bind(to_text(as_literal(pair->items[0])->val), std::move(bound));
  }
  value last = value(nullptr);
  for (size_t i = 1; i < c.args.size(); ++i) {
    last = eval(frame, c.args[i]);
    if (failed(frame)) {
      break;
    }
  }
  return last;
}

// A bare lambda only has meaning as an argument to a higher-order operator.
inline value form_fn(eval_frame &, const call &) { return value(nullptr); }

inline value form_and(eval_frame & frame, const call & c) {
  for (const node & term : c.args) {
    if (!truthy(eval(frame, term)) || failed(frame)) {
      return value(false);
    }
  }
  return value(true);
}

inline value form_or(eval_frame & frame, const call & c) {
  for (const node & term : c.args) {
    const bool hit = truthy(eval(frame, term));
    if (failed(frame)) {
      return value(false);
    }
    if (hit) {
      return value(true);
    }
  }
  return value(false);
}

// ---- math/* ----

template <double (*Fn)(double)>
value math_unary(eval_frame &, const value * args, const size_t) {
  return make_number(Fn(to_number(args[0])));
}

inline double js_round(const double x) { return std::floor(x + 0.5); }
inline double js_sign(const double x) { return x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0); }
inline double std_abs(const double x) { return std::fabs(x); }
inline double std_floor(const double x) { return std::floor(x); }
inline double std_ceil(const double x) { return std::ceil(x); }
inline double std_sqrt(const double x) { return std::sqrt(x); }

inline void collect_numbers(const value * args, const size_t count, std::vector<double> & out) {
  if (count == 1 && args[0].is_array()) {
    for (const value & item : args[0]) {
      out.push_back(to_number(item));
    }
    return;
  }
  for (size_t i = 0; i < count; ++i) {
    out.push_back(to_number(args[i]));
  }
}

inline value math_min(eval_frame &, const value * args, const size_t count) {
  std::vector<double> numbers;
  collect_numbers(args, count, numbers);
  if (numbers.empty()) {
    return value(nullptr);
  }
  return make_number(*std::min_element(numbers.begin(), numbers.end()));
}

inline value math_max(eval_frame &, const value * args, const size_t count) {
  std::vector<double> numbers;
  collect_numbers(args, count, numbers);
  if (numbers.empty()) {
    return value(nullptr);
  }
  return make_number(*std::max_element(numbers.begin(), numbers.end()));
}

inline value math_clamp(eval_frame &, const value * args, const size_t) {
  const double lo = to_number(args[1]);
  const double hi = to_number(args[2]);
  return make_number(std::min(std::max(to_number(args[0]), lo), hi));
}

inline value math_pow(eval_frame &, const value * args, const size_t) {
  return make_number(std::pow(to_number(args[0]), to_number(args[1])));
}

inline value math_mod(eval_frame &, const value * args, const size_t) {
  const double divisor = to_number(args[1]);
  if (divisor == 0.0) {
    return value(nullptr);
  }
  return make_number(std::fmod(std::fmod(to_number(args[0]), divisor) + divisor, divisor));
}

inline value math_lerp(eval_frame &, const value * args, const size_t) {
  const double a = to_number(args[0]);
  const double b = to_number(args[1]);
  return make_number(a + (b - a) * to_number(args[2]));
}

inline value math_default(eval_frame &, const value * args, const size_t) {
  return is_nullish(args[0]) ? args[1] : args[0];
}

// ---- str/* ----

inline value str_len(eval_frame &, const value * args, const size_t) {
  return value(static_cast<int64_t>(to_text(args[0]).size()));
}

inline value str_concat(eval_frame &, const value * args, const size_t count) {
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    out += to_text(args[i]);
  }
  return value(std::move(out));
}

inline value str_slice(eval_frame &, const value * args, const size_t count) {
  const std::string text = to_text(args[0]);
  size_t begin = 0;
  size_t end = 0;
  slice_bounds(text.size(), args[1], arg(args, count, 2), begin, end);
  return value(text.substr(begin, end - begin));
}

inline value str_upper(eval_frame &, const value * args, const size_t) {
  std::string text = to_text(args[0]);
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return value(std::move(text));
}

inline value str_lower(eval_frame &, const value * args, const size_t) {
  std::string text = to_text(args[0]);
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value(std::move(text));
}

inline value str_trim(eval_frame &, const value * args, const size_t) {
  const std::string text = to_text(args[0]);
  const size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return value(std::string());
  }
  const size_t last = text.find_last_not_of(" \t\r\n");
  return value(text.substr(first, last - first + 1));
}

inline value str_includes(eval_frame &, const value * args, const size_t) {
  return value(to_text(args[0]).find(to_text(args[1])) != std::string::npos);
}

inline value str_starts_with(eval_frame &, const value * args, const size_t) {
  const std::string text = to_text(args[0]);
  const std::string prefix = to_text(args[1]);
  return value(text.compare(0, prefix.size(), prefix) == 0 && text.size() >= prefix.size());
}

inline value str_ends_with(eval_frame &, const value * args, const size_t) {
  const std::string text = to_text(args[0]);
  const std::string suffix = to_text(args[1]);
  return value(text.size() >= suffix.size() &&
               text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0);
}

inline value str_split(eval_frame &, const value * args, const size_t) {
  const std::string text = to_text(args[0]);
  const std::string sep = to_text(args[1]);
  value out = value::array();
  if (sep.empty()) {
    for (const char ch : text) {
      out.push_back(std::string(1, ch));
    }
    return out;
  }
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(sep, start);
    if (pos == std::string::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + sep.size();
  }
  return out;
}

inline value str_join(eval_frame &, const value * args, const size_t count) {
  const std::string sep = count > 1 ? to_text(args[1]) : std::string(",");
  std::string out;
  bool first = true;
  for (const value & item : array_or_empty(args[0])) {
    if (!first) {
      out += sep;
    }
    out += to_text(item);
    first = false;
  }
  return value(std::move(out));
}

inline value str_default(eval_frame &, const value * args, const size_t) {
  return to_text(args[0]).empty() ? args[1] : args[0];
}

// ---- array/* ----

inline value array_len(eval_frame &, const value * args, const size_t) {
  return value(static_cast<int64_t>(array_or_empty(args[0]).size()));
}

inline value array_empty(eval_frame &, const value * args, const size_t) {
  return value(array_or_empty(args[0]).empty());
}

inline value array_first(eval_frame &, const value * args, const size_t) {
  const value & items = array_or_empty(args[0]);
  return items.empty() ? make_undefined() : items.front();
}

inline value array_last(eval_frame &, const value * args, const size_t) {
  const value & items = array_or_empty(args[0]);
  return items.empty() ? make_undefined() : items.back();
}

inline value array_nth(eval_frame &, const value * args, const size_t) {
  const value & items = array_or_empty(args[0]);
  const double raw = to_number(args[1]);
  if (raw < 0 || raw >= static_cast<double>(items.size())) {
    return make_undefined();
  }
  return items[static_cast<size_t>(raw)];
}

inline value array_slice(eval_frame &, const value * args, const size_t count) {
  const value & items = array_or_empty(args[0]);
  size_t begin = 0;
  size_t end = 0;
  slice_bounds(items.size(), arg(args, count, 1), arg(args, count, 2), begin, end);
  value out = value::array();
  for (size_t i = begin; i < end; ++i) {
    out.push_back(items[i]);
  }
  return out;
}

inline value array_concat(eval_frame &, const value * args, const size_t count) {
  value out = value::array();
  for (size_t i = 0; i < count; ++i) {
    for (const value & item : array_or_empty(args[i])) {
      out.push_back(item);
    }
  }
  return out;
}

inline value array_append(eval_frame &, const value * args, const size_t) {
  value out = array_or_empty(args[0]);
  out.push_back(sanitize(args[1]));
  return out;
}

inline value array_prepend(eval_frame &, const value * args, const size_t) {
  value out = value::array();
  out.push_back(sanitize(args[1]));
  for (const value & item : array_or_empty(args[0])) {
    out.push_back(item);
  }
  return out;
}

inline value array_remove(eval_frame &, const value * args, const size_t) {
  const value & items = array_or_empty(args[0]);
  const double raw = to_number(args[1]);
  value out = value::array();
  for (size_t i = 0; i < items.size(); ++i) {
    if (static_cast<double>(i) != raw) {
      out.push_back(items[i]);
    }
  }
  return out;
}

inline value array_remove_item(eval_frame &, const value * args, const size_t) {
  value out = value::array();
  for (const value & item : array_or_empty(args[0])) {
    if (!loose_equal(item, args[1])) {
      out.push_back(item);
    }
  }
  return out;
}

inline value array_reverse(eval_frame &, const value * args, const size_t) {
  value out = array_or_empty(args[0]);
  std::reverse(out.begin(), out.end());
  return out;
}

inline value array_unique(eval_frame &, const value * args, const size_t) {
  value out = value::array();
  for (const value & item : array_or_empty(args[0])) {
    bool seen = false;
    for (const value & kept : out) {
      if (loose_equal(kept, item)) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      out.push_back(item);
    }
  }
  return out;
}

inline value array_index_of(eval_frame &, const value * args, const size_t) {
  const value & items = array_or_empty(args[0]);
  for (size_t i = 0; i < items.size(); ++i) {
    if (loose_equal(items[i], args[1])) {
      return value(static_cast<int64_t>(i));
    }
  }
  return value(static_cast<int64_t>(-1));
}

inline value array_includes(eval_frame & frame, const value * args, const size_t count) {
  return value(array_index_of(frame, args, count).get<int64_t>() >= 0);
}

inline value array_sum(eval_frame &, const value * args, const size_t) {
  double total = 0.0;
  for (const value & item : array_or_empty(args[0])) {
    total += to_number(item);
  }
  return make_number(total);
}

enum class lambda_mode : uint8_t { filter, reject, map, find, find_index, some, every };

template <lambda_mode Mode>
value array_lambda(eval_frame & frame, const call & c) {
  const value source = eval(frame, c.args[0]);
  if (failed(frame)) {
    return make_undefined();
  }
  const value & items = array_or_empty(source);
  value out = value::array();
  for (size_t i = 0; i < items.size(); ++i) {
    const value call_args[2] = {items[i], value(static_cast<int64_t>(i))};
    const value result = call_lambda(frame, c.args[1], call_args, 2);
    if (failed(frame)) {
      return make_undefined();
    }
    const bool hit = truthy(result);
    switch (Mode) {
      case lambda_mode::filter:
        if (hit) {
          out.push_back(items[i]);
        }
        break;
      case lambda_mode::reject:
        if (!hit) {
          out.push_back(items[i]);
        }
        break;
      case lambda_mode::map:
        out.push_back(sanitize(result));
        break;
      case lambda_mode::find:
        if (hit) {
          return items[i];
        }
        break;
      case lambda_mode::find_index:
        if (hit) {
          return value(static_cast<int64_t>(i));
        }
        break;
      case lambda_mode::some:
        if (hit) {
          return value(true);
        }
        break;
      case lambda_mode::every:
        if (!hit) {
          return value(false);
        }
        break;
    }
  }
  switch (Mode) {
    case lambda_mode::find:
      return make_undefined();
    case lambda_mode::find_index:
      return value(static_cast<int64_t>(-1));
    case lambda_mode::some:
      return value(false);
    case lambda_mode::every:
      return value(true);
    default:
      return out;
  }
}

inline value array_reduce(eval_frame & frame, const call & c) {
  const value source = eval(frame, c.args[0]);
  value acc = c.args.size() > 2 ? eval(frame, c.args[2]) : value(nullptr);
  if (failed(frame)) {
    return make_undefined();
  }
  const value & items = array_or_empty(source);
  for (size_t i = 0; i < items.size(); ++i) {
    const value call_args[3] = {acc, items[i], value(static_cast<int64_t>(i))};
    acc = call_lambda(frame, c.args[1], call_args, 3);
    if (failed(frame)) {
      return make_undefined();
    }
  }
  return acc;
}

// ---- object/* ----

inline value object_keys(eval_frame &, const value * args, const size_t) {
  value out = value::array();
  const value & obj = object_or_empty(args[0]);
  for (auto it = obj.begin(); it != obj.end(); ++it) {
    out.push_back(it.key());
  }
  return out;
}

inline value object_values(eval_frame &, const value * args, const size_t) {
  value out = value::array();
  for (const value & item : object_or_empty(args[0])) {
    out.push_back(item);
  }
  return out;
}

inline value object_get(eval_frame &, const value * args, const size_t count) {
  const std::string path = to_text(args[1]);
  std::vector<std::string> segments;
  size_t start = 0;
  while (true) {
    const size_t dot = path.find('.', start);
    segments.push_back(path.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  value found = walk_path(&args[0], segments);
  if (is_undefined(found) && count > 2) {
    return args[2];
  }
  return found;
}

inline value object_set(eval_frame &, const value * args, const size_t) {
  value out = object_or_empty(args[0]);
  out[to_text(args[1])] = sanitize(args[2]);
  return out;
}

inline value object_has(eval_frame &, const value * args, const size_t) {
  return value(object_or_empty(args[0]).contains(to_text(args[1])));
}

inline value object_remove(eval_frame &, const value * args, const size_t) {
  value out = object_or_empty(args[0]);
  out.erase(to_text(args[1]));
  return out;
}

inline value object_merge(eval_frame &, const value * args, const size_t count) {
  value out = value::object();
  for (size_t i = 0; i < count; ++i) {
    const value & obj = object_or_empty(args[i]);
    for (auto it = obj.begin(); it != obj.end(); ++it) {
      out[it.key()] = it.value();
    }
  }
  return out;
}

// ---- time/*, validate/*, format/* ----

inline value time_now(eval_frame & frame, const value *, const size_t) {
  return value(frame.ctx->now_ms);
}

inline bool looks_like_email(const std::string & text) {
  const size_t at = text.find('@');
  if (at == std::string::npos || at == 0 || text.find('@', at + 1) != std::string::npos) {
    return false;
  }
  const size_t dot = text.find('.', at + 2);
  if (dot == std::string::npos || dot + 1 >= text.size()) {
    return false;
  }
  return text.find_first_of(" \t\r\n") == std::string::npos;
}

inline bool length_of(const value & v, size_t & out) {
  if (v.is_string()) {
    out = v.get_ref<const std::string &>().size();
    return true;
  }
  if (v.is_array()) {
    out = v.size();
    return true;
  }
  return false;
}

inline bool rule_passes(const std::string & rule, const value & field, const value & params,
                        bool & known) {
  known = true;
  const value & p0 = params.size() > 0 ? params[0] : undefined_value();
  const value & p1 = params.size() > 1 ? params[1] : undefined_value();
  size_t len = 0;
  if (rule == "required") {
    return !is_nullish(field) && !(field.is_string() && field.get_ref<const std::string &>().empty());
  }
  if (rule == "string") {
    return field.is_string();
  }
  if (rule == "number") {
    return field.is_number();
  }
  if (rule == "boolean") {
    return field.is_boolean();
  }
  if (rule == "email") {
    return field.is_string() && looks_like_email(field.get_ref<const std::string &>());
  }
  if (rule == "minLength") {
    return length_of(field, len) && static_cast<double>(len) >= to_number(p0);
  }
  if (rule == "maxLength") {
    return length_of(field, len) && static_cast<double>(len) <= to_number(p0);
  }
  if (rule == "min") {
    return field.is_number() && to_number(field) >= to_number(p0);
  }
  if (rule == "max") {
    return field.is_number() && to_number(field) <= to_number(p0);
  }
  if (rule == "range") {
    return field.is_number() && to_number(field) >= to_number(p0) &&
           to_number(field) <= to_number(p1);
  }
  if (rule == "pattern") {
    if (!field.is_string()) {
      return false;
    }
    try {
      return std::regex_search(field.get_ref<const std::string &>(), std::regex(to_text(p0)));
    } catch (const std::regex_error &) {
      return false;
    }
  }
  if (rule == "oneOf") {
    for (const value & option : array_or_empty(p0)) {
      if (loose_equal(option, field)) {
        return true;
      }
    }
    return false;
  }
  known = false;
  return true;
}

// ["validate/check", values, {field: [[rule, args...], ...]}] -> {valid, errors}
inline value validate_check(eval_frame &, const value * args, const size_t) {
  const value & values = object_or_empty(args[0]);
  const value & rules = object_or_empty(args[1]);
  value errors = value::array();
  for (auto it = rules.begin(); it != rules.end(); ++it) {
    const auto field_it = values.find(it.key());
    const value & field = field_it == values.end() ? undefined_value() : *field_it;
    for (const value & rule : array_or_empty(it.value())) {
      if (!rule.is_array() || rule.empty() || !rule[0].is_string()) {
        continue;
      }
      value params = value::array();
      for (size_t i = 1; i < rule.size(); ++i) {
        params.push_back(rule[i]);
      }
      const std::string & name = rule[0].get_ref<const std::string &>();
      bool known = false;
      if (!rule_passes(name, field, params, known) && known) {
        errors.push_back(it.key() + ": " + name + " validation failed");
      }
    }
  }
  value out = value::object();
  out["valid"] = errors.empty();
  out["errors"] = std::move(errors);
  return out;
}

inline value validate_required(eval_frame &, const value * args, const size_t) {
  bool known = false;
  return value(rule_passes("required", args[0], value::array(), known));
}

inline value validate_email(eval_frame &, const value * args, const size_t) {
  return value(args[0].is_string() && looks_like_email(args[0].get_ref<const std::string &>()));
}

inline value format_plural(eval_frame &, const value * args, const size_t) {
  const double n = to_number(args[0]);
  return value(to_text(make_number(n)) + " " + to_text(std::fabs(n) == 1.0 ? args[1] : args[2]));
}

inline value format_list(eval_frame &, const value * args, const size_t count) {
  const value & items = array_or_empty(args[0]);
  const std::string style = count > 1 ? to_text(args[1]) : std::string("and");
  if (items.empty()) {
    return value(std::string());
  }
  if (items.size() == 1) {
    return value(to_text(items[0]));
  }
  if (items.size() == 2) {
    return value(to_text(items[0]) + " " + style + " " + to_text(items[1]));
  }
  std::string out;
  for (size_t i = 0; i + 1 < items.size(); ++i) {
    out += to_text(items[i]);
    out += ", ";
  }
  return value(out + style + " " + to_text(items.back()));
}

// ---- effect operators ----

inline value sink_result(eval_frame & frame, const int32_t err, const std::string & op_name) {
  if (err != BEHAVE_OK) {
    return fault(frame, "Operator '" + op_name + "' rejected by host: " + status_name(err), err);
  }
  return value(nullptr);
}

inline value effect_set(eval_frame & frame, const call & c) {
  const context_ref * target = as_ref(c.args[0]);
  if (target == nullptr || target->root != ref_root::entity || target->path.empty()) {
    return fault(frame, "Operator 'set' target must be an @entity field");
  }
  value v = eval(frame, c.args[1]);
  if (failed(frame)) {
    return make_undefined();
  }
  std::string message;
  const int32_t err = frame.sink->set(*target, sanitize(v), message);
  if (err != BEHAVE_OK) {
    return fault(frame, message.empty() ? "Operator 'set' failed for " + target->text : message,
                 err);
  }
  return value(nullptr);
}

inline value effect_emit(eval_frame & frame, const value * args, const size_t count) {
  const std::string key = to_text(args[0]);
  if (key.empty()) {
    return fault(frame, "Operator 'emit' requires an event key");
  }
  value payload = count > 1 && !is_nullish(args[1]) ? sanitize(args[1]) : value::object();
  return sink_result(frame, frame.sink->emit(key, std::move(payload)), "emit");
}

inline value effect_render(eval_frame & frame, const value * args, const size_t count) {
  const std::string slot = to_text(args[0]);
  const value & component = args[1];
  const value & props = arg(args, count, 2);
  if (is_nullish(component) || (count > 2 && is_nullish(props))) {
    return sink_result(frame, frame.sink->render(slot, std::string(), value(nullptr)), "render");
  }
  value sent = count > 2 ? sanitize(props) : value::object();
  return sink_result(frame, frame.sink->render(slot, to_text(component), std::move(sent)), "render");
}

inline value effect_render_ui(eval_frame & frame, const value * args, const size_t) {
  const std::string slot = to_text(args[0]);
  const value & props = args[1];
  if (is_nullish(props)) {
    return sink_result(frame, frame.sink->render(slot, std::string(), value(nullptr)),
                       "render-ui");
  }
  if (!props.is_object()) {
    return fault(frame, "Operator 'render-ui' props must be an object or null");
  }
  const auto type_it = props.find("type");
  if (type_it == props.end() || !type_it->is_string()) {
    return fault(frame, "Operator 'render-ui' props require a component 'type'");
  }
  return sink_result(frame, frame.sink->render(slot, type_it->get<std::string>(), sanitize(props)),
                     "render-ui");
}

inline bool parse_notify_kind(const value & v, behave_notify_kind & out) {
  if (is_nullish(v)) {
    out = BEHAVE_NOTIFY_INFO;
    return true;
  }
  const std::string text = to_text(v);
  if (text == "success") {
    out = BEHAVE_NOTIFY_SUCCESS;
  } else if (text == "error") {
    out = BEHAVE_NOTIFY_ERROR;
  } else if (text == "info") {
    out = BEHAVE_NOTIFY_INFO;
  } else if (text == "warning") {
    out = BEHAVE_NOTIFY_WARNING;
  } else {
    return false;
  }
  return true;
}

// ["notify", {type, message, action?}] or ["notify", type, message, action?]
inline value effect_notify(eval_frame & frame, const value * args, const size_t count) {
  value kind_v;
  std::string message;
  value action = value(nullptr);
  if (count == 1 && args[0].is_object()) {
    const value & spec = args[0];
    kind_v = spec.contains("type") ? spec["type"] : value(nullptr);
    message = spec.contains("message") ? to_text(spec["message"]) : std::string();
    if (spec.contains("action")) {
      action = sanitize(spec["action"]);
    }
  } else if (count == 1) {
    kind_v = value(nullptr);
    message = to_text(args[0]);
  } else {
    kind_v = args[0];
    message = to_text(args[1]);
    action = sanitize(arg(args, count, 2));
  }
  behave_notify_kind kind = BEHAVE_NOTIFY_INFO;
  if (!parse_notify_kind(kind_v, kind)) {
    return fault(frame, "Unknown notify type '" + to_text(kind_v) + "'");
  }
  return sink_result(frame, frame.sink->notify(kind, message, std::move(action)), "notify");
}

inline bool parse_persist_op(const std::string & text, behave_persist_op & out) noexcept {
  if (text == "create") {
    out = BEHAVE_PERSIST_CREATE;
  } else if (text == "update") {
    out = BEHAVE_PERSIST_UPDATE;
  } else if (text == "delete") {
    out = BEHAVE_PERSIST_DELETE;
  } else if (text == "save") {
    out = BEHAVE_PERSIST_SAVE;
  } else {
    return false;
  }
  return true;
}

inline value effect_persist(eval_frame & frame, const value * args, const size_t count) {
  const std::string op_text = to_text(args[0]);
  behave_persist_op op = BEHAVE_PERSIST_SAVE;
  if (!parse_persist_op(op_text, op)) {
    return fault(frame, "Unknown persist operation '" + op_text + "'");
  }
  value payload = count > 2 ? sanitize(args[2]) : value::object();
  return sink_result(frame, frame.sink->persist(op, to_text(args[1]), std::move(payload)),
                     "persist");
}

inline value effect_navigate(eval_frame & frame, const value * args, const size_t count) {
  value params = count > 1 && !is_nullish(args[1]) ? sanitize(args[1]) : value::object();
  return sink_result(frame, frame.sink->navigate(to_text(args[0]), std::move(params)),
                     "navigate");
}

template <timer_kind Kind>
value effect_timer(eval_frame & frame, const call & c) {
  const value delay = eval(frame, c.args[0]);
  if (failed(frame)) {
    return make_undefined();
  }
  if (c.args.size() < 2) {
    return value(nullptr);
  }
  const double requested = to_number(delay);
  if (std::isnan(requested)) {
    return fault(frame, "Operator '" + c.name + "' delay must be a number of milliseconds");
  }
  // fractional delays round up, so 0.5 never collapses into an immediate timer
  const double limit = static_cast<double>(k_max_timer_delay_ms);
  const int64_t ms = static_cast<int64_t>(std::ceil(std::clamp(requested, 0.0, limit)));
  value payload = frame.ctx->payload != nullptr ? sanitize(*frame.ctx->payload) : value::object();
  return sink_result(frame,
                     frame.sink->schedule(Kind, ms, &c.args[1],
                                          capture_locals(frame), std::move(payload)),
                     c.name);
}

}  // namespace behave::expr::stdlib

namespace behave::expr {

namespace detail {

inline operator_meta eager_op(std::string name, const int32_t min_arity,
                              const int32_t max_arity, const eager_fn fn,
                              const operator_kind kind = operator_kind::pure) {
  operator_meta meta;
  meta.name = std::move(name);
  meta.min_arity = min_arity;
  meta.max_arity = max_arity;
  meta.kind = kind;
  meta.eager = fn;
  return meta;
}

inline operator_meta form_op(std::string name, const int32_t min_arity, const int32_t max_arity,
                             const form_fn fn, const operator_kind kind,
                             const bool accepts_lambda = false) {
  operator_meta meta;
  meta.name = std::move(name);
  meta.min_arity = min_arity;
  meta.max_arity = max_arity;
  meta.kind = kind;
  meta.accepts_lambda = accepts_lambda;
  meta.form = fn;
  return meta;
}

}  // namespace detail

// Adds the standard operator set to `table`; returns the first failed insert.
inline int32_t register_standard_operators(operator_table & table) {
  namespace lib = behave::expr::stdlib;
  using k = operator_kind;
  using detail::eager_op;
  using detail::form_op;
  int32_t err = BEHAVE_OK;
  const auto add = [&table, &err](operator_meta meta) {
    const int32_t added = table.add(std::move(meta));
    if (err == BEHAVE_OK) {
      err = added;
    }
  };

  add(form_op("if", 2, 3, lib::form_if, k::special_form));
  add(form_op("when", 2, 2, lib::form_when, k::special_form));
  add(form_op("do", 0, -1, lib::form_do, k::special_form));
  add(form_op("let", 2, -1, lib::form_let, k::special_form));
  add(form_op("fn", 2, -1, lib::form_fn, k::special_form));
  add(form_op("and", 0, -1, lib::form_and, k::special_form));
  add(form_op("or", 0, -1, lib::form_or, k::special_form));

  add(eager_op("+", 0, -1, lib::op_add));
  add(eager_op("-", 1, -1, lib::op_sub));
  add(eager_op("*", 0, -1, lib::op_mul));
  add(eager_op("/", 2, 2, lib::op_div));
  add(eager_op("%", 2, 2, lib::op_mod));
  add(eager_op("=", 2, 2, lib::op_eq));
  add(eager_op("==", 2, 2, lib::op_eq));
  add(eager_op("!=", 2, 2, lib::op_ne));
  add(eager_op("<", 2, 2, lib::op_compare<lib::ordering::lt>));
  add(eager_op(">", 2, 2, lib::op_compare<lib::ordering::gt>));
  add(eager_op("<=", 2, 2, lib::op_compare<lib::ordering::le>));
  add(eager_op(">=", 2, 2, lib::op_compare<lib::ordering::ge>));
  add(eager_op("not", 1, 1, lib::op_not));

  add(eager_op("math/abs", 1, 1, lib::math_unary<lib::std_abs>));
  add(eager_op("math/floor", 1, 1, lib::math_unary<lib::std_floor>));
  add(eager_op("math/ceil", 1, 1, lib::math_unary<lib::std_ceil>));
  add(eager_op("math/round", 1, 1, lib::math_unary<lib::js_round>));
  add(eager_op("math/sqrt", 1, 1, lib::math_unary<lib::std_sqrt>));
  add(eager_op("math/sign", 1, 1, lib::math_unary<lib::js_sign>));
  add(eager_op("math/min", 1, -1, lib::math_min));
  add(eager_op("math/max", 1, -1, lib::math_max));
  add(eager_op("math/clamp", 3, 3, lib::math_clamp));
  add(eager_op("math/pow", 2, 2, lib::math_pow));
  add(eager_op("math/mod", 2, 2, lib::math_mod));
  add(eager_op("math/lerp", 3, 3, lib::math_lerp));
  add(eager_op("math/default", 2, 2, lib::math_default));

  add(eager_op("str/len", 1, 1, lib::str_len));
  add(eager_op("str/concat", 0, -1, lib::str_concat));
  add(eager_op("str/slice", 2, 3, lib::str_slice));
  add(eager_op("str/upper", 1, 1, lib::str_upper));
  add(eager_op("str/lower", 1, 1, lib::str_lower));
  add(eager_op("str/trim", 1, 1, lib::str_trim));
  add(eager_op("str/includes", 2, 2, lib::str_includes));
  add(eager_op("str/startsWith", 2, 2, lib::str_starts_with));
  add(eager_op("str/endsWith", 2, 2, lib::str_ends_with));
  add(eager_op("str/split", 2, 2, lib::str_split));
  add(eager_op("str/join", 1, 2, lib::str_join));
  add(eager_op("str/default", 2, 2, lib::str_default));

  add(eager_op("array/len", 1, 1, lib::array_len));
  add(eager_op("array/empty?", 1, 1, lib::array_empty));
  add(eager_op("array/first", 1, 1, lib::array_first));
  add(eager_op("array/last", 1, 1, lib::array_last));
  add(eager_op("array/nth", 2, 2, lib::array_nth));
  add(eager_op("array/slice", 1, 3, lib::array_slice));
  add(eager_op("array/concat", 0, -1, lib::array_concat));
  add(eager_op("array/append", 2, 2, lib::array_append));
  add(eager_op("array/prepend", 2, 2, lib::array_prepend));
  add(eager_op("array/remove", 2, 2, lib::array_remove));
  add(eager_op("array/removeItem", 2, 2, lib::array_remove_item));
  add(eager_op("array/reverse", 1, 1, lib::array_reverse));
  add(eager_op("array/unique", 1, 1, lib::array_unique));
  add(eager_op("array/includes", 2, 2, lib::array_includes));
  add(eager_op("array/indexOf", 2, 2, lib::array_index_of));
  add(eager_op("array/sum", 1, 1, lib::array_sum));
  add(form_op("array/filter", 2, 2, lib::array_lambda<lib::lambda_mode::filter>,
              k::pure, true));
  add(form_op("array/reject", 2, 2, lib::array_lambda<lib::lambda_mode::reject>,
              k::pure, true));
  add(form_op("array/map", 2, 2, lib::array_lambda<lib::lambda_mode::map>, k::pure,
              true));
  add(form_op("array/find", 2, 2, lib::array_lambda<lib::lambda_mode::find>, k::pure,
              true));
  add(form_op("array/findIndex", 2, 2,
              lib::array_lambda<lib::lambda_mode::find_index>, k::pure, true));
  add(form_op("array/some", 2, 2, lib::array_lambda<lib::lambda_mode::some>, k::pure,
              true));
  add(form_op("array/every", 2, 2, lib::array_lambda<lib::lambda_mode::every>,
              k::pure, true));
  add(form_op("array/reduce", 2, 3, lib::array_reduce, k::pure, true));

  add(eager_op("object/keys", 1, 1, lib::object_keys));
  add(eager_op("object/values", 1, 1, lib::object_values));
  add(eager_op("object/get", 2, 3, lib::object_get));
  add(eager_op("object/set", 3, 3, lib::object_set));
  add(eager_op("object/has", 2, 2, lib::object_has));
  add(eager_op("object/remove", 2, 2, lib::object_remove));
  add(eager_op("object/merge", 0, -1, lib::object_merge));

  add(eager_op("time/now", 0, 0, lib::time_now));
  add(eager_op("validate/check", 2, 2, lib::validate_check));
  add(eager_op("validate/required", 1, 1, lib::validate_required));
  add(eager_op("validate/email", 1, 1, lib::validate_email));
  add(eager_op("format/plural", 3, 3, lib::format_plural));
  add(eager_op("format/list", 1, 2, lib::format_list));

  add(form_op("set", 2, 2, lib::effect_set, k::effect));
  add(eager_op("emit", 1, 2, lib::effect_emit, k::effect));
  add(eager_op("render", 2, 3, lib::effect_render, k::effect));
  add(eager_op("render-ui", 2, 2, lib::effect_render_ui, k::effect));
  add(eager_op("notify", 1, 3, lib::effect_notify, k::effect));
  add(eager_op("persist", 2, 3, lib::effect_persist, k::effect));
  add(eager_op("navigate", 1, 2, lib::effect_navigate, k::effect));
  add(form_op("async/delay", 1, 2, lib::effect_timer<timer_kind::delay>, k::effect));
  add(form_op("async/interval", 2, 2, lib::effect_timer<timer_kind::interval>,
              k::effect));
  add(form_op("async/debounce", 2, 2, lib::effect_timer<timer_kind::debounce>,
              k::effect));
  return err;
}

/**
 * shared standard table.
 *
 * hosts that register extra operators copy it and parse their catalog
 * against the copy.
 */
inline const operator_table & standard_operators() {
  static const operator_table table = [] {
    operator_table out;
    if (register_standard_operators(out) != BEHAVE_OK) {
      throw std::logic_error("standard operator table failed to register");
    }
    return out;
  }();
  return table;
}

}  // namespace behave::expr
