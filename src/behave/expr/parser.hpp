#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "behave/behave.h"
#include "behave/expr/ast.hpp"
#include "behave/expr/operators.hpp"
#include "behave/expr/value.hpp"

namespace behave::expr {

namespace detail {

inline ref_root root_for(std::string_view name) noexcept {
  if (name == "entity") {
    return ref_root::entity;
  }
  if (name == "config") {
    return ref_root::config;
  }
  if (name == "payload") {
    return ref_root::payload;
  }
  if (name == "now") {
    return ref_root::now;
  }
  if (name == "state") {
    return ref_root::state;
  }
  return ref_root::unbound;
}

inline bool is_reference_text(const value & v) {
  if (!v.is_string()) {
    return false;
  }
  const std::string & text = v.get_ref<const std::string &>();
  return text.size() > 1 && text[0] == '@';
}

inline bool all_literal(const node_list & nodes) noexcept {
  for (const node & n : nodes) {
    if (as_literal(n) == nullptr) {
      return false;
    }
  }
  return true;
}

inline std::string arity_text(const int32_t n) {
  return std::to_string(n) + " argument(s)";
}

struct parser {
  const operator_table & ops;
  std::vector<std::string> & errors;
  std::vector<std::string> locals = {};

  bool is_local(std::string_view name) const noexcept {
    for (auto it = locals.rbegin(); it != locals.rend(); ++it) {
      if (*it == name) {
        return true;
      }
    }
    return false;
  }

  node parse_ref(const std::string & text) {
    context_ref ref;
    ref.text = text;
    std::string_view rest(text);
    rest.remove_prefix(1);
    size_t start = 0;
    bool first = true;
    while (start <= rest.size()) {
      const size_t dot = rest.find('.', start);
      const size_t end = dot == std::string_view::npos ? rest.size() : dot;
      std::string part(rest.substr(start, end - start));
      if (first) {
        ref.name = std::move(part);
        first = false;
      } else {
        ref.path.push_back(std::move(part));
      }
      if (dot == std::string_view::npos) {
        break;
      }
      start = dot + 1;
    }
    if (is_local(ref.name)) {
      ref.root = ref_root::local;
    } else {
      ref.root = root_for(ref.name);
    }
    return node{std::move(ref)};
  }

  node parse(const value & src) {
    if (is_reference_text(src)) {
      return parse_ref(src.get_ref<const std::string &>());
    }
    if (src.is_array()) {
      if (!src.empty() && src[0].is_string()) {
        const operator_meta * op = ops.find(src[0].get_ref<const std::string &>());
        if (op != nullptr) {
          return parse_call(src, op);
        }
      }
      array_form form;
      form.items.reserve(src.size());
      for (const value & item : src) {
        form.items.push_back(parse(item));
      }
      return collapse(std::move(form));
    }
    if (src.is_object()) {
      object_form form;
      for (auto it = src.begin(); it != src.end(); ++it) {
        form.keys.push_back(it.key());
        form.values.push_back(parse(it.value()));
      }
      return collapse(std::move(form));
    }
    return node{literal{src}};
  }

  node collapse(array_form form) {
    if (!all_literal(form.items)) {
      return node{std::move(form)};
    }
    value out = value::array();
    for (node & item : form.items) {
      out.push_back(std::move(std::get<literal>(item.kind).val));
    }
    return node{literal{std::move(out)}};
  }

  node collapse(object_form form) {
    if (!all_literal(form.values)) {
      return node{std::move(form)};
    }
    value out = value::object();
    for (size_t i = 0; i < form.keys.size(); ++i) {
      out[form.keys[i]] = std::move(std::get<literal>(form.values[i].kind).val);
    }
    return node{literal{std::move(out)}};
  }

  void check_arity(const operator_meta & op, const int32_t argc) {
    if (argc < op.min_arity) {
      errors.push_back("Operator '" + op.name + "' requires at least " +
                       arity_text(op.min_arity) + ", got " + std::to_string(argc));
    } else if (!op.variadic() && argc > op.max_arity) {
      errors.push_back("Operator '" + op.name + "' accepts at most " +
                       arity_text(op.max_arity) + ", got " + std::to_string(argc));
    }
  }

  node parse_call(const value & src, const operator_meta * op) {
    call out;
    out.op = op;
    out.name = op->name;
    const int32_t argc = static_cast<int32_t>(src.size()) - 1;
    check_arity(*op, argc);

    if (op->name == "let" && argc >= 1) {
      parse_let(src, out);
    } else if (op->name == "fn" && argc >= 1) {
      parse_fn(src, out);
    } else {
      out.args.reserve(static_cast<size_t>(argc));
      for (size_t i = 1; i < src.size(); ++i) {
        out.args.push_back(parse(src[i]));
      }
    }

    if (op->name == "set" && !out.args.empty()) {
      const context_ref * target = as_ref(out.args[0]);
      if (target == nullptr) {
        errors.push_back("Operator 'set' target must be a context reference");
      } else if (target->root != ref_root::entity || target->path.empty()) {
        errors.push_back("Operator 'set' can only write @entity fields (got: " +
                         target->text + ")");
      }
    }
    return node{std::move(out)};
  }

  // ["let", [[name, expr], ...], body...]; each binding sees the ones before it.
  void parse_let(const value & src, call & out) {
    const size_t scope_mark = locals.size();
    array_form bindings;
    const value & spec = src[1];
    if (!spec.is_array()) {
      errors.push_back("Operator 'let' bindings must be a list of [name, expression] pairs");
    } else {
      for (const value & pair : spec) {
        if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
          errors.push_back("Operator 'let' bindings must be a list of [name, expression] pairs");
          continue;
        }
        array_form binding;
        binding.items.push_back(node{literal{pair[0]}});
        binding.items.push_back(parse(pair[1]));
        bindings.items.push_back(node{std::move(binding)});
        locals.push_back(pair[0].get<std::string>());
      }
    }
    out.args.push_back(node{std::move(bindings)});
    for (size_t i = 2; i < src.size(); ++i) {
      out.args.push_back(parse(src[i]));
    }
    locals.resize(scope_mark);
  }

  // ["fn", param..., body]; a param is a name or a list of names.
  void parse_fn(const value & src, call & out) {
    const size_t scope_mark = locals.size();
    const size_t last = src.size() - 1;
    for (size_t i = 1; i < last; ++i) {
      const value & param = src[i];
      bool ok = param.is_string() && !is_reference_text(param);
      if (param.is_array()) {
        ok = true;
        for (const value & name : param) {
          if (!name.is_string()) {
            ok = false;
            break;
          }
          locals.push_back(name.get<std::string>());
        }
      } else if (ok) {
        locals.push_back(param.get<std::string>());
      }
      if (!ok) {
        errors.push_back("Operator 'fn' parameters must be names");
      }
      out.args.push_back(node{literal{param}});
    }
    if (last >= 1) {
      out.args.push_back(parse(src[last]));
    }
    locals.resize(scope_mark);
  }
};

}  // namespace detail

/**
 * parses one JSON S-expression into a tree.
 *
 * arrays headed by a registered operator name become calls (arity checked
 * here), other arrays and objects become composite literal forms, and
 * `@`-prefixed strings become context references. `scope` seeds names that
 * resolve as locals.
 */
inline int32_t parse_expression(const value & source, const operator_table & ops, node & out,
                                std::vector<std::string> & errors,
                                const std::vector<std::string> & scope = {}) {
  const size_t before = errors.size();
  detail::parser p{ops, errors, scope};
  out = p.parse(source);
  return errors.size() == before ? BEHAVE_OK : BEHAVE_ERR_STRUCTURE;
}

}  // namespace behave::expr
