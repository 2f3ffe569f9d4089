#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "behave/behave.h"
#include "behave/expr/ast.hpp"
#include "behave/expr/parser.hpp"
#include "behave/expr/stdlib.hpp"

namespace {

using behave::expr::node;
using behave::expr::value;

int32_t parse_text(const char * text, node & out, std::vector<std::string> & errors,
                   const std::vector<std::string> & scope = {}) {
  return behave::expr::parse_expression(value::parse(text), behave::expr::standard_operators(),
                                        out, errors, scope);
}

}  // namespace

TEST_CASE("expr_parser_keeps_scalars_as_literals") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text("42", out, errors) == BEHAVE_OK);
  const behave::expr::literal * lit = behave::expr::as_literal(out);
  REQUIRE(lit != nullptr);
  CHECK(lit->val == 42);
  CHECK(errors.empty());
}

TEST_CASE("expr_parser_splits_context_references") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"("@entity.profile.name")", out, errors) == BEHAVE_OK);
  const behave::expr::context_ref * ref = behave::expr::as_ref(out);
  REQUIRE(ref != nullptr);
  CHECK(ref->root == behave::expr::ref_root::entity);
  CHECK(ref->name == "entity");
  REQUIRE(ref->path.size() == 2);
  CHECK(ref->path[0] == "profile");
  CHECK(ref->path[1] == "name");
  CHECK(ref->text == "@entity.profile.name");
}

TEST_CASE("expr_parser_resolves_every_context_root") {
  const struct {
    const char * text;
    behave::expr::ref_root root;
  } cases[] = {
    {R"("@config.title")", behave::expr::ref_root::config},
    {R"("@payload.id")", behave::expr::ref_root::payload},
    {R"("@now")", behave::expr::ref_root::now},
    {R"("@state")", behave::expr::ref_root::state},
    {R"("@mystery")", behave::expr::ref_root::unbound},
  };
  for (const auto & c : cases) {
    node out;
    std::vector<std::string> errors;
    CHECK(parse_text(c.text, out, errors) == BEHAVE_OK);
    const behave::expr::context_ref * ref = behave::expr::as_ref(out);
    REQUIRE(ref != nullptr);
    CHECK(ref->root == c.root);
  }
}

TEST_CASE("expr_parser_builds_calls_for_registered_operators") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["+", 1, "@entity.count"])", out, errors) == BEHAVE_OK);
  const behave::expr::call * c = behave::expr::as_call(out);
  REQUIRE(c != nullptr);
  CHECK(c->name == "+");
  REQUIRE(c->op != nullptr);
  CHECK(c->op->pure());
  CHECK(c->args.size() == 2);
}

TEST_CASE("expr_parser_collapses_literal_composites") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["a", "b", {"k": [1, 2]}])", out, errors) == BEHAVE_OK);
  const behave::expr::literal * lit = behave::expr::as_literal(out);
  REQUIRE(lit != nullptr);
  CHECK(lit->val.is_array());
  CHECK(lit->val.size() == 3);
  CHECK(lit->val[2]["k"][1] == 2);
}

TEST_CASE("expr_parser_keeps_composites_with_references") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"({"id": "@payload.id", "kind": "row"})", out, errors) == BEHAVE_OK);
  const behave::expr::object_form * obj = behave::expr::as_object(out);
  REQUIRE(obj != nullptr);
  CHECK(obj->keys.size() == 2);

  CHECK(parse_text(R"([1, "@entity.x"])", out, errors) == BEHAVE_OK);
  CHECK(behave::expr::as_array(out) != nullptr);
}

TEST_CASE("expr_parser_reports_arity_violations") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["not"])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator 'not' requires at least 1 argument(s), got 0");

  errors.clear();
  CHECK(parse_text(R"(["/", 1, 2, 3])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator '/' accepts at most 2 argument(s), got 3");
}

TEST_CASE("expr_parser_restricts_set_to_entity_fields") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["set", "@config.title", 1])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator 'set' can only write @entity fields (got: @config.title)");

  errors.clear();
  CHECK(parse_text(R"(["set", "literal", 1])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator 'set' target must be a context reference");

  errors.clear();
  CHECK(parse_text(R"(["set", "@entity.count", 1])", out, errors) == BEHAVE_OK);
}

TEST_CASE("expr_parser_scopes_let_bindings") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["let", [["a", 1], ["b", "@a"]], "@b"])", out, errors) == BEHAVE_OK);
  const behave::expr::call * let = behave::expr::as_call(out);
  REQUIRE(let != nullptr);
  REQUIRE(let->args.size() == 2);
  const behave::expr::context_ref * body = behave::expr::as_ref(let->args[1]);
  REQUIRE(body != nullptr);
  CHECK(body->root == behave::expr::ref_root::local);

  const behave::expr::array_form * bindings = behave::expr::as_array(let->args[0]);
  REQUIRE(bindings != nullptr);
  const behave::expr::array_form * second = behave::expr::as_array(bindings->items[1]);
  REQUIRE(second != nullptr);
  const behave::expr::context_ref * earlier = behave::expr::as_ref(second->items[1]);
  REQUIRE(earlier != nullptr);
  CHECK(earlier->root == behave::expr::ref_root::local);
}

TEST_CASE("expr_parser_rejects_malformed_let_bindings") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["let", "x", 1])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator 'let' bindings must be a list of [name, expression] pairs");
}

TEST_CASE("expr_parser_binds_lambda_parameters") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"(["array/map", "@entity.items", ["fn", "n", ["*", "@n", 2]]])", out,
                   errors) == BEHAVE_OK);
  CHECK(errors.empty());

  CHECK(parse_text(R"(["fn", 3, "@x"])", out, errors) == BEHAVE_ERR_STRUCTURE);
  REQUIRE(errors.size() == 1);
  CHECK(errors[0] == "Operator 'fn' parameters must be names");
}

TEST_CASE("expr_parser_seeds_scope_names") {
  node out;
  std::vector<std::string> errors;
  CHECK(parse_text(R"("@item.id")", out, errors, {"item"}) == BEHAVE_OK);
  const behave::expr::context_ref * ref = behave::expr::as_ref(out);
  REQUIRE(ref != nullptr);
  CHECK(ref->root == behave::expr::ref_root::local);
}

TEST_CASE("expr_standard_operators_register_cleanly") {
  behave::expr::operator_table table;
  CHECK(behave::expr::register_standard_operators(table) == BEHAVE_OK);
  CHECK(table.size() == behave::expr::standard_operators().size());
  CHECK(table.contains("async/debounce"));
  CHECK(table.contains("validate/check"));
  CHECK_FALSE(table.contains("no/such-op"));

  const behave::expr::operator_meta * emit = table.find("emit");
  REQUIRE(emit != nullptr);
  CHECK_FALSE(emit->pure());
  CHECK(table.find("array/filter")->accepts_lambda);

  CHECK(behave::expr::register_standard_operators(table) == BEHAVE_ERR_DUPLICATE);
}
