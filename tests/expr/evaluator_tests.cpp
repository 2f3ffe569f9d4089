#include <string>
#include <vector>

#include <doctest/doctest.h>

#include "behave/behave.h"
#include "behave/expr/evaluator.hpp"
#include "behave/expr/parser.hpp"
#include "behave/expr/stdlib.hpp"

namespace {

using behave::expr::value;

struct eval_fixture {
  value entity = value::object();
  value config = value::object();
  value payload = value::object();
  behave::expr::context ctx;

  eval_fixture() {
    ctx.entity = &entity;
    ctx.config = &config;
    ctx.payload = &payload;
    ctx.now_ms = 1000;
    ctx.state = "Idle";
  }

  value eval(const char * text, int32_t * err_out = nullptr, std::string * message_out = nullptr) {
    behave::expr::node tree;
    std::vector<std::string> errors;
    REQUIRE(behave::expr::parse_expression(value::parse(text), behave::expr::standard_operators(),
                                           tree, errors) == BEHAVE_OK);
    int32_t err = BEHAVE_OK;
    value out = behave::expr::evaluate_value(tree, ctx, &err, message_out);
    if (err_out != nullptr) {
      *err_out = err;
    }
    return out;
  }

  bool guard(const char * text, int32_t * err_out = nullptr, std::string * message_out = nullptr) {
    behave::expr::node tree;
    std::vector<std::string> errors;
    REQUIRE(behave::expr::parse_expression(value::parse(text), behave::expr::standard_operators(),
                                           tree, errors) == BEHAVE_OK);
    return behave::expr::evaluate_guard(tree, ctx, err_out, message_out);
  }
};

}  // namespace

TEST_CASE("expr_eval_arithmetic") {
  eval_fixture f;
  CHECK(f.eval(R"(["+", 1, 2, 3])") == 6);
  CHECK(f.eval(R"(["-", 5])") == -5);
  CHECK(f.eval(R"(["-", 10, 3, 2])") == 5);
  CHECK(f.eval(R"(["*", 2, 3.5])") == 7);
  CHECK(f.eval(R"(["/", 7, 2])") == 3.5);
  CHECK(f.eval(R"(["/", 1, 0])").is_null());
  CHECK(f.eval(R"(["%", 7, 3])") == 1);
  CHECK(f.eval(R"(["+", "4", true])") == 5);
}

TEST_CASE("expr_eval_integral_results_stay_integers") {
  eval_fixture f;
  const value v = f.eval(R"(["/", 6, 2])");
  CHECK(v.is_number_integer());
  CHECK(behave::expr::to_text(v) == "3");
}

TEST_CASE("expr_eval_comparison_and_equality") {
  eval_fixture f;
  CHECK(f.eval(R"(["<", 1, 2])") == true);
  CHECK(f.eval(R"([">=", 2, 2])") == true);
  CHECK(f.eval(R"(["<", "apple", "banana"])") == true);
  CHECK(f.eval(R"(["=", 1, 1.0])") == true);
  CHECK(f.eval(R"(["!=", "a", "b"])") == true);
  CHECK(f.eval(R"(["=", null, "@entity.missing"])") == true);
  CHECK(f.eval(R"(["<", null, 1])") == false);
}

TEST_CASE("expr_eval_logic_short_circuits") {
  eval_fixture f;
  CHECK(f.eval(R"(["and", true, 1, "x"])") == true);
  CHECK(f.eval(R"(["and", true, 0])") == false);
  CHECK(f.eval(R"(["or", false, null, "x"])") == true);
  CHECK(f.eval(R"(["not", ""])") == true);

  int32_t err = BEHAVE_OK;
  CHECK(f.guard(R"(["or", true, ["emit", "NEVER"]])", &err));
  CHECK(err == BEHAVE_OK);
  CHECK_FALSE(f.guard(R"(["and", false, ["emit", "NEVER"]])", &err));
  CHECK(err == BEHAVE_OK);
}

TEST_CASE("expr_eval_guard_faults_on_effects") {
  eval_fixture f;
  int32_t err = BEHAVE_OK;
  std::string message;
  CHECK_FALSE(f.guard(R"(["emit", "SAVE"])", &err, &message));
  CHECK(err == BEHAVE_ERR_ENGINE_FAULT);
  CHECK(message == "Effect operator 'emit' cannot run in a guard");
}

TEST_CASE("expr_eval_resolves_context_paths") {
  eval_fixture f;
  f.entity = value::parse(R"({"items": [{"id": 7}, {"id": 9}], "name": "box"})");
  f.config = value::parse(R"({"limit": 3})");
  f.payload = value::parse(R"({"id": 9})");

  CHECK(f.eval(R"("@entity.items.1.id")") == 9);
  CHECK(f.eval(R"("@entity.items.length")") == 2);
  CHECK(f.eval(R"("@entity.name.length")") == 3);
  CHECK(f.eval(R"("@config.limit")") == 3);
  CHECK(f.eval(R"("@payload.id")") == 9);
  CHECK(f.eval(R"("@now")") == 1000);
  CHECK(f.eval(R"("@state")") == "Idle");
  CHECK(f.eval(R"("@entity.items.5.id")").is_null());
  CHECK(f.eval(R"("@entity.name.first")").is_null());
}

TEST_CASE("expr_eval_undefined_paths_are_nullish_in_composites") {
  eval_fixture f;
  const value out = f.eval(R"({"id": "@payload.missing", "n": 1})");
  CHECK(out["id"].is_null());
  CHECK(out["n"] == 1);
}

TEST_CASE("expr_eval_conditionals") {
  eval_fixture f;
  CHECK(f.eval(R"(["if", true, "yes", "no"])") == "yes");
  CHECK(f.eval(R"(["if", 0, "yes", "no"])") == "no");
  CHECK(f.eval(R"(["if", false, "yes"])").is_null());
  CHECK(f.eval(R"(["when", true, 5])") == 5);
  CHECK(f.eval(R"(["when", false, 5])").is_null());
  CHECK(f.eval(R"(["do", 1, 2, 3])") == 3);
}

TEST_CASE("expr_eval_let_binds_sequentially") {
  eval_fixture f;
  CHECK(f.eval(R"(["let", [["a", 2], ["b", ["*", "@a", 3]]], ["+", "@a", "@b"]])") == 8);
}

TEST_CASE("expr_eval_bare_lambda_is_null") {
  eval_fixture f;
  CHECK(f.eval(R"(["fn", "x", "@x"])").is_null());
}

TEST_CASE("expr_eval_higher_order_array_operators") {
  eval_fixture f;
  CHECK(f.eval(R"(["array/filter", [1, 2, 3, 4], ["fn", "n", [">", "@n", 2]]])") ==
        value::parse("[3, 4]"));
  CHECK(f.eval(R"(["array/reject", [1, 2, 3, 4], ["fn", "n", [">", "@n", 2]]])") ==
        value::parse("[1, 2]"));
  CHECK(f.eval(R"(["array/map", ["a", "b"], ["fn", "s", "i", ["str/concat", "@s", "@i"]]])") ==
        value::parse(R"(["a0", "b1"])"));
  CHECK(f.eval(R"(["array/find", [5, 8, 11], ["fn", "n", [">", "@n", 6]]])") == 8);
  CHECK(f.eval(R"(["array/find", [5], ["fn", "n", [">", "@n", 6]]])").is_null());
  CHECK(f.eval(R"(["array/findIndex", [5, 8, 11], ["fn", "n", [">", "@n", 6]]])") == 1);
  CHECK(f.eval(R"(["array/some", [1, 2], ["fn", "n", ["=", "@n", 2]]])") == true);
  CHECK(f.eval(R"(["array/every", [1, 2], ["fn", "n", ["=", "@n", 2]]])") == false);
  CHECK(f.eval(R"(["array/reduce", [1, 2, 3], ["fn", "acc", "n", ["+", "@acc", "@n"]], 0])") == 6);
}

TEST_CASE("expr_eval_lambda_destructures_pairs") {
  eval_fixture f;
  CHECK(f.eval(R"(["array/map", [[1, 2], [3, 4]], ["fn", ["a", "b"], ["+", "@a", "@b"]]])") ==
        value::parse("[3, 7]"));
}

TEST_CASE("expr_eval_lambda_sees_outer_context") {
  eval_fixture f;
  f.entity = value::parse(R"({"items": [{"id": 1}, {"id": 2}]})");
  f.payload = value::parse(R"({"id": 1})");
  CHECK(f.eval(R"(["array/filter", "@entity.items", ["fn", "n", ["!=", "@n.id", "@payload.id"]]])") ==
        value::parse(R"([{"id": 2}])"));
}

TEST_CASE("expr_eval_array_operators") {
  eval_fixture f;
  CHECK(f.eval(R"(["array/len", [1, 2, 3]])") == 3);
  CHECK(f.eval(R"(["array/empty?", []])") == true);
  CHECK(f.eval(R"(["array/first", [4, 5]])") == 4);
  CHECK(f.eval(R"(["array/last", [4, 5]])") == 5);
  CHECK(f.eval(R"(["array/nth", [4, 5], 1])") == 5);
  CHECK(f.eval(R"(["array/slice", [1, 2, 3, 4], 1, -1])") == value::parse("[2, 3]"));
  CHECK(f.eval(R"(["array/concat", [1], [2, 3]])") == value::parse("[1, 2, 3]"));
  CHECK(f.eval(R"(["array/append", [1], 2])") == value::parse("[1, 2]"));
  CHECK(f.eval(R"(["array/prepend", [1], 0])") == value::parse("[0, 1]"));
  CHECK(f.eval(R"(["array/remove", [1, 2, 3], 1])") == value::parse("[1, 3]"));
  CHECK(f.eval(R"(["array/removeItem", [1, 2, 1], 1])") == value::parse("[2]"));
  CHECK(f.eval(R"(["array/reverse", [1, 2]])") == value::parse("[2, 1]"));
  CHECK(f.eval(R"(["array/unique", [1, 1, 2]])") == value::parse("[1, 2]"));
  CHECK(f.eval(R"(["array/includes", [1, 2], 2])") == true);
  CHECK(f.eval(R"(["array/indexOf", [1, 2], 3])") == -1);
  CHECK(f.eval(R"(["array/sum", [1, 2, 3.5]])") == 6.5);
}

TEST_CASE("expr_eval_string_operators") {
  eval_fixture f;
  CHECK(f.eval(R"(["str/len", "hello"])") == 5);
  CHECK(f.eval(R"(["str/concat", "a", 1, true])") == "a1true");
  CHECK(f.eval(R"(["str/slice", "hello", 1, 3])") == "el");
  CHECK(f.eval(R"(["str/upper", "abc"])") == "ABC");
  CHECK(f.eval(R"(["str/lower", "ABC"])") == "abc");
  CHECK(f.eval(R"(["str/trim", "  x  "])") == "x");
  CHECK(f.eval(R"(["str/includes", "hello", "ell"])") == true);
  CHECK(f.eval(R"(["str/startsWith", "hello", "he"])") == true);
  CHECK(f.eval(R"(["str/endsWith", "hello", "lo"])") == true);
  CHECK(f.eval(R"(["str/split", "a,b,,c", ","])") == value::parse(R"(["a", "b", "", "c"])"));
  CHECK(f.eval(R"(["str/join", ["a", "b"], "-"])") == "a-b");
  CHECK(f.eval(R"(["str/default", "", "fallback"])") == "fallback");
}

TEST_CASE("expr_eval_math_operators") {
  eval_fixture f;
  CHECK(f.eval(R"(["math/abs", -3])") == 3);
  CHECK(f.eval(R"(["math/round", 2.5])") == 3);
  CHECK(f.eval(R"(["math/floor", 2.7])") == 2);
  CHECK(f.eval(R"(["math/min", 4, 2, 9])") == 2);
  CHECK(f.eval(R"(["math/max", [4, 2, 9]])") == 9);
  CHECK(f.eval(R"(["math/clamp", 15, 0, 10])") == 10);
  CHECK(f.eval(R"(["math/pow", 2, 10])") == 1024);
  CHECK(f.eval(R"(["math/mod", -1, 5])") == 4);
  CHECK(f.eval(R"(["math/lerp", 0, 10, 0.5])") == 5);
  CHECK(f.eval(R"(["math/default", null, 7])") == 7);
}

TEST_CASE("expr_eval_object_operators") {
  eval_fixture f;
  CHECK(f.eval(R"(["object/keys", {"a": 1, "b": 2}])") == value::parse(R"(["a", "b"])"));
  CHECK(f.eval(R"(["object/get", {"a": {"b": 2}}, "a.b"])") == 2);
  CHECK(f.eval(R"(["object/get", {}, "x", 5])") == 5);
  CHECK(f.eval(R"(["object/set", {"a": 1}, "b", 2])") == value::parse(R"({"a": 1, "b": 2})"));
  CHECK(f.eval(R"(["object/has", {"a": 1}, "a"])") == true);
  CHECK(f.eval(R"(["object/remove", {"a": 1, "b": 2}, "a"])") == value::parse(R"({"b": 2})"));
  CHECK(f.eval(R"(["object/merge", {"a": 1}, {"a": 2, "c": 3}])") ==
        value::parse(R"({"a": 2, "c": 3})"));
}

TEST_CASE("expr_eval_validation_and_formatting") {
  eval_fixture f;
  const value report = f.eval(
      R"(["validate/check", {"email": "nope", "name": ""}, {"email": [["email"]], "name": [["required"], ["minLength", 2]]}])");
  CHECK(report["valid"] == false);
  REQUIRE(report["errors"].size() == 3);
  CHECK(report["errors"][0] == "email: email validation failed");
  CHECK(report["errors"][1] == "name: required validation failed");
  CHECK(report["errors"][2] == "name: minLength validation failed");

  CHECK(f.eval(R"(["validate/email", "a@b.co"])") == true);
  CHECK(f.eval(R"(["validate/required", ""])") == false);
  CHECK(f.eval(R"(["format/plural", 1, "item", "items"])") == "1 item");
  CHECK(f.eval(R"(["format/plural", 3, "item", "items"])") == "3 items");
  CHECK(f.eval(R"(["format/list", ["a", "b", "c"]])") == "a, b, and c");
  CHECK(f.eval(R"(["time/now"])") == 1000);
}

TEST_CASE("expr_eval_reports_step_budget_exhaustion") {
  eval_fixture f;
  f.entity["items"] = value::array();
  for (int i = 0; i < 60000; ++i) {
    f.entity["items"].push_back(i);
  }
  int32_t err = BEHAVE_OK;
  std::string message;
  const value out =
      f.eval(R"(["array/map", "@entity.items", ["fn", "n", ["+", "@n", 1]]])", &err, &message);
  CHECK(err == BEHAVE_ERR_ENGINE_FAULT);
  CHECK(message == "Evaluation step budget exhausted");
  CHECK(out.is_null());
}
