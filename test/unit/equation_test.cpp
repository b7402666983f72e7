#include <eqp/equation.hpp>
#include <eqp/errors.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace eqp;
using namespace eqp::equation;

namespace {

  std::string
  render(std::string_view text) {
    return to_string(parse(text));
  }

} // namespace

// == Operands ================================================================

TEST_CASE("equation: integer literal", "[equation]") {
  auto n = parse("5");
  REQUIRE(n.holds<scalar>());
  CHECK(n.get<scalar>().value == 5.0);
}

TEST_CASE("equation: float literal", "[equation]") {
  auto n = parse("2.25");
  REQUIRE(n.holds<scalar>());
  CHECK(n.get<scalar>().value == 2.25);
}

TEST_CASE("equation: t is the variable", "[equation]") {
  CHECK(parse("t").holds<variable>());
  CHECK(render("t") == "t");
}

TEST_CASE("equation: names are parameters", "[equation]") {
  auto n = parse("time");
  REQUIRE(n.holds<parameter>());
  CHECK(n.get<parameter>().name == "time");

  CHECK(parse("t2").get<parameter>().name == "t2");
  CHECK(parse("logistic").get<parameter>().name == "logistic");
  CHECK(parse("k_on").get<parameter>().name == "k_on");
}

TEST_CASE("equation: parentheses do not add a node", "[equation]") {
  CHECK(parse("(5)") == parse("5"));
  CHECK(render("((x))") == "x");
}

// == Operators ===============================================================

TEST_CASE("equation: single binary operator", "[equation]") {
  auto n = parse("5.0+5.0");
  REQUIRE(n.holds<binary_op>());
  const auto& b = n.get<binary_op>();
  CHECK(b.op == binary_operator::add);
  CHECK(*b.lhs == parse("5"));
  CHECK(*b.rhs == parse("5"));
  CHECK(render("5.0+5.0") == "(5 + 5)");
}

TEST_CASE("equation: operators nest to the right", "[equation]") {
  CHECK(render("1+2+3+4") == "(1 + (2 + (3 + 4)))");
  CHECK(render("1-2+3") == "(1 - (2 + 3))");
  CHECK(render("2*3+4") == "(2 * (3 + 4))");
  CHECK(render("x+t*5+2.2") == "(x + (t * (5 + 2.2)))");
}

TEST_CASE("equation: parentheses group", "[equation]") {
  CHECK(render("(1+2)*3") == "((1 + 2) * 3)");
}

TEST_CASE("equation: power", "[equation]") {
  CHECK(render("sin(t)^2") == "(sin(t) ^ 2)");
}

TEST_CASE("equation: whitespace is insignificant", "[equation]") {
  CHECK(parse(" x\t+\n5 ") == parse("x+5"));
}

// == Functions ===============================================================

TEST_CASE("equation: function calls", "[equation]") {
  auto n = parse("cos(t)");
  REQUIRE(n.holds<function_call>());
  CHECK(n.get<function_call>().fn == function::cos);
  CHECK(n.get<function_call>().arg->holds<variable>());

  CHECK(render("ln(x*2)") == "ln((x * 2))");
  CHECK(render("sin(k)") == "sin(k)");
}

TEST_CASE("equation: log defaults to base 10", "[equation]") {
  CHECK(render("log(x)") == "(ln(x) / ln(10))");
}

TEST_CASE("equation: log with an explicit base", "[equation]") {
  CHECK(render("log(s,t)") == "(ln(s) / ln(t))");
}

// == Failures ================================================================

TEST_CASE("equation: dangling operator", "[equation]") {
  try {
    parse("5+");
    FAIL("expected unexpected_end");
  } catch (const unexpected_end& e) {
    CHECK(e.token_index() == 2);
  }
}

TEST_CASE("equation: unclosed parenthesis", "[equation]") {
  try {
    parse("(5");
    FAIL("expected unexpected_end");
  } catch (const unexpected_end& e) {
    CHECK(e.token_index() == 2);
  }
}

TEST_CASE("equation: two operands without an operator", "[equation]") {
  try {
    parse("5 5");
    FAIL("expected symbol_not_found");
  } catch (const symbol_not_found& e) {
    CHECK(e.token_index() == 1);
    CHECK(e.lexeme() == "5");
    CHECK(e.offset() == 2);
  }
}

TEST_CASE("equation: unknown character", "[equation]") {
  try {
    parse("5 $");
    FAIL("expected no_match_error");
  } catch (const no_match_error& e) {
    CHECK(e.offset() == 2);
  }
}

TEST_CASE("equation: number without fraction digits", "[equation]") {
  try {
    parse("3.");
    FAIL("expected no_match_error");
  } catch (const no_match_error& e) {
    CHECK(e.offset() == 1);
  }
}

TEST_CASE("equation: empty text", "[equation]") {
  CHECK_THROWS_AS(parse(""), unexpected_end);
}

// == Nodes and rendering =====================================================

TEST_CASE("equation: structural equality", "[equation]") {
  CHECK(make_binary(binary_operator::mul, scalar{2}, variable{}) ==
        parse("2*t"));
  CHECK_FALSE(parse("2*t") == parse("2/t"));
  CHECK_FALSE(parse("a") == parse("b"));
  CHECK_FALSE(parse("a") == parse("t"));
  CHECK(make_call(function::ln, parameter{"x"}) == parse("ln(x)"));
}

TEST_CASE("equation: stream output", "[equation]") {
  std::ostringstream os;
  os << parse("x^2");
  CHECK(os.str() == "(x ^ 2)");
}

TEST_CASE("equation: token kind names", "[equation]") {
  CHECK(to_string(token_kind::float_literal) == "float");
  CHECK(to_string(token_kind::open_paren) == "open_paren");
  CHECK(to_string(binary_operator::div) == "/");
  CHECK(to_string(function::sin) == "sin");
}

TEST_CASE("equation: keywords need a word boundary", "[equation]") {
  auto tokens = default_compiler().tokenize("sine sin(t) lnx");
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[0].kind == token_kind::parameter);
  CHECK(tokens[1].kind == token_kind::sin);
  CHECK(tokens[3].kind == token_kind::variable);
  CHECK(tokens[5].kind == token_kind::parameter);
}

// == Compiler ================================================================

TEST_CASE("equation: default compiler is shared", "[equation]") {
  CHECK(&default_compiler() == &default_compiler());
  CHECK(default_compiler().start() == symbol::program);
}

TEST_CASE("equation: compile to an item", "[equation]") {
  auto result = make_compiler().compile("t");
  REQUIRE(std::holds_alternative<node>(result));
  CHECK(std::get<node>(result).holds<variable>());
}

TEST_CASE("equation: reducer shape errors abort the parse", "[equation]") {
  equation_compiler c(
      {{token_kind::add, escape("+")}}, {" "},
      {{symbol::program,
        {term(token_kind::add), end_of_input},
        [](std::vector<item> items) -> item {
          if (!std::holds_alternative<node>(items.front()))
            throw shape_error("equation: expected an operand");
          return std::move(items.front());
        }}},
      symbol::program,
      [](const token_kind&, std::string_view) -> item {
        return binary_operator::add;
      });
  CHECK_THROWS_AS(c.compile("+"), shape_error);
}
