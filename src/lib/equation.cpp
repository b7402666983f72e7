#include <eqp/equation.hpp>

#include <eqp/lexicon.hpp>

#include <charconv>
#include <sstream>
#include <vector>

namespace eqp::equation {

  bool
  operator==(const node& lhs, const node& rhs) {
    if (lhs.data().index() != rhs.data().index()) return false;

    if (lhs.holds<binary_op>()) {
      const auto& a = lhs.get<binary_op>();
      const auto& b = rhs.get<binary_op>();
      return a.op == b.op && *a.lhs == *b.lhs && *a.rhs == *b.rhs;
    }
    if (lhs.holds<function_call>()) {
      const auto& a = lhs.get<function_call>();
      const auto& b = rhs.get<function_call>();
      return a.fn == b.fn && *a.arg == *b.arg;
    }
    if (lhs.holds<parameter>())
      return lhs.get<parameter>().name == rhs.get<parameter>().name;
    if (lhs.holds<scalar>())
      return lhs.get<scalar>().value == rhs.get<scalar>().value;
    return true; // variable
  }

  std::ostream&
  operator<<(std::ostream& os, const node& n) {
    return os << to_string(n);
  }

  node
  make_binary(binary_operator op, node lhs, node rhs) {
    return binary_op{op, std::make_unique<node>(std::move(lhs)),
                     std::make_unique<node>(std::move(rhs))};
  }

  node
  make_call(function fn, node arg) {
    return function_call{fn, std::make_unique<node>(std::move(arg))};
  }

  std::string
  to_string(binary_operator op) {
    switch (op) {
      case binary_operator::add: return "+";
      case binary_operator::sub: return "-";
      case binary_operator::mul: return "*";
      case binary_operator::div: return "/";
      case binary_operator::pow: return "^";
    }
    return "?";
  }

  std::string
  to_string(function fn) {
    switch (fn) {
      case function::ln: return "ln";
      case function::cos: return "cos";
      case function::sin: return "sin";
    }
    return "?";
  }

  std::string
  to_string(const node& n) {
    if (n.holds<binary_op>()) {
      const auto& b = n.get<binary_op>();
      return "(" + to_string(*b.lhs) + " " + to_string(b.op) + " " +
             to_string(*b.rhs) + ")";
    }
    if (n.holds<function_call>()) {
      const auto& f = n.get<function_call>();
      return to_string(f.fn) + "(" + to_string(*f.arg) + ")";
    }
    if (n.holds<parameter>()) return n.get<parameter>().name;
    if (n.holds<scalar>()) {
      std::ostringstream os;
      os << n.get<scalar>().value;
      return os.str();
    }
    return "t";
  }

  std::string
  to_string(token_kind kind) {
    switch (kind) {
      case token_kind::close_paren: return "close_paren";
      case token_kind::open_paren: return "open_paren";
      case token_kind::mul: return "mul";
      case token_kind::div: return "div";
      case token_kind::add: return "add";
      case token_kind::sub: return "sub";
      case token_kind::pow: return "pow";
      case token_kind::log: return "log";
      case token_kind::ln: return "ln";
      case token_kind::cos: return "cos";
      case token_kind::sin: return "sin";
      case token_kind::comma: return "comma";
      case token_kind::float_literal: return "float";
      case token_kind::int_literal: return "int";
      case token_kind::variable: return "variable";
      case token_kind::parameter: return "parameter";
    }
    return "unknown";
  }

  namespace {

    // -----------------------------------------------------------------------
    // Item accessors used by the reducers
    // -----------------------------------------------------------------------

    node
    take_node(std::vector<item>& items, std::size_t index) {
      if (index >= items.size() || !std::holds_alternative<node>(items[index]))
        throw shape_error("equation: expected an operand at position " +
                          std::to_string(index));
      return std::get<node>(std::move(items[index]));
    }

    template <typename T>
    T
    take(std::vector<item>& items, std::size_t index, const char* what) {
      if (index >= items.size() || !std::holds_alternative<T>(items[index]))
        throw shape_error(std::string("equation: expected ") + what +
                          " at position " + std::to_string(index));
      return std::get<T>(items[index]);
    }

    void
    expect(std::vector<item>& items, std::size_t index, punctuation p,
           const char* what) {
      if (take<punctuation>(items, index, what) != p)
        throw shape_error(std::string("equation: expected ") + what +
                          " at position " + std::to_string(index));
    }

    void
    expect_size(const std::vector<item>& items, std::size_t n) {
      if (items.size() != n)
        throw shape_error("equation: expected " + std::to_string(n) +
                          " items, got " + std::to_string(items.size()));
    }

    // log_base(x) = ln(x) / ln(base)
    node
    log_node(node value, node base) {
      return make_binary(binary_operator::div,
                         make_call(function::ln, std::move(value)),
                         make_call(function::ln, std::move(base)));
    }

    // -----------------------------------------------------------------------
    // Reducers
    // -----------------------------------------------------------------------

    item
    reduce_first(std::vector<item> items) {
      if (items.empty()) throw shape_error("equation: nothing to reduce");
      return std::move(items.front());
    }

    // Value op Value
    item
    reduce_operator(std::vector<item> items) {
      expect_size(items, 3);
      auto lhs = take_node(items, 0);
      auto op = take<binary_operator>(items, 1, "an operator");
      auto rhs = take_node(items, 2);
      return make_binary(op, std::move(lhs), std::move(rhs));
    }

    // log ( Value )
    item
    reduce_log10(std::vector<item> items) {
      expect_size(items, 4);
      expect(items, 0, punctuation::log, "'log'");
      expect(items, 1, punctuation::open_paren, "'('");
      auto value = take_node(items, 2);
      expect(items, 3, punctuation::close_paren, "')'");
      return log_node(std::move(value), scalar{10.0});
    }

    // log ( Value , Value )
    item
    reduce_log(std::vector<item> items) {
      expect_size(items, 6);
      expect(items, 0, punctuation::log, "'log'");
      expect(items, 1, punctuation::open_paren, "'('");
      auto value = take_node(items, 2);
      expect(items, 3, punctuation::comma, "','");
      auto base = take_node(items, 4);
      expect(items, 5, punctuation::close_paren, "')'");
      return log_node(std::move(value), std::move(base));
    }

    // fn ( Value )
    item
    reduce_function(std::vector<item> items) {
      expect_size(items, 4);
      auto fn = take<function>(items, 0, "a function");
      expect(items, 1, punctuation::open_paren, "'('");
      auto arg = take_node(items, 2);
      expect(items, 3, punctuation::close_paren, "')'");
      return make_call(fn, std::move(arg));
    }

    // ( Value )
    item
    reduce_group(std::vector<item> items) {
      expect_size(items, 3);
      return take_node(items, 1);
    }

    double
    to_number(std::string_view lexeme) {
      double value = 0.0;
      auto [ptr, ec] =
          std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), value);
      if (ec != std::errc{} || ptr != lexeme.data() + lexeme.size())
        throw shape_error("equation: invalid number '" + std::string(lexeme) +
                          "'");
      return value;
    }

    item
    token_value(const token_kind& kind, std::string_view lexeme) {
      switch (kind) {
        case token_kind::open_paren: return punctuation::open_paren;
        case token_kind::close_paren: return punctuation::close_paren;
        case token_kind::comma: return punctuation::comma;
        case token_kind::log: return punctuation::log;
        case token_kind::add: return binary_operator::add;
        case token_kind::sub: return binary_operator::sub;
        case token_kind::mul: return binary_operator::mul;
        case token_kind::div: return binary_operator::div;
        case token_kind::pow: return binary_operator::pow;
        case token_kind::ln: return function::ln;
        case token_kind::cos: return function::cos;
        case token_kind::sin: return function::sin;
        case token_kind::int_literal:
        case token_kind::float_literal: return node(scalar{to_number(lexeme)});
        case token_kind::variable: return node(variable{});
        case token_kind::parameter:
          return node(parameter{std::string(lexeme)});
      }
      throw shape_error("equation: unknown token kind");
    }

    // Keywords must not run into a following name character, so that "time"
    // is a parameter rather than the variable t followed by "ime".
    std::string
    keyword(std::string_view word) {
      return escape(word) + "(?![a-zA-Z0-9_-])";
    }

  } // namespace

  equation_compiler
  make_compiler() {
    using tk = token_kind;

    equation_compiler::tokenizer_type::pattern_list tokens = {
        {tk::close_paren, escape(")")},
        {tk::open_paren, escape("(")},
        {tk::mul, escape("*")},
        {tk::div, escape("/")},
        {tk::add, escape("+")},
        {tk::sub, escape("-")},
        {tk::pow, escape("^")},
        {tk::log, keyword("log")},
        {tk::ln, keyword("ln")},
        {tk::cos, keyword("cos")},
        {tk::sin, keyword("sin")},
        {tk::comma, escape(",")},
        {tk::float_literal, R"(\d+\.\d+)"},
        {tk::int_literal, R"(\d+)"},
        {tk::variable, keyword("t")},
        {tk::parameter, "[a-zA-Z][a-zA-Z0-9_-]*"},
    };

    const auto value = sym(symbol::value);

    auto binary = [&](tk op) {
      return equation_compiler::production_type{
          symbol::value, {value, term(op), value}, reduce_operator};
    };

    auto call = [&](tk fn) {
      return equation_compiler::production_type{
          symbol::value,
          {term(fn), term(tk::open_paren), value, term(tk::close_paren)},
          reduce_function};
    };

    std::vector<equation_compiler::production_type> productions = {
        {symbol::program, {value, end_of_input}, reduce_first},
        binary(tk::add),
        binary(tk::sub),
        binary(tk::mul),
        binary(tk::div),
        binary(tk::pow),
        {symbol::value,
         {term(tk::log), term(tk::open_paren), value, term(tk::close_paren)},
         reduce_log10},
        {symbol::value,
         {term(tk::log), term(tk::open_paren), value, term(tk::comma), value,
          term(tk::close_paren)},
         reduce_log},
        call(tk::ln),
        call(tk::sin),
        call(tk::cos),
        {symbol::value,
         {term(tk::open_paren), value, term(tk::close_paren)},
         reduce_group},
        {symbol::value, {term(tk::int_literal)}, reduce_first},
        {symbol::value, {term(tk::float_literal)}, reduce_first},
        {symbol::value, {term(tk::parameter)}, reduce_first},
        {symbol::value, {term(tk::variable)}, reduce_first},
    };

    return equation_compiler(tokens, {" ", "\n", "\t"}, std::move(productions),
                             symbol::program, token_value);
  }

  const equation_compiler&
  default_compiler() {
    static const equation_compiler instance = make_compiler();
    return instance;
  }

  node
  parse(std::string_view text) {
    auto result = default_compiler().compile(text);
    if (!std::holds_alternative<node>(result))
      throw shape_error("equation: input is not an expression");
    return std::get<node>(std::move(result));
  }

} // namespace eqp::equation
