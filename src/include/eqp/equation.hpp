#pragma once

#include <eqp/compiler.hpp>

#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace eqp::equation {

  // Forward declaration
  class node;

  enum class binary_operator { add, sub, mul, div, pow };

  enum class function { ln, cos, sin };

  // ---------------------------------------------------------------------------
  // Node types
  // ---------------------------------------------------------------------------

  struct binary_op {
    binary_operator op;
    std::unique_ptr<node> lhs;
    std::unique_ptr<node> rhs;
  };

  struct function_call {
    function fn;
    std::unique_ptr<node> arg;
  };

  // The free variable t.
  struct variable {};

  struct parameter {
    std::string name;
  };

  struct scalar {
    double value = 0.0;
  };

  // ---------------------------------------------------------------------------
  // Node
  // ---------------------------------------------------------------------------

  class node {
  public:
    using variant_type =
        std::variant<binary_op, function_call, variable, parameter, scalar>;

    node(variant_type v) : data_(std::move(v)) {}

    node(binary_op v) : data_(std::move(v)) {}

    node(function_call v) : data_(std::move(v)) {}

    node(variable v) : data_(v) {}

    node(parameter v) : data_(std::move(v)) {}

    node(scalar v) : data_(v) {}

    node(const node&) = delete;
    node&
    operator=(const node&) = delete;
    node(node&&) = default;
    node&
    operator=(node&&) = default;

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    // Structural equality, recursing into children.
    friend bool
    operator==(const node& lhs, const node& rhs);

  private:
    variant_type data_;
  };

  std::ostream&
  operator<<(std::ostream& os, const node& n);

  node
  make_binary(binary_operator op, node lhs, node rhs);

  node
  make_call(function fn, node arg);

  // Fully parenthesized rendering: "(x + (t * 5))", "ln(s)", "t", "2.5".
  std::string
  to_string(const node& n);

  std::string
  to_string(binary_operator op);

  std::string
  to_string(function fn);

  // ---------------------------------------------------------------------------
  // Language
  // ---------------------------------------------------------------------------

  enum class token_kind {
    close_paren,
    open_paren,
    mul,
    div,
    add,
    sub,
    pow,
    log,
    ln,
    cos,
    sin,
    comma,
    float_literal,
    int_literal,
    variable,
    parameter,
  };

  enum class symbol { program, value };

  // Tokens that carry no value of their own.
  enum class punctuation { open_paren, close_paren, comma, log };

  // Intermediate value passed between reducers.
  using item = std::variant<node, binary_operator, function, punctuation>;

  using equation_compiler = compiler<token_kind, symbol, item>;

  std::string
  to_string(token_kind kind);

  // Raised by a reducer that receives an item of the wrong shape, and by
  // parse() when the start symbol does not reduce to a node.
  class shape_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Builds the equation lexicon and grammar. Binary operators have no
  // precedence: the first operator in the text takes the leading operand on
  // its left and everything after it on its right, so "2*3+4" is 2*(3+4) and
  // "1-2+3" is 1-(2+3). Parentheses and function calls group as usual.
  equation_compiler
  make_compiler();

  // Shared instance of make_compiler().
  const equation_compiler&
  default_compiler();

  node
  parse(std::string_view text);

} // namespace eqp::equation
