#pragma once

#include <eqp/grammar.hpp>
#include <eqp/grammar_engine.hpp>
#include <eqp/token.hpp>
#include <eqp/tokenizer.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eqp {

  // Text in, Result out: a tokenizer and a grammar engine bound to one start
  // symbol.
  template <typename Token, typename Symbol, typename Result>
  class compiler {
  public:
    using tokenizer_type = tokenizer<Token>;
    using engine_type = grammar_engine<Token, Symbol, Result>;
    using production_type = typename engine_type::production_type;
    using token_value_type = typename engine_type::token_value_type;

  private:
    tokenizer_type tokenizer_;
    engine_type engine_;
    Symbol start_;

  public:
    compiler(const typename tokenizer_type::pattern_list& patterns,
             const std::vector<std::string>& whitespace,
             std::vector<production_type> productions, Symbol start,
             token_value_type token_value)
        : tokenizer_(patterns, whitespace),
          engine_(std::move(productions), std::move(token_value)),
          start_(std::move(start)) {}

    Result
    compile(std::string_view text) const {
      return engine_.analyze(tokenizer_.tokenize(text), start_);
    }

    token_stream<Token>
    tokenize(std::string_view text) const {
      return tokenizer_.tokenize(text);
    }

    Result
    analyze(const token_stream<Token>& tokens) const {
      return engine_.analyze(tokens, start_);
    }

    const Symbol&
    start() const {
      return start_;
    }
  };

} // namespace eqp
