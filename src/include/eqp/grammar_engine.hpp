#pragma once

#include <eqp/errors.hpp>
#include <eqp/grammar.hpp>
#include <eqp/token.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace eqp {

  // Backtracking, ordered-choice, recursive-descent matcher.
  //
  // A symbol is resolved by trying its productions in declaration order; the
  // first whose body matches is reduced and wins. A structural mismatch
  // anywhere inside a candidate sends the cursor back to where the symbol
  // started and the next candidate is tried. A reducer that throws is never
  // backtracked over: the exception leaves analyze() unchanged.
  //
  // Left recursion terminates through exclusion sets. When a production's body
  // starts with a nonterminal, that production's body is excluded for the
  // nested resolution at the same position. Exclusions are copied one call
  // layer down and cleared whenever a terminal or the end marker is consumed,
  // since the position has then moved. Every candidate starts from the set
  // the symbol was entered with: a clear made inside a failed candidate must
  // not leak into its siblings, or a grammar with three or more left
  // recursive alternatives recurses without bound on input such as "1+".
  // Grammars whose bodies start with nullable nonterminals are outside what
  // the guard covers.
  //
  // The descent uses native recursion, a few frames per nested symbol, so
  // very deep grammars or very long inputs can exhaust the thread's stack.
  // That is a hard resource limit and is not reported as a parse_error.
  // Nothing is memoized, so a failing input against a grammar with many left
  // recursive alternatives can take time exponential in its length.
  //
  // An engine is immutable after construction; concurrent analyze() calls are
  // safe as long as the reducers and the token value function are.
  template <typename Token, typename Symbol, typename Result>
  class grammar_engine {
  public:
    using grammar_type = grammar<Token, Symbol, Result>;
    using production_type = typename grammar_type::production_type;
    using token_value_type =
        std::function<Result(const Token&, std::string_view)>;

  private:
    grammar_type grammar_;
    token_value_type token_value_;

  public:
    grammar_engine(grammar_type g, token_value_type token_value)
        : grammar_(std::move(g)), token_value_(std::move(token_value)) {
      if (!token_value_)
        throw std::invalid_argument("grammar_engine: missing token value "
                                    "function");
    }

    grammar_engine(std::vector<production_type> productions,
                   token_value_type token_value)
        : grammar_engine(grammar_type(std::move(productions)),
                         std::move(token_value)) {}

    const grammar_type&
    rules() const {
      return grammar_;
    }

    // Throws symbol_not_found or unexpected_end when start cannot be resolved
    // from the first token, or whatever a reducer threw.
    Result
    analyze(const token_stream<Token>& tokens, const Symbol& start) const {
      descent d(*this, tokens);
      return d.run(start);
    }

  private:
    // State of one analyze() call: the cursor and the furthest position at
    // which a mismatch was seen, for diagnostics.
    class descent {
      using exclusion_set = std::unordered_set<std::size_t>;

      const grammar_engine& engine_;
      const token_stream<Token>& tokens_;
      std::size_t pos_ = 0;
      std::size_t furthest_ = 0;

    public:
      descent(const grammar_engine& engine, const token_stream<Token>& tokens)
          : engine_(engine), tokens_(tokens) {}

      Result
      run(const Symbol& start) {
        auto result = resolve_symbol(start, exclusion_set{});
        if (!result) throw_failure();
        return std::move(*result);
      }

    private:
      void
      mismatch() {
        furthest_ = std::max(furthest_, pos_);
      }

      [[noreturn]] void
      throw_failure() const {
        if (tokens_.at_end(furthest_))
          throw unexpected_end(furthest_, tokens_.end_offset());
        const auto& tok = tokens_[furthest_];
        throw symbol_not_found(furthest_, tok.offset, tok.lexeme);
      }

      std::optional<Result>
      resolve_symbol(const Symbol& symbol, const exclusion_set& exclusions) {
        const auto& rules = engine_.grammar_;

        std::vector<std::size_t> candidates;
        for (auto index : rules.alternatives(symbol))
          if (!exclusions.contains(rules.body_id(index)))
            candidates.push_back(index);

        const auto start = pos_;
        for (auto index : candidates) {
          pos_ = start;
          exclusion_set working = exclusions;
          std::vector<Result> values;
          if (!match_body(index, values, working)) continue;
          return rules[index].reducer(std::move(values));
        }

        pos_ = start;
        if (candidates.empty()) mismatch();
        return std::nullopt;
      }

      bool
      match_body(std::size_t index, std::vector<Result>& values,
                 exclusion_set& exclusions) {
        const auto& rules = engine_.grammar_;
        const auto& body = rules[index].body;
        values.reserve(body.size());

        for (std::size_t i = 0; i < body.size(); ++i) {
          const auto& elem = body[i];

          if (const auto* t = std::get_if<terminal<Token>>(&elem)) {
            if (tokens_.at_end(pos_) || !(tokens_[pos_].kind == t->kind)) {
              mismatch();
              return false;
            }
            const auto& tok = tokens_[pos_];
            ++pos_;
            exclusions.clear();
            values.push_back(engine_.token_value_(tok.kind, tok.lexeme));
            continue;
          }

          if (const auto* n = std::get_if<nonterminal<Symbol>>(&elem)) {
            exclusion_set derived = exclusions;
            if (i == 0) derived.insert(rules.body_id(index));
            auto value = resolve_symbol(n->symbol, derived);
            if (!value) return false;
            values.push_back(std::move(*value));
            continue;
          }

          // end_marker
          if (!tokens_.at_end(pos_)) {
            mismatch();
            return false;
          }
          exclusions.clear();
        }
        return true;
      }
    };
  };

} // namespace eqp
