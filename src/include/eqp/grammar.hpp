#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace eqp {

  // ---------------------------------------------------------------------------
  // Grammar elements
  // ---------------------------------------------------------------------------

  template <typename Token>
  struct terminal {
    Token kind;

    bool
    operator==(const terminal&) const = default;
  };

  template <typename Symbol>
  struct nonterminal {
    Symbol symbol;

    bool
    operator==(const nonterminal&) const = default;
  };

  // Matches only at the end of the token stream. Consumes nothing and
  // contributes no value to the reducer.
  struct end_marker {
    bool
    operator==(const end_marker&) const = default;
  };

  template <typename Token, typename Symbol>
  using element =
      std::variant<terminal<Token>, nonterminal<Symbol>, end_marker>;

  template <typename Token>
  terminal<Token>
  term(Token kind) {
    return terminal<Token>{std::move(kind)};
  }

  template <typename Symbol>
  nonterminal<Symbol>
  sym(Symbol symbol) {
    return nonterminal<Symbol>{std::move(symbol)};
  }

  inline constexpr end_marker end_of_input{};

  // ---------------------------------------------------------------------------
  // Productions
  // ---------------------------------------------------------------------------

  template <typename Token, typename Symbol, typename Result>
  struct production {
    using reducer_type = std::function<Result(std::vector<Result>)>;

    Symbol head;
    std::vector<element<Token, Symbol>> body;
    // One value per terminal and nonterminal of body, in order. Anything it
    // throws aborts the whole parse.
    reducer_type reducer;
  };

  // Ordered list of productions. Declaration order is the priority among
  // productions sharing a head.
  //
  // Every production also gets a body identity: the index of the first
  // production whose body is equal to its own. Two productions with equal
  // bodies share an identity even when their heads differ, which is what the
  // engine's exclusion sets compare.
  template <typename Token, typename Symbol, typename Result>
  class grammar {
  public:
    using production_type = production<Token, Symbol, Result>;

  private:
    std::vector<production_type> productions_;
    std::vector<std::size_t> body_ids_;

  public:
    grammar() = default;

    explicit grammar(std::vector<production_type> productions)
        : productions_(std::move(productions)) {
      body_ids_.reserve(productions_.size());
      for (std::size_t i = 0; i < productions_.size(); ++i) {
        if (!productions_[i].reducer)
          throw std::invalid_argument("grammar: production #" +
                                      std::to_string(i) + " has no reducer");
        std::size_t id = i;
        for (std::size_t j = 0; j < i; ++j) {
          if (productions_[j].body == productions_[i].body) {
            id = body_ids_[j];
            break;
          }
        }
        body_ids_.push_back(id);
      }
    }

    std::size_t
    size() const {
      return productions_.size();
    }

    bool
    empty() const {
      return productions_.empty();
    }

    const production_type&
    operator[](std::size_t index) const {
      return productions_[index];
    }

    std::size_t
    body_id(std::size_t index) const {
      return body_ids_[index];
    }

    // Indices of the productions for head, in declaration order.
    std::vector<std::size_t>
    alternatives(const Symbol& head) const {
      std::vector<std::size_t> result;
      for (std::size_t i = 0; i < productions_.size(); ++i)
        if (productions_[i].head == head) result.push_back(i);
      return result;
    }

    bool
    defines(const Symbol& head) const {
      for (const auto& p : productions_)
        if (p.head == head) return true;
      return false;
    }
  };

} // namespace eqp
