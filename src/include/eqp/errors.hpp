#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace eqp {

  // Raised while building a tokenizer when a token or whitespace pattern is
  // not a valid regular expression.
  class pattern_compile_error : public std::runtime_error {
    std::string pattern_;
    std::size_t index_;

  public:
    pattern_compile_error(std::string pattern, std::size_t index,
                          const std::string& reason);

    const std::string&
    pattern() const {
      return pattern_;
    }

    std::size_t
    index() const {
      return index_;
    }
  };

  // Raised by tokenize() when neither a token pattern nor a whitespace
  // pattern matches at the current offset.
  class no_match_error : public std::runtime_error {
    std::size_t offset_;
    std::string excerpt_;

  public:
    no_match_error(std::size_t offset, std::string excerpt);

    std::size_t
    offset() const {
      return offset_;
    }

    // At most 10 characters of the unmatched remainder.
    const std::string&
    excerpt() const {
      return excerpt_;
    }
  };

  // Structural mismatch between a token stream and a grammar.
  class parse_error : public std::runtime_error {
    std::size_t token_index_;
    std::size_t offset_;
    std::string lexeme_;

  public:
    parse_error(std::size_t token_index, std::size_t offset, std::string lexeme,
                const std::string& message);

    std::size_t
    token_index() const {
      return token_index_;
    }

    std::size_t
    offset() const {
      return offset_;
    }

    // Empty when the failure is at the end of input.
    const std::string&
    lexeme() const {
      return lexeme_;
    }
  };

  class symbol_not_found : public parse_error {
  public:
    symbol_not_found(std::size_t token_index, std::size_t offset,
                     std::string lexeme);
  };

  class unexpected_end : public parse_error {
  public:
    unexpected_end(std::size_t token_index, std::size_t offset);
  };

  // "line L, column C" for a byte offset into text. Both are 1-based.
  std::string
  describe_position(std::string_view text, std::size_t offset);

} // namespace eqp
