#include <eqp/errors.hpp>

#include <utility>

namespace eqp {

  pattern_compile_error::pattern_compile_error(std::string pattern,
                                               std::size_t index,
                                               const std::string& reason)
      : std::runtime_error("tokenizer: invalid pattern #" +
                           std::to_string(index) + " '" + pattern +
                           "': " + reason),
        pattern_(std::move(pattern)), index_(index) {}

  no_match_error::no_match_error(std::size_t offset, std::string excerpt)
      : std::runtime_error("tokenizer: no pattern matches at offset " +
                           std::to_string(offset) + " near '" + excerpt + "'"),
        offset_(offset), excerpt_(std::move(excerpt)) {}

  parse_error::parse_error(std::size_t token_index, std::size_t offset,
                           std::string lexeme, const std::string& message)
      : std::runtime_error(message), token_index_(token_index),
        offset_(offset), lexeme_(std::move(lexeme)) {}

  symbol_not_found::symbol_not_found(std::size_t token_index,
                                     std::size_t offset, std::string lexeme)
      : parse_error(token_index, offset, lexeme,
                    "grammar_engine: no production matches at token " +
                        std::to_string(token_index) + " '" + lexeme + "'") {}

  unexpected_end::unexpected_end(std::size_t token_index, std::size_t offset)
      : parse_error(token_index, offset, std::string{},
                    "grammar_engine: unexpected end of input at token " +
                        std::to_string(token_index)) {}

  std::string
  describe_position(std::string_view text, std::size_t offset) {
    std::size_t line = 1;
    std::size_t column = 1;
    for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
      if (text[i] == '\n') {
        ++line;
        column = 1;
      } else {
        ++column;
      }
    }
    return "line " + std::to_string(line) + ", column " +
           std::to_string(column);
  }

} // namespace eqp
