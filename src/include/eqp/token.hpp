#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace eqp {

  template <typename Kind>
  struct token {
    Kind kind;
    std::string lexeme;
    std::size_t offset = 0; // byte offset of lexeme in the source text

    bool
    operator==(const token&) const = default;
  };

  // Tokens produced from one source text, followed by an implicit end
  // sentinel at index size(). Immutable once built.
  template <typename Kind>
  class token_stream {
    std::vector<token<Kind>> tokens_;
    std::size_t end_offset_ = 0;

  public:
    token_stream() = default;

    token_stream(std::vector<token<Kind>> tokens, std::size_t end_offset)
        : tokens_(std::move(tokens)), end_offset_(end_offset) {}

    std::size_t
    size() const {
      return tokens_.size();
    }

    bool
    empty() const {
      return tokens_.empty();
    }

    bool
    at_end(std::size_t index) const {
      return index >= tokens_.size();
    }

    const token<Kind>&
    operator[](std::size_t index) const {
      return tokens_[index];
    }

    // Source offset of the token at index, or of the end sentinel.
    std::size_t
    offset_of(std::size_t index) const {
      return at_end(index) ? end_offset_ : tokens_[index].offset;
    }

    std::size_t
    end_offset() const {
      return end_offset_;
    }

    auto
    begin() const {
      return tokens_.begin();
    }

    auto
    end() const {
      return tokens_.end();
    }

    bool
    operator==(const token_stream&) const = default;
  };

} // namespace eqp
