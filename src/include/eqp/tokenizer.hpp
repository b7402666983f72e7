#pragma once

#include <eqp/errors.hpp>
#include <eqp/lexicon.hpp>
#include <eqp/token.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace eqp {

  // Pattern-ordered lexer. At each offset whitespace is skipped, then the
  // token patterns are tried in declaration order and the first one that
  // matches wins, even when a later pattern would match more text. More
  // specific patterns (keywords, multi-character operators) must therefore be
  // declared before general ones (identifiers).
  template <typename Kind>
  class tokenizer {
    std::vector<Kind> kinds_;
    lexicon tokens_;
    lexicon whitespace_;

  public:
    using pattern_list = std::vector<std::pair<Kind, std::string>>;

    static constexpr std::size_t excerpt_length = 10;

    // Throws pattern_compile_error. Token patterns are numbered first and
    // whitespace patterns continue the numbering after them.
    tokenizer(const pattern_list& patterns,
              const std::vector<std::string>& whitespace)
        : tokens_(split(patterns, kinds_)),
          whitespace_(whitespace, patterns.size()) {}

    token_stream<Kind>
    tokenize(std::string_view text) const {
      std::vector<token<Kind>> result;
      std::size_t pos = 0;
      while (true) {
        pos = skip_whitespace(text, pos);
        if (pos >= text.size()) break;

        auto m = tokens_.match_at(text, pos);
        if (!m) {
          throw no_match_error(pos, std::string(excerpt(text, pos)));
        }
        result.push_back(token<Kind>{kinds_[m->index],
                                     std::string(text.substr(pos, m->length)),
                                     pos});
        pos += m->length;
      }
      return token_stream<Kind>(std::move(result), text.size());
    }

  private:
    // At most excerpt_length bytes from pos, never ending inside a UTF-8
    // sequence.
    static std::string_view
    excerpt(std::string_view text, std::size_t pos) {
      auto rest = text.substr(pos);
      if (rest.size() <= excerpt_length) return rest;
      auto length = excerpt_length;
      while (length > 0 &&
             (static_cast<unsigned char>(rest[length]) & 0xC0) == 0x80)
        --length;
      return rest.substr(0, length);
    }

    // Restarts from the first whitespace pattern after every skip.
    std::size_t
    skip_whitespace(std::string_view text, std::size_t pos) const {
      while (auto m = whitespace_.match_at(text, pos))
        pos += m->length;
      return pos;
    }

    static lexicon
    split(const pattern_list& patterns, std::vector<Kind>& kinds) {
      std::vector<std::string> sources;
      sources.reserve(patterns.size());
      kinds.reserve(patterns.size());
      for (const auto& [kind, pattern] : patterns) {
        kinds.push_back(kind);
        sources.push_back(pattern);
      }
      return lexicon(sources);
    }
  };

} // namespace eqp
