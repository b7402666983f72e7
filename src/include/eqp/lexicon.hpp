#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace eqp {

  struct lexicon_match {
    std::size_t index;  // position of the matching pattern in the lexicon
    std::size_t length; // length of the matched text, never zero
  };

  // An ordered list of ECMAScript regular expressions, each anchored to the
  // offset it is tried at. Immutable after construction, so one lexicon can be
  // shared between threads.
  class lexicon {
    std::vector<std::regex> patterns_;

  public:
    lexicon() = default;

    // Throws pattern_compile_error naming the first pattern that fails to
    // compile. Error indices are reported relative to first_index.
    explicit lexicon(const std::vector<std::string>& patterns,
                     std::size_t first_index = 0);

    // First pattern in declaration order with a non-empty match starting
    // exactly at offset. The longest match is not preferred.
    std::optional<lexicon_match>
    match_at(std::string_view text, std::size_t offset) const;

    std::size_t
    size() const {
      return patterns_.size();
    }

    bool
    empty() const {
      return patterns_.empty();
    }
  };

  // Pattern matching literal verbatim.
  std::string
  escape(std::string_view literal);

} // namespace eqp
