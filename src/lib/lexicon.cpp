#include <eqp/lexicon.hpp>

#include <eqp/errors.hpp>

namespace eqp {

  lexicon::lexicon(const std::vector<std::string>& patterns,
                   std::size_t first_index) {
    patterns_.reserve(patterns.size());
    for (std::size_t i = 0; i < patterns.size(); ++i) {
      try {
        patterns_.emplace_back(patterns[i], std::regex::ECMAScript);
      } catch (const std::regex_error& e) {
        throw pattern_compile_error(patterns[i], first_index + i, e.what());
      }
    }
  }

  std::optional<lexicon_match>
  lexicon::match_at(std::string_view text, std::size_t offset) const {
    if (offset >= text.size()) return std::nullopt;

    const char* first = text.data() + offset;
    const char* last = text.data() + text.size();

    // The remaining input is matched as a fresh string, so ^ holds at offset.
    const auto flags = std::regex_constants::match_continuous;

    for (std::size_t i = 0; i < patterns_.size(); ++i) {
      std::cmatch m;
      if (!std::regex_search(first, last, m, patterns_[i], flags)) continue;
      auto length = static_cast<std::size_t>(m.length(0));
      if (length == 0) continue;
      return lexicon_match{i, length};
    }
    return std::nullopt;
  }

  std::string
  escape(std::string_view literal) {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string result;
    result.reserve(literal.size() * 2);
    for (char c : literal) {
      if (special.find(c) != std::string_view::npos) result += '\\';
      result += c;
    }
    return result;
  }

} // namespace eqp
