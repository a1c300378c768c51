#ifndef PROXWATCH_HELPERS_STRINGS_HPP
#define PROXWATCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string helpers shared by the config loader and the codec.
 *
 * All functions operate on std::string_view and never allocate unless they
 * return a std::string or container.
 */

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {
namespace helpers {
namespace strings {

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief View of text without leading/trailing whitespace (space, tab, CR, LF).
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = text.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = text.find_last_not_of(WS);
  return text.substr(FIRST, LAST - FIRST + 1);
}

/* ----------------------------- Comparison ----------------------------- */

/**
 * @brief ASCII case-insensitive equality.
 */
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    const auto CA = static_cast<unsigned char>(a[i]);
    const auto CB = static_cast<unsigned char>(b[i]);
    if (std::tolower(CA) != std::tolower(CB)) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on a single delimiter, keeping empty pieces.
 * @note Returned views point into text.
 */
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view text, char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = text.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, POS - start));
    start = POS + 1;
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace proxwatch

#endif // PROXWATCH_HELPERS_STRINGS_HPP
