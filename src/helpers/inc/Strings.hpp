#ifndef MODSCOUT_HELPERS_STRINGS_HPP
#define MODSCOUT_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Small string_view helpers shared by the parsers and tools.
 *
 * All functions are non-owning and noexcept except those that build
 * std::string / std::vector results.
 */

#include <charconv> // std::from_chars
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error> // std::errc
#include <vector>

namespace modscout {
namespace helpers {
namespace strings {

/* ----------------------------- Character Classes ----------------------------- */

/// ASCII letter test (locale-independent).
[[nodiscard]] constexpr bool isAlpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// ASCII decimal digit test.
[[nodiscard]] constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/// ASCII letter or digit.
[[nodiscard]] constexpr bool isAlnum(char c) noexcept { return isAlpha(c) || isDigit(c); }

/* ----------------------------- Scanning ----------------------------- */

/**
 * @brief Length of the leading run of characters satisfying a predicate.
 * @param text Input view.
 * @param pred Predicate called per character.
 * @return Number of leading characters accepted.
 */
template <typename Pred>
[[nodiscard]] constexpr std::size_t spanWhile(std::string_view text, Pred pred) noexcept {
  std::size_t n = 0;
  while (n < text.size() && pred(text[n])) {
    ++n;
  }
  return n;
}

/**
 * @brief Parse an unsigned decimal integer occupying the whole view.
 * @tparam T Unsigned integer type.
 * @param text Digits only; no sign, no whitespace.
 * @param out Parsed value (untouched on failure).
 * @return false on empty input, non-digit characters or overflow of T.
 */
template <typename T>
[[nodiscard]] inline bool parseUnsigned(std::string_view text, T& out) noexcept {
  if (text.empty()) {
    return false;
  }
  T value{};
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, value, 10);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return false;
  }
  out = value;
  return true;
}

/* ----------------------------- Affixes ----------------------------- */

/// @brief True if text begins with prefix.
[[nodiscard]] constexpr bool startsWith(std::string_view text, std::string_view prefix) noexcept {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

/// @brief True if text ends with suffix.
[[nodiscard]] constexpr bool endsWith(std::string_view text, std::string_view suffix) noexcept {
  return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on a delimiter, dropping empty segments.
 *
 * "a,b," -> {"a", "b"}; ",," -> {}.
 *
 * @note Allocates.
 */
[[nodiscard]] inline std::vector<std::string> splitNonEmpty(std::string_view text, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find(delim, start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    if (end > start) {
      out.emplace_back(text.substr(start, end - start));
    }
    start = end + 1;
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace modscout

#endif // MODSCOUT_HELPERS_STRINGS_HPP
