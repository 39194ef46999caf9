#ifndef MODSCOUT_MODULES_SYMBOL_CLASSIFIER_HPP
#define MODSCOUT_MODULES_SYMBOL_CLASSIFIER_HPP
/**
 * @file SymbolClassifier.hpp
 * @brief Split an object's symbol table into provided and referenced names.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Rules, applied to globally bound symbols only:
 *  - kind UNKNOWN (untyped, i.e. an undefined reference) -> REFERENCES
 *  - any other kind                                     -> PROVIDES
 * Local and weak symbols contribute to neither list.
 */

#include <cstdint>  // std::uint8_t
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

#include "src/object/inc/ElfSymbols.hpp"

namespace modscout {

namespace modules {

/* ----------------------------- Types ----------------------------- */

/// Which side of a link a symbol sits on.
enum class SymbolDirection : std::uint8_t {
  PROVIDES = 0,
  REFERENCES,
};

/// @brief "provides" / "references".
[[nodiscard]] const char* toString(SymbolDirection direction) noexcept;

/// Intermediate classification result for one symbol.
struct SymbolEntry {
  std::string name{};
  SymbolDirection direction{SymbolDirection::PROVIDES};
};

/// Classified name lists, in symbol-table order, duplicates kept.
struct ClassifiedSymbols {
  std::vector<std::string> provided{};
  std::vector<std::string> referenced{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Classify a single symbol.
 * @return Direction, or std::nullopt if the symbol is ignored.
 */
[[nodiscard]] std::optional<SymbolDirection>
classifySymbol(const object::ObjectSymbol& symbol) noexcept;

/// @brief Classify every symbol, dropping ignored ones.
[[nodiscard]] std::vector<SymbolEntry>
classifySymbolEntries(const std::vector<object::ObjectSymbol>& symbols);

/// @brief Classify every symbol into the two name lists.
[[nodiscard]] ClassifiedSymbols classifySymbols(const std::vector<object::ObjectSymbol>& symbols);

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_SYMBOL_CLASSIFIER_HPP
