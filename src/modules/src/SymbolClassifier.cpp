/**
 * @file SymbolClassifier.cpp
 * @brief Provided/referenced symbol classification.
 */

#include "src/modules/inc/SymbolClassifier.hpp"

#include <utility> // std::move

namespace modscout {

namespace modules {

using object::ObjectSymbol;
using object::SymbolBinding;
using object::SymbolKind;

const char* toString(SymbolDirection direction) noexcept {
  switch (direction) {
  case SymbolDirection::PROVIDES:
    return "provides";
  case SymbolDirection::REFERENCES:
    return "references";
  }
  return "unknown";
}

std::optional<SymbolDirection> classifySymbol(const ObjectSymbol& symbol) noexcept {
  if (symbol.binding != SymbolBinding::GLOBAL) {
    return std::nullopt;
  }
  return (symbol.kind == SymbolKind::UNKNOWN) ? SymbolDirection::REFERENCES
                                              : SymbolDirection::PROVIDES;
}

std::vector<SymbolEntry> classifySymbolEntries(const std::vector<ObjectSymbol>& symbols) {
  std::vector<SymbolEntry> entries;
  entries.reserve(symbols.size());
  for (const ObjectSymbol& sym : symbols) {
    const std::optional<SymbolDirection> DIR = classifySymbol(sym);
    if (DIR) {
      entries.push_back(SymbolEntry{sym.name, *DIR});
    }
  }
  return entries;
}

ClassifiedSymbols classifySymbols(const std::vector<ObjectSymbol>& symbols) {
  ClassifiedSymbols out;
  for (SymbolEntry& entry : classifySymbolEntries(symbols)) {
    if (entry.direction == SymbolDirection::PROVIDES) {
      out.provided.push_back(std::move(entry.name));
    } else {
      out.referenced.push_back(std::move(entry.name));
    }
  }
  return out;
}

} // namespace modules

} // namespace modscout
