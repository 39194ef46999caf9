/**
 * @file ModuleRecord.cpp
 * @brief ModuleRecord helpers and module name derivation.
 */

#include "src/modules/inc/ModuleRecord.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::find

#include <fmt/core.h>

namespace modscout {

namespace modules {

namespace {

using modscout::helpers::strings::endsWith;

/// Suffixes kmod and distributions append after ".ko".
constexpr std::string_view COMPRESSION_SUFFIXES[] = {".zst", ".xz", ".gz"};

} // namespace

/* ----------------------------- ModuleRecord Methods ----------------------------- */

bool ModuleRecord::provides(std::string_view symbol) const noexcept {
  return std::find(providedSymbols.begin(), providedSymbols.end(), symbol) !=
         providedSymbols.end();
}

std::string ModuleRecord::toString() const {
  return fmt::format("{:<24} provides={:<6} references={:<6} {}", name, providedSymbols.size(),
                     referencedSymbols.size(), path);
}

/* ----------------------------- API ----------------------------- */

std::string moduleNameFromPath(std::string_view path) {
  std::string_view base = modscout::helpers::files::baseName(path);

  for (const std::string_view SUFFIX : COMPRESSION_SUFFIXES) {
    const std::size_t FULL = MODULE_EXTENSION.size() + SUFFIX.size();
    if (base.size() > FULL && endsWith(base, SUFFIX) &&
        endsWith(base.substr(0, base.size() - SUFFIX.size()), MODULE_EXTENSION)) {
      base.remove_suffix(FULL);
      return std::string(base);
    }
  }

  if (base.size() > MODULE_EXTENSION.size() && endsWith(base, MODULE_EXTENSION)) {
    base.remove_suffix(MODULE_EXTENSION.size());
  }
  return std::string(base);
}

} // namespace modules

} // namespace modscout
