#ifndef MODSCOUT_OBJECT_ELF_SYMBOLS_HPP
#define MODSCOUT_OBJECT_ELF_SYMBOLS_HPP
/**
 * @file ElfSymbols.hpp
 * @brief ELF symbol table reader.
 * @note Reads ELFCLASS32/ELFCLASS64 images in either byte order from memory.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Only the static symbol table (SHT_SYMTAB) is read; that is where kernel
 * modules and vmlinux keep the symbols that matter for dependency resolution.
 * An image without a symbol table (fully stripped) yields an empty table.
 */

#include <cstdint> // std::uint8_t, std::uint16_t
#include <span>    // std::span
#include <string>  // std::string
#include <vector>  // std::vector

#include "src/object/inc/Container.hpp"

namespace modscout {

namespace object {

/* ----------------------------- Symbol Attributes ----------------------------- */

/**
 * @brief What a symbol names, as far as the linker knows.
 *
 * UNKNOWN is STT_NOTYPE (and unrecognised types): undefined references in a
 * relocatable object carry no type.
 */
enum class SymbolKind : std::uint8_t {
  UNKNOWN = 0,
  TEXT,
  DATA,
  SECTION,
  FILE,
  TLS,
};

/**
 * @brief Linkage visibility.
 */
enum class SymbolBinding : std::uint8_t {
  LOCAL = 0,
  GLOBAL,
  WEAK,
};

/// @brief Short name ("unknown", "text", ...).
[[nodiscard]] const char* toString(SymbolKind kind) noexcept;

/// @brief Short name ("local", "global", "weak").
[[nodiscard]] const char* toString(SymbolBinding binding) noexcept;

/* ----------------------------- Symbol Table ----------------------------- */

/**
 * @brief One entry of an object's symbol table.
 */
struct ObjectSymbol {
  std::string name{};
  SymbolKind kind{SymbolKind::UNKNOWN};
  SymbolBinding binding{SymbolBinding::LOCAL};
  bool defined{false}; ///< st_shndx != SHN_UNDEF
};

/**
 * @brief Parsed symbol table plus the header facts worth reporting.
 */
struct SymbolTable {
  std::uint8_t elfClass{0};  ///< ELFCLASS32 or ELFCLASS64
  bool bigEndian{false};     ///< ELFDATA2MSB
  std::uint16_t type{0};     ///< e_type (ET_REL for modules, ET_EXEC for vmlinux)
  std::uint16_t machine{0};  ///< e_machine
  std::vector<ObjectSymbol> symbols{}; ///< In table order, null symbol excluded.
};

/* ----------------------------- API ----------------------------- */

/// @brief True if image starts with the ELF magic.
[[nodiscard]] bool isElfImage(std::span<const std::uint8_t> image) noexcept;

/**
 * @brief Parse an in-memory ELF image and extract its symbol table.
 * @param image Raw (already decompressed) object bytes.
 * @param out Populated on success.
 * @param detail Set to a description on failure.
 * @return OK, NOT_AN_OBJECT (wrong magic, class or encoding) or
 *         MALFORMED_OBJECT (truncated headers, tables out of bounds,
 *         symbol names outside the string table).
 * @note Allocates one std::string per symbol.
 */
[[nodiscard]] ObjectStatus readElfSymbols(std::span<const std::uint8_t> image, SymbolTable& out,
                                          std::string& detail);

} // namespace object

} // namespace modscout

#endif // MODSCOUT_OBJECT_ELF_SYMBOLS_HPP
