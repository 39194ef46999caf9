/**
 * @file ElfSymbols.cpp
 * @brief ELF symbol table reader over the <elf.h> record layouts.
 * @note Every header and table is bounds-checked against the image before use;
 *       records are copied out with memcpy so unaligned images are fine.
 */

#include "src/object/inc/ElfSymbols.hpp"

#include <elf.h> // Elf32_*/Elf64_* records, ELFMAG, SHT_*, STT_*, STB_*

#include <bit>     // std::endian
#include <cstring> // std::memcpy, std::memcmp, strnlen

#include <fmt/core.h>

namespace modscout {

namespace object {

namespace {

/* ----------------------------- Byte Order ----------------------------- */

template <typename T> constexpr T byteSwap(T value) noexcept {
  if constexpr (sizeof(T) == 1) {
    return value;
  } else if constexpr (sizeof(T) == 2) {
    return static_cast<T>(__builtin_bswap16(static_cast<std::uint16_t>(value)));
  } else if constexpr (sizeof(T) == 4) {
    return static_cast<T>(__builtin_bswap32(static_cast<std::uint32_t>(value)));
  } else {
    static_assert(sizeof(T) == 8, "unsupported field width");
    return static_cast<T>(__builtin_bswap64(static_cast<std::uint64_t>(value)));
  }
}

/// Bounds-checked, byte-order-aware view of an ELF image.
class ImageView {
public:
  ImageView(std::span<const std::uint8_t> image, bool swap) noexcept
      : image_(image), swap_(swap) {}

  /// True if [offset, offset + length) lies inside the image.
  [[nodiscard]] bool contains(std::uint64_t offset, std::uint64_t length) const noexcept {
    return offset <= image_.size() && length <= image_.size() - offset;
  }

  template <typename T> [[nodiscard]] bool read(std::uint64_t offset, T& out) const noexcept {
    if (!contains(offset, sizeof(T))) {
      return false;
    }
    std::memcpy(&out, image_.data() + offset, sizeof(T));
    return true;
  }

  /// Convert a field from file to host byte order.
  template <typename T> [[nodiscard]] T fix(T value) const noexcept {
    return swap_ ? byteSwap(value) : value;
  }

  [[nodiscard]] const char* chars(std::uint64_t offset) const noexcept {
    return reinterpret_cast<const char*>(image_.data() + offset);
  }

private:
  std::span<const std::uint8_t> image_;
  bool swap_;
};

/* ----------------------------- Class Traits ----------------------------- */

struct Elf32Traits {
  using Ehdr = Elf32_Ehdr;
  using Shdr = Elf32_Shdr;
  using Sym = Elf32_Sym;
};

struct Elf64Traits {
  using Ehdr = Elf64_Ehdr;
  using Shdr = Elf64_Shdr;
  using Sym = Elf64_Sym;
};

/* ----------------------------- Attribute Mapping ----------------------------- */

SymbolKind mapKind(unsigned char type) noexcept {
  switch (type) {
  case STT_OBJECT:
  case STT_COMMON:
    return SymbolKind::DATA;
  case STT_FUNC:
  case STT_GNU_IFUNC:
    return SymbolKind::TEXT;
  case STT_SECTION:
    return SymbolKind::SECTION;
  case STT_FILE:
    return SymbolKind::FILE;
  case STT_TLS:
    return SymbolKind::TLS;
  default:
    return SymbolKind::UNKNOWN;
  }
}

SymbolBinding mapBinding(unsigned char bind) noexcept {
  switch (bind) {
  case STB_GLOBAL:
  case STB_GNU_UNIQUE:
    return SymbolBinding::GLOBAL;
  case STB_WEAK:
    return SymbolBinding::WEAK;
  default:
    return SymbolBinding::LOCAL;
  }
}

/* ----------------------------- Parsing ----------------------------- */

template <typename Traits>
ObjectStatus parseImage(const ImageView& view, SymbolTable& out, std::string& detail) {
  using Ehdr = typename Traits::Ehdr;
  using Shdr = typename Traits::Shdr;
  using Sym = typename Traits::Sym;

  Ehdr ehdr{};
  if (!view.read(0, ehdr)) {
    detail = "truncated ELF header";
    return ObjectStatus::MALFORMED_OBJECT;
  }
  out.type = view.fix(ehdr.e_type);
  out.machine = view.fix(ehdr.e_machine);

  const std::uint64_t SHOFF = view.fix(ehdr.e_shoff);
  const std::uint64_t SHENTSIZE = view.fix(ehdr.e_shentsize);
  std::uint64_t shnum = view.fix(ehdr.e_shnum);

  if (SHOFF == 0) {
    return ObjectStatus::OK;
  }
  if (SHENTSIZE < sizeof(Shdr)) {
    detail = fmt::format("section header entry size {} is too small", SHENTSIZE);
    return ObjectStatus::MALFORMED_OBJECT;
  }

  const auto READ_SHDR = [&](std::uint64_t index, Shdr& shdr) {
    return view.read(SHOFF + index * SHENTSIZE, shdr);
  };

  // Extended numbering: the real count lives in section 0.
  if (shnum == 0) {
    Shdr first{};
    if (!READ_SHDR(0, first)) {
      detail = "section header table lies outside the image";
      return ObjectStatus::MALFORMED_OBJECT;
    }
    shnum = view.fix(first.sh_size);
  }

  if (shnum > (UINT64_MAX / SHENTSIZE) || !view.contains(SHOFF, shnum * SHENTSIZE)) {
    detail = fmt::format("section header table ({} entries at {:#x}) lies outside the image", shnum,
                         SHOFF);
    return ObjectStatus::MALFORMED_OBJECT;
  }

  Shdr symtab{};
  bool found = false;
  for (std::uint64_t i = 0; i < shnum && !found; ++i) {
    if (READ_SHDR(i, symtab) && view.fix(symtab.sh_type) == SHT_SYMTAB) {
      found = true;
    }
  }
  if (!found) {
    return ObjectStatus::OK;
  }

  const std::uint64_t LINK = view.fix(symtab.sh_link);
  Shdr strtab{};
  if (LINK >= shnum || !READ_SHDR(LINK, strtab) || view.fix(strtab.sh_type) != SHT_STRTAB) {
    detail = fmt::format("symbol table links to invalid string table section {}", LINK);
    return ObjectStatus::MALFORMED_OBJECT;
  }

  const std::uint64_t STR_OFF = view.fix(strtab.sh_offset);
  const std::uint64_t STR_SIZE = view.fix(strtab.sh_size);
  if (!view.contains(STR_OFF, STR_SIZE)) {
    detail = "string table lies outside the image";
    return ObjectStatus::MALFORMED_OBJECT;
  }

  const std::uint64_t SYM_OFF = view.fix(symtab.sh_offset);
  const std::uint64_t SYM_SIZE = view.fix(symtab.sh_size);
  std::uint64_t entSize = view.fix(symtab.sh_entsize);
  if (entSize == 0) {
    entSize = sizeof(Sym);
  }
  if (entSize < sizeof(Sym)) {
    detail = fmt::format("symbol entry size {} is too small", entSize);
    return ObjectStatus::MALFORMED_OBJECT;
  }
  if (!view.contains(SYM_OFF, SYM_SIZE)) {
    detail = "symbol table lies outside the image";
    return ObjectStatus::MALFORMED_OBJECT;
  }

  const std::uint64_t COUNT = SYM_SIZE / entSize;
  if (COUNT > 1) {
    out.symbols.reserve(static_cast<std::size_t>(COUNT - 1));
  }

  // Index 0 is the reserved null symbol.
  for (std::uint64_t i = 1; i < COUNT; ++i) {
    Sym sym{};
    if (!view.read(SYM_OFF + i * entSize, sym)) {
      detail = fmt::format("symbol {} lies outside the image", i);
      return ObjectStatus::MALFORMED_OBJECT;
    }

    const std::uint64_t NAME_OFF = view.fix(sym.st_name);
    if (NAME_OFF >= STR_SIZE) {
      detail = fmt::format("symbol {} has name offset {} outside the string table", i, NAME_OFF);
      return ObjectStatus::MALFORMED_OBJECT;
    }
    const char* name = view.chars(STR_OFF + NAME_OFF);
    const std::size_t MAX_LEN = static_cast<std::size_t>(STR_SIZE - NAME_OFF);
    const std::size_t LEN = ::strnlen(name, MAX_LEN);
    if (LEN == MAX_LEN) {
      detail = fmt::format("symbol {} has an unterminated name", i);
      return ObjectStatus::MALFORMED_OBJECT;
    }

    ObjectSymbol entry{};
    entry.name.assign(name, LEN);
    entry.kind = mapKind(ELF64_ST_TYPE(sym.st_info));
    entry.binding = mapBinding(ELF64_ST_BIND(sym.st_info));
    entry.defined = (view.fix(sym.st_shndx) != SHN_UNDEF);
    out.symbols.push_back(std::move(entry));
  }

  return ObjectStatus::OK;
}

} // namespace

/* ----------------------------- Attribute Strings ----------------------------- */

const char* toString(SymbolKind kind) noexcept {
  switch (kind) {
  case SymbolKind::UNKNOWN:
    return "unknown";
  case SymbolKind::TEXT:
    return "text";
  case SymbolKind::DATA:
    return "data";
  case SymbolKind::SECTION:
    return "section";
  case SymbolKind::FILE:
    return "file";
  case SymbolKind::TLS:
    return "tls";
  }
  return "unknown";
}

const char* toString(SymbolBinding binding) noexcept {
  switch (binding) {
  case SymbolBinding::LOCAL:
    return "local";
  case SymbolBinding::GLOBAL:
    return "global";
  case SymbolBinding::WEAK:
    return "weak";
  }
  return "local";
}

/* ----------------------------- API ----------------------------- */

bool isElfImage(std::span<const std::uint8_t> image) noexcept {
  return image.size() >= SELFMAG && std::memcmp(image.data(), ELFMAG, SELFMAG) == 0;
}

ObjectStatus readElfSymbols(std::span<const std::uint8_t> image, SymbolTable& out,
                            std::string& detail) {
  out = SymbolTable{};

  if (!isElfImage(image) || image.size() < EI_NIDENT) {
    detail = "not an ELF image";
    return ObjectStatus::NOT_AN_OBJECT;
  }

  const std::uint8_t CLASS = image[EI_CLASS];
  const std::uint8_t DATA = image[EI_DATA];
  if (CLASS != ELFCLASS32 && CLASS != ELFCLASS64) {
    detail = fmt::format("unsupported ELF class {}", CLASS);
    return ObjectStatus::NOT_AN_OBJECT;
  }
  if (DATA != ELFDATA2LSB && DATA != ELFDATA2MSB) {
    detail = fmt::format("unsupported ELF data encoding {}", DATA);
    return ObjectStatus::NOT_AN_OBJECT;
  }

  out.elfClass = CLASS;
  out.bigEndian = (DATA == ELFDATA2MSB);
  const bool HOST_BIG = (std::endian::native == std::endian::big);
  const ImageView VIEW(image, out.bigEndian != HOST_BIG);

  const ObjectStatus STATUS = (CLASS == ELFCLASS64) ? parseImage<Elf64Traits>(VIEW, out, detail)
                                                    : parseImage<Elf32Traits>(VIEW, out, detail);
  if (STATUS != ObjectStatus::OK) {
    out.symbols.clear();
  }
  return STATUS;
}

} // namespace object

} // namespace modscout
