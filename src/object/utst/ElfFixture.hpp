#ifndef MODSCOUT_OBJECT_UTST_ELF_FIXTURE_HPP
#define MODSCOUT_OBJECT_UTST_ELF_FIXTURE_HPP
/**
 * @file ElfFixture.hpp
 * @brief Synthetic ELF images and compressed wrappers for unit tests.
 *
 * Builds a minimal relocatable object in memory: null, .text, .strtab and
 * .symtab sections, no section name table. Enough for the symbol reader and
 * everything layered on it.
 */

#include <elf.h>
#include <lzma.h>
#include <zstd.h>

#include <bit>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

namespace modscout {
namespace elffixture {

/* ----------------------------- Types ----------------------------- */

/// Section index of .text in generated images.
inline constexpr std::uint16_t TEXT_SECTION = 1;

struct FixtureSymbol {
  std::string name;
  unsigned char type{STT_NOTYPE};
  unsigned char bind{STB_GLOBAL};
  std::uint16_t shndx{SHN_UNDEF};
};

struct FixtureOptions {
  bool is64{true};
  bool bigEndian{false};
  std::uint16_t type{ET_REL};
};

/* ----------------------------- Symbol Shorthands ----------------------------- */

/// Undefined global: what a module emits for a symbol it needs.
inline FixtureSymbol undefinedRef(const std::string& name) {
  return {name, STT_NOTYPE, STB_GLOBAL, SHN_UNDEF};
}

/// Defined global function (an export).
inline FixtureSymbol exportedFunc(const std::string& name) {
  return {name, STT_FUNC, STB_GLOBAL, TEXT_SECTION};
}

/// Defined global object.
inline FixtureSymbol exportedData(const std::string& name) {
  return {name, STT_OBJECT, STB_GLOBAL, TEXT_SECTION};
}

/// Defined static function.
inline FixtureSymbol localFunc(const std::string& name) {
  return {name, STT_FUNC, STB_LOCAL, TEXT_SECTION};
}

/// Defined weak function.
inline FixtureSymbol weakFunc(const std::string& name) {
  return {name, STT_FUNC, STB_WEAK, TEXT_SECTION};
}

/* ----------------------------- Builder ----------------------------- */

namespace detail {

template <typename T> T toFileOrder(T value, bool bigEndian) {
  const bool HOST_BIG = (std::endian::native == std::endian::big);
  if (bigEndian == HOST_BIG || sizeof(T) == 1) {
    return value;
  }
  T out{};
  const auto* src = reinterpret_cast<const unsigned char*>(&value);
  auto* dst = reinterpret_cast<unsigned char*>(&out);
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    dst[i] = src[sizeof(T) - 1 - i];
  }
  return out;
}

template <typename T> void put(std::vector<std::uint8_t>& buf, std::size_t offset, const T& rec) {
  if (buf.size() < offset + sizeof(T)) {
    buf.resize(offset + sizeof(T));
  }
  std::memcpy(buf.data() + offset, &rec, sizeof(T));
}

inline std::size_t alignUp(std::size_t value, std::size_t align) {
  return (value + align - 1) / align * align;
}

template <typename Ehdr, typename Shdr, typename Sym>
std::vector<std::uint8_t> build(const std::vector<FixtureSymbol>& symbols,
                                const FixtureOptions& opts, unsigned char elfClass) {
  const bool BE = opts.bigEndian;
  const auto F = [BE](auto v) { return toFileOrder(v, BE); };

  std::string strtab(1, '\0');
  std::vector<std::size_t> nameOffsets;
  for (const auto& sym : symbols) {
    nameOffsets.push_back(strtab.size());
    strtab += sym.name;
    strtab.push_back('\0');
  }

  const std::size_t STRTAB_OFF = sizeof(Ehdr);
  const std::size_t SYMTAB_OFF = alignUp(STRTAB_OFF + strtab.size(), 8);
  const std::size_t SYMTAB_SIZE = (symbols.size() + 1) * sizeof(Sym);
  const std::size_t SHDR_OFF = alignUp(SYMTAB_OFF + SYMTAB_SIZE, 8);
  constexpr std::size_t SHNUM = 4;

  std::vector<std::uint8_t> buf(SHDR_OFF + SHNUM * sizeof(Shdr), 0);

  Ehdr ehdr{};
  std::memcpy(ehdr.e_ident, ELFMAG, SELFMAG);
  ehdr.e_ident[EI_CLASS] = elfClass;
  ehdr.e_ident[EI_DATA] = BE ? ELFDATA2MSB : ELFDATA2LSB;
  ehdr.e_ident[EI_VERSION] = EV_CURRENT;
  ehdr.e_type = F(opts.type);
  ehdr.e_machine = F(static_cast<decltype(ehdr.e_machine)>(EM_X86_64));
  ehdr.e_version = F(static_cast<decltype(ehdr.e_version)>(EV_CURRENT));
  ehdr.e_shoff = F(static_cast<decltype(ehdr.e_shoff)>(SHDR_OFF));
  ehdr.e_ehsize = F(static_cast<decltype(ehdr.e_ehsize)>(sizeof(Ehdr)));
  ehdr.e_shentsize = F(static_cast<decltype(ehdr.e_shentsize)>(sizeof(Shdr)));
  ehdr.e_shnum = F(static_cast<decltype(ehdr.e_shnum)>(SHNUM));
  ehdr.e_shstrndx = F(static_cast<decltype(ehdr.e_shstrndx)>(SHN_UNDEF));
  put(buf, 0, ehdr);

  std::memcpy(buf.data() + STRTAB_OFF, strtab.data(), strtab.size());

  for (std::size_t i = 0; i < symbols.size(); ++i) {
    Sym sym{};
    sym.st_name = F(static_cast<decltype(sym.st_name)>(nameOffsets[i]));
    sym.st_info = static_cast<unsigned char>((symbols[i].bind << 4) | (symbols[i].type & 0xF));
    sym.st_shndx = F(static_cast<decltype(sym.st_shndx)>(symbols[i].shndx));
    put(buf, SYMTAB_OFF + (i + 1) * sizeof(Sym), sym);
  }

  Shdr text{};
  text.sh_type = F(static_cast<decltype(text.sh_type)>(SHT_PROGBITS));
  put(buf, SHDR_OFF + 1 * sizeof(Shdr), text);

  Shdr str{};
  str.sh_type = F(static_cast<decltype(str.sh_type)>(SHT_STRTAB));
  str.sh_offset = F(static_cast<decltype(str.sh_offset)>(STRTAB_OFF));
  str.sh_size = F(static_cast<decltype(str.sh_size)>(strtab.size()));
  put(buf, SHDR_OFF + 2 * sizeof(Shdr), str);

  Shdr sym{};
  sym.sh_type = F(static_cast<decltype(sym.sh_type)>(SHT_SYMTAB));
  sym.sh_offset = F(static_cast<decltype(sym.sh_offset)>(SYMTAB_OFF));
  sym.sh_size = F(static_cast<decltype(sym.sh_size)>(SYMTAB_SIZE));
  sym.sh_link = F(static_cast<decltype(sym.sh_link)>(2));
  sym.sh_entsize = F(static_cast<decltype(sym.sh_entsize)>(sizeof(Sym)));
  put(buf, SHDR_OFF + 3 * sizeof(Shdr), sym);

  return buf;
}

} // namespace detail

/// @brief Build an ELF image containing the given symbols (in order).
inline std::vector<std::uint8_t> buildElf(const std::vector<FixtureSymbol>& symbols,
                                          const FixtureOptions& opts = {}) {
  if (opts.is64) {
    return detail::build<Elf64_Ehdr, Elf64_Shdr, Elf64_Sym>(symbols, opts, ELFCLASS64);
  }
  return detail::build<Elf32_Ehdr, Elf32_Shdr, Elf32_Sym>(symbols, opts, ELFCLASS32);
}

/* ----------------------------- Compression ----------------------------- */

/// @brief Wrap data in a single zstd frame.
inline std::vector<std::uint8_t> zstdCompress(const std::vector<std::uint8_t>& data) {
  std::vector<std::uint8_t> out(ZSTD_compressBound(data.size()));
  const std::size_t N = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  out.resize(ZSTD_isError(N) != 0U ? 0 : N);
  return out;
}

/// @brief Wrap data in an .xz stream (CRC64 check).
inline std::vector<std::uint8_t> xzCompress(const std::vector<std::uint8_t>& data) {
  std::vector<std::uint8_t> out(lzma_stream_buffer_bound(data.size()));
  std::size_t pos = 0;
  const lzma_ret RET = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr, data.data(),
                                               data.size(), out.data(), &pos, out.size());
  out.resize(RET == LZMA_OK ? pos : 0);
  return out;
}

/* ----------------------------- Files ----------------------------- */

/// @brief Write bytes to path, replacing any existing file.
inline bool writeFile(const std::string& path, const std::vector<std::uint8_t>& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return static_cast<bool>(ofs);
}

} // namespace elffixture
} // namespace modscout

#endif // MODSCOUT_OBJECT_UTST_ELF_FIXTURE_HPP
