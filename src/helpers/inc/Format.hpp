#ifndef MODSCOUT_HELPERS_FORMAT_HPP
#define MODSCOUT_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable and JSON formatting helpers for the CLI tools.
 *
 * @note All functions return std::string. Use only for output.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <fmt/format.h>

namespace modscout {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "992.0 KiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;

  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }
  return fmt::format("{} B", bytes);
}

/**
 * @brief Quote a string as a JSON string literal.
 *
 * Escapes quote, backslash and control characters; other bytes pass through
 * unchanged (paths are emitted as-is, not re-encoded).
 */
[[nodiscard]] inline std::string jsonQuote(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (const char C : text) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(C)));
      } else {
        out.push_back(C);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace format
} // namespace helpers
} // namespace modscout

#endif // MODSCOUT_HELPERS_FORMAT_HPP
