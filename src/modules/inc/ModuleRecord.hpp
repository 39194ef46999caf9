#ifndef MODSCOUT_MODULES_MODULE_RECORD_HPP
#define MODSCOUT_MODULES_MODULE_RECORD_HPP
/**
 * @file ModuleRecord.hpp
 * @brief Identity and symbol interface of one kernel module or the kernel image.
 */

#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace modscout {

namespace modules {

/* ----------------------------- Constants ----------------------------- */

/// Reserved name of the kernel image pseudo-module.
inline constexpr std::string_view KERNEL_MODULE_NAME = "vmlinux";

/// Module file extension; a compression suffix may follow it.
inline constexpr std::string_view MODULE_EXTENSION = ".ko";

/* ----------------------------- ModuleRecord ----------------------------- */

/**
 * @brief Symbol summary of one binary.
 *
 * Built once by the loader and treated as immutable afterwards. Symbol lists
 * keep symbol-table order and duplicates.
 */
struct ModuleRecord {
  /// Module name ("wireguard"), or KERNEL_MODULE_NAME for the kernel image.
  std::string name{};

  /// File the record was loaded from, verbatim.
  std::string path{};

  /// Global symbols this binary defines.
  std::vector<std::string> providedSymbols{};

  /// Global symbols this binary needs from elsewhere.
  std::vector<std::string> referencedSymbols{};

  /// @brief True for the kernel image pseudo-module.
  [[nodiscard]] bool isKernel() const noexcept { return name == KERNEL_MODULE_NAME; }

  /// @brief True if symbol appears in providedSymbols.
  [[nodiscard]] bool provides(std::string_view symbol) const noexcept;

  /// @brief One-line summary: name, path and symbol counts.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Derive a module name from a file path.
 *
 * Takes the base name and strips ".ko" plus an optional compression suffix:
 * "/lib/modules/6.1/kernel/net/wireguard.ko.zst" -> "wireguard". Names
 * without a module extension are returned unchanged.
 */
[[nodiscard]] std::string moduleNameFromPath(std::string_view path);

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_MODULE_RECORD_HPP
