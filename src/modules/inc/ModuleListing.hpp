#ifndef MODSCOUT_MODULES_MODULE_LISTING_HPP
#define MODSCOUT_MODULES_MODULE_LISTING_HPP
/**
 * @file ModuleListing.hpp
 * @brief Parser for the kernel's live module table (/proc/modules).
 * @note Linux-only for readModuleListing(); the parsers are pure.
 *
 * Line format (fields separated by one or more spaces):
 *   name size refs dependents state address [trailing]
 * Example:
 *   ip_tables 36864 2 iptable_nat,iptable_filter, Live 0x0000000000000000
 *
 * Any line that does not match fails the whole parse; the result names the
 * 1-based line number and carries the offending text.
 */

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t, std::uint32_t, std::uint64_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace modscout {

namespace modules {

/* ----------------------------- Constants ----------------------------- */

/// Conventional location of the live module table.
inline constexpr const char* PROC_MODULES_PATH = "/proc/modules";

/* ----------------------------- Types ----------------------------- */

/// Module lifecycle state as reported by the kernel.
enum class ModuleState : std::uint8_t {
  LIVE = 0,
  LOADING,
  UNLOADING,
};

/// @brief Kernel spelling ("Live", "Loading", "Unloading").
[[nodiscard]] const char* toString(ModuleState state) noexcept;

/**
 * @brief Status codes for listing parses.
 */
enum class ListingStatus : std::uint8_t {
  OK = 0,
  IO_ERROR,          ///< Listing file could not be read.
  BAD_LINE,          ///< Line does not match the field grammar.
  UNKNOWN_STATE,     ///< State field is not Live/Loading/Unloading.
  UNTERMINATED_LINE, ///< Final line lacks a line break.
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ListingStatus status) noexcept;

/**
 * @brief One row of the live module table.
 */
struct KernelModuleStatus {
  std::string name{};
  std::uint64_t sizeBytes{0};
  std::uint32_t refCount{0};

  /// nullopt when the kernel prints "-"; otherwise the listed names, in order.
  std::optional<std::vector<std::string>> dependents{};

  ModuleState state{ModuleState::LIVE};

  /// Load address token, uninterpreted (zeroed without CAP_SYSLOG).
  std::string address{};
};

/// Parser knobs.
struct ListingOptions {
  /// Accept a final line that is not followed by a line break.
  bool acceptUnterminated{false};
};

/**
 * @brief Result of parsing a whole listing.
 *
 * On failure modules holds the rows parsed before the failing line.
 */
struct ListingResult {
  ListingStatus status{ListingStatus::OK};
  std::vector<KernelModuleStatus> modules{};
  std::size_t line{0};     ///< 1-based failing line, 0 on success or IO_ERROR.
  std::string lineText{};  ///< Failing line without its terminator.
  std::string detail{};    ///< Failure description.

  [[nodiscard]] bool ok() const noexcept { return status == ListingStatus::OK; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse one line (without its line break).
 * @param line Line text.
 * @param out Filled on success.
 * @param detail Set on failure, naming the field or token at fault.
 * @return OK, BAD_LINE or UNKNOWN_STATE.
 */
[[nodiscard]] ListingStatus parseModuleStatusLine(std::string_view line, KernelModuleStatus& out,
                                                  std::string& detail);

/**
 * @brief Parse a complete listing.
 *
 * Lines end with "\n", optionally preceded by "\r". Empty input yields zero
 * records.
 */
[[nodiscard]] ListingResult parseModuleListing(std::string_view text,
                                               const ListingOptions& opts = {});

/**
 * @brief Read and parse a listing file.
 * @param path Listing location, normally PROC_MODULES_PATH.
 * @return IO_ERROR if the file cannot be read, otherwise as parseModuleListing().
 */
[[nodiscard]] ListingResult readModuleListing(const std::string& path = PROC_MODULES_PATH,
                                              const ListingOptions& opts = {});

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_MODULE_LISTING_HPP
