#ifndef MODSCOUT_MODULES_MODULE_LOADER_HPP
#define MODSCOUT_MODULES_MODULE_LOADER_HPP
/**
 * @file ModuleLoader.hpp
 * @brief Build a ModuleRecord from one module file or kernel image.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Pipeline: read file -> sniff container -> decompress -> parse ELF ->
 * classify symbols. Either a complete record is produced or a status other
 * than OK is returned; there is no partial result.
 */

#include <cstdint> // std::uint8_t
#include <string>  // std::string

#include "src/modules/inc/ModuleRecord.hpp"
#include "src/object/inc/Container.hpp"

namespace modscout {

namespace modules {

/* ----------------------------- LoadStatus ----------------------------- */

/**
 * @brief Status codes for module loading.
 */
enum class LoadStatus : std::uint8_t {
  OK = 0,
  IO_ERROR,     ///< File missing or unreadable.
  FORMAT_ERROR, ///< Unknown container, decompression failure, or not a valid object.
  CANCELLED,    ///< Not attempted because the run was cancelled.
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(LoadStatus status) noexcept;

/* ----------------------------- LoadResult ----------------------------- */

/**
 * @brief Outcome of loading one file.
 */
struct LoadResult {
  LoadStatus status{LoadStatus::OK};
  ModuleRecord record{}; ///< Valid only when status == OK.
  std::string detail{};  ///< Failure description, empty on success.

  [[nodiscard]] bool ok() const noexcept { return status == LoadStatus::OK; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Load a module file.
 * @param path Module file (.ko, .ko.zst, .ko.xz, or any name; content decides).
 * @return Record named by moduleNameFromPath(), or IO_ERROR / FORMAT_ERROR.
 * @note Reads and decompresses the whole file into memory.
 */
[[nodiscard]] LoadResult loadModule(const std::string& path);

/**
 * @brief Load the kernel image. Same pipeline, record named KERNEL_MODULE_NAME.
 */
[[nodiscard]] LoadResult loadKernelImage(const std::string& path);

/**
 * @brief Build a record from file contents already in memory.
 * @param path Location to record (used for the name unless name is non-empty).
 * @param data File contents; consumed (decompressed in place).
 * @param name Explicit record name, or empty to derive it from path.
 * @return OK or FORMAT_ERROR.
 */
[[nodiscard]] LoadResult loadModuleFromBuffer(const std::string& path, object::ByteBuffer data,
                                              const std::string& name = {});

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_MODULE_LOADER_HPP
