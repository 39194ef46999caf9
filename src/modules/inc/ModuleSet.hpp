#ifndef MODSCOUT_MODULES_MODULE_SET_HPP
#define MODSCOUT_MODULES_MODULE_SET_HPP
/**
 * @file ModuleSet.hpp
 * @brief Discover module files and assemble the resolution working set.
 *
 * The kernel image must load; every other candidate is best-effort: a file
 * that fails to load is logged, recorded in ModuleSet::failures and skipped.
 * Candidate loads are independent and may run on a bounded worker pool;
 * results are always collected in discovery order, so the working set is
 * identical for any job count.
 */

#include <atomic>      // std::atomic
#include <cstddef>     // std::size_t
#include <functional>  // std::function
#include <string>      // std::string
#include <string_view> // std::string_view
#include <thread>      // std::thread
#include <vector>      // std::vector

#include "src/helpers/inc/Log.hpp"
#include "src/modules/inc/ModuleLoader.hpp"
#include "src/modules/inc/ModuleRecord.hpp"

namespace modscout {

namespace modules {

/* ----------------------------- Constants ----------------------------- */

/// Default file-name pattern for candidates (matches .ko, .ko.zst, .ko.xz).
inline constexpr std::string_view DEFAULT_MODULE_PATTERN = "*.ko*";

/// Upper bound on loader threads.
inline constexpr std::size_t MAX_LOAD_JOBS = 64;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Inputs for buildModuleSet().
 */
struct ModuleSetConfig {
  /// Kernel image (vmlinux). Required.
  std::string kernelPath{};

  /// Directory searched recursively for candidates, or a single module file.
  /// Empty means kernel only.
  std::string modulesPath{};

  /// fnmatch(3) pattern applied to each candidate's file name.
  std::string pattern{DEFAULT_MODULE_PATTERN};

  /// Loader threads; 0 and 1 both mean sequential. Clamped to MAX_LOAD_JOBS.
  std::size_t jobs{1};

  /// Progress and skip reports. May be empty.
  helpers::log::LogSink log{};

  /// When set and raised, candidates not yet started are reported CANCELLED.
  const std::atomic<bool>* cancel{nullptr};
};

/// One candidate that did not make it into the working set.
struct LoadFailure {
  std::string path{};
  LoadStatus status{LoadStatus::OK};
  std::string detail{};
};

/**
 * @brief Assembled working set.
 *
 * On success modules[0] is the kernel image, followed by every loaded
 * candidate in path order.
 */
struct ModuleSet {
  LoadStatus status{LoadStatus::OK}; ///< Non-OK only for fatal failures.
  std::string detail{};              ///< Fatal failure description.
  std::vector<ModuleRecord> modules{};
  std::vector<LoadFailure> failures{};
  std::size_t candidateCount{0};

  [[nodiscard]] bool ok() const noexcept { return status == LoadStatus::OK; }

  /// @brief First record with the given name, or nullptr.
  [[nodiscard]] const ModuleRecord* find(std::string_view name) const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Enumerate candidate module files.
 * @param root Directory to walk recursively (symlinked directories are not
 *             followed), or a regular file which becomes the only candidate.
 * @param pattern fnmatch(3) pattern matched against file names.
 * @param out Matching regular files, sorted by path.
 * @param error Set when root cannot be opened.
 * @param log Receives warnings for subtrees that cannot be walked.
 * @return false only if root itself is missing or unreadable.
 */
[[nodiscard]] bool discoverModuleFiles(const std::string& root, const std::string& pattern,
                                       std::vector<std::string>& out, std::string& error,
                                       const helpers::log::LogSink& log = {});

/**
 * @brief Starts one loader worker thread.
 *
 * May throw std::system_error when no thread can be created; the pool then
 * runs with the workers it already has.
 */
using ThreadSpawner = std::function<std::thread(std::function<void()>)>;

/// @brief Spawner used by default: plain std::thread construction.
[[nodiscard]] std::thread spawnThread(std::function<void()> body);

/**
 * @brief Load files independently, optionally in parallel.
 * @param paths Files to load.
 * @param jobs Worker count (clamped to [1, MAX_LOAD_JOBS] and to paths.size()).
 * @param cancel Optional cancellation flag, checked before each file.
 * @param spawn Creates the extra workers. If it throws std::system_error no
 *              further workers are started; the calling thread and the
 *              workers already running load the remaining files.
 * @return One result per path, same order as paths.
 */
[[nodiscard]] std::vector<LoadResult> loadModuleFiles(const std::vector<std::string>& paths,
                                                      std::size_t jobs = 1,
                                                      const std::atomic<bool>* cancel = nullptr,
                                                      const ThreadSpawner& spawn = spawnThread);

/**
 * @brief Load the kernel image and all discovered candidates.
 * @return Working set; status is non-OK only if the kernel image fails to
 *         load or the modules root cannot be opened.
 */
[[nodiscard]] ModuleSet buildModuleSet(const ModuleSetConfig& config);

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_MODULE_SET_HPP
