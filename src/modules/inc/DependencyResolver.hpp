#ifndef MODSCOUT_MODULES_DEPENDENCY_RESOLVER_HPP
#define MODSCOUT_MODULES_DEPENDENCY_RESOLVER_HPP
/**
 * @file DependencyResolver.hpp
 * @brief Load order computation over the symbol-satisfaction graph.
 * @note Thread-safe: a built DependencyGraph is immutable; concurrent
 *       resolve() calls on the same graph are safe.
 *
 * Nodes are module records. Module A has an edge to module B when B provides
 * a symbol A references. Resolving a target is a depth-first post-order walk
 * from the target: every provider is emitted before the module that needs
 * it, and each module is emitted once, at its first completed visit.
 *
 * Records sharing a name collapse onto the first record with that name.
 * A module providing a symbol it also references has no edge to itself.
 */

#include <cstddef>       // std::size_t
#include <cstdint>       // std::uint8_t
#include <optional>      // std::optional
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map
#include <vector>        // std::vector

#include "src/modules/inc/ModuleRecord.hpp"

namespace modscout {

namespace modules {

/* ----------------------------- ResolveStatus ----------------------------- */

/**
 * @brief Status codes for dependency resolution.
 */
enum class ResolveStatus : std::uint8_t {
  OK = 0,
  NOT_FOUND,      ///< No record carries the target name.
  CYCLE_DETECTED, ///< A reference chain loops back on itself.
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ResolveStatus status) noexcept;

/* ----------------------------- ResolveResult ----------------------------- */

/**
 * @brief Outcome of one resolution.
 *
 * order points into the working set the graph was built from; it stays
 * valid as long as that vector is alive and unmodified.
 */
struct ResolveResult {
  ResolveStatus status{ResolveStatus::OK};

  /// Load order, dependencies first, target last. Empty on failure.
  std::vector<const ModuleRecord*> order{};

  /// On CYCLE_DETECTED: module names along the loop, first name repeated last.
  std::vector<std::string> cycle{};

  /// Failure description, empty on success.
  std::string detail{};

  [[nodiscard]] bool ok() const noexcept { return status == ResolveStatus::OK; }

  /// @brief Names of order, in order.
  [[nodiscard]] std::vector<std::string> names() const;
};

/* ----------------------------- DependencyGraph ----------------------------- */

/**
 * @brief Indexed symbol-satisfaction graph over a fixed working set.
 *
 * Building costs one pass over every provided and referenced symbol. The
 * graph keeps a reference to modules; the vector must outlive the graph and
 * must not be modified while the graph is in use.
 */
class DependencyGraph {
public:
  explicit DependencyGraph(const std::vector<ModuleRecord>& modules);

  DependencyGraph(const DependencyGraph&) = delete;
  DependencyGraph& operator=(const DependencyGraph&) = delete;

  /// @brief Number of records in the working set.
  [[nodiscard]] std::size_t size() const noexcept { return modules_.size(); }

  /// @brief Index of the authoritative (first) record with name.
  [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view name) const noexcept;

  /// @brief Record at index (index < size()).
  [[nodiscard]] const ModuleRecord& record(std::size_t index) const noexcept {
    return modules_[index];
  }

  /**
   * @brief Modules directly satisfying the references of index.
   * @return Authoritative indices in working-set order, without duplicates
   *         and without index itself. Empty for non-authoritative records.
   */
  [[nodiscard]] const std::vector<std::size_t>& providersOf(std::size_t index) const noexcept {
    return edges_[index];
  }

  /**
   * @brief Symbols referenced by index that no record provides.
   * @return Names in first-reference order, without duplicates.
   */
  [[nodiscard]] std::vector<std::string> unresolvedSymbols(std::size_t index) const;

  /**
   * @brief Compute the load order for target.
   * @return OK with the order, NOT_FOUND, or CYCLE_DETECTED with the loop.
   */
  [[nodiscard]] ResolveResult resolve(std::string_view target) const;

private:
  const std::vector<ModuleRecord>& modules_;
  std::unordered_map<std::string_view, std::size_t> byName_;
  std::unordered_map<std::string_view, std::vector<std::size_t>> providersBySymbol_;
  std::vector<std::vector<std::size_t>> edges_;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief One-shot convenience: build a graph over modules and resolve target.
 *
 * Resolving the same target against the same unmodified set always yields
 * the same order.
 */
[[nodiscard]] ResolveResult resolveLoadOrder(const std::vector<ModuleRecord>& modules,
                                             std::string_view target);

} // namespace modules

} // namespace modscout

#endif // MODSCOUT_MODULES_DEPENDENCY_RESOLVER_HPP
