#ifndef MODSCOUT_HELPERS_ARGS_HPP
#define MODSCOUT_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI flag parsing for the modscout tools.
 *
 * Each flag consumes a fixed number of following tokens. Unknown tokens are
 * ignored. Parsed values are views into argv and must not outlive it.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace modscout {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--kernel"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * A matched flag takes the next nargs tokens literally, even if they look
 * like flags. A repeated flag overwrites its earlier values.
 *
 * @param args   Argument list (argv[1..]).
 * @param map    Accepted flags.
 * @param pargs  Output map of parsed values.
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on a truncated flag or missing required flag.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  const auto FAIL = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [key, def] : map) {
    byFlag.emplace(def.flag, key);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }

    const ArgDef& DEF = map.at(IT->second);
    if (i + DEF.nargs >= args.size()) {
      return FAIL(fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs));
    }

    auto& values = pargs[IT->second];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& [key, def] : map) {
    if (def.required && pargs.count(key) == 0) {
      return FAIL(fmt::format("Missing required argument '{}'", def.flag));
    }
  }

  return true;
}

/// @brief True if the flag for key was given.
[[nodiscard]] inline bool hasFlag(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.count(key) != 0;
}

/// @brief First value of a flag, or fallback when absent.
[[nodiscard]] inline std::string_view valueOr(const ParsedArgs& pargs, std::uint8_t key,
                                              std::string_view fallback) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return fallback;
  }
  return IT->second.front();
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    std::string left(def->flag);
    for (std::uint8_t k = 0; k < def->nargs; ++k) {
      left += " <value>";
    }
    fmt::print("  {:<24}  {}{}{}\n", left, def->desc,
               (def->required && !def->desc.empty()) ? " " : "",
               def->required ? "(required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace modscout

#endif // MODSCOUT_HELPERS_ARGS_HPP
