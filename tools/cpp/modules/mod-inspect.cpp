/**
 * @file mod-inspect.cpp
 * @brief Compute the load order for a kernel module from symbol tables.
 *
 * Reads the kernel image and every module file under a directory, works out
 * which modules satisfy the target's undefined symbols, and prints the files
 * to load, dependencies first. The kernel image itself is never printed.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/modules/inc/DependencyResolver.hpp"
#include "src/modules/inc/ModuleRecord.hpp"
#include "src/modules/inc/ModuleSet.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace mods = modscout::modules;

using modscout::helpers::format::jsonQuote;
using modscout::helpers::log::LogLevel;
using modscout::helpers::log::logMsg;

namespace {

std::atomic<bool> g_cancel{false};

void signalHandler(int /*signum*/) { g_cancel.store(true); }

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_KERNEL = 1,
  ARG_MODULES = 2,
  ARG_TARGET = 3,
  ARG_PATTERN = 4,
  ARG_JOBS = 5,
  ARG_VERBOSE = 6,
  ARG_JSON = 7,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Print the module files to load for --target, dependencies first.\n"
    "Dependencies are derived from the symbol tables of the kernel image and\n"
    "of every module found under --modules (plain, .zst or .xz).";

/// Build argument definitions.
modscout::helpers::args::ArgMap buildArgMap() {
  modscout::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_KERNEL] = {"--kernel", 1, true, "Kernel image (vmlinux)"};
  map[ARG_MODULES] = {"--modules", 1, true, "Module directory (searched recursively) or file"};
  map[ARG_TARGET] = {"--target", 1, true, "Module to resolve (e.g. wireguard)"};
  map[ARG_PATTERN] = {"--pattern", 1, false, "Module file name glob (default *.ko*)"};
  map[ARG_JOBS] = {"--jobs", 1, false, "Parallel module loads (default 1)"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Progress logging and unresolved symbols"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

/* ----------------------------- Human Output ----------------------------- */

void printOrder(const mods::ResolveResult& res) {
  for (const mods::ModuleRecord* rec : res.order) {
    if (rec->isKernel()) {
      continue;
    }
    fmt::print("{}\n", rec->path);
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::string& target, const mods::ResolveResult& res,
               const mods::ModuleSet& set) {
  fmt::print("{{\n");
  fmt::print("  \"target\": {},\n", jsonQuote(target));

  fmt::print("  \"order\": [");
  bool first = true;
  for (const mods::ModuleRecord* rec : res.order) {
    if (rec->isKernel()) {
      continue;
    }
    fmt::print("{}\n    {{\"name\": {}, \"path\": {}}}", first ? "" : ",", jsonQuote(rec->name),
               jsonQuote(rec->path));
    first = false;
  }
  fmt::print("{}],\n", first ? "" : "\n  ");

  fmt::print("  \"skipped\": [");
  for (std::size_t i = 0; i < set.failures.size(); ++i) {
    const mods::LoadFailure& F = set.failures[i];
    fmt::print("{}\n    {{\"path\": {}, \"status\": \"{}\", \"detail\": {}}}",
               (i > 0) ? "," : "", jsonQuote(F.path), mods::toString(F.status),
               jsonQuote(F.detail));
  }
  fmt::print("{}]\n", set.failures.empty() ? "" : "\n  ");
  fmt::print("}}\n");
}

/* ----------------------------- Diagnostics ----------------------------- */

void reportUnresolved(const mods::DependencyGraph& graph, const mods::ResolveResult& res,
                      const modscout::helpers::log::LogSink& log) {
  for (const mods::ModuleRecord* rec : res.order) {
    if (rec->isKernel()) {
      continue;
    }
    const std::vector<std::string> MISSING = graph.unresolvedSymbols(*graph.indexOf(rec->name));
    if (MISSING.empty()) {
      continue;
    }
    std::string list;
    for (const std::string& sym : MISSING) {
      list += list.empty() ? sym : ", " + sym;
    }
    logMsg(log, LogLevel::INFO, "{}: {} unresolved symbol(s): {}", rec->name, MISSING.size(),
           list);
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const modscout::helpers::args::ArgMap ARG_MAP = buildArgMap();
  modscout::helpers::args::ParsedArgs pargs;

  std::vector<std::string_view> args;
  args.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  for (const std::string_view ARG : args) {
    if (ARG == "--help") {
      modscout::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }
  }

  std::string error;
  if (!modscout::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    modscout::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  const bool JSON_OUTPUT = modscout::helpers::args::hasFlag(pargs, ARG_JSON);
  const bool VERBOSE = modscout::helpers::args::hasFlag(pargs, ARG_VERBOSE);

  mods::ModuleSetConfig config;
  config.kernelPath = std::string(pargs[ARG_KERNEL].front());
  config.modulesPath = std::string(pargs[ARG_MODULES].front());
  config.pattern = std::string(
      modscout::helpers::args::valueOr(pargs, ARG_PATTERN, mods::DEFAULT_MODULE_PATTERN));

  const std::string_view JOBS = modscout::helpers::args::valueOr(pargs, ARG_JOBS, "1");
  if (!modscout::helpers::strings::parseUnsigned(JOBS, config.jobs) || config.jobs == 0) {
    fmt::print(stderr, "Error: --jobs expects a positive integer, got '{}'\n", JOBS);
    return 1;
  }

  config.log = modscout::helpers::log::stderrSink(VERBOSE ? LogLevel::DEBUG : LogLevel::WARN);
  config.cancel = &g_cancel;
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  // "wireguard.ko" and "wireguard" name the same module
  const std::string TARGET = mods::moduleNameFromPath(pargs[ARG_TARGET].front());

  const mods::ModuleSet SET = mods::buildModuleSet(config);
  if (!SET.ok()) {
    fmt::print(stderr, "Error: {}\n", SET.detail);
    return 1;
  }
  if (g_cancel.load()) {
    fmt::print(stderr, "Error: interrupted while loading modules\n");
    return 1;
  }

  const mods::DependencyGraph GRAPH(SET.modules);
  const mods::ResolveResult RES = GRAPH.resolve(TARGET);
  if (!RES.ok()) {
    fmt::print(stderr, "Error: {}\n", RES.detail);
    return 1;
  }

  if (VERBOSE) {
    reportUnresolved(GRAPH, RES, config.log);
  }

  if (JSON_OUTPUT) {
    printJson(TARGET, RES, SET);
  } else {
    printOrder(RES);
  }

  return 0;
}
