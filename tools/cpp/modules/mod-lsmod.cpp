/**
 * @file mod-lsmod.cpp
 * @brief Display the live kernel module table.
 *
 * Parses /proc/modules (or a saved copy) and prints it in the manner of
 * lsmod(8), with the module state appended.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/modules/inc/ModuleListing.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace mods = modscout::modules;

using modscout::helpers::format::bytesBinary;
using modscout::helpers::format::jsonQuote;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_FILE = 1,
  ARG_JSON = 2,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Display loaded kernel modules from /proc/modules.\n"
    "Use --file to read a saved copy instead.\n"
    "Listings whose dependents column holds a bracketed marker such as\n"
    "'[permanent]' are rejected with the offending line.";

/// Build argument definitions.
modscout::helpers::args::ArgMap buildArgMap() {
  modscout::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_FILE] = {"--file", 1, false, "Listing to parse (default /proc/modules)"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  return map;
}

std::string usedBy(const mods::KernelModuleStatus& mod) {
  std::string out = std::to_string(mod.refCount);
  if (mod.dependents && !mod.dependents->empty()) {
    out += ' ';
    for (std::size_t i = 0; i < mod.dependents->size(); ++i) {
      if (i > 0) {
        out += ',';
      }
      out += (*mod.dependents)[i];
    }
  }
  return out;
}

/* ----------------------------- Human Output ----------------------------- */

void printTable(const std::vector<mods::KernelModuleStatus>& modules) {
  fmt::print("{:<24} {:>10}  {:<40}  {}\n", "Module", "Size", "Used by", "State");
  for (const mods::KernelModuleStatus& mod : modules) {
    fmt::print("{:<24} {:>10}  {:<40}  {}\n", mod.name, bytesBinary(mod.sizeBytes), usedBy(mod),
               mods::toString(mod.state));
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<mods::KernelModuleStatus>& modules) {
  fmt::print("{{\n");
  fmt::print("  \"moduleCount\": {},\n", modules.size());
  fmt::print("  \"modules\": [\n");
  for (std::size_t i = 0; i < modules.size(); ++i) {
    const mods::KernelModuleStatus& MOD = modules[i];
    fmt::print("    {{\n");
    fmt::print("      \"name\": {},\n", jsonQuote(MOD.name));
    fmt::print("      \"sizeBytes\": {},\n", MOD.sizeBytes);
    fmt::print("      \"refCount\": {},\n", MOD.refCount);

    if (MOD.dependents) {
      fmt::print("      \"dependents\": [");
      for (std::size_t d = 0; d < MOD.dependents->size(); ++d) {
        if (d > 0)
          fmt::print(", ");
        fmt::print("{}", jsonQuote((*MOD.dependents)[d]));
      }
      fmt::print("],\n");
    } else {
      fmt::print("      \"dependents\": null,\n");
    }

    fmt::print("      \"state\": \"{}\",\n", mods::toString(MOD.state));
    fmt::print("      \"address\": {}\n", jsonQuote(MOD.address));
    fmt::print("    }}{}\n", (i + 1 < modules.size()) ? "," : "");
  }
  fmt::print("  ]\n");
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const modscout::helpers::args::ArgMap ARG_MAP = buildArgMap();
  modscout::helpers::args::ParsedArgs pargs;
  bool jsonOutput = false;
  std::string path = mods::PROC_MODULES_PATH;

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!modscout::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      modscout::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      modscout::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    jsonOutput = (pargs.count(ARG_JSON) != 0);
    path = std::string(modscout::helpers::args::valueOr(pargs, ARG_FILE, path));
  }

  const mods::ListingResult RES = mods::readModuleListing(path);
  if (!RES.ok()) {
    if (RES.line == 0) {
      fmt::print(stderr, "Error: {}\n", RES.detail);
    } else {
      fmt::print(stderr, "Error: {}:{}: {} ({})\n  {}\n", path, RES.line, RES.detail,
                 mods::toString(RES.status), RES.lineText);
    }
    return 1;
  }

  if (jsonOutput) {
    printJson(RES.modules);
  } else {
    printTable(RES.modules);
  }

  return 0;
}
