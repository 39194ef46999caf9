/**
 * @file ModuleLoader.cpp
 * @brief File -> container -> ELF -> ModuleRecord.
 */

#include "src/modules/inc/ModuleLoader.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/modules/inc/SymbolClassifier.hpp"
#include "src/object/inc/ElfSymbols.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace modscout {

namespace modules {

namespace {

using modscout::helpers::files::readFileBytes;

LoadResult fail(LoadStatus status, const std::string& path, const std::string& why) {
  LoadResult res;
  res.status = status;
  res.detail = fmt::format("{}: {}", path, why);
  return res;
}

LoadResult loadFromFile(const std::string& path, const std::string& name) {
  object::ByteBuffer data;
  std::string error;
  if (!readFileBytes(path, data, error)) {
    LoadResult res;
    res.status = LoadStatus::IO_ERROR;
    res.detail = std::move(error);
    return res;
  }
  return loadModuleFromBuffer(path, std::move(data), name);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(LoadStatus status) noexcept {
  switch (status) {
  case LoadStatus::OK:
    return "OK";
  case LoadStatus::IO_ERROR:
    return "IO_ERROR";
  case LoadStatus::FORMAT_ERROR:
    return "FORMAT_ERROR";
  case LoadStatus::CANCELLED:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

LoadResult loadModuleFromBuffer(const std::string& path, object::ByteBuffer data,
                                const std::string& name) {
  std::string detail;
  const object::ObjectStatus DECODED = object::decodeContainer(data, detail);
  if (DECODED != object::ObjectStatus::OK) {
    return fail(LoadStatus::FORMAT_ERROR, path, detail);
  }

  object::SymbolTable table;
  const object::ObjectStatus PARSED = object::readElfSymbols(data, table, detail);
  if (PARSED != object::ObjectStatus::OK) {
    return fail(LoadStatus::FORMAT_ERROR, path, detail);
  }

  ClassifiedSymbols classified = classifySymbols(table.symbols);

  LoadResult res;
  res.record.name = name.empty() ? moduleNameFromPath(path) : name;
  res.record.path = path;
  res.record.providedSymbols = std::move(classified.provided);
  res.record.referencedSymbols = std::move(classified.referenced);
  return res;
}

LoadResult loadModule(const std::string& path) { return loadFromFile(path, {}); }

LoadResult loadKernelImage(const std::string& path) {
  return loadFromFile(path, std::string(KERNEL_MODULE_NAME));
}

} // namespace modules

} // namespace modscout
