/**
 * @file ModuleSet.cpp
 * @brief Candidate discovery, pooled loading and working-set assembly.
 */

#include "src/modules/inc/ModuleSet.hpp"
#include "src/helpers/inc/Files.hpp"

#include <fnmatch.h> // fnmatch

#include <algorithm>    // std::sort, std::min, std::max
#include <filesystem>   // std::filesystem::directory_iterator
#include <new>          // std::bad_alloc
#include <system_error> // std::error_code, std::system_error
#include <thread>       // std::thread
#include <utility>      // std::move

#include <fmt/core.h>

namespace modscout {

namespace modules {

namespace {

namespace fs = std::filesystem;

using modscout::helpers::log::LogLevel;
using modscout::helpers::log::logMsg;

bool nameMatches(const std::string& pattern, const std::string& fileName) noexcept {
  return ::fnmatch(pattern.c_str(), fileName.c_str(), 0) == 0;
}

/// Runs a loader, reporting allocation failure as a format error.
LoadResult loadGuarded(LoadResult (*load)(const std::string&), const std::string& path) {
  try {
    return load(path);
  } catch (const std::bad_alloc&) {
    LoadResult res;
    res.status = LoadStatus::FORMAT_ERROR;
    res.detail = fmt::format("{}: out of memory while loading", path);
    return res;
  }
}

} // namespace

/* ----------------------------- ModuleSet Methods ----------------------------- */

const ModuleRecord* ModuleSet::find(std::string_view name) const noexcept {
  for (const ModuleRecord& rec : modules) {
    if (rec.name == name) {
      return &rec;
    }
  }
  return nullptr;
}

/* ----------------------------- API ----------------------------- */

bool discoverModuleFiles(const std::string& root, const std::string& pattern,
                         std::vector<std::string>& out, std::string& error,
                         const helpers::log::LogSink& log) {
  out.clear();

  if (helpers::files::isRegularFile(root.c_str())) {
    out.push_back(root);
    return true;
  }
  if (!helpers::files::isDirectory(root.c_str())) {
    error = fmt::format("module path '{}' is not a file or directory", root);
    return false;
  }

  std::error_code ec;
  const fs::directory_iterator ROOT_DIR(root, ec);
  if (ec) {
    error = fmt::format("cannot open module directory '{}': {}", root, ec.message());
    return false;
  }

  // Depth-first over directories; symlinked directories are not followed.
  std::vector<fs::path> pending{fs::path(root)};
  while (!pending.empty()) {
    const fs::path DIR = std::move(pending.back());
    pending.pop_back();

    fs::directory_iterator it(DIR, ec);
    if (ec) {
      logMsg(log, LogLevel::WARN, "Skipping directory '{}': {}", DIR.string(), ec.message());
      continue;
    }

    for (const fs::directory_iterator END; it != END; it.increment(ec)) {
      const fs::directory_entry& entry = *it;
      std::error_code typeEc;
      const bool LINK = entry.is_symlink(typeEc);
      if (!LINK && entry.is_directory(typeEc)) {
        pending.push_back(entry.path());
        continue;
      }
      if (entry.is_regular_file(typeEc) && nameMatches(pattern, entry.path().filename().string())) {
        out.push_back(entry.path().string());
      }
    }
    if (ec) {
      logMsg(log, LogLevel::WARN, "Stopped reading directory '{}': {}", DIR.string(),
             ec.message());
      ec.clear();
    }
  }

  std::sort(out.begin(), out.end());
  return true;
}

std::thread spawnThread(std::function<void()> body) { return std::thread(std::move(body)); }

std::vector<LoadResult> loadModuleFiles(const std::vector<std::string>& paths, std::size_t jobs,
                                        const std::atomic<bool>* cancel,
                                        const ThreadSpawner& spawn) {
  const std::size_t N = paths.size();
  std::vector<LoadResult> results(N);
  if (N == 0) {
    return results;
  }

  std::atomic<std::size_t> next{0};
  const auto WORKER = [&]() {
    for (;;) {
      const std::size_t I = next.fetch_add(1, std::memory_order_relaxed);
      if (I >= N) {
        return;
      }
      if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
        results[I].status = LoadStatus::CANCELLED;
        results[I].detail = fmt::format("{}: cancelled before loading", paths[I]);
        continue;
      }
      results[I] = loadGuarded(&loadModule, paths[I]);
    }
  };

  const std::size_t LIMIT = std::min(MAX_LOAD_JOBS, N);
  const std::size_t WORKERS = std::min(std::max<std::size_t>(jobs, 1), LIMIT);
  if (WORKERS == 1) {
    WORKER();
    return results;
  }

  std::vector<std::thread> pool;
  pool.reserve(WORKERS - 1);
  for (std::size_t t = 0; t + 1 < WORKERS; ++t) {
    try {
      pool.push_back(spawn(WORKER));
    } catch (const std::system_error&) {
      // Out of threads: whoever is already running drains the queue.
      break;
    }
  }
  WORKER();
  for (std::thread& th : pool) {
    if (th.joinable()) {
      th.join();
    }
  }
  return results;
}

ModuleSet buildModuleSet(const ModuleSetConfig& config) {
  ModuleSet set;

  logMsg(config.log, LogLevel::INFO, "Parsing kernel image {}", config.kernelPath);
  LoadResult kernel = loadGuarded(&loadKernelImage, config.kernelPath);
  if (!kernel.ok()) {
    set.status = kernel.status;
    set.detail = std::move(kernel.detail);
    return set;
  }
  logMsg(config.log, LogLevel::DEBUG, "Kernel image provides {} symbols",
         kernel.record.providedSymbols.size());
  set.modules.push_back(std::move(kernel.record));

  if (config.modulesPath.empty()) {
    return set;
  }

  std::vector<std::string> paths;
  std::string error;
  if (!discoverModuleFiles(config.modulesPath, config.pattern, paths, error, config.log)) {
    set.status = LoadStatus::IO_ERROR;
    set.detail = std::move(error);
    return set;
  }
  set.candidateCount = paths.size();

  logMsg(config.log, LogLevel::INFO, "Parsing {} module files under {}", paths.size(),
         config.modulesPath);
  std::vector<LoadResult> results = loadModuleFiles(paths, config.jobs, config.cancel);

  set.modules.reserve(1 + results.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    LoadResult& res = results[i];
    if (res.ok()) {
      set.modules.push_back(std::move(res.record));
      continue;
    }
    logMsg(config.log, LogLevel::WARN, "Skipping {} ({})", res.detail, toString(res.status));
    set.failures.push_back(LoadFailure{paths[i], res.status, std::move(res.detail)});
  }

  logMsg(config.log, LogLevel::INFO, "Loaded {} modules, skipped {}", set.modules.size() - 1,
         set.failures.size());
  return set;
}

} // namespace modules

} // namespace modscout
