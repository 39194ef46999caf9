/**
 * @file DependencyResolver.cpp
 * @brief Symbol-satisfaction graph construction and iterative post-order walk.
 */

#include "src/modules/inc/DependencyResolver.hpp"

#include <algorithm>     // std::sort, std::unique
#include <unordered_set> // std::unordered_set

#include <fmt/core.h>

namespace modscout {

namespace modules {

namespace {

/// Per-node traversal state.
enum class Mark : std::uint8_t {
  UNVISITED = 0,
  ACTIVE, ///< On the current descent path.
  DONE,   ///< Emitted.
};

struct Frame {
  std::size_t node;
  std::size_t nextEdge;
};

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ResolveStatus status) noexcept {
  switch (status) {
  case ResolveStatus::OK:
    return "OK";
  case ResolveStatus::NOT_FOUND:
    return "NOT_FOUND";
  case ResolveStatus::CYCLE_DETECTED:
    return "CYCLE_DETECTED";
  }
  return "UNKNOWN";
}

/* ----------------------------- ResolveResult Methods ----------------------------- */

std::vector<std::string> ResolveResult::names() const {
  std::vector<std::string> out;
  out.reserve(order.size());
  for (const ModuleRecord* rec : order) {
    out.push_back(rec->name);
  }
  return out;
}

/* ----------------------------- DependencyGraph Methods ----------------------------- */

DependencyGraph::DependencyGraph(const std::vector<ModuleRecord>& modules)
    : modules_(modules), edges_(modules.size()) {
  byName_.reserve(modules_.size());
  for (std::size_t i = 0; i < modules_.size(); ++i) {
    byName_.emplace(modules_[i].name, i); // keeps the first
  }

  for (std::size_t i = 0; i < modules_.size(); ++i) {
    for (const std::string& sym : modules_[i].providedSymbols) {
      std::vector<std::size_t>& providers = providersBySymbol_[sym];
      if (providers.empty() || providers.back() != i) {
        providers.push_back(i);
      }
    }
  }

  for (std::size_t i = 0; i < modules_.size(); ++i) {
    if (byName_.at(modules_[i].name) != i) {
      continue;
    }

    std::vector<std::size_t>& edges = edges_[i];
    for (const std::string& sym : modules_[i].referencedSymbols) {
      const auto IT = providersBySymbol_.find(sym);
      if (IT == providersBySymbol_.end()) {
        continue;
      }
      for (const std::size_t P : IT->second) {
        const std::size_t AUTH = byName_.at(modules_[P].name);
        if (AUTH != i) {
          edges.push_back(AUTH);
        }
      }
    }
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
  }
}

std::optional<std::size_t> DependencyGraph::indexOf(std::string_view name) const noexcept {
  const auto IT = byName_.find(name);
  if (IT == byName_.end()) {
    return std::nullopt;
  }
  return IT->second;
}

std::vector<std::string> DependencyGraph::unresolvedSymbols(std::size_t index) const {
  std::vector<std::string> out;
  std::unordered_set<std::string_view> seen;
  const ModuleRecord& rec = modules_[index];
  for (const std::string& sym : rec.referencedSymbols) {
    if (providersBySymbol_.count(sym) != 0 || !seen.insert(sym).second) {
      continue;
    }
    out.push_back(sym);
  }
  return out;
}

ResolveResult DependencyGraph::resolve(std::string_view target) const {
  ResolveResult res;

  const std::optional<std::size_t> ROOT = indexOf(target);
  if (!ROOT) {
    res.status = ResolveStatus::NOT_FOUND;
    res.detail = fmt::format("module '{}' not found among {} loaded modules", target,
                             modules_.size());
    return res;
  }

  std::vector<Mark> marks(modules_.size(), Mark::UNVISITED);
  std::vector<Frame> stack;
  stack.push_back(Frame{*ROOT, 0});
  marks[*ROOT] = Mark::ACTIVE;

  while (!stack.empty()) {
    Frame& top = stack.back();
    const std::vector<std::size_t>& edges = edges_[top.node];

    if (top.nextEdge == edges.size()) {
      marks[top.node] = Mark::DONE;
      res.order.push_back(&modules_[top.node]);
      stack.pop_back();
      continue;
    }

    const std::size_t CHILD = edges[top.nextEdge++];
    if (marks[CHILD] == Mark::DONE) {
      continue;
    }

    if (marks[CHILD] == Mark::ACTIVE) {
      auto it = std::find_if(stack.begin(), stack.end(),
                             [CHILD](const Frame& f) { return f.node == CHILD; });
      for (; it != stack.end(); ++it) {
        res.cycle.push_back(modules_[it->node].name);
      }
      res.cycle.push_back(modules_[CHILD].name);

      std::string path;
      for (const std::string& name : res.cycle) {
        path += path.empty() ? name : " -> " + name;
      }
      res.status = ResolveStatus::CYCLE_DETECTED;
      res.detail = fmt::format("dependency cycle: {}", path);
      res.order.clear();
      return res;
    }

    marks[CHILD] = Mark::ACTIVE;
    stack.push_back(Frame{CHILD, 0});
  }

  return res;
}

/* ----------------------------- API ----------------------------- */

ResolveResult resolveLoadOrder(const std::vector<ModuleRecord>& modules, std::string_view target) {
  const DependencyGraph GRAPH(modules);
  return GRAPH.resolve(target);
}

} // namespace modules

} // namespace modscout
