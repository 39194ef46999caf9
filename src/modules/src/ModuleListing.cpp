/**
 * @file ModuleListing.cpp
 * @brief Field-by-field scanner for /proc/modules lines.
 */

#include "src/modules/inc/ModuleListing.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace modscout {

namespace modules {

namespace {

using helpers::strings::isAlnum;
using helpers::strings::isAlpha;
using helpers::strings::isDigit;
using helpers::strings::parseUnsigned;
using helpers::strings::spanWhile;
using helpers::strings::splitNonEmpty;

/// Consumes a line left to right.
class LineCursor {
public:
  explicit LineCursor(std::string_view line) noexcept : rest_(line) {}

  /// Take the leading run accepted by pred (possibly empty).
  template <typename Pred> std::string_view take(Pred pred) noexcept {
    const std::size_t N = spanWhile(rest_, pred);
    const std::string_view TOKEN = rest_.substr(0, N);
    rest_.remove_prefix(N);
    return TOKEN;
  }

  /// Consume one or more spaces. Returns false if none are present.
  bool separator() noexcept { return !take([](char c) { return c == ' '; }).empty(); }

  [[nodiscard]] std::string_view rest() const noexcept { return rest_; }

private:
  std::string_view rest_;
};

bool isNameChar(char c) noexcept { return isAlnum(c) || c == '_'; }

bool isDependentsChar(char c) noexcept {
  return isAlnum(c) || c == '_' || c == ',' || c == '-';
}

std::string_view takeName(LineCursor& cur) noexcept {
  if (cur.rest().empty() || !isAlpha(cur.rest().front())) {
    return {};
  }
  return cur.take(isNameChar);
}

std::optional<ModuleState> stateFromToken(std::string_view token) noexcept {
  if (token == "Live") {
    return ModuleState::LIVE;
  }
  if (token == "Loading") {
    return ModuleState::LOADING;
  }
  if (token == "Unloading") {
    return ModuleState::UNLOADING;
  }
  return std::nullopt;
}

ListingStatus badLine(std::string& detail, std::string msg) {
  detail = std::move(msg);
  return ListingStatus::BAD_LINE;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ModuleState state) noexcept {
  switch (state) {
  case ModuleState::LIVE:
    return "Live";
  case ModuleState::LOADING:
    return "Loading";
  case ModuleState::UNLOADING:
    return "Unloading";
  }
  return "Unknown";
}

const char* toString(ListingStatus status) noexcept {
  switch (status) {
  case ListingStatus::OK:
    return "OK";
  case ListingStatus::IO_ERROR:
    return "IO_ERROR";
  case ListingStatus::BAD_LINE:
    return "BAD_LINE";
  case ListingStatus::UNKNOWN_STATE:
    return "UNKNOWN_STATE";
  case ListingStatus::UNTERMINATED_LINE:
    return "UNTERMINATED_LINE";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

ListingStatus parseModuleStatusLine(std::string_view line, KernelModuleStatus& out,
                                    std::string& detail) {
  LineCursor cur(line);
  KernelModuleStatus mod;

  const std::string_view NAME = takeName(cur);
  if (NAME.empty()) {
    return badLine(detail, "expected module name");
  }
  mod.name = std::string(NAME);
  if (!cur.separator()) {
    return badLine(detail, fmt::format("expected space after name '{}'", NAME));
  }

  const std::string_view SIZE = cur.take(isDigit);
  if (!parseUnsigned(SIZE, mod.sizeBytes)) {
    return badLine(detail, SIZE.empty() ? std::string("expected size")
                                        : fmt::format("size '{}' out of range", SIZE));
  }
  if (!cur.separator()) {
    return badLine(detail, "expected space after size");
  }

  const std::string_view REFS = cur.take(isDigit);
  if (!parseUnsigned(REFS, mod.refCount)) {
    return badLine(detail, REFS.empty() ? std::string("expected reference count")
                                        : fmt::format("reference count '{}' out of range", REFS));
  }
  if (!cur.separator()) {
    return badLine(detail, "expected space after reference count");
  }

  const std::string_view DEPS = cur.take(isDependentsChar);
  if (DEPS.empty()) {
    if (!cur.rest().empty() && cur.rest().front() == '[') {
      const std::size_t END = cur.rest().find_first_of(" ,");
      return badLine(detail, fmt::format("unsupported dependents marker '{}'",
                                         cur.rest().substr(0, END)));
    }
    return badLine(detail, "expected dependents list or '-'");
  }
  if (DEPS != "-") {
    mod.dependents = splitNonEmpty(DEPS, ',');
  }
  if (!cur.separator()) {
    return badLine(detail, "expected space after dependents");
  }

  const std::string_view STATE = cur.take(isAlpha);
  if (STATE.empty()) {
    return badLine(detail, "expected module state");
  }
  const std::optional<ModuleState> PARSED_STATE = stateFromToken(STATE);
  if (!PARSED_STATE) {
    detail = fmt::format("unknown module state '{}'", STATE);
    return ListingStatus::UNKNOWN_STATE;
  }
  mod.state = *PARSED_STATE;
  if (!cur.separator()) {
    return badLine(detail, "expected space after state");
  }

  const std::string_view ADDRESS = cur.take(isAlnum);
  if (ADDRESS.empty()) {
    return badLine(detail, "expected load address");
  }
  mod.address = std::string(ADDRESS);

  // Taint flags and anything newer kernels append are not interpreted.
  out = std::move(mod);
  return ListingStatus::OK;
}

ListingResult parseModuleListing(std::string_view text, const ListingOptions& opts) {
  ListingResult res;

  std::size_t lineNo = 0;
  while (!text.empty()) {
    ++lineNo;

    std::string_view line;
    const std::size_t NL = text.find('\n');
    if (NL == std::string_view::npos) {
      line = text;
      text = {};
      if (!opts.acceptUnterminated) {
        res.status = ListingStatus::UNTERMINATED_LINE;
        res.line = lineNo;
        res.lineText = std::string(line);
        res.detail = "final line is not terminated by a line break";
        return res;
      }
    } else {
      line = text.substr(0, NL);
      text.remove_prefix(NL + 1);
    }
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    KernelModuleStatus mod;
    std::string detail;
    const ListingStatus STATUS = parseModuleStatusLine(line, mod, detail);
    if (STATUS != ListingStatus::OK) {
      res.status = STATUS;
      res.line = lineNo;
      res.lineText = std::string(line);
      res.detail = std::move(detail);
      return res;
    }
    res.modules.push_back(std::move(mod));
  }

  return res;
}

ListingResult readModuleListing(const std::string& path, const ListingOptions& opts) {
  std::string text;
  std::string error;
  if (!helpers::files::readFileText(path, text, error)) {
    ListingResult res;
    res.status = ListingStatus::IO_ERROR;
    res.detail = std::move(error);
    return res;
  }
  return parseModuleListing(text, opts);
}

} // namespace modules

} // namespace modscout
