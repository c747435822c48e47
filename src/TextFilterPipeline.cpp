#include "ddmm/TextFilterPipeline.h"

#include "ddmm/BracketChecker.h"
#include "ddmm/TransformRegistry.h"
#include "ddmm/Transpiler.h"

#include <algorithm>
#include <iterator>
#include <utility>

namespace ddmm {

namespace {
constexpr const char *kToPythonFilter = "to-python";
} // namespace

bool TextFilterPipeline::apply(const std::string &input,
                               std::string &output,
                               std::string &error,
                               const TextFilterOptions &options) const {
  output.clear();
  error.clear();
  std::string current = input;
  for (const auto &filter : options.enabledFilters) {
    if (!isTextFilterName(filter)) {
      error = "unknown text filter: " + filter;
      return false;
    }
    if (filter == "check-brackets") {
      std::vector<Diagnostic> diagnostics = checkBracketMatching(current, options.sourceName);
      if (!diagnostics.empty()) {
        attachSourceLines(diagnostics, current);
        error = formatDiagnostics(diagnostics);
        return false;
      }
    } else if (filter == "to-python") {
      current = transform(current);
    } else if (filter == "to-ddmm") {
      current = reverseTransform(current);
    }
  }
  output = std::move(current);
  return true;
}

HookStatus TransformHook::install(TextFilterOptions &options) {
  if (target_ != nullptr || options.hasFilter(kToPythonFilter)) {
    return HookStatus::AlreadyInstalled;
  }
  options.enabledFilters.push_back(kToPythonFilter);
  target_ = &options;
  return HookStatus::Installed;
}

HookStatus TransformHook::uninstall(TextFilterOptions &options) {
  if (target_ != &options) {
    return HookStatus::NotInstalled;
  }
  target_ = nullptr;
  auto &filters = options.enabledFilters;
  auto it = std::find(filters.rbegin(), filters.rend(), kToPythonFilter);
  if (it == filters.rend()) {
    return HookStatus::NotInstalled;
  }
  filters.erase(std::next(it).base());
  return HookStatus::Removed;
}

bool TransformHook::installed() const {
  return target_ != nullptr;
}

bool TransformHook::installedInto(const TextFilterOptions &options) const {
  return target_ == &options;
}

} // namespace ddmm
