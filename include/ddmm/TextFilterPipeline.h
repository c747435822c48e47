#pragma once

#include <string>
#include <vector>

namespace ddmm {

struct TextFilterOptions {
  std::vector<std::string> enabledFilters = {"check-brackets", "to-python"};
  std::string sourceName = "<string>";

  bool hasFilter(const std::string &name) const {
    for (const auto &filter : enabledFilters) {
      if (filter == name) {
        return true;
      }
    }
    return false;
  }
};

class TextFilterPipeline {
public:
  bool apply(const std::string &input,
             std::string &output,
             std::string &error,
             const TextFilterOptions &options = {}) const;
};

enum class HookStatus { Installed, AlreadyInstalled, Removed, NotInstalled };

// Registers the to-python step on a set of filter options, the way a host
// shell registers an input pre-processor. Each handle only removes the entry
// it added, and only from the options object it added it to. The target is
// compared by address and never dereferenced after install.
class TransformHook {
public:
  HookStatus install(TextFilterOptions &options);
  HookStatus uninstall(TextFilterOptions &options);
  bool installed() const;
  bool installedInto(const TextFilterOptions &options) const;

private:
  const TextFilterOptions *target_ = nullptr;
};

} // namespace ddmm
