#include "ddmm/TransformRegistry.h"

#include <array>

namespace {
constexpr std::array<std::string_view, 3> kTextFilters = {
    "check-brackets",
    "to-python",
    "to-ddmm",
};

bool containsFilter(std::string_view name, const auto &list) {
  for (const auto &entry : list) {
    if (entry == name) {
      return true;
    }
  }
  return false;
}
} // namespace

namespace ddmm {

bool isTextFilterName(std::string_view name) {
  return containsFilter(name, kTextFilters);
}

} // namespace ddmm
