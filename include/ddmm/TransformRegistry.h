#pragma once

#include <string_view>

namespace ddmm {

bool isTextFilterName(std::string_view name);

} // namespace ddmm
