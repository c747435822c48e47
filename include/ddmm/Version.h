#pragma once

namespace ddmm {

constexpr const char *kVersion = "1.0.0";

} // namespace ddmm
