#pragma once

#include <string>
#include <vector>

#include "ddmm/Diagnostic.h"

namespace ddmm {

// Reports unexpected closers, mismatched pairs and unclosed openers in
// order of discovery. An empty result means every keyword bracket is
// balanced.
std::vector<Diagnostic> checkBracketMatching(const std::string &source,
                                             const std::string &displayName = "<string>");

} // namespace ddmm
