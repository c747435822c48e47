#pragma once

#include <string>

namespace ddmm {

// Rewrites drake/maye keywords in code and interpolation expressions to the
// brackets they stand for. Strings and comments are copied untouched. Never
// fails; unterminated strings or comments run to the end of the input.
std::string transform(const std::string &source);

// Rewrites brackets in code and interpolation expressions back to keywords.
std::string reverseTransform(const std::string &source);

} // namespace ddmm
