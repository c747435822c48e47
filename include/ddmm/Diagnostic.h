#pragma once

#include <string>
#include <vector>

namespace ddmm {

struct Diagnostic {
  std::string message;
  std::string displayName;
  int line = 0;
  std::string sourceText;
};

// "<message>\n  File \"<name>\", line <n>" followed by the source excerpt on
// a third line when one is attached.
std::string formatDiagnostic(const Diagnostic &diagnostic);
std::string formatDiagnostics(const std::vector<Diagnostic> &diagnostics);
void attachSourceLines(std::vector<Diagnostic> &diagnostics, const std::string &source);

} // namespace ddmm
