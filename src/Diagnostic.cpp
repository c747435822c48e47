#include "ddmm/Diagnostic.h"

#include "text_filter/ScanHelpers.h"

#include <sstream>

namespace ddmm {

std::string formatDiagnostic(const Diagnostic &diagnostic) {
  std::ostringstream out;
  out << diagnostic.message;
  if (!diagnostic.displayName.empty() && diagnostic.line > 0) {
    out << "\n  File \"" << diagnostic.displayName << "\", line " << diagnostic.line;
  }
  if (!diagnostic.sourceText.empty()) {
    out << "\n    " << diagnostic.sourceText;
  }
  return out.str();
}

std::string formatDiagnostics(const std::vector<Diagnostic> &diagnostics) {
  std::string text;
  for (const auto &diagnostic : diagnostics) {
    if (!text.empty()) {
      text.push_back('\n');
    }
    text.append(formatDiagnostic(diagnostic));
  }
  return text;
}

void attachSourceLines(std::vector<Diagnostic> &diagnostics, const std::string &source) {
  for (auto &diagnostic : diagnostics) {
    std::string line = text_filter::lineAt(source, diagnostic.line);
    size_t start = line.find_first_not_of(" \t");
    diagnostic.sourceText = start == std::string::npos ? std::string() : line.substr(start);
  }
}

} // namespace ddmm
