#include "ddmm/BracketChecker.h"

#include "ddmm/SourceScanner.h"

#include <utility>

namespace ddmm {

namespace {
std::string describe(BracketToken token) {
  std::string text = "'";
  text.append(keywordText(token));
  text.append("' (");
  text.append(bracketFamilyName(token));
  text.append(")");
  return text;
}
} // namespace

std::vector<Diagnostic> checkBracketMatching(const std::string &source, const std::string &displayName) {
  std::vector<Diagnostic> diagnostics;
  std::vector<std::pair<BracketToken, int>> open;
  SourceScanner scanner(source, ScanMode::Keywords);
  ScanSpan span;
  while (scanner.next(span)) {
    if (span.kind != SpanKind::Token) {
      continue;
    }
    if (isOpener(span.token)) {
      open.emplace_back(span.token, span.line);
      continue;
    }
    if (open.empty()) {
      diagnostics.push_back({"Unexpected closing " + describe(span.token) + " with no matching opener",
                             displayName,
                             span.line,
                             {}});
      continue;
    }
    const auto [opener, openLine] = open.back();
    open.pop_back();
    if (opener != matchingOpener(span.token)) {
      diagnostics.push_back({"Mismatched brackets - opened with " + describe(opener) + " on line " +
                                 std::to_string(openLine) + " but closed with " + describe(span.token),
                             displayName,
                             span.line,
                             {}});
    }
  }
  for (const auto &[opener, openLine] : open) {
    diagnostics.push_back({"Unclosed " + describe(opener), displayName, openLine, {}});
  }
  return diagnostics;
}

} // namespace ddmm
