#include "ddmm/Transpiler.h"

#include "ddmm/SourceScanner.h"
#include "text_filter/ScanHelpers.h"

namespace ddmm {
using namespace text_filter;

std::string transform(const std::string &source) {
  std::string output;
  output.reserve(source.size());
  SourceScanner scanner(source, ScanMode::Keywords);
  ScanSpan span;
  while (scanner.next(span)) {
    if (span.kind == SpanKind::Verbatim) {
      output.append(source, span.begin, span.length);
      continue;
    }
    if (!output.empty() && isIdentifierChar(output.back())) {
      output.push_back(' ');
    }
    output.push_back(bracketChar(span.token));
    const size_t after = span.begin + span.length;
    if (after < source.size() && (isIdentifierChar(source[after]) || isQuoteChar(source[after]))) {
      output.push_back(' ');
    }
  }
  return output;
}

std::string reverseTransform(const std::string &source) {
  std::string output;
  output.reserve(source.size() + source.size() / 4);
  SourceScanner scanner(source, ScanMode::Brackets);
  ScanSpan span;
  while (scanner.next(span)) {
    if (span.kind == SpanKind::Verbatim) {
      output.append(source, span.begin, span.length);
      continue;
    }
    if (!output.empty() && (isIdentifierChar(output.back()) || isQuoteChar(output.back()))) {
      output.push_back(' ');
    }
    output.append(keywordText(span.token));
    const size_t after = span.begin + span.length;
    if (after < source.size() &&
        (isIdentifierChar(source[after]) || isQuoteChar(source[after]) || isBracketChar(source[after]))) {
      output.push_back(' ');
    }
  }
  return output;
}

} // namespace ddmm
