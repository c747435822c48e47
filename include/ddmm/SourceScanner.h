#pragma once

#include <string>
#include <variant>
#include <vector>

#include "ddmm/BracketKeywords.h"

namespace ddmm {

enum class ScanMode { Keywords, Brackets };

enum class ScanContext { Code, Comment, StringLiteral, Interpolation };

enum class SpanKind { Verbatim, Token };

struct CodeFrame {};

struct CommentFrame {};

struct StringFrame {
  char quote = '"';
  bool triple = false;
  bool raw = false;
  bool interpolated = false;
  bool bytes = false;
};

struct InterpolationFrame {
  int braceDepth = 1;
};

using ScanFrame = std::variant<CodeFrame, CommentFrame, StringFrame, InterpolationFrame>;

// One classified piece of the input. Verbatim spans are copied as-is by every
// consumer; Token spans carry a keyword (Keywords mode) or a bracket
// character (Brackets mode) found in Code or Interpolation context.
struct ScanSpan {
  SpanKind kind = SpanKind::Verbatim;
  ScanContext context = ScanContext::Code;
  size_t begin = 0;
  size_t length = 0;
  int line = 1;
  BracketToken token = BracketToken::OpenParen;
};

class SourceScanner {
public:
  SourceScanner(const std::string &source, ScanMode mode);

  bool next(ScanSpan &out);

  ScanContext currentContext() const;
  const std::vector<ScanFrame> &frames() const;
  size_t depth() const;
  int line() const;

private:
  void scanComment(ScanSpan &out);
  void scanString(ScanSpan &out);
  void scanActive(ScanSpan &out);
  bool tryOpenString(ScanSpan &out);
  void emit(ScanSpan &out, SpanKind kind, ScanContext context, size_t length);

  const std::string &source_;
  ScanMode mode_;
  size_t pos_ = 0;
  int line_ = 1;
  std::vector<ScanFrame> frames_;
};

} // namespace ddmm
