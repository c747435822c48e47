#include "ddmm/SourceScanner.h"

#include "text_filter/ScanHelpers.h"

namespace ddmm {
using namespace text_filter;

namespace {
ScanContext contextOf(const ScanFrame &frame) {
  if (std::holds_alternative<CommentFrame>(frame)) {
    return ScanContext::Comment;
  }
  if (std::holds_alternative<StringFrame>(frame)) {
    return ScanContext::StringLiteral;
  }
  if (std::holds_alternative<InterpolationFrame>(frame)) {
    return ScanContext::Interpolation;
  }
  return ScanContext::Code;
}
} // namespace

SourceScanner::SourceScanner(const std::string &source, ScanMode mode) : source_(source), mode_(mode) {
  frames_.push_back(CodeFrame{});
}

bool SourceScanner::next(ScanSpan &out) {
  if (pos_ >= source_.size()) {
    return false;
  }
  const ScanFrame &frame = frames_.back();
  if (std::holds_alternative<CommentFrame>(frame)) {
    scanComment(out);
  } else if (std::holds_alternative<StringFrame>(frame)) {
    scanString(out);
  } else {
    scanActive(out);
  }
  return true;
}

ScanContext SourceScanner::currentContext() const {
  return contextOf(frames_.back());
}

const std::vector<ScanFrame> &SourceScanner::frames() const {
  return frames_;
}

size_t SourceScanner::depth() const {
  return frames_.size();
}

int SourceScanner::line() const {
  return line_;
}

void SourceScanner::emit(ScanSpan &out, SpanKind kind, ScanContext context, size_t length) {
  if (pos_ + length > source_.size()) {
    length = source_.size() - pos_;
  }
  out.kind = kind;
  out.context = context;
  out.begin = pos_;
  out.length = length;
  out.line = line_;
  line_ += static_cast<int>(countNewlines(source_, pos_, length));
  pos_ += length;
}

void SourceScanner::scanComment(ScanSpan &out) {
  size_t newline = source_.find('\n', pos_);
  if (newline == std::string::npos) {
    emit(out, SpanKind::Verbatim, ScanContext::Comment, source_.size() - pos_);
    return;
  }
  emit(out, SpanKind::Verbatim, ScanContext::Comment, newline + 1 - pos_);
  frames_.pop_back();
}

void SourceScanner::scanString(ScanSpan &out) {
  const StringFrame str = std::get<StringFrame>(frames_.back());
  const char c = source_[pos_];
  const bool hasNext = pos_ + 1 < source_.size();
  if (str.triple) {
    if (source_.compare(pos_, 3, std::string(3, str.quote)) == 0) {
      frames_.pop_back();
      emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 3);
      return;
    }
  } else if (c == str.quote && (str.raw || !isEscaped(source_, pos_))) {
    frames_.pop_back();
    emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 1);
    return;
  }
  if (str.interpolated && c == '{') {
    if (hasNext && source_[pos_ + 1] == '{') {
      emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 2);
      return;
    }
    emit(out, SpanKind::Verbatim, ScanContext::Interpolation, 1);
    frames_.push_back(InterpolationFrame{});
    return;
  }
  if (str.interpolated && c == '}' && hasNext && source_[pos_ + 1] == '}') {
    emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 2);
    return;
  }
  if (!str.raw && c == '\\' && hasNext) {
    emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 2);
    return;
  }
  emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, 1);
}

bool SourceScanner::tryOpenString(ScanSpan &out) {
  size_t quotePos = pos_;
  StringFrame str;
  while (quotePos < source_.size() && isStringPrefixChar(source_[quotePos])) {
    switch (source_[quotePos]) {
    case 'f':
    case 'F':
      str.interpolated = true;
      break;
    case 'r':
    case 'R':
      str.raw = true;
      break;
    case 'b':
    case 'B':
      str.bytes = true;
      break;
    default:
      break;
    }
    ++quotePos;
  }
  if (quotePos >= source_.size() || !isQuoteChar(source_[quotePos])) {
    return false;
  }
  str.quote = source_[quotePos];
  str.triple = source_.compare(quotePos, 3, std::string(3, str.quote)) == 0;
  const size_t delimiterLength = str.triple ? 3 : 1;
  emit(out, SpanKind::Verbatim, ScanContext::StringLiteral, quotePos - pos_ + delimiterLength);
  frames_.push_back(str);
  return true;
}

void SourceScanner::scanActive(ScanSpan &out) {
  const char c = source_[pos_];
  const bool inInterpolation = std::holds_alternative<InterpolationFrame>(frames_.back());
  const ScanContext context = inInterpolation ? ScanContext::Interpolation : ScanContext::Code;
  if (!inInterpolation && c == '#') {
    emit(out, SpanKind::Verbatim, ScanContext::Comment, 1);
    frames_.push_back(CommentFrame{});
    return;
  }
  if (tryOpenString(out)) {
    return;
  }
  if (inInterpolation && (c == '{' || c == '}')) {
    auto &interpolation = std::get<InterpolationFrame>(frames_.back());
    if (c == '{') {
      ++interpolation.braceDepth;
    } else if (--interpolation.braceDepth == 0) {
      frames_.pop_back();
      emit(out, SpanKind::Verbatim, ScanContext::Interpolation, 1);
      return;
    }
    if (mode_ == ScanMode::Brackets) {
      out.token = c == '{' ? BracketToken::OpenBrace : BracketToken::CloseBrace;
      emit(out, SpanKind::Token, context, 1);
    } else {
      emit(out, SpanKind::Verbatim, context, 1);
    }
    return;
  }
  BracketToken token;
  if (mode_ == ScanMode::Keywords && matchKeywordAt(source_, pos_, token)) {
    out.token = token;
    emit(out, SpanKind::Token, context, keywordText(token).size());
    return;
  }
  if (mode_ == ScanMode::Brackets && bracketTokenFor(c, token)) {
    out.token = token;
    emit(out, SpanKind::Token, context, 1);
    return;
  }
  emit(out, SpanKind::Verbatim, context, 1);
}

} // namespace ddmm
