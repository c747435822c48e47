#include "ddmm/Console.h"

#include "ddmm/SourceScanner.h"

#include <utility>

namespace ddmm {
namespace {

std::string trimRight(const std::string &text) {
  size_t end = text.size();
  while (end > 0 && (text[end - 1] == ' ' || text[end - 1] == '\t' || text[end - 1] == '\r')) {
    --end;
  }
  return text.substr(0, end);
}

bool insideTripleQuotedString(const SourceScanner &scanner) {
  for (const auto &frame : scanner.frames()) {
    if (const auto *str = std::get_if<StringFrame>(&frame)) {
      if (str->triple) {
        return true;
      }
    }
  }
  return false;
}

// Looks for a ':' that ends the line in code context, ignoring a trailing
// comment.
bool opensBlock(const std::string &line) {
  SourceScanner scanner(line, ScanMode::Keywords);
  ScanSpan span;
  char last = '\0';
  while (scanner.next(span)) {
    if (span.context == ScanContext::Comment) {
      break;
    }
    for (size_t i = span.begin; i < span.begin + span.length; ++i) {
      const char c = line[i];
      if (c != ' ' && c != '\t' && c != '\r') {
        last = c;
      }
    }
    if (span.context == ScanContext::StringLiteral || span.context == ScanContext::Interpolation) {
      last = '"';
    }
  }
  return last == ':';
}

} // namespace

bool needsMoreInput(const std::string &source) {
  SourceScanner scanner(source, ScanMode::Keywords);
  ScanSpan span;
  int depth = 0;
  char last = '\0';
  ScanContext lastContext = ScanContext::Code;
  while (scanner.next(span)) {
    if (span.kind == SpanKind::Token) {
      depth += isOpener(span.token) ? 1 : -1;
    }
    for (size_t i = span.begin; i < span.begin + span.length; ++i) {
      const char c = source[i];
      if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
        last = c;
        lastContext = span.context;
      }
    }
  }
  if (insideTripleQuotedString(scanner)) {
    return true;
  }
  if (depth > 0) {
    return true;
  }
  return last == '\\' && lastContext == ScanContext::Code;
}

ConsoleStatus ConsoleInput::pushLine(const std::string &line) {
  const std::string trimmed = trimRight(line);
  if (buffer_.empty() && trimmed.empty()) {
    return ConsoleStatus::Complete;
  }
  buffer_.append(line);
  buffer_.push_back('\n');
  if (needsMoreInput(buffer_)) {
    return ConsoleStatus::NeedMore;
  }
  if (inBlock_) {
    if (trimmed.empty()) {
      inBlock_ = false;
      return ConsoleStatus::Complete;
    }
    return ConsoleStatus::NeedMore;
  }
  if (opensBlock(trimmed)) {
    inBlock_ = true;
    return ConsoleStatus::NeedMore;
  }
  return ConsoleStatus::Complete;
}

std::string ConsoleInput::takeSource() {
  std::string source = std::move(buffer_);
  reset();
  return source;
}

void ConsoleInput::reset() {
  buffer_.clear();
  inBlock_ = false;
}

bool ConsoleInput::empty() const {
  return buffer_.empty();
}

const std::string &ConsoleInput::buffer() const {
  return buffer_;
}

const char *ConsoleInput::prompt() const {
  return buffer_.empty() ? kPrimaryPrompt : kContinuationPrompt;
}

} // namespace ddmm
