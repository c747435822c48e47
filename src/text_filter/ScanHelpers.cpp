#include "ScanHelpers.h"

#include <cctype>

namespace ddmm::text_filter {

// Bytes are not decoded: every byte of a multi-byte UTF-8 sequence counts,
// including non-alphanumeric characters such as U+00A0 or U+00D7.
bool isIdentifierChar(char c) {
  const unsigned char byte = static_cast<unsigned char>(c);
  return std::isalnum(byte) || c == '_' || byte >= 0x80;
}

bool isQuoteChar(char c) {
  return c == '"' || c == '\'';
}

bool isStringPrefixChar(char c) {
  switch (c) {
  case 'f':
  case 'F':
  case 'r':
  case 'R':
  case 'b':
  case 'B':
  case 'u':
  case 'U':
    return true;
  default:
    return false;
  }
}

bool isBracketChar(char c) {
  return c == '(' || c == ')' || c == '{' || c == '}' || c == '[' || c == ']';
}

size_t countBackslashesBefore(const std::string &text, size_t index) {
  size_t count = 0;
  while (index > 0 && text[index - 1] == '\\') {
    ++count;
    --index;
  }
  return count;
}

bool isEscaped(const std::string &text, size_t index) {
  return countBackslashesBefore(text, index) % 2 == 1;
}

size_t countNewlines(const std::string &text, size_t start, size_t length) {
  size_t count = 0;
  const size_t end = start + length < text.size() ? start + length : text.size();
  for (size_t i = start; i < end; ++i) {
    if (text[i] == '\n') {
      ++count;
    }
  }
  return count;
}

std::string lineAt(const std::string &text, int line) {
  if (line < 1) {
    return {};
  }
  size_t start = 0;
  for (int current = 1; current < line; ++current) {
    size_t newline = text.find('\n', start);
    if (newline == std::string::npos) {
      return {};
    }
    start = newline + 1;
  }
  size_t end = text.find('\n', start);
  if (end == std::string::npos) {
    end = text.size();
  }
  if (end > start && text[end - 1] == '\r') {
    --end;
  }
  return text.substr(start, end - start);
}

} // namespace ddmm::text_filter
