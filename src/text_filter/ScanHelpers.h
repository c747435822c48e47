#pragma once

#include <string>

namespace ddmm::text_filter {

// Letters, digits, underscore, and any byte of a multi-byte UTF-8 sequence.
bool isIdentifierChar(char c);
bool isQuoteChar(char c);
bool isStringPrefixChar(char c);
bool isBracketChar(char c);
size_t countBackslashesBefore(const std::string &text, size_t index);
bool isEscaped(const std::string &text, size_t index);
size_t countNewlines(const std::string &text, size_t start, size_t length);
std::string lineAt(const std::string &text, int line);

} // namespace ddmm::text_filter
