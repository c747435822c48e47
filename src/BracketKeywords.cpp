#include "ddmm/BracketKeywords.h"

#include "text_filter/ScanHelpers.h"

#include <array>

namespace {
struct BracketEntry {
  ddmm::BracketToken token;
  std::string_view keyword;
  char bracket;
  std::string_view family;
};

constexpr std::array<BracketEntry, 6> kBrackets = {{
    {ddmm::BracketToken::OpenParen, "drake", '(', "paren"},
    {ddmm::BracketToken::OpenBrace, "Drake", '{', "curly brace"},
    {ddmm::BracketToken::OpenBracket, "DRAKE", '[', "square bracket"},
    {ddmm::BracketToken::CloseParen, "maye", ')', "paren"},
    {ddmm::BracketToken::CloseBrace, "Maye", '}', "curly brace"},
    {ddmm::BracketToken::CloseBracket, "MAYE", ']', "square bracket"},
}};

const BracketEntry &entryFor(ddmm::BracketToken token) {
  for (const auto &entry : kBrackets) {
    if (entry.token == token) {
      return entry;
    }
  }
  return kBrackets.front();
}
} // namespace

namespace ddmm {
using namespace text_filter;

std::string_view keywordText(BracketToken token) {
  return entryFor(token).keyword;
}

char bracketChar(BracketToken token) {
  return entryFor(token).bracket;
}

std::string_view bracketFamilyName(BracketToken token) {
  return entryFor(token).family;
}

bool isOpener(BracketToken token) {
  return token == BracketToken::OpenParen || token == BracketToken::OpenBrace ||
         token == BracketToken::OpenBracket;
}

BracketToken matchingOpener(BracketToken closer) {
  switch (closer) {
  case BracketToken::CloseParen:
    return BracketToken::OpenParen;
  case BracketToken::CloseBrace:
    return BracketToken::OpenBrace;
  case BracketToken::CloseBracket:
    return BracketToken::OpenBracket;
  default:
    return closer;
  }
}

bool matchKeywordAt(const std::string &text, size_t pos, BracketToken &out) {
  if (pos >= text.size()) {
    return false;
  }
  if (pos > 0 && isIdentifierChar(text[pos - 1])) {
    return false;
  }
  for (const auto &entry : kBrackets) {
    const size_t end = pos + entry.keyword.size();
    if (end > text.size()) {
      continue;
    }
    if (text.compare(pos, entry.keyword.size(), entry.keyword) != 0) {
      continue;
    }
    if (end < text.size() && isIdentifierChar(text[end])) {
      continue;
    }
    out = entry.token;
    return true;
  }
  return false;
}

bool bracketTokenFor(char c, BracketToken &out) {
  for (const auto &entry : kBrackets) {
    if (entry.bracket == c) {
      out = entry.token;
      return true;
    }
  }
  return false;
}

} // namespace ddmm
