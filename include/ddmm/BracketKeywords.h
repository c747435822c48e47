#pragma once

#include <string>
#include <string_view>

namespace ddmm {

enum class BracketToken {
  OpenParen,
  CloseParen,
  OpenBrace,
  CloseBrace,
  OpenBracket,
  CloseBracket
};

std::string_view keywordText(BracketToken token);
char bracketChar(BracketToken token);
// "paren", "curly brace" or "square bracket".
std::string_view bracketFamilyName(BracketToken token);
bool isOpener(BracketToken token);
BracketToken matchingOpener(BracketToken closer);

// Matches one of the six keywords at pos. The characters on either side of
// the match must not be identifier characters.
bool matchKeywordAt(const std::string &text, size_t pos, BracketToken &out);
bool bracketTokenFor(char c, BracketToken &out);

} // namespace ddmm
