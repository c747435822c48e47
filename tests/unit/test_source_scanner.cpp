#include "ddmm/SourceScanner.h"

#include <doctest/doctest.h>

#include <string>
#include <vector>

TEST_SUITE_BEGIN("ddmm.source_scanner");

namespace {
std::vector<ddmm::ScanSpan> scanAll(const std::string &source, ddmm::ScanMode mode) {
  std::vector<ddmm::ScanSpan> spans;
  ddmm::SourceScanner scanner(source, mode);
  ddmm::ScanSpan span;
  while (scanner.next(span)) {
    spans.push_back(span);
  }
  return spans;
}

std::vector<ddmm::ScanSpan> tokensOf(const std::vector<ddmm::ScanSpan> &spans) {
  std::vector<ddmm::ScanSpan> tokens;
  for (const auto &span : spans) {
    if (span.kind == ddmm::SpanKind::Token) {
      tokens.push_back(span);
    }
  }
  return tokens;
}
} // namespace

TEST_CASE("spans cover the whole input in order") {
  const std::string source = "f drake 'x' maye  # drake\nDRAKE f\"{a}\" MAYE";
  for (auto mode : {ddmm::ScanMode::Keywords, ddmm::ScanMode::Brackets}) {
    const auto spans = scanAll(source, mode);
    size_t expected = 0;
    for (const auto &span : spans) {
      CHECK(span.begin == expected);
      CHECK(span.length > 0);
      expected += span.length;
    }
    CHECK(expected == source.size());
  }
}

TEST_CASE("keyword tokens carry their bracket and line") {
  const auto tokens = tokensOf(scanAll("x = drake\n  Drake Maye\nmaye", ddmm::ScanMode::Keywords));
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[0].token == ddmm::BracketToken::OpenParen);
  CHECK(tokens[0].line == 1);
  CHECK(tokens[1].token == ddmm::BracketToken::OpenBrace);
  CHECK(tokens[1].line == 2);
  CHECK(tokens[2].token == ddmm::BracketToken::CloseBrace);
  CHECK(tokens[3].token == ddmm::BracketToken::CloseParen);
  CHECK(tokens[3].line == 3);
  CHECK(tokens[3].length == 4);
}

TEST_CASE("keywords inside identifiers are not tokens") {
  CHECK(tokensOf(scanAll("drakes mayes undrake _maye maye2", ddmm::ScanMode::Keywords)).empty());
  CHECK(tokensOf(scanAll("DrAkE mAyE", ddmm::ScanMode::Keywords)).empty());
}

TEST_CASE("comments and strings produce no tokens") {
  const auto spans = scanAll("# drake (\n'maye )' \"\"\"DRAKE\n[\"\"\"", ddmm::ScanMode::Keywords);
  CHECK(tokensOf(spans).empty());
  CHECK(tokensOf(scanAll("# drake (\n'maye )' \"\"\"DRAKE\n[\"\"\"", ddmm::ScanMode::Brackets)).empty());
  CHECK(spans.front().context == ddmm::ScanContext::Comment);
}

TEST_CASE("comment context ends at the newline") {
  ddmm::SourceScanner scanner("# c\nmaye", ddmm::ScanMode::Keywords);
  ddmm::ScanSpan span;
  REQUIRE(scanner.next(span));
  CHECK(scanner.currentContext() == ddmm::ScanContext::Comment);
  REQUIRE(scanner.next(span));
  CHECK(span.context == ddmm::ScanContext::Comment);
  CHECK(scanner.currentContext() == ddmm::ScanContext::Code);
  REQUIRE(scanner.next(span));
  CHECK(span.kind == ddmm::SpanKind::Token);
  CHECK(span.line == 2);
}

TEST_CASE("string frames record their prefix flags") {
  ddmm::SourceScanner scanner("rb'''x", ddmm::ScanMode::Keywords);
  ddmm::ScanSpan span;
  REQUIRE(scanner.next(span));
  CHECK(span.length == 5);
  REQUIRE(scanner.frames().size() == 2);
  const auto *str = std::get_if<ddmm::StringFrame>(&scanner.frames().back());
  REQUIRE(str != nullptr);
  CHECK(str->raw);
  CHECK(str->bytes);
  CHECK(str->triple);
  CHECK_FALSE(str->interpolated);
  CHECK(str->quote == '\'');
}

TEST_CASE("interpolation nests inside formatted strings") {
  ddmm::SourceScanner scanner("f\"{x}\"", ddmm::ScanMode::Keywords);
  ddmm::ScanSpan span;
  REQUIRE(scanner.next(span));
  CHECK(scanner.currentContext() == ddmm::ScanContext::StringLiteral);
  REQUIRE(scanner.next(span));
  CHECK(span.context == ddmm::ScanContext::Interpolation);
  CHECK(scanner.currentContext() == ddmm::ScanContext::Interpolation);
  CHECK(scanner.depth() == 3);
  REQUIRE(scanner.next(span));
  REQUIRE(scanner.next(span));
  CHECK(scanner.currentContext() == ddmm::ScanContext::StringLiteral);
  REQUIRE(scanner.next(span));
  CHECK(scanner.currentContext() == ddmm::ScanContext::Code);
  CHECK_FALSE(scanner.next(span));
}

TEST_CASE("doubled braces stay literal in formatted strings") {
  CHECK(tokensOf(scanAll("f'{{drake}}'", ddmm::ScanMode::Keywords)).empty());
  CHECK(tokensOf(scanAll("f'{{(}}'", ddmm::ScanMode::Brackets)).empty());
}

TEST_CASE("bracket mode tracks nested braces in interpolation") {
  const auto tokens = tokensOf(scanAll("f'{ {1: 2}[1] }'", ddmm::ScanMode::Brackets));
  REQUIRE(tokens.size() == 4);
  CHECK(tokens[0].token == ddmm::BracketToken::OpenBrace);
  CHECK(tokens[0].context == ddmm::ScanContext::Interpolation);
  CHECK(tokens[1].token == ddmm::BracketToken::CloseBrace);
  CHECK(tokens[2].token == ddmm::BracketToken::OpenBracket);
  CHECK(tokens[3].token == ddmm::BracketToken::CloseBracket);
}

TEST_CASE("parens and square brackets do not close interpolation") {
  ddmm::SourceScanner scanner("f'{g(]}'", ddmm::ScanMode::Brackets);
  ddmm::ScanSpan span;
  std::vector<ddmm::ScanContext> contexts;
  while (scanner.next(span)) {
    contexts.push_back(span.context);
  }
  REQUIRE(contexts.size() == 7);
  CHECK(contexts[3] == ddmm::ScanContext::Interpolation);
  CHECK(contexts[4] == ddmm::ScanContext::Interpolation);
  CHECK(contexts[5] == ddmm::ScanContext::Interpolation);
  CHECK(contexts[6] == ddmm::ScanContext::StringLiteral);
}

TEST_CASE("escaped quotes do not close a string") {
  ddmm::SourceScanner scanner("'a\\'b' maye", ddmm::ScanMode::Keywords);
  ddmm::ScanSpan span;
  int tokens = 0;
  while (scanner.next(span)) {
    if (span.kind == ddmm::SpanKind::Token) {
      ++tokens;
      CHECK(span.begin == 7);
    }
  }
  CHECK(tokens == 1);
}

TEST_CASE("unterminated strings run to the end of input") {
  ddmm::SourceScanner scanner("'open drake\nmaye", ddmm::ScanMode::Keywords);
  ddmm::ScanSpan span;
  while (scanner.next(span)) {
    CHECK(span.kind == ddmm::SpanKind::Verbatim);
  }
  CHECK(scanner.currentContext() == ddmm::ScanContext::StringLiteral);
  CHECK(scanner.line() == 2);
}

TEST_SUITE_END();
