/***
 * Name: test_lexer_tokens
 * Purpose: Token kinds, byte ranges and line tracking for common inputs.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "lexer/Lexer.h"

using namespace puretop;

static std::vector<lex::Token> lexAll(const std::string& src) {
  lex::Lexer L; L.pushString(src, "lex.js");
  return L.tokens();
}

TEST(LexerTokens, SimpleCallStatement) {
  auto toks = lexAll("foo();");
  ASSERT_EQ(toks.size(), 5u);
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[0].text, "foo");
  EXPECT_EQ(toks[0].begin, 0u);
  EXPECT_EQ(toks[0].end, 3u);
  EXPECT_EQ(toks[1].kind, lex::TokenKind::LParen);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::RParen);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::Semicolon);
  EXPECT_EQ(toks[4].kind, lex::TokenKind::End);
  EXPECT_EQ(toks[4].begin, 6u);
}

TEST(LexerTokens, KeywordsAndContextualIdentifiers) {
  auto toks = lexAll("new Date; let async = yield");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::New);
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::Ident); // let
  EXPECT_EQ(toks[4].kind, lex::TokenKind::Ident); // async
  EXPECT_EQ(toks[6].kind, lex::TokenKind::Ident); // yield
}

TEST(LexerTokens, LongestPunctuatorWins) {
  auto toks = lexAll("a >>>= b ?? c?.d ... e === f");
  EXPECT_EQ(toks[1].kind, lex::TokenKind::URShiftEqual);
  EXPECT_EQ(toks[3].kind, lex::TokenKind::QuestionQuestion);
  EXPECT_EQ(toks[5].kind, lex::TokenKind::QuestionDot);
  EXPECT_EQ(toks[7].kind, lex::TokenKind::Ellipsis);
  EXPECT_EQ(toks[9].kind, lex::TokenKind::EqEqEq);
}

TEST(LexerTokens, QuestionDotBeforeDigitIsConditional) {
  auto toks = lexAll("a?.5:b");
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Question);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Number);
  EXPECT_EQ(toks[2].text, ".5");
}

TEST(LexerTokens, NumericForms) {
  auto toks = lexAll("0x1F 0o17 0b101 1_000 10n .5 1e3 2.5E-2");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::Number);
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Number);
  EXPECT_EQ(toks[2].kind, lex::TokenKind::Number);
  EXPECT_EQ(toks[3].text, "1_000");
  EXPECT_EQ(toks[4].kind, lex::TokenKind::BigInt);
  EXPECT_EQ(toks[5].text, ".5");
  EXPECT_EQ(toks[6].text, "1e3");
  EXPECT_EQ(toks[7].text, "2.5E-2");
}

TEST(LexerTokens, StringsKeepQuotes) {
  auto toks = lexAll(R"JS('a\'b' "c")JS");
  EXPECT_EQ(toks[0].kind, lex::TokenKind::String);
  EXPECT_EQ(toks[0].text, R"JS('a\'b')JS");
  EXPECT_EQ(toks[1].text, "\"c\"");
}

TEST(LexerTokens, LineAndColumnTracking) {
  auto toks = lexAll("a\n  b\r\nc");
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_FALSE(toks[0].newlineBefore);
  EXPECT_EQ(toks[1].line, 2);
  EXPECT_EQ(toks[1].col, 3);
  EXPECT_TRUE(toks[1].newlineBefore);
  EXPECT_EQ(toks[2].line, 3);
  EXPECT_EQ(toks[2].col, 1);
}

TEST(LexerTokens, UnicodeLineSeparatorEndsLine) {
  auto toks = lexAll("a\xE2\x80\xA8" "b");
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[1].line, 2);
  EXPECT_TRUE(toks[1].newlineBefore);
}

TEST(LexerTokens, NonAsciiIdentifiers) {
  auto toks = lexAll("const caf\xC3\xA9 = \xCF\x80;");
  EXPECT_EQ(toks[1].kind, lex::TokenKind::Ident);
  EXPECT_EQ(toks[1].text, "caf\xC3\xA9");
  EXPECT_EQ(toks[3].kind, lex::TokenKind::Ident);
}

TEST(LexerTokens, NoBreakSpaceIsWhitespace) {
  auto toks = lexAll("a\xC2\xA0" "b");
  ASSERT_EQ(toks.size(), 3u);
  EXPECT_EQ(toks[1].text, "b");
  EXPECT_FALSE(toks[1].newlineBefore);
}

TEST(LexerTokens, PrivateNames) {
  auto toks = lexAll("this.#count");
  EXPECT_EQ(toks[2].kind, lex::TokenKind::PrivateName);
  EXPECT_EQ(toks[2].text, "#count");
}

TEST(LexerTokens, ToStringIsStable) {
  EXPECT_STREQ(lex::to_string(lex::TokenKind::Ident), "Ident");
  EXPECT_STREQ(lex::to_string(lex::TokenKind::QuestionDot), "QuestionDot");
  EXPECT_STREQ(lex::to_string(lex::TokenKind::End), "End");
}
