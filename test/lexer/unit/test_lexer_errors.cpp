/***
 * Name: test_lexer_errors
 * Purpose: Lexical errors raise ParseError with a source location.
 */
#include <gtest/gtest.h>
#include <string>
#include "lexer/Lexer.h"
#include "puretop/exceptions/file_read_error.h"
#include "puretop/exceptions/parse_error.h"

using namespace puretop;

static void expectLexError(const std::string& src, int line, int col) {
  lex::Lexer L; L.pushString(src, "err.js");
  try {
    (void)L.tokens();
    FAIL() << "expected ParseError for: " << src;
  } catch (const exceptions::ParseError& ex) {
    EXPECT_EQ(ex.line(), line) << src;
    EXPECT_EQ(ex.col(), col) << src;
  }
}

TEST(LexerErrors, UnterminatedString) { expectLexError("x = 'abc", 1, 5); }
TEST(LexerErrors, NewlineInString) { expectLexError("'ab\ncd'", 1, 1); }
TEST(LexerErrors, UnterminatedBlockComment) { expectLexError("a /* never", 1, 3); }
TEST(LexerErrors, UnterminatedTemplate) { expectLexError("`abc", 1, 1); }
TEST(LexerErrors, IdentifierAfterNumber) { expectLexError("3in x", 1, 2); }
TEST(LexerErrors, MissingRadixDigits) { expectLexError("0x", 1, 1); }
TEST(LexerErrors, UnexpectedCharacter) { expectLexError("a @ b", 1, 3); }
TEST(LexerErrors, UnterminatedRegExp) { expectLexError("x = /abc\n", 1, 5); }

TEST(LexerErrors, MissingFileRaisesFileReadError) {
  lex::Lexer L; L.pushFile("/nonexistent/dir/input.js");
  EXPECT_THROW((void)L.tokens(), exceptions::FileReadError);
}
