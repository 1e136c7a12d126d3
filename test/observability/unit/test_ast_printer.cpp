/***
 * Name: test_ast_printer
 * Purpose: Validate AST dump layout, node descriptions and comment listing.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "optimizer/PureToplevel.h"
#include "parser/Parser.h"

using namespace puretop;

static std::unique_ptr<ast::Module> parseText(lex::Lexer& L, const char* src) {
  L.pushString(src, "printer_test.js");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(ObservabilityAstPrinter, IndentsByDepth) {
  lex::Lexer L;
  auto mod = parseText(L, "foo();");
  obs::AstPrinter printer;
  EXPECT_EQ(printer.print(*mod),
            "Module @1:1\n"
            "  ExprStmt @1:1\n"
            "    Call args=0 @1:1\n"
            "      Name foo @1:1\n");
}

TEST(ObservabilityAstPrinter, ListsCommentsOnce) {
  lex::Lexer L;
  auto mod = parseText(L, "// note\nbar(1);");
  opt::PureToplevel pass;
  pass.run(*mod);
  obs::AstPrinter printer;
  const auto out = printer.print(*mod);
  const auto first = out.find("Comment // note");
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(out.find("Comment // note", first + 1), std::string::npos);
  EXPECT_EQ(out.find("Comment+"), std::string::npos);
}

TEST(ObservabilityAstPrinter, MarksSynthesizedComments) {
  lex::Lexer L;
  auto mod = parseText(L, "const x = new Foo;");
  opt::PureToplevel pass;
  pass.run(*mod);
  obs::AstPrinter printer;
  const auto out = printer.print(*mod);
  EXPECT_NE(out.find("Comment+ /*#__PURE__*/"), std::string::npos);
  EXPECT_NE(out.find("NewExpr args=0 no-parens @1:11"), std::string::npos);
  EXPECT_NE(out.find("VarDecl const"), std::string::npos);
}

TEST(ObservabilityAstPrinter, DescribeNodes) {
  lex::Lexer L;
  auto mod = parseText(L, "async function* gen() {}");
  ASSERT_EQ(mod->body.size(), 1u);
  EXPECT_EQ(obs::AstPrinter::describe(*mod->body[0]), "FunctionDecl name=gen async generator");
}
