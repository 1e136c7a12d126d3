/***
 * Name: test_parser_statements
 * Purpose: Module items, declarations, classes and automatic semicolon insertion.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace puretop;

static std::unique_ptr<ast::Module> parseSrc(const std::string& src) {
  lex::Lexer L; L.pushString(src, "stmt.js");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(ParserStatements, ImportForms) {
  auto mod = parseSrc(
      "import d, { a as b, c } from './m.js';\n"
      "import * as ns from \"ns\";\n"
      "import './side.js';\n");
  ASSERT_EQ(mod->body.size(), 3u);
  const auto& first = static_cast<const ast::ImportDecl&>(*mod->body[0]);
  ASSERT_EQ(first.kind, ast::NodeKind::ImportDecl);
  EXPECT_EQ(first.source, "./m.js");
  ASSERT_EQ(first.specifiers.size(), 3u);
  EXPECT_EQ(first.specifiers[0].importKind, ast::ImportKind::Default);
  EXPECT_EQ(first.specifiers[1].imported, "a");
  EXPECT_EQ(first.specifiers[1].local, "b");
  const auto& second = static_cast<const ast::ImportDecl&>(*mod->body[1]);
  EXPECT_EQ(second.specifiers[0].importKind, ast::ImportKind::Namespace);
  EXPECT_TRUE(static_cast<const ast::ImportDecl&>(*mod->body[2]).specifiers.empty());
}

TEST(ParserStatements, ExportForms) {
  auto mod = parseSrc(
      "export const x = f();\n"
      "export default g();\n"
      "export { x as y };\n"
      "export * from './all.js';\n");
  ASSERT_EQ(mod->body.size(), 4u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::ExportNamedDecl);
  const auto& named = static_cast<const ast::ExportNamedDecl&>(*mod->body[0]);
  ASSERT_NE(named.declaration, nullptr);
  EXPECT_EQ(named.declaration->kind, ast::NodeKind::VarDecl);
  const auto& def = static_cast<const ast::ExportDefaultDecl&>(*mod->body[1]);
  ASSERT_EQ(def.kind, ast::NodeKind::ExportDefaultDecl);
  EXPECT_EQ(def.declaration->kind, ast::NodeKind::Call);
  const auto& list = static_cast<const ast::ExportNamedDecl&>(*mod->body[2]);
  ASSERT_EQ(list.specifiers.size(), 1u);
  EXPECT_EQ(list.specifiers[0].exported, "y");
  EXPECT_EQ(mod->body[3]->kind, ast::NodeKind::ExportAllDecl);
}

TEST(ParserStatements, AutomaticSemicolonInsertion) {
  auto mod = parseSrc("a\nb\nfoo()\n");
  EXPECT_EQ(mod->body.size(), 3u);
}

TEST(ParserStatements, ReturnRestrictedProduction) {
  auto mod = parseSrc("function f() { return\n g(); }");
  const auto& fn = static_cast<const ast::FunctionDecl&>(*mod->body[0]);
  ASSERT_EQ(fn.body.size(), 2u);
  EXPECT_EQ(static_cast<const ast::ReturnStmt&>(*fn.body[0]).value, nullptr);
}

TEST(ParserStatements, FunctionDeclarations) {
  auto mod = parseSrc("async function* gen(a, b = 1, ...rest) { yield a; }");
  const auto& fn = static_cast<const ast::FunctionDecl&>(*mod->body[0]);
  ASSERT_EQ(fn.kind, ast::NodeKind::FunctionDecl);
  EXPECT_EQ(fn.name, "gen");
  EXPECT_TRUE(fn.isAsync);
  EXPECT_TRUE(fn.isGenerator);
  EXPECT_EQ(fn.params.size(), 3u);
}

TEST(ParserStatements, ClassMembers) {
  auto mod = parseSrc(
      "class A extends B {\n"
      "  static s = make();\n"
      "  f = init();\n"
      "  #p;\n"
      "  constructor() { super(); }\n"
      "  get v() { return 1; }\n"
      "  static { boot(); }\n"
      "  [key()]() {}\n"
      "}\n");
  const auto& cls = static_cast<const ast::ClassDecl&>(*mod->body[0]);
  ASSERT_EQ(cls.kind, ast::NodeKind::ClassDecl);
  EXPECT_EQ(cls.name, "A");
  ASSERT_NE(cls.superClass, nullptr);
  ASSERT_EQ(cls.members.size(), 7u);
  EXPECT_EQ(cls.members[0]->memberKind, ast::ClassMemberKind::Field);
  EXPECT_TRUE(cls.members[0]->isStatic);
  EXPECT_EQ(cls.members[1]->memberKind, ast::ClassMemberKind::Field);
  EXPECT_FALSE(cls.members[1]->isStatic);
  EXPECT_EQ(cls.members[2]->key->kind, ast::NodeKind::PrivateName);
  EXPECT_EQ(cls.members[2]->value, nullptr);
  EXPECT_EQ(cls.members[3]->memberKind, ast::ClassMemberKind::Constructor);
  EXPECT_EQ(cls.members[4]->memberKind, ast::ClassMemberKind::Getter);
  EXPECT_EQ(cls.members[5]->memberKind, ast::ClassMemberKind::StaticBlock);
  EXPECT_EQ(cls.members[5]->body.size(), 1u);
  EXPECT_TRUE(cls.members[6]->computed);
  EXPECT_EQ(cls.members[6]->key->kind, ast::NodeKind::Call);
}

TEST(ParserStatements, ObjectLiteralMethods) {
  auto mod = parseSrc("const o = { a: 1, b, c() {}, get d() { return 2; }, ...rest };");
  const auto& decl = static_cast<const ast::VarDecl&>(*mod->body[0]);
  const auto& obj = static_cast<const ast::ObjectLiteral&>(*decl.declarations[0].init);
  ASSERT_EQ(obj.properties.size(), 5u);
  EXPECT_EQ(obj.properties[0]->propKind, ast::PropertyKind::Init);
  EXPECT_EQ(obj.properties[1]->propKind, ast::PropertyKind::Shorthand);
  EXPECT_EQ(obj.properties[2]->propKind, ast::PropertyKind::Method);
  EXPECT_EQ(obj.properties[3]->propKind, ast::PropertyKind::Getter);
  EXPECT_EQ(obj.properties[4]->propKind, ast::PropertyKind::Spread);
}

TEST(ParserStatements, LoopsAndControlFlow) {
  auto mod = parseSrc(
      "for (const k in o) {}\n"
      "for (let v of xs) {}\n"
      "for (let i = 0; i < n; i++) {}\n"
      "while (x) { break; }\n"
      "do { continue; } while (y)\n"
      "outer: for (;;) { break outer; }\n"
      "switch (z) { case 1: f(); break; default: g(); }\n"
      "try { h(); } catch { } finally { }\n"
      "if (a) b(); else c();\n");
  ASSERT_EQ(mod->body.size(), 9u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::ForInStmt);
  EXPECT_EQ(static_cast<const ast::ForInStmt&>(*mod->body[1]).loopKind, ast::ForInKind::Of);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::ForStmt);
  EXPECT_EQ(mod->body[3]->kind, ast::NodeKind::WhileStmt);
  EXPECT_EQ(mod->body[4]->kind, ast::NodeKind::DoWhileStmt);
  EXPECT_EQ(mod->body[5]->kind, ast::NodeKind::LabeledStmt);
  EXPECT_EQ(mod->body[6]->kind, ast::NodeKind::SwitchStmt);
  EXPECT_EQ(mod->body[7]->kind, ast::NodeKind::TryStmt);
  EXPECT_EQ(mod->body[8]->kind, ast::NodeKind::IfStmt);
}

TEST(ParserStatements, LetAsIdentifier) {
  auto mod = parseSrc("let x = 1; let\n");
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::VarDecl);
  EXPECT_EQ(static_cast<const ast::VarDecl&>(*mod->body[0]).declKind, "let");
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::ExprStmt);
}

TEST(ParserStatements, CommentsMoveToModule) {
  auto mod = parseSrc("/* lead */ foo(); // tail\n");
  EXPECT_EQ(mod->comments.size(), 2u);
  EXPECT_TRUE(mod->comments.hasLeading(11));
}

TEST(ParserStatements, EmptyModule) {
  auto mod = parseSrc("");
  EXPECT_TRUE(mod->body.empty());
  EXPECT_EQ(mod->comments.size(), 0u);
}
