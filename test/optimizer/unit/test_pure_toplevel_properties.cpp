/***
 * Name: test_pure_toplevel_properties
 * Purpose: Idempotence, determinism, shared start positions and pass statistics.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "ast/Nodes.h"
#include "codegen/Emitter.h"
#include "lexer/Lexer.h"
#include "optimizer/PureToplevel.h"
#include "parser/Parser.h"

using namespace puretop;
using purity::MutationOutcome;
using purity::Verdict;

namespace {

const char* kMixed =
    "import x from './x.js';\n"
    "/* keep me */\n"
    "const a = foo(), b = new Map;\n"
    "bar(1);\n"
    "__extends();\n"
    "function f() { return g(); }\n"
    "a().b();\n";

std::unique_ptr<ast::Module> parseSrc(lex::Lexer& L, const std::string& src) {
  L.pushString(src, "props.js");
  parse::Parser P(L);
  return P.parseModule();
}

} // namespace

TEST(PureToplevelProperties, SecondRunOverSameTreeChangesNothing) {
  lex::Lexer L;
  auto mod = parseSrc(L, kMixed);
  opt::PureToplevel pass;
  const size_t first = pass.run(*mod);
  const auto once = codegen::Emitter::emit(L.source(), mod->comments);
  const size_t second = pass.run(*mod);
  const auto twice = codegen::Emitter::emit(L.source(), mod->comments);
  EXPECT_EQ(first, 3u);
  EXPECT_EQ(second, 0u);
  EXPECT_EQ(once, twice);
  EXPECT_EQ(pass.stats().at("already_marked"), 4u);
}

TEST(PureToplevelProperties, OutputIsDeterministic) {
  std::string previous;
  for (int i = 0; i < 3; ++i) {
    lex::Lexer L;
    auto mod = parseSrc(L, kMixed);
    opt::PureToplevel pass;
    pass.run(*mod);
    const auto out = codegen::Emitter::emit(L.source(), mod->comments);
    if (i > 0) { EXPECT_EQ(out, previous); }
    previous = out;
  }
  EXPECT_EQ(previous,
            "import x from './x.js';\n"
            "/* keep me */\n"
            "const a = /*#__PURE__*/foo(), b = /*#__PURE__*/new Map;\n"
            "bar(1);\n"
            "__extends();\n"
            "function f() { return g(); }\n"
            "/*#__PURE__*/a().b();\n");
}

TEST(PureToplevelProperties, SharedStartGetsOneMarker) {
  lex::Lexer L;
  auto mod = parseSrc(L, "a().b();");
  opt::PureToplevel pass;
  EXPECT_EQ(pass.run(*mod), 1u);
  ASSERT_EQ(pass.decisions().size(), 2u);
  EXPECT_FALSE(pass.decisions()[0].node.callee.has_value());
  ASSERT_TRUE(pass.decisions()[1].node.callee.has_value());
  EXPECT_EQ(*pass.decisions()[1].node.callee, "a");
  EXPECT_EQ(pass.decisions()[0].outcome, MutationOutcome::Applied);
  EXPECT_EQ(pass.decisions()[1].outcome, MutationOutcome::AlreadyMarked);
  EXPECT_EQ(mod->comments.synthesizedCount(), 1u);
}

TEST(PureToplevelProperties, OuterCallWithArgumentsWithholdsInnerMarker) {
  lex::Lexer L;
  auto mod = parseSrc(L, "a().b(x);\nnew Foo().bar(x);\nf()(1);\n");
  opt::PureToplevel pass;
  EXPECT_EQ(pass.run(*mod), 0u);
  EXPECT_EQ(codegen::Emitter::emit(L.source(), mod->comments), "a().b(x);\nnew Foo().bar(x);\nf()(1);\n");
  const auto& d = pass.decisions();
  ASSERT_EQ(d.size(), 6u);
  EXPECT_EQ(d[0].verdict, Verdict::HasArguments);
  EXPECT_EQ(d[1].verdict, Verdict::Eligible);
  EXPECT_EQ(d[1].outcome, MutationOutcome::Skipped);
  EXPECT_EQ(d[3].node.kind, purity::CallKind::Construct);
  EXPECT_EQ(d[3].outcome, MutationOutcome::Skipped);
  EXPECT_EQ(pass.stats().at("withheld"), 3u);
  EXPECT_EQ(pass.stats().at("eligible"), 3u);
}

TEST(PureToplevelProperties, EligibleOuterCallKeepsSharedMarker) {
  lex::Lexer L;
  auto mod = parseSrc(L, "x = make()();\nok = make().then;\n");
  opt::PureToplevel pass;
  EXPECT_EQ(pass.run(*mod), 2u);
  EXPECT_EQ(codegen::Emitter::emit(L.source(), mod->comments),
            "x = /*#__PURE__*/make()();\nok = /*#__PURE__*/make().then;\n");
  EXPECT_EQ(pass.decisions()[1].outcome, MutationOutcome::AlreadyMarked);
  EXPECT_EQ(pass.stats().at("withheld"), 0u);
}

TEST(PureToplevelProperties, NewThenCallSharesStart) {
  lex::Lexer L;
  auto mod = parseSrc(L, "new Foo().bar();");
  opt::PureToplevel pass;
  pass.run(*mod);
  EXPECT_EQ(codegen::Emitter::emit(L.source(), mod->comments), "/*#__PURE__*/new Foo().bar();");
  EXPECT_EQ(pass.stats().at("calls"), 1u);
  EXPECT_EQ(pass.stats().at("constructs"), 1u);
}

TEST(PureToplevelProperties, StatsCountEveryVerdict) {
  lex::Lexer L;
  auto mod = parseSrc(L, kMixed);
  opt::PureToplevel pass;
  pass.run(*mod);
  const auto& s = pass.stats();
  EXPECT_EQ(s.at("visited"), 7u);
  EXPECT_EQ(s.at("calls"), 6u);
  EXPECT_EQ(s.at("constructs"), 1u);
  EXPECT_EQ(s.at("eligible"), 4u);
  EXPECT_EQ(s.at("annotated"), 3u);
  EXPECT_EQ(s.at("already_marked"), 1u);
  EXPECT_EQ(s.at("not_top_level"), 1u);
  EXPECT_EQ(s.at("has_arguments"), 1u);
  EXPECT_EQ(s.at("denylisted"), 1u);
}

TEST(PureToplevelProperties, StatsStartAtZero) {
  lex::Lexer L;
  auto mod = parseSrc(L, "const x = 1;");
  opt::PureToplevel pass;
  EXPECT_EQ(pass.run(*mod), 0u);
  EXPECT_EQ(pass.stats().size(), 10u);
  for (const auto& [key, value] : pass.stats()) { EXPECT_EQ(value, 0u) << key; }
  EXPECT_TRUE(pass.decisions().empty());
}

TEST(PureToplevelProperties, DecisionsFollowDocumentOrder) {
  lex::Lexer L;
  auto mod = parseSrc(L, "one();\nclass C { m() { two(); } }\nthree(4);\n");
  opt::PureToplevel pass;
  pass.run(*mod);
  const auto& d = pass.decisions();
  ASSERT_EQ(d.size(), 3u);
  EXPECT_EQ(*d[0].node.callee, "one");
  EXPECT_EQ(d[0].unit, purity::UnitKind::Program);
  EXPECT_EQ(*d[1].node.callee, "two");
  EXPECT_EQ(d[1].verdict, Verdict::NotTopLevel);
  EXPECT_EQ(d[1].unit, purity::UnitKind::Method);
  EXPECT_EQ(d[1].enclosing, "m");
  EXPECT_EQ(d[2].node.line, 3);
  EXPECT_EQ(d[2].verdict, Verdict::HasArguments);
}

TEST(PureToplevelProperties, InstanceFieldContext) {
  lex::Lexer L;
  auto mod = parseSrc(L, "class C { field = make(); }");
  opt::PureToplevel pass;
  pass.run(*mod);
  ASSERT_EQ(pass.decisions().size(), 1u);
  EXPECT_EQ(pass.decisions()[0].unit, purity::UnitKind::ClassField);
  EXPECT_EQ(pass.decisions()[0].enclosing, "field");
}

TEST(PureToplevelProperties, DefaultConstructorUsesBuiltInDenylist) {
  const opt::PureToplevel pass;
  EXPECT_EQ(pass.denylist().size(), purity::Denylist::defaults().size());
}

TEST(PureToplevelProperties, RunsThroughPassInterface) {
  lex::Lexer L;
  auto mod = parseSrc(L, "init();");
  opt::PureToplevel concrete;
  opt::Pass& pass = concrete;
  EXPECT_STREQ(pass.name(), "pure_toplevel");
  EXPECT_EQ(pass.run(*mod), 1u);
}
