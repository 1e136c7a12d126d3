/***
 * Name: test_pure_toplevel_scenarios
 * Purpose: Annotate top-level zero-argument calls; leave everything else untouched.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ast/Nodes.h"
#include "codegen/Emitter.h"
#include "lexer/Lexer.h"
#include "optimizer/PureToplevel.h"
#include "parser/Parser.h"

using namespace puretop;
using purity::MutationOutcome;
using purity::Verdict;

namespace {

struct PassRun {
  std::string out;
  size_t applied{0};
  std::vector<opt::PureDecision> decisions;
  std::unordered_map<std::string, uint64_t> stats;
};

PassRun runPass(const std::string& src, const purity::Denylist& denylist = purity::Denylist::defaults()) {
  lex::Lexer L; L.pushString(src, "scenario.js");
  parse::Parser P(L);
  auto mod = P.parseModule();
  opt::PureToplevel pass(denylist);
  PassRun r;
  r.applied = pass.run(*mod);
  r.decisions = pass.decisions();
  r.stats = pass.stats();
  r.out = codegen::Emitter::emit(L.source(), mod->comments);
  return r;
}

} // namespace

TEST(PureToplevelScenarios, TopLevelCallIsMarked) {
  const auto r = runPass("foo();");
  EXPECT_EQ(r.out, "/*#__PURE__*/foo();");
  EXPECT_EQ(r.applied, 1u);
  ASSERT_EQ(r.decisions.size(), 1u);
  EXPECT_EQ(r.decisions[0].verdict, Verdict::Eligible);
  EXPECT_EQ(r.decisions[0].outcome, MutationOutcome::Applied);
}

TEST(PureToplevelScenarios, TopLevelConstructIsMarked) {
  const auto r = runPass("new Date();");
  EXPECT_EQ(r.out, "/*#__PURE__*/new Date();");
  ASSERT_EQ(r.decisions.size(), 1u);
  EXPECT_EQ(r.decisions[0].node.kind, purity::CallKind::Construct);
}

TEST(PureToplevelScenarios, CallInFunctionBodyIsUnchanged) {
  const std::string src = "function f() {\n  foo();\n}\n";
  const auto r = runPass(src);
  EXPECT_EQ(r.out, src);
  EXPECT_EQ(r.applied, 0u);
  ASSERT_EQ(r.decisions.size(), 1u);
  EXPECT_EQ(r.decisions[0].verdict, Verdict::NotTopLevel);
  EXPECT_EQ(r.decisions[0].unit, purity::UnitKind::Function);
  EXPECT_EQ(r.decisions[0].enclosing, "f");
}

TEST(PureToplevelScenarios, CallWithArgumentIsUnchanged) {
  const auto r = runPass("Object.create({});");
  EXPECT_EQ(r.out, "Object.create({});");
  ASSERT_EQ(r.decisions.size(), 1u);
  EXPECT_EQ(r.decisions[0].verdict, Verdict::HasArguments);
  EXPECT_EQ(r.decisions[0].outcome, MutationOutcome::Skipped);
}

TEST(PureToplevelScenarios, DenylistedHelperIsUnchanged) {
  const auto r = runPass("__extends();");
  EXPECT_EQ(r.out, "__extends();");
  ASSERT_EQ(r.decisions.size(), 1u);
  EXPECT_EQ(r.decisions[0].verdict, Verdict::DenylistedCallee);
}

TEST(PureToplevelScenarios, RerunAddsNoSecondMarker) {
  const auto first = runPass("foo();");
  const auto second = runPass(first.out);
  EXPECT_EQ(second.out, "/*#__PURE__*/foo();");
  EXPECT_EQ(second.applied, 0u);
  ASSERT_EQ(second.decisions.size(), 1u);
  EXPECT_EQ(second.decisions[0].outcome, MutationOutcome::AlreadyMarked);
}

TEST(PureToplevelScenarios, ArgumentSensitivity) {
  EXPECT_EQ(runPass("init();").out, "/*#__PURE__*/init();");
  EXPECT_EQ(runPass("init(1);").out, "init(1);");
  EXPECT_EQ(runPass("new Foo;").out, "/*#__PURE__*/new Foo;");
  EXPECT_EQ(runPass("f(...[]);").out, "f(...[]);");
}

TEST(PureToplevelScenarios, InjectedDenylistReplacesDefaults) {
  const purity::Denylist custom{{"setup"}};
  EXPECT_EQ(runPass("setup(); __extends();", custom).out, "setup(); /*#__PURE__*/__extends();");
}

TEST(PureToplevelScenarios, RenamedHelpersStayUnmarked) {
  EXPECT_EQ(runPass("__importStar$1();").out, "__importStar$1();");
  EXPECT_EQ(runPass("tslib_1.__extends();").out, "/*#__PURE__*/tslib_1.__extends();");
}
