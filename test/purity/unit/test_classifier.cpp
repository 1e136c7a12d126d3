/***
 * Name: test_classifier
 * Purpose: Verdict rules and their precedence: nesting, arguments, denylist.
 */
#include <gtest/gtest.h>
#include <string>
#include "purity/CallLikeNode.h"
#include "purity/Classifier.h"
#include "purity/Denylist.h"
#include "purity/LexicalContext.h"
#include "purity/Verdict.h"

using namespace puretop::purity;

namespace {

CallLikeNode callTo(const char* callee, size_t args) {
  CallLikeNode node;
  node.kind = CallKind::Call;
  if (callee != nullptr) { node.callee = std::string(callee); }
  node.argCount = args;
  return node;
}

const LexicalContext kTop = LexicalContext::topLevel();

} // namespace

TEST(Classifier, ZeroArgTopLevelIsEligible) {
  EXPECT_EQ(classify(callTo("foo", 0), kTop, Denylist::defaults()), Verdict::Eligible);
}

TEST(Classifier, NestedIsNotTopLevel) {
  const auto inFn = kTop.enter(UnitKind::Function, "f");
  EXPECT_EQ(classify(callTo("foo", 0), inFn, Denylist::defaults()), Verdict::NotTopLevel);
  const auto inArrow = kTop.enter(UnitKind::Arrow);
  EXPECT_EQ(classify(callTo("foo", 0), inArrow, Denylist::defaults()), Verdict::NotTopLevel);
}

TEST(Classifier, ArgumentsBlockEligibility) {
  EXPECT_EQ(classify(callTo("foo", 1), kTop, Denylist::defaults()), Verdict::HasArguments);
  EXPECT_EQ(classify(callTo("Object.create", 1), kTop, Denylist::defaults()), Verdict::HasArguments);
}

TEST(Classifier, DenylistedCallee) {
  EXPECT_EQ(classify(callTo("__extends", 0), kTop, Denylist::defaults()), Verdict::DenylistedCallee);
}

TEST(Classifier, NestingWinsOverArgumentsAndDenylist) {
  const auto inMethod = kTop.enter(UnitKind::Method, "m");
  EXPECT_EQ(classify(callTo("__extends", 3), inMethod, Denylist::defaults()), Verdict::NotTopLevel);
}

TEST(Classifier, ArgumentsWinOverDenylist) {
  EXPECT_EQ(classify(callTo("__importStar", 1), kTop, Denylist::defaults()), Verdict::HasArguments);
}

TEST(Classifier, UnresolvedCalleeNeverDenylisted) {
  EXPECT_EQ(classify(callTo(nullptr, 0), kTop, Denylist::defaults()), Verdict::Eligible);
}

TEST(Classifier, InjectedDenylistIsHonored) {
  const Denylist custom{{"init"}};
  EXPECT_EQ(classify(callTo("init", 0), kTop, custom), Verdict::DenylistedCallee);
  EXPECT_EQ(classify(callTo("__extends", 0), kTop, custom), Verdict::Eligible);
  EXPECT_EQ(classify(callTo("init", 0), kTop, Denylist{}), Verdict::Eligible);
}

TEST(Classifier, ConstructKindFollowsSameRules) {
  CallLikeNode node = callTo("Date", 0);
  node.kind = CallKind::Construct;
  EXPECT_EQ(classify(node, kTop, Denylist::defaults()), Verdict::Eligible);
  node.argCount = 1;
  EXPECT_EQ(classify(node, kTop, Denylist::defaults()), Verdict::HasArguments);
}

TEST(Classifier, VerdictNames) {
  EXPECT_STREQ(to_string(Verdict::Eligible), "Eligible");
  EXPECT_STREQ(to_string(Verdict::NotTopLevel), "NotTopLevel");
  EXPECT_STREQ(to_string(Verdict::HasArguments), "HasArguments");
  EXPECT_STREQ(to_string(Verdict::DenylistedCallee), "DenylistedCallee");
  EXPECT_STREQ(to_string(MutationOutcome::AlreadyMarked), "AlreadyMarked");
}
