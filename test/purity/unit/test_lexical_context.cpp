/***
 * Name: test_lexical_context
 * Purpose: Nested contexts are values; the outer context is unchanged.
 */
#include <gtest/gtest.h>
#include "purity/LexicalContext.h"

using namespace puretop::purity;

TEST(LexicalContext, TopLevelDefaults) {
  const auto top = LexicalContext::topLevel();
  EXPECT_TRUE(top.isTopLevel());
  EXPECT_EQ(top.unit(), UnitKind::Program);
  EXPECT_EQ(top.functionDepth(), 0);
  EXPECT_TRUE(top.enclosingName().empty());
}

TEST(LexicalContext, EnterNests) {
  const auto top = LexicalContext::topLevel();
  const auto fn = top.enter(UnitKind::Function, "outer");
  const auto arrow = fn.enter(UnitKind::Arrow);
  EXPECT_FALSE(fn.isTopLevel());
  EXPECT_EQ(fn.enclosingName(), "outer");
  EXPECT_EQ(arrow.functionDepth(), 2);
  EXPECT_EQ(arrow.unit(), UnitKind::Arrow);
  EXPECT_TRUE(arrow.enclosingName().empty());
  EXPECT_TRUE(top.isTopLevel());
}

TEST(LexicalContext, UnitNames) {
  EXPECT_STREQ(to_string(UnitKind::Program), "Program");
  EXPECT_STREQ(to_string(UnitKind::ClassField), "ClassField");
  EXPECT_STREQ(to_string(UnitKind::Method), "Method");
}
