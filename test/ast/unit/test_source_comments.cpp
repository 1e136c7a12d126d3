/***
 * Name: test_source_comments
 * Purpose: Position-keyed comment store semantics.
 */
#include <gtest/gtest.h>
#include "ast/SourceComments.h"

using namespace puretop;

static ast::Comment block(const char* text, bool synthesized) {
  ast::Comment c;
  c.kind = ast::CommentKind::Block;
  c.text = text;
  c.synthesized = synthesized;
  return c;
}

TEST(SourceComments, EmptyLookupsAreSafe) {
  ast::SourceComments comments;
  EXPECT_FALSE(comments.hasLeading(0));
  EXPECT_TRUE(comments.leading(42).empty());
  EXPECT_EQ(comments.size(), 0u);
  EXPECT_TRUE(comments.synthesized().empty());
}

TEST(SourceComments, SynthesizedInPositionOrder) {
  ast::SourceComments comments;
  comments.addLeading(30, block("b", true));
  comments.addLeading(10, block("src", false));
  comments.addLeading(10, block("a", true));
  comments.addLeading(20, block("keep", false));
  EXPECT_EQ(comments.size(), 4u);
  EXPECT_EQ(comments.synthesizedCount(), 2u);
  const auto synth = comments.synthesized();
  ASSERT_EQ(synth.size(), 2u);
  EXPECT_EQ(synth[0].first, 10u);
  EXPECT_EQ(synth[0].second->text, "a");
  EXPECT_EQ(synth[1].first, 30u);
}

TEST(SourceComments, AnyLeadingAppliesPredicate) {
  ast::SourceComments comments;
  comments.addLeading(5, block("x", false));
  comments.addLeading(5, block("y", false));
  EXPECT_TRUE(comments.anyLeading(5, [](const ast::Comment& c) { return c.text == "y"; }));
  EXPECT_FALSE(comments.anyLeading(5, [](const ast::Comment& c) { return c.text == "z"; }));
  EXPECT_FALSE(comments.anyLeading(6, [](const ast::Comment&) { return true; }));
}
