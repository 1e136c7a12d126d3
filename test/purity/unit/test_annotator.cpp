/***
 * Name: test_annotator
 * Purpose: Marker recognition and the three annotation outcomes.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/SourceComments.h"
#include "purity/Annotator.h"
#include "purity/CallLikeNode.h"
#include "purity/PureMarker.h"
#include "purity/Verdict.h"

using namespace puretop;
using purity::MutationOutcome;
using purity::Verdict;

namespace {

purity::CallLikeNode nodeAt(size_t begin) {
  purity::CallLikeNode node;
  node.callee = std::string("foo");
  node.begin = begin;
  node.line = 3;
  node.col = 7;
  return node;
}

ast::Comment sourceBlock(const char* text) {
  ast::Comment c;
  c.kind = ast::CommentKind::Block;
  c.text = text;
  return c;
}

} // namespace

TEST(PureMarker, RecognizedForms) {
  EXPECT_TRUE(purity::isPureMarker(sourceBlock("#__PURE__")));
  EXPECT_TRUE(purity::isPureMarker(sourceBlock("@__PURE__")));
  EXPECT_TRUE(purity::isPureMarker(sourceBlock("  #__PURE__ ")));
  EXPECT_FALSE(purity::isPureMarker(sourceBlock("#__pure__")));
  EXPECT_FALSE(purity::isPureMarker(sourceBlock("#__PURE__ call")));
  ast::Comment line = sourceBlock("#__PURE__");
  line.kind = ast::CommentKind::Line;
  EXPECT_FALSE(purity::isPureMarker(line));
}

TEST(PureMarker, SynthesizedShape) {
  const auto marker = purity::makePureMarker(12);
  EXPECT_EQ(marker.kind, ast::CommentKind::Block);
  EXPECT_EQ(marker.text, "#__PURE__");
  EXPECT_EQ(marker.begin, 12u);
  EXPECT_EQ(marker.end, 12u);
  EXPECT_TRUE(marker.synthesized);
}

TEST(Annotator, EligibleIsApplied) {
  ast::SourceComments comments;
  EXPECT_EQ(purity::annotate(nodeAt(4), Verdict::Eligible, comments), MutationOutcome::Applied);
  ASSERT_EQ(comments.leading(4).size(), 1u);
  const auto& marker = comments.leading(4)[0];
  EXPECT_TRUE(marker.synthesized);
  EXPECT_EQ(marker.line, 3);
  EXPECT_EQ(marker.col, 7);
}

TEST(Annotator, OtherVerdictsAreSkipped) {
  ast::SourceComments comments;
  for (auto verdict : {Verdict::NotTopLevel, Verdict::HasArguments, Verdict::DenylistedCallee}) {
    EXPECT_EQ(purity::annotate(nodeAt(0), verdict, comments), MutationOutcome::Skipped);
  }
  EXPECT_EQ(comments.size(), 0u);
}

TEST(Annotator, SecondApplicationIsAlreadyMarked) {
  ast::SourceComments comments;
  ASSERT_EQ(purity::annotate(nodeAt(0), Verdict::Eligible, comments), MutationOutcome::Applied);
  EXPECT_EQ(purity::annotate(nodeAt(0), Verdict::Eligible, comments), MutationOutcome::AlreadyMarked);
  EXPECT_EQ(comments.leading(0).size(), 1u);
}

TEST(Annotator, ExistingSourceMarkerCounts) {
  ast::SourceComments comments;
  comments.addLeading(9, sourceBlock("@__PURE__"));
  EXPECT_EQ(purity::annotate(nodeAt(9), Verdict::Eligible, comments), MutationOutcome::AlreadyMarked);
  EXPECT_EQ(comments.synthesizedCount(), 0u);
}

TEST(Annotator, UnrelatedLeadingCommentDoesNotBlock) {
  ast::SourceComments comments;
  comments.addLeading(2, sourceBlock(" note "));
  EXPECT_EQ(purity::annotate(nodeAt(2), Verdict::Eligible, comments), MutationOutcome::Applied);
  EXPECT_EQ(comments.leading(2).size(), 2u);
}
