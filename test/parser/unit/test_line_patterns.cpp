/***
 * Name: test_line_patterns
 * Purpose: Line scanners capture the same pieces at the same positions as
 *   their pattern forms, including the backtracking corner cases.
 */
#include <gtest/gtest.h>
#include <string>
#include "parser/LinePatterns.h"

using namespace sasstree::parse;

TEST(LinePatterns, OldAttributeOperator) {
  auto m = patterns::MatchOldAttribute(":width = 1 + 2");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "width");
  EXPECT_EQ(m->op, "=");
  EXPECT_EQ(m->value.text, "1 + 2");
  EXPECT_EQ(m->value.pos, 9u);

  // `=` glued to the value is part of the literal
  m = patterns::MatchOldAttribute(":name =foo");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->op, "");
  EXPECT_EQ(m->value.text, "=foo");
  EXPECT_EQ(m->value.pos, 6u);

  EXPECT_FALSE(patterns::MatchOldAttribute(":").has_value());
  EXPECT_FALSE(patterns::MatchOldAttribute(":a\"b c").has_value());
}

TEST(LinePatterns, NewAttributeShapes) {
  auto m = patterns::MatchNewAttribute("color: red");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->op, ":");
  EXPECT_EQ(m->value.text, "red");
  EXPECT_EQ(m->value.pos, 7u);

  m = patterns::MatchNewAttribute("width  = 1px");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "width");
  EXPECT_EQ(m->op, "  =");
  EXPECT_EQ(m->value.text, "1px");

  m = patterns::MatchNewAttribute("font:");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->value.text, "");

  EXPECT_FALSE(patterns::MatchNewAttribute("a:hover").has_value());
  EXPECT_FALSE(patterns::MatchNewAttribute("a=b: c").has_value());
}

TEST(LinePatterns, NewAttributeMatcher) {
  EXPECT_TRUE(patterns::LooksLikeNewAttribute("color: red"));
  EXPECT_TRUE(patterns::LooksLikeNewAttribute("width = 1"));
  EXPECT_TRUE(patterns::LooksLikeNewAttribute("a=b: c"));
  EXPECT_FALSE(patterns::LooksLikeNewAttribute("a:hover"));
  EXPECT_FALSE(patterns::LooksLikeNewAttribute("div.x > p"));
  EXPECT_FALSE(patterns::LooksLikeNewAttribute(""));
}

TEST(LinePatterns, VariableAssignment) {
  auto m = patterns::MatchVariable("!a ||= 1");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "a");
  EXPECT_TRUE(m->guarded);
  EXPECT_EQ(m->value.text, "1");
  EXPECT_EQ(m->value.pos, 7u);

  m = patterns::MatchVariable("!main_color=blue");
  ASSERT_TRUE(m.has_value());
  EXPECT_FALSE(m->guarded);
  EXPECT_EQ(m->value.text, "blue");

  // A lone trailing space is still a value
  m = patterns::MatchVariable("!a = ");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->value.text, " ");

  EXPECT_FALSE(patterns::MatchVariable("!a =").has_value());
  EXPECT_FALSE(patterns::MatchVariable("!1a = 2").has_value());
  EXPECT_FALSE(patterns::MatchVariable("!a 2").has_value());
}

TEST(LinePatterns, VariableNames) {
  EXPECT_TRUE(patterns::IsVariableName("!a"));
  EXPECT_TRUE(patterns::IsVariableName("!_x9"));
  EXPECT_FALSE(patterns::IsVariableName("!"));
  EXPECT_FALSE(patterns::IsVariableName("a"));
  EXPECT_FALSE(patterns::IsVariableName("!a-b"));
}

TEST(LinePatterns, ForTakesRightmostKeyword) {
  auto m = patterns::MatchFor("!i from 1 to 2 to 3");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->var, "!i");
  EXPECT_EQ(m->from.text, "1 to 2");
  EXPECT_EQ(m->from.pos, 8u);
  EXPECT_FALSE(m->inclusive);
  EXPECT_EQ(m->to.text, "3");
  EXPECT_EQ(m->to.pos, 18u);

  m = patterns::MatchFor("!i from !a through !b");
  ASSERT_TRUE(m.has_value());
  EXPECT_TRUE(m->inclusive);
  EXPECT_EQ(m->from.text, "!a");
  EXPECT_EQ(m->to.text, "!b");
}

TEST(LinePatterns, ForRangeStartMayBeBlank) {
  const auto m = patterns::MatchFor("!i from   to 3");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->from.text, " ");
  EXPECT_EQ(m->from.pos, 8u);
  EXPECT_EQ(m->to.text, "3");
}

TEST(LinePatterns, ForMissingPieces) {
  EXPECT_FALSE(patterns::HasForVariable(""));
  EXPECT_TRUE(patterns::HasForVariable("!i"));
  EXPECT_FALSE(patterns::HasForStart("!i"));
  EXPECT_FALSE(patterns::HasForStart("!i from"));
  EXPECT_TRUE(patterns::HasForStart("!i from 1"));
  EXPECT_FALSE(patterns::MatchFor("!i from 1").has_value());
  EXPECT_FALSE(patterns::MatchFor("!i from 1 to").has_value());
}

TEST(LinePatterns, ElseGuard) {
  auto m = patterns::MatchElseGuard("if !x == 1");
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->text, "!x == 1");
  EXPECT_EQ(m->pos, 3u);
  EXPECT_FALSE(patterns::MatchElseGuard("if").has_value());
  EXPECT_FALSE(patterns::MatchElseGuard("iffy").has_value());
}

TEST(LinePatterns, MixinHeads) {
  auto m = patterns::MatchMixinHead("= foo(!a)", '=');
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "foo");
  EXPECT_EQ(m->rest, "(!a)");

  m = patterns::MatchMixinHead("+bar", '+');
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, "bar");
  EXPECT_EQ(m->rest, "");

  // The blank before `(` becomes the name
  m = patterns::MatchMixinHead("+ (x)", '+');
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->name, " ");
  EXPECT_EQ(m->rest, "(x)");

  EXPECT_FALSE(patterns::MatchMixinHead("+(x)", '+').has_value());
  EXPECT_FALSE(patterns::MatchMixinHead("=foo", '+').has_value());
}

TEST(LinePatterns, LongLinesScanWithoutRecursion) {
  const std::string tail(200000, 'A');
  const auto v = patterns::MatchVariable("!x = " + tail);
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->value.text.size(), tail.size());

  const auto f = patterns::MatchFor("!i from " + tail + " to " + tail);
  ASSERT_TRUE(f.has_value());
  EXPECT_EQ(f->from.text, tail);
  EXPECT_EQ(f->to.text, tail);

  EXPECT_FALSE(patterns::LooksLikeNewAttribute(".sel-" + tail));
}
