/***
 * Name: test_parseargs
 * Purpose: Command-line option parsing, happy and sad paths.
 */
#include <gtest/gtest.h>
#include <vector>
#include "cli/Options.h"
#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"
#include "cli/Usage.h"
#include "sasstree/exceptions/config_error.h"

using namespace sasstree::cli;

static bool parse(std::vector<const char*> args, Options& o) {
  args.insert(args.begin(), "sasstree");
  return ParseArgs(static_cast<int>(args.size()), const_cast<char**>(args.data()), o);
}

TEST(ParseArgs, InputsAndDefaults) {
  Options o;
  ASSERT_TRUE(parse({"a.sass", "b.sass"}, o));
  EXPECT_EQ(o.inputs, (std::vector<std::string>{"a.sass", "b.sass"}));
  EXPECT_TRUE(o.printAst);
  EXPECT_FALSE(o.metrics);
  EXPECT_EQ(o.style, sasstree::config::OutputStyle::Nested);
  EXPECT_FALSE(o.line.has_value());
  EXPECT_EQ(o.color, ColorMode::Auto);
  EXPECT_EQ(o.logPath, ".");
}

TEST(ParseArgs, LoadPathsInOrder) {
  Options o;
  ASSERT_TRUE(parse({"-I", "lib", "--load-path=vendor", "-Ishared", "main.sass"}, o));
  EXPECT_EQ(o.loadPaths, (std::vector<std::string>{"lib", "vendor", "shared"}));
  EXPECT_EQ(o.inputs, std::vector<std::string>{"main.sass"});
}

TEST(ParseArgs, FlagsAndValues) {
  Options o;
  ASSERT_TRUE(parse({"--no-ast", "--metrics", "--metrics-json", "--style=compressed", "--line=7",
                     "--log-path=/tmp/logs", "--log-lexer", "--log-ast", "--color=never", "x.sass"},
                    o));
  EXPECT_FALSE(o.printAst);
  EXPECT_TRUE(o.metrics);
  EXPECT_TRUE(o.metricsJson);
  EXPECT_EQ(o.style, sasstree::config::OutputStyle::Compressed);
  EXPECT_EQ(o.line, 7);
  EXPECT_EQ(o.logPath, "/tmp/logs");
  EXPECT_TRUE(o.logLexer);
  EXPECT_TRUE(o.logAst);
  EXPECT_EQ(o.color, ColorMode::Never);
}

TEST(ParseArgs, HelpNeedsNoInputs) {
  Options o;
  ASSERT_TRUE(parse({"--help"}, o));
  EXPECT_TRUE(o.showHelp);
  Options s;
  ASSERT_TRUE(parse({"-h"}, s));
  EXPECT_TRUE(s.showHelp);
}

TEST(ParseArgs, EndOfOptions) {
  Options o;
  ASSERT_TRUE(parse({"--", "-odd.sass", "--metrics"}, o));
  EXPECT_EQ(o.inputs, (std::vector<std::string>{"-odd.sass", "--metrics"}));
  EXPECT_FALSE(o.metrics);
}

TEST(ParseArgs, Rejections) {
  Options a;
  EXPECT_FALSE(parse({"--bogus", "x.sass"}, a));
  Options b;
  EXPECT_FALSE(parse({}, b));
  Options c;
  EXPECT_FALSE(parse({"--style=fancy", "x.sass"}, c));
  Options d;
  EXPECT_FALSE(parse({"--line=0", "x.sass"}, d));
  Options e;
  EXPECT_FALSE(parse({"--line=abc", "x.sass"}, e));
  Options f;
  EXPECT_FALSE(parse({"x.sass", "-I"}, f));
}

TEST(ParseArgsInternals, ValueParsers) {
  EXPECT_EQ(detail::parseColorValue("always"), ColorMode::Always);
  EXPECT_EQ(detail::parseColorValue("sometimes"), ColorMode::Auto);
  EXPECT_EQ(detail::parseStyleValue("expanded"), sasstree::config::OutputStyle::Expanded);
  EXPECT_THROW((void)detail::parseStyleValue("loud"), sasstree::exceptions::ConfigError);
  EXPECT_EQ(detail::parseLineValue("12"), 12);
  EXPECT_THROW((void)detail::parseLineValue("-3"), sasstree::exceptions::ConfigError);
  EXPECT_TRUE(detail::isUnknownOptionArg("--x"));
  EXPECT_FALSE(detail::isUnknownOptionArg("-"));
  EXPECT_FALSE(detail::isUnknownOptionArg("file.sass"));
}

TEST(ParseArgs, ParserOptionsMapping) {
  Options o;
  ASSERT_TRUE(parse({"-I", "lib", "--style=expanded", "--line=3", "site/main.sass"}, o));
  const auto p = ToParserOptions(o, o.inputs[0]);
  EXPECT_EQ(p.loadPaths, (std::vector<std::string>{".", "lib"}));
  EXPECT_EQ(p.style, sasstree::config::OutputStyle::Expanded);
  EXPECT_EQ(p.filename, "site/main.sass");
  EXPECT_EQ(p.line, 3);
}

TEST(Usage, MentionsEveryOption) {
  const auto text = Usage();
  for (const char* opt : {"--help", "-I <dir>", "--load-path=", "--style=", "--line=", "--no-ast", "--metrics",
                          "--metrics-json", "--log-path=", "--log-lexer", "--log-ast", "--color="}) {
    EXPECT_NE(text.find(opt), std::string::npos) << opt;
  }
}
