/***
 * Name: test_tokenizer_errors
 * Purpose: Indentation violations raise SyntaxError with the offending line.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "sasstree/exceptions/file_read_error.h"
#include "sasstree/exceptions/syntax_error.h"

using namespace sasstree;

static exceptions::SyntaxError tabulateError(const std::string& src) {
  try {
    (void)lex::Tokenizer().tabulate(src);
  } catch (const exceptions::SyntaxError& e) {
    return e;
  }
  ADD_FAILURE() << "expected SyntaxError for: " << src;
  return exceptions::SyntaxError("none");
}

TEST(TokenizerErrors, IndentedFirstLine) {
  const auto e = tabulateError("  a\nb\n");
  EXPECT_EQ(e.message(), "Indenting at the beginning of the document is illegal.");
  EXPECT_EQ(e.line(), 1);
}

TEST(TokenizerErrors, IndentedFirstLineAfterBlanks) {
  const auto e = tabulateError("\n\n  a\n");
  EXPECT_EQ(e.line(), 3);
}

TEST(TokenizerErrors, MixedTabsAndSpacesInUnit) {
  const auto e = tabulateError("a\n \tb\n");
  EXPECT_EQ(e.message(), "Indentation can't use both tabs and spaces.");
  EXPECT_EQ(e.line(), 2);
}

TEST(TokenizerErrors, MixedUnitSetDeepInDocument) {
  const auto e = tabulateError("a\n\nb\n\nc\n \td: e\n");
  EXPECT_EQ(e.message(), "Indentation can't use both tabs and spaces.");
  EXPECT_EQ(e.line(), 6);
}

TEST(TokenizerErrors, NotAMultipleOfTheUnit) {
  const auto e = tabulateError("a\n  b\n   c\n");
  EXPECT_EQ(e.message(),
            "Inconsistent indentation: 3 spaces were used for indentation, but the rest of the document was "
            "indented using 2 spaces.");
  EXPECT_EQ(e.line(), 3);
}

TEST(TokenizerErrors, TabsAfterSpaceUnit) {
  const auto e = tabulateError("a\n  b\n\tc\n");
  EXPECT_EQ(e.message(),
            "Inconsistent indentation: 1 tab was used for indentation, but the rest of the document was "
            "indented using 2 spaces.");
}

TEST(TokenizerErrors, MissingFileRaisesFileReadError) {
  EXPECT_THROW(lex::FileInput("/nonexistent/dir/missing.sass"), exceptions::FileReadError);
}
