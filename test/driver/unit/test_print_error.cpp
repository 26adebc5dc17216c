/***
 * Name: test_print_error
 * Purpose: Validate print_error output format and caret positioning.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include "driver/Diagnostic.h"
#include "driver/Driver.h"

using namespace sasstree;
namespace fs = std::filesystem;

static std::string readFile(const std::string& p) {
  std::ifstream in(p);
  std::string all, line;
  while (std::getline(in, line)) { all += line; all += '\n'; }
  return all;
}

static std::string tmpPath(const std::string& name) {
  return (fs::temp_directory_path() / ("sasstree_pe_" + name)).string();
}

// Runs print_error with stderr redirected to a file and returns what was written.
static std::string capture(const driver::Diagnostic& d, const bool color) {
  const std::string outPath = tmpPath("out.txt");
  const int saved = dup(2);
  FILE* fp = std::fopen(outPath.c_str(), "w");
  if (fp == nullptr) { return {}; }
  dup2(fileno(fp), 2);
  driver::Driver::print_error(d, color);
  fflush(stderr);
  dup2(saved, 2);
  close(saved);
  std::fclose(fp);
  return readFile(outPath);
}

TEST(PrintError, WritesHeaderLabelCaret) {
  const auto src = tmpPath("a.sass");
  { std::ofstream out(src); out << "a\n  b: c\n"; }
  const auto out = capture(driver::Diagnostic{src, 2, 3, "oops"}, false);
  ASSERT_NE(out.find("sasstree_pe_a.sass:2:3: "), std::string::npos);
  ASSERT_NE(out.find("error: oops"), std::string::npos);
  ASSERT_NE(out.find("\n    b: c\n    ^\n"), std::string::npos);
}

TEST(PrintError, ColumnZeroPointsAtFirstNonBlank) {
  const auto src = tmpPath("b.sass");
  { std::ofstream out(src); out << "a\n    !x = 1\n"; }
  const auto out = capture(driver::Diagnostic{src, 2, 0, "bad"}, false);
  ASSERT_NE(out.find(":2:5: "), std::string::npos);
  ASSERT_NE(out.find("\n      ^\n"), std::string::npos);
}

TEST(PrintError, ColorAddsAnsiSequences) {
  const auto src = tmpPath("c.sass");
  { std::ofstream out(src); out << "x\n"; }
  const auto out = capture(driver::Diagnostic{src, 1, 1, "oops"}, true);
  ASSERT_NE(out.find("\x1b[31merror:"), std::string::npos);
  ASSERT_NE(out.find("\x1b[0m"), std::string::npos);
}

TEST(PrintError, LinePastEndHasNoCaret) {
  const auto src = tmpPath("d.sass");
  { std::ofstream out(src); }
  const auto out = capture(driver::Diagnostic{src, 1, 1, "msg"}, false);
  ASSERT_NE(out.find("sasstree_pe_d.sass:1:1:"), std::string::npos);
  ASSERT_EQ(out.find("^\n"), std::string::npos);
}

TEST(PrintError, MissingFilePathPrintsLabelAndMessageOnly) {
  const auto out = capture(driver::Diagnostic{"", 1, 1, "oops"}, false);
  ASSERT_EQ(out.rfind("error: oops", 0), 0U);
}

TEST(PrintError, StartLineMapsToPhysicalLine) {
  const auto src = tmpPath("e.sass");
  { std::ofstream out(src); out << "a\n  b: c\n    d: e\n"; }
  driver::Diagnostic diag{src, 11, 0, "nested"};
  diag.startLine = 10;
  const auto out = capture(diag, false);
  ASSERT_NE(out.find("sasstree_pe_e.sass:11:3: "), std::string::npos);
  ASSERT_NE(out.find("\n    b: c\n    ^\n"), std::string::npos);
}
