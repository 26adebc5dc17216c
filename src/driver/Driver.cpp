/***
 * Name: sasstree::driver::Driver::run
 * Purpose: Parse every input file and report trees, logs and metrics.
 */
#include "driver/Driver.h"
#include "ast/GeometrySummary.h"
#include "cli/ColorMode.h"
#include "cli/Options.h"
#include "driver/Diagnostic.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "parser/Parser.h"
#include "sasstree/exceptions/file_read_error.h"
#include "sasstree/exceptions/syntax_error.h"
#include "sasstree/support/fs.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace sasstree::driver {

namespace {

bool resolve_color(const cli::ColorMode mode) {
  if (mode == cli::ColorMode::Always) { return true; }
  if (mode == cli::ColorMode::Never) { return false; }
  constexpr int kStderrFd = 2;
  return (isatty(kStderrFd) != 0) || Driver::use_env_color();
}

// Timestamp prefix for logs
std::string timestamp_prefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
  localtime_r(&tsTime, &tmBuf);
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

std::string lexer_log(const std::vector<lex::LogicalLine>& lines) {
  std::ostringstream oss;
  for (const auto& line : lines) {
    oss << line.index << ":" << line.offset << " depth=" << line.tabs << " | " << line.text << "\n";
  }
  return oss.str();
}

void write_log(const std::string& path, const std::string& contents) {
  std::string err;
  if (!support::WriteFile(path, contents, err)) {
    std::cerr << "sasstree: failed to write log '" << path << "': " << err << "\n";
  }
}

} // namespace

int Driver::run(const cli::Options& opts) { // NOLINT(readability-function-cognitive-complexity)
  if (opts.inputs.empty()) {
    std::cerr << "sasstree: no input files provided\n";
    return 2;
  }
  obs::Metrics metrics;
  const bool color = resolve_color(opts.color);

  // Optional log directory creation
  bool logsEnabled = opts.logLexer || opts.logAst;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  if (logsEnabled) {
    std::error_code errCode;
    namespace fs = std::filesystem;
    if (!fs::exists(logDir, errCode)) {
      if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
        std::cerr << "sasstree: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
        logsEnabled = false;
      }
    }
  }
  const std::string tsPrefix = timestamp_prefix();

  int status = 0;
  ast::GeometrySummary total;
  for (const auto& input : opts.inputs) {
    const parse::Parser parser(cli::ToParserOptions(opts, input));
    const std::string stem = std::filesystem::path(input).stem().string();
    try {
      if (logsEnabled && opts.logLexer) {
        lex::FileInput source(input);
        const auto lines = lex::Tokenizer(opts.line.value_or(1)).tabulate(source);
        write_log(logDir + "/" + tsPrefix + stem + ".lexer.log", lexer_log(lines));
      }
      auto root = parser.parseFile(input, &metrics);
      metrics.incCounter("parse.files");
      metrics.incCounter("parse.top_level_nodes", static_cast<uint64_t>(root->children.size()));

      const auto geom = ast::ComputeGeometry(*root);
      total.nodes += geom.nodes;
      total.maxDepth = std::max(total.maxDepth, geom.maxDepth);

      obs::AstPrinter printer; // NOLINT(misc-const-correctness)
      if (opts.printAst || (logsEnabled && opts.logAst)) {
        const auto out = printer.print(*root);
        if (opts.printAst) { std::cout << "== AST " << input << " ==\n" << out; }
        if (logsEnabled && opts.logAst) { write_log(logDir + "/" + tsPrefix + stem + ".ast.log", out); }
      }
    } catch (const exceptions::SyntaxError& e) {
      const Diagnostic diag{e.filename().empty() ? input : e.filename(), e.line(), 0, e.message(), e.startLine()};
      print_error(diag, color);
      metrics.incCounter("parse.errors");
      status = 1;
    } catch (const exceptions::FileReadError& e) {
      print_error(Diagnostic{input, 0, 0, e.what()}, color);
      metrics.incCounter("parse.errors");
      status = 1;
    }
  }
  metrics.setAstGeometry({total.nodes, total.maxDepth});

  if (opts.metrics) { std::cout << metrics.summaryText(); }
  if (opts.metricsJson) { std::cout << metrics.summaryJson(); }
  return status;
}

} // namespace sasstree::driver
