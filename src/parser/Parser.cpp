/***
 * Name: sasstree::parse::Parser (impl)
 * Purpose: Wire tokenizer, structurer and assembler; attach error metadata.
 */
#include "parser/Parser.h"

#include <utility>
#include <vector>

#include "lexer/Lexer.h"
#include "observability/Metrics.h"
#include "parser/Assembler.h"
#include "parser/TreeStructurer.h"
#include "sasstree/exceptions/syntax_error.h"
#include "script/TextExpressionParser.h"

namespace sasstree::parse {

namespace {

// Times one stage when metrics are enabled
class StageTimer {
 public:
  StageTimer(obs::Metrics* metrics, const char* name) : metrics_(metrics), name_(name) {
    if (metrics_ != nullptr) { metrics_->start(name_); }
  }
  ~StageTimer() {
    if (metrics_ != nullptr) { metrics_->stop(name_); }
  }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

 private:
  obs::Metrics* metrics_;
  const char* name_;
};

} // namespace

Parser::Parser(config::Options options)
  : Parser(std::move(options), std::make_shared<script::TextExpressionParser>(),
           std::make_shared<support::FileImportResolver>()) {}

Parser::Parser(config::Options options, std::shared_ptr<const script::ExpressionParser> expressions,
               std::shared_ptr<const support::ImportResolver> imports)
  : options_(std::move(options)), expressions_(std::move(expressions)), imports_(std::move(imports)) {}

std::unique_ptr<ast::Root> Parser::parseDocument(const std::string& text, obs::Metrics* metrics) const {
  lex::StringInput input(text, options_.filename.value_or(""));
  return parse(input, metrics);
}

std::unique_ptr<ast::Root> Parser::parseFile(const std::string& path, obs::Metrics* metrics) const {
  std::unique_ptr<lex::FileInput> input;
  {
    const StageTimer timer(metrics, "Read");
    input = std::make_unique<lex::FileInput>(path);
  }
  if (options_.filename) { return parse(*input, metrics); }
  config::Options withName = options_;
  withName.filename = path;
  const Parser named(std::move(withName), expressions_, imports_);
  return named.parse(*input, metrics);
}

std::unique_ptr<ast::Root> Parser::parse(lex::InputSource& input, obs::Metrics* metrics) const {
  try {
    std::vector<lex::LogicalLine> lines;
    {
      const StageTimer timer(metrics, "Tokenize");
      lines = lex::Tokenizer(options_.line.value_or(1)).tabulate(input);
    }
    if (metrics != nullptr) { metrics->setCounter("lines", lines.size()); }

    std::vector<lex::LogicalLine> tree;
    {
      const StageTimer timer(metrics, "Structure");
      tree = StructureLines(std::move(lines));
    }

    auto root = std::make_unique<ast::Root>();
    root->options = options_;
    root->file = input.name();
    {
      const StageTimer timer(metrics, "Classify");
      const ParseContext ctx{options_, *expressions_, *imports_};
      AppendChildren(ctx, *root, tree, true);
    }
    return root;
  } catch (exceptions::SyntaxError& e) {
    e.addMetadata(options_.filename.value_or(""), options_.line.value_or(1));
    throw;
  }
}

} // namespace sasstree::parse
