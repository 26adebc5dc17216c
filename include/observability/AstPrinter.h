/***
 * Name: sasstree::obs::AstPrinter
 * Purpose: Visitor-based AST pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::Root (or any subtree)
 * Outputs:
 *   - One line per node with its kind, salient fields and `@line` when known.
 * Theory of Operation:
 *   Implements ast::VisitorBase to traverse nodes, collecting a textual
 *   representation with indentation reflecting tree depth. An @else chain is
 *   printed under an "Else:" label of the IfNode it belongs to.
 */
#pragma once

#include <string>
#include <cstddef>
#include <sstream>
#include <vector>
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

namespace sasstree::obs {

class AstPrinter : public ast::VisitorBase {
 public:
  std::string print(const ast::Node& n) {
    ss_.str(""); ss_.clear(); depth_ = 0;
    n.accept(*this);
    return ss_.str();
  }

  void visit(const ast::Root& r) override { line(r, "Root style=" + std::string(config::to_string(r.options.style))); children(r); }
  void visit(const ast::RuleNode& r) override { line(r, "Rule " + join(r.rules)); children(r); }
  void visit(const ast::AttributeNode& a) override {
    const std::string style = a.style == ast::AttributeStyle::Old ? "old" : "new";
    if (a.expr) { line(a, "Attribute " + a.name + " = " + a.expr->inspect() + " (" + style + ")"); }
    else { line(a, "Attribute " + a.name + ": " + a.value + " (" + style + ")"); }
    children(a);
  }
  void visit(const ast::CommentNode& c) override {
    line(c, std::string(c.silent ? "Comment silent " : "Comment ") + c.text);
    depth_++; for (const auto& l : c.lines) { indent(); ss_ << "| " << l << "\n"; } depth_--;
  }
  void visit(const ast::DirectiveNode& d) override { line(d, "Directive " + d.value); children(d); }
  void visit(const ast::VariableNode& v) override { line(v, "Variable !" + v.name + (v.guarded ? " ||= " : " = ") + v.expr->inspect()); }
  void visit(const ast::MixinDefNode& m) override {
    std::string s = "MixinDef " + m.name + "(";
    for (std::size_t i = 0; i < m.args.size(); ++i) {
      if (i != 0) s += ", ";
      s += "!" + m.args[i].name;
      if (m.args[i].defaultValue) s += " = " + m.args[i].defaultValue->inspect();
    }
    line(m, s + ")"); children(m);
  }
  void visit(const ast::MixinNode& m) override {
    std::string s = "Mixin " + m.name + "(";
    for (std::size_t i = 0; i < m.args.size(); ++i) { if (i != 0) s += ", "; s += m.args[i]->inspect(); }
    line(m, s + ")");
  }
  void visit(const ast::IfNode& i) override {
    line(i, i.expr ? "If " + i.expr->inspect() : std::string("Else"));
    children(i);
    if (i.elseNode) { depth_++; indent(); ss_ << "Else:\n"; depth_++; i.elseNode->accept(*this); depth_ -= 2; }
  }
  void visit(const ast::WhileNode& w) override { line(w, "While " + w.expr->inspect()); children(w); }
  void visit(const ast::ForNode& f) override {
    line(f, "For !" + f.var + " from " + f.from->inspect() + (f.inclusive ? " through " : " to ") + f.to->inspect());
    children(f);
  }
  void visit(const ast::DebugNode& d) override { line(d, "Debug " + d.expr->inspect()); }
  void visit(const ast::FileNode& f) override { line(f, "File " + f.filename); }
  void visit(const ast::CssImportNode& c) override { line(c, "CssImport " + c.value); }

 private:
  static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) { if (!out.empty()) out += " "; out += p; }
    return out;
  }
  void children(const ast::Node& n) { depth_++; for (const auto& c : n.children) c->accept(*this); depth_--; }
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  void line(const ast::Node& n, const std::string& s) {
    indent(); ss_ << s;
    if (n.line > 0) ss_ << " @" << n.line;
    ss_ << "\n";
  }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace sasstree::obs
