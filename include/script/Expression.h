/***
 * Name: sasstree::script::Expression
 * Purpose: Opaque parsed expression handed to the evaluation stage.
 * Theory of Operation: The classifier never looks inside an expression; it
 *   only stores what the ExpressionParser returns. The base keeps the source
 *   text and where it came from so that evaluators can report errors.
 */
#pragma once

#include <string>
#include <utility>

namespace sasstree::script {

struct Expression {
    std::string source;
    int line{0};
    int offset{0};
    std::string file{};

    Expression(std::string src, const int ln, const int off, std::string f)
        : source(std::move(src)), line(ln), offset(off), file(std::move(f)) {}
    virtual ~Expression() = default;

    virtual std::string inspect() const { return source; }
};

} // namespace sasstree::script
