/**
 * Name: sasstree::lex::StringInput
 * Purpose: String-backed input source implementation.
 * Theory of Operation: Line endings are normalized to \n on construction.
 */
#pragma once

#include <istream>
#include <memory>
#include <string>
#include "lexer/InputSource.h"

namespace sasstree::lex {

class StringInput : public InputSource {
public:
    StringInput(const std::string& text, std::string name);

    bool getline(std::string& out) override;

    const std::string& name() const override { return name_; }

private:
    std::string name_{};
    std::unique_ptr<std::istream> in_{nullptr};
};

} // namespace sasstree::lex
