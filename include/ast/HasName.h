/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace sasstree::ast {

struct HasName {
    std::string name;
};

}
