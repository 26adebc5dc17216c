#pragma once

#include <string>

namespace sasstree::cli {

    std::string Usage();

} // namespace sasstree::cli
