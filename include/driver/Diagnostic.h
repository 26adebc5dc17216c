#pragma once

#include <string>

namespace sasstree::driver {

// One user-facing error. col 0 means "point at the start of the line's text".
// `line` is the reported line number; the source was numbered from `startLine`.
struct Diagnostic {
    std::string file;
    int line{0};
    int col{0};
    std::string message;
    int startLine{1};
};

} // namespace sasstree::driver
