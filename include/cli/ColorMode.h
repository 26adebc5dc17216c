#pragma once

namespace sasstree::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace sasstree::cli
