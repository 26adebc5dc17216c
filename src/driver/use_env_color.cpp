#include "driver/Driver.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace sasstree::driver {
    static bool equals_ci(const std::string_view lhs, const std::string_view rhs) {
        if (lhs.size() != rhs.size()) { return false; }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            const unsigned char lhsCh = static_cast<unsigned char>(lhs[i]);
            const unsigned char rhsCh = static_cast<unsigned char>(rhs[i]);
            if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
        }
        return true;
    }

    static bool is_true_value(const char *strVal) {
        if (strVal == nullptr) { return false; }
        const std::string_view valView{strVal, std::strlen(strVal)};
        return valView == "1" || equals_ci(valView, "true") || equals_ci(valView, "yes") || equals_ci(valView, "on");
    }

    /***
     * Name: sasstree::driver::Driver::use_env_color
     * Purpose: SASSTREE_COLOR=1|true|yes|on forces color when --color=auto.
     */
    bool Driver::use_env_color() {
        return is_true_value(std::getenv("SASSTREE_COLOR"));
    }
} // namespace sasstree::driver
