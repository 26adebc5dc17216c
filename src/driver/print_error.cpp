/***
 * Name: sasstree::driver::Driver::print_error
 * Purpose: Render a diagnostic as `file:line:col: error: message` followed by
 *   the offending source line and a caret.
 */
#include "driver/Driver.h"
#include "driver/Diagnostic.h"
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace sasstree::driver {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static std::optional<std::string> read_source_line(const Diagnostic &diag) {
        // Physical line in the file; reported numbers start at diag.startLine
        const int physical = diag.line - (diag.startLine - 1);
        if (diag.file.empty() || physical <= 0) { return std::nullopt; }
        std::ifstream input(diag.file);
        if (!input) { return std::nullopt; }
        std::string lineStr;
        int curLine = 0;
        while (curLine < physical && std::getline(input, lineStr)) { ++curLine; }
        if (curLine != physical) { return std::nullopt; }
        if (!lineStr.empty() && lineStr.back() == '\r') { lineStr.pop_back(); }
        return lineStr;
    }

    static int effective_column(const Diagnostic &diag, const std::optional<std::string> &source) {
        if (diag.col > 0 || !source) { return diag.col; }
        const auto start = source->find_first_not_of(" \t");
        return start == std::string::npos ? 1 : static_cast<int>(start) + 1;
    }

    static void print_header(const Diagnostic &diag, const int col, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { std::cerr << kBold; }
        std::cerr << diag.file;
        if (diag.line > 0) { std::cerr << ":" << diag.line; }
        if (diag.line > 0 && col > 0) { std::cerr << ":" << col; }
        std::cerr << ": ";
        if (color) { std::cerr << kReset; }
    }

    static void print_label(const bool color) {
        if (color) {
            std::cerr << kRed << "error: " << kReset;
        } else { std::cerr << "error: "; }
    }

    static void print_source_with_caret(const std::optional<std::string> &source, const int col) {
        if (!source || col <= 0) { return; }
        std::cerr << "  " << *source << "\n  ";
        for (int i = 1; i < col; ++i) { std::cerr << ' '; }
        std::cerr << "^\n";
    }

    void Driver::print_error(const Diagnostic &diag, const bool color) {
        const auto source = read_source_line(diag);
        const int col = effective_column(diag, source);
        print_header(diag, col, color);
        print_label(color);
        std::cerr << diag.message << "\n";
        print_source_with_caret(source, col);
    }
} // namespace sasstree::driver
