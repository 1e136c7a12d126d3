#include "driver/Driver.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

extern "C" long write(int, const void *, unsigned long);

namespace puretop {
    static void write_str(const char *str) {
        if (str == nullptr) { return; }
        const auto len = std::strlen(str);
        (void) write(2, str, static_cast<unsigned long>(len));
    }

    static void write_str(const std::string_view strView) {
        (void) write(2, strView.data(), static_cast<unsigned long>(strView.size()));
    }

    static void write_int(const int value) {
        const auto str = std::to_string(value);
        (void) write(2, str.c_str(), static_cast<unsigned long>(str.size()));
    }

    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kGreen = "\033[32m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const Diagnostic &diag, const bool color) {
        if (diag.file.empty()) {
            write_str("puretop: ");
            return;
        }
        if (color) { write_str(kBold); }
        write_str(diag.file);
        if (diag.line > 0) {
            write_str(":");
            write_int(diag.line);
            write_str(":");
            write_int(diag.col);
        }
        write_str(": ");
        if (color) { write_str(kReset); }
    }

    static void print_label(const bool color) {
        if (color) {
            write_str(kRed);
            write_str("error: ");
            write_str(kReset);
        } else { write_str("error: "); }
    }

    // Up to `context` lines before the offending line, the line itself and a caret
    static void print_source_with_caret(const Diagnostic &diag, const bool color, const int context) {
        if (diag.file.empty() || diag.line <= 0 || diag.col <= 0) { return; }
        std::ifstream input(diag.file, std::ios::binary);
        if (!input) { return; }
        const int first = std::max(1, diag.line - std::max(context, 0));
        std::vector<std::string> lines;
        std::string lineStr;
        int curLine = 1;
        while (curLine <= diag.line && std::getline(input, lineStr)) {
            if (!lineStr.empty() && lineStr.back() == '\r') { lineStr.pop_back(); }
            if (curLine >= first) { lines.push_back(lineStr); }
            ++curLine;
        }
        if (curLine <= diag.line) { return; }
        for (const auto &text : lines) {
            write_str("  ");
            write_str(text);
            write_str("\n");
        }
        write_str("  ");
        for (int i = 1; i < diag.col; ++i) { write_str(" "); }
        if (color) { write_str(kGreen); }
        write_str("^");
        if (color) { write_str(kReset); }
        write_str("\n");
    }

    void Driver::print_error(const Diagnostic &diag, const bool color, const int context) {
        print_header(diag, color);
        print_label(color);
        write_str(diag.message);
        write_str("\n");
        print_source_with_caret(diag, color, context);
    }
} // namespace puretop
