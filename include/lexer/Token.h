/**
 * Name: puretop::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <cstddef>
#include <string>
#include "lexer/TokenKind.h"

namespace puretop::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // exact source text of the token
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based byte column at token start
    std::size_t begin{0}; // byte offset of the first character
    std::size_t end{0};   // byte offset one past the last character
    bool newlineBefore{false}; // a line terminator separates this token from the previous one
};

} // namespace puretop::lex
