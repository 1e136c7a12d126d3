/**
 * Name: puretop::lex::ITokenStream
 * Purpose: Abstract interface for token streams.
 */
#pragma once

#include <cstddef>
#include "ast/SourceComments.h"
#include "lexer/Token.h"

namespace puretop::lex {

class ITokenStream {
public:
    virtual ~ITokenStream() = default;

    virtual const Token& peek(size_t k = 0) = 0; // lookahead k (0=current)
    virtual Token next() = 0; // consume next token
    // Comments seen while tokenizing, keyed by the offset of the token they precede
    virtual ast::SourceComments takeComments() = 0;
};

} // namespace puretop::lex
