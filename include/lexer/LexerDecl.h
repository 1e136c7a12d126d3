/**
 * Name: puretop::lex::Lexer
 * Purpose: Tokenize one ECMAScript module source.
 * Theory of Operation:
 *   The whole input is tokenized eagerly on first access. Comments are not
 *   tokens; they are collected into an ast::SourceComments keyed by the byte
 *   offset of the following token. Regular expression literals are recognized
 *   from the previous significant token, and template literals track the
 *   brace depth of each open `${` substitution.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "ast/SourceComments.h"
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"

namespace puretop::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    // One input per lexer; a later push replaces the earlier one
    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    ast::SourceComments takeComments() override;

    std::vector<Token> tokens();

    const std::string& source();

private:
    // Eager tokenization buffer to simplify streaming semantics safely
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};
    ast::SourceComments comments_{};

    std::unique_ptr<InputSource> src_{};
    std::string text_{};
    std::string name_{};

    struct State {
        size_t index{0};
        int lineNo{1};
        size_t lineStart{0};
        bool sawNewline{false};
        std::vector<ast::Comment> pending{};
        std::vector<int> templateBraces{}; // brace depth per open substitution
        int braceDepth{0};
    };

    // helpers
    void buildAll();
    Token scanOne(State& state);
    void skipTrivia(State& state);
    Token scanIdentifierOrKeyword(State& state, size_t start, bool isPrivate);
    Token scanNumber(State& state, size_t start);
    Token scanString(State& state, size_t start);
    Token scanTemplatePart(State& state, size_t start, bool head);
    Token scanRegExp(State& state, size_t start);
    Token scanPunctuator(State& state, size_t start);
    bool regexAllowed() const;
    size_t lineTerminatorAt(size_t at) const;
    void consumeLineTerminator(State& state);
    Token makeToken(const State& state, TokenKind kind, size_t start, int line, int col) const;
    [[noreturn]] void fail(int line, int col, const std::string& msg) const;
};

} // namespace puretop::lex
