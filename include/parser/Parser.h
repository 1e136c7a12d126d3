/***
 * Name: puretop::parse::Parser
 * Purpose: Build an ECMAScript module AST from tokens.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 * Outputs:
 *   - Module AST whose nodes carry byte ranges into the source, plus the
 *     source comments collected by the lexer.
 * Theory of Operation:
 *   Recursive descent over ITokenStream. Statements and module items live in
 *   Parser.cpp, expressions in ParserExpr.cpp. Binary operators use precedence
 *   climbing; arrow functions are recognized by scanning ahead to the matching
 *   `)` and looking for `=>`. Destructuring patterns reuse the array and object
 *   literal nodes. Automatic semicolon insertion accepts a missing `;` before
 *   `}`, at end of input or after a line terminator. Syntax errors throw
 *   exceptions::ParseError at the offending token. Statements, assignment and
 *   unary expressions, `new` and each link of a member/call or binary chain
 *   count one nesting level; past kMaxNestingDepth levels the parser throws
 *   ParseError("nesting too deep") so that the AST depth stays bounded.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace puretop::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

 private:
  lex::ITokenStream& ts_;
  lex::Token prev_{};       // last consumed token
  bool inGenerator_{false}; // `yield` is an operator
  bool noIn_{false};        // `in` is not a binary operator (for-statement head)
  size_t depth_{0};         // nesting levels currently held by NestingGuards

  static constexpr size_t kMaxNestingDepth = 2000;

  // Holds nesting levels for one parse routine and releases them on scope exit
  class NestingGuard {
   public:
    explicit NestingGuard(Parser& parser) : parser_(parser) {}
    ~NestingGuard() { parser_.depth_ -= levels_; }
    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;
    // Takes one more level; throws exceptions::ParseError past kMaxNestingDepth
    void deeper();

   private:
    Parser& parser_;
    size_t levels_{0};
  };

  const lex::Token& peek(size_t k = 0) const;
  lex::Token get();
  bool check(lex::TokenKind tokenKind) const;
  bool match(lex::TokenKind tokenKind);
  void expect(lex::TokenKind tokenKind, const char* msg);
  bool isIdent(const char* word, size_t k = 0) const; // contextual keyword check
  void expectIdent(const char* word);
  void consumeSemicolon();
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg) const;

  static bool isIdentifierName(const lex::Token& tok);
  static void stamp(ast::Node& node, const lex::Token& tok);
  static void stampFrom(ast::Node& node, const ast::Node& first);
  void finish(ast::Node& node) const;

  // Module items and statements (Parser.cpp)
  std::unique_ptr<ast::Stmt> parseModuleItem();
  std::unique_ptr<ast::Stmt> parseImportDecl();
  std::unique_ptr<ast::Stmt> parseExportDecl();
  std::string parseModuleSpecifier();
  std::string parseExportName();
  std::unique_ptr<ast::Stmt> parseStatement();
  bool atLexicalDecl() const;
  std::unique_ptr<ast::VarDecl> parseVarDecl();
  std::unique_ptr<ast::FunctionDecl> parseFunctionDecl(bool allowAnonymous);
  std::unique_ptr<ast::ClassDecl> parseClassDecl(bool allowAnonymous);
  std::unique_ptr<ast::BlockStmt> parseBlock();
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseForStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseDoWhileStmt();
  std::unique_ptr<ast::Stmt> parseReturnStmt();
  std::unique_ptr<ast::Stmt> parseThrowStmt();
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseSwitchStmt();
  std::unique_ptr<ast::Stmt> parseJumpStmt();
  std::unique_ptr<ast::Stmt> parseLabeledStmt();
  std::unique_ptr<ast::Stmt> parseExprStmt();

  // Functions and classes
  void parseParams(std::vector<std::unique_ptr<ast::Expr>>& out);
  void parseFunctionBody(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseClassTail(ast::HasClassBody& cls);
  std::unique_ptr<ast::ClassMember> parseClassMember();
  std::unique_ptr<ast::FunctionExpr> parseMethod(bool isAsync, bool isGenerator);
  std::unique_ptr<ast::Expr> parsePropertyKey(bool& computed);
  bool isPropertyKeyStart(size_t k) const;

  // Expressions (ParserExpr.cpp)
  std::unique_ptr<ast::Expr> parseExpression();
  std::unique_ptr<ast::Expr> parseAssignment();
  std::unique_ptr<ast::Expr> parseConditional();
  std::unique_ptr<ast::Expr> parseBinary(int minPrec);
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parseLeftHandSide();
  std::unique_ptr<ast::Expr> parseCallTail(std::unique_ptr<ast::Expr> expr, bool allowCall);
  std::unique_ptr<ast::Expr> parseNew();
  std::unique_ptr<ast::Expr> parsePrimary();
  std::unique_ptr<ast::Expr> parseArrayLiteral();
  std::unique_ptr<ast::Expr> parseObjectLiteral();
  std::unique_ptr<ast::TemplateLiteral> parseTemplate();
  std::unique_ptr<ast::Expr> parseFunctionExpr();
  std::unique_ptr<ast::Expr> parseClassExpr();
  std::unique_ptr<ast::Expr> parseArrow();
  std::unique_ptr<ast::Expr> parseYield();
  std::unique_ptr<ast::Expr> parseBindingTarget();
  std::unique_ptr<ast::Expr> parseBindingElement();
  void parseArguments(std::vector<std::unique_ptr<ast::Expr>>& out);
  bool isArrowAhead() const;
  size_t matchingParen(size_t openAt) const; // lookahead index of the `)` closing peek(openAt)
  int binaryPrecedence(const lex::Token& tok) const;
  static bool isAssignOp(lex::TokenKind kind);
  static bool isValidAssignTarget(const ast::Expr& expr, bool allowPattern);
};

} // namespace puretop::parse
