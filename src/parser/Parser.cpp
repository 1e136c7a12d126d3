/***
 * Name: puretop::parse::Parser (module items, statements, functions, classes)
 * Purpose: Recursive-descent parsing of ECMAScript module structure.
 */
#include "parser/Parser.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "puretop/exceptions/parse_error.h"

namespace puretop::parse {

using TK = lex::TokenKind;

void Parser::NestingGuard::deeper() {
  if (parser_.depth_ >= kMaxNestingDepth) { parser_.fail(parser_.peek(), "nesting too deep"); }
  ++parser_.depth_;
  ++levels_;
}

const lex::Token& Parser::peek(size_t k) const { return ts_.peek(k); }

lex::Token Parser::get() {
  prev_ = ts_.next();
  return prev_;
}

bool Parser::check(const TK tokenKind) const { return peek().kind == tokenKind; }

bool Parser::match(const TK tokenKind) {
  if (peek().kind == tokenKind) { get(); return true; }
  return false;
}

void Parser::fail(const lex::Token& tok, const std::string& msg) const {
  std::string m = msg;
  m += ", got ";
  m += to_string(tok.kind);
  if (!tok.text.empty()) {
    m += " ('";
    m += tok.text;
    m += "')";
  }
  throw exceptions::ParseError(m, tok.line, tok.col);
}

void Parser::expect(const TK tokenKind, const char* msg) {
  if (!match(tokenKind)) { fail(peek(), std::string("expected ") + msg); }
}

bool Parser::isIdent(const char* word, size_t k) const {
  const auto& tok = peek(k);
  return tok.kind == TK::Ident && tok.text == word;
}

void Parser::expectIdent(const char* word) {
  if (!isIdent(word)) { fail(peek(), std::string("expected '") + word + "'"); }
  get();
}

void Parser::consumeSemicolon() {
  if (match(TK::Semicolon)) { return; }
  if (check(TK::RBrace) || check(TK::End) || peek().newlineBefore) { return; }
  fail(peek(), "expected ';'");
}

bool Parser::isIdentifierName(const lex::Token& tok) {
  return tok.kind == TK::Ident || (tok.kind >= TK::Var && tok.kind <= TK::Enum);
}

void Parser::stamp(ast::Node& node, const lex::Token& tok) {
  node.line = tok.line;
  node.col = tok.col;
  node.begin = tok.begin;
  node.file = tok.file;
}

void Parser::stampFrom(ast::Node& node, const ast::Node& first) {
  node.line = first.line;
  node.col = first.col;
  node.begin = first.begin;
  node.file = first.file;
}

void Parser::finish(ast::Node& node) const { node.end = prev_.end; }

std::unique_ptr<ast::Module> Parser::parseModule() {
  auto mod = std::make_unique<ast::Module>();
  mod->file = peek().file;
  mod->line = 1;
  mod->col = 1;
  mod->begin = 0;
  while (!check(TK::End)) {
    mod->body.emplace_back(parseModuleItem());
  }
  mod->end = peek().begin;
  mod->comments = ts_.takeComments();
  return mod;
}

std::unique_ptr<ast::Stmt> Parser::parseModuleItem() {
  if (check(TK::Import) && peek(1).kind != TK::LParen && peek(1).kind != TK::Dot) { return parseImportDecl(); }
  if (check(TK::Export)) { return parseExportDecl(); }
  return parseStatement();
}

std::string Parser::parseModuleSpecifier() {
  if (!check(TK::String)) { fail(peek(), "expected module specifier string"); }
  const auto tok = get();
  return tok.text.substr(1, tok.text.size() - 2);
}

std::string Parser::parseExportName() {
  if (check(TK::String)) {
    const auto tok = get();
    return tok.text.substr(1, tok.text.size() - 2);
  }
  if (!isIdentifierName(peek())) { fail(peek(), "expected export name"); }
  return get().text;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseImportDecl() {
  auto decl = std::make_unique<ast::ImportDecl>();
  stamp(*decl, peek());
  expect(TK::Import, "'import'");
  if (check(TK::String)) {
    decl->source = parseModuleSpecifier();
    consumeSemicolon();
    finish(*decl);
    return decl;
  }
  bool needNamed = true;
  if (check(TK::Ident)) {
    ast::ImportSpecifier spec;
    spec.importKind = ast::ImportKind::Default;
    spec.local = get().text;
    decl->specifiers.push_back(std::move(spec));
    needNamed = match(TK::Comma);
  }
  if (needNamed) {
    if (match(TK::Star)) {
      expectIdent("as");
      if (!check(TK::Ident)) { fail(peek(), "expected namespace binding"); }
      ast::ImportSpecifier spec;
      spec.importKind = ast::ImportKind::Namespace;
      spec.local = get().text;
      decl->specifiers.push_back(std::move(spec));
    } else if (match(TK::LBrace)) {
      while (!match(TK::RBrace)) {
        ast::ImportSpecifier spec;
        spec.importKind = ast::ImportKind::Named;
        spec.imported = parseExportName();
        spec.local = spec.imported;
        if (isIdent("as")) {
          get();
          if (!check(TK::Ident)) { fail(peek(), "expected local binding"); }
          spec.local = get().text;
        }
        decl->specifiers.push_back(std::move(spec));
        if (!check(TK::RBrace)) { expect(TK::Comma, "',' or '}'"); }
      }
    } else {
      fail(peek(), "expected import specifiers");
    }
  }
  expectIdent("from");
  decl->source = parseModuleSpecifier();
  consumeSemicolon();
  finish(*decl);
  return decl;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseExportDecl() {
  const auto exportTok = peek();
  expect(TK::Export, "'export'");
  if (match(TK::Star)) {
    auto all = std::make_unique<ast::ExportAllDecl>();
    stamp(*all, exportTok);
    if (isIdent("as")) {
      get();
      all->exported = parseExportName();
    }
    expectIdent("from");
    all->source = parseModuleSpecifier();
    consumeSemicolon();
    finish(*all);
    return all;
  }
  if (match(TK::Default)) {
    auto def = std::make_unique<ast::ExportDefaultDecl>();
    stamp(*def, exportTok);
    if (check(TK::Function) || (isIdent("async") && peek(1).kind == TK::Function && !peek(1).newlineBefore)) {
      def->declaration = parseFunctionDecl(true);
    } else if (check(TK::Class)) {
      def->declaration = parseClassDecl(true);
    } else {
      def->declaration = parseAssignment();
      consumeSemicolon();
    }
    finish(*def);
    return def;
  }
  auto named = std::make_unique<ast::ExportNamedDecl>();
  stamp(*named, exportTok);
  if (match(TK::LBrace)) {
    while (!match(TK::RBrace)) {
      ast::ExportSpecifier spec;
      spec.local = parseExportName();
      spec.exported = spec.local;
      if (isIdent("as")) {
        get();
        spec.exported = parseExportName();
      }
      named->specifiers.push_back(std::move(spec));
      if (!check(TK::RBrace)) { expect(TK::Comma, "',' or '}'"); }
    }
    if (isIdent("from")) {
      get();
      named->source = parseModuleSpecifier();
    }
    consumeSemicolon();
  } else if (check(TK::Var) || check(TK::Const) || atLexicalDecl()) {
    named->declaration = parseVarDecl();
    consumeSemicolon();
  } else if (check(TK::Function) || (isIdent("async") && peek(1).kind == TK::Function && !peek(1).newlineBefore)) {
    named->declaration = parseFunctionDecl(false);
  } else if (check(TK::Class)) {
    named->declaration = parseClassDecl(false);
  } else {
    fail(peek(), "expected declaration or export list after 'export'");
  }
  finish(*named);
  return named;
}

bool Parser::atLexicalDecl() const {
  if (!isIdent("let")) { return false; }
  const auto kind = peek(1).kind;
  return kind == TK::Ident || kind == TK::LBracket || kind == TK::LBrace;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseStatement() {
  NestingGuard guard(*this);
  guard.deeper();
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::LBrace: return parseBlock();
    case TK::Var:
    case TK::Const: {
      auto decl = parseVarDecl();
      consumeSemicolon();
      finish(*decl);
      return decl;
    }
    case TK::Function: return parseFunctionDecl(false);
    case TK::Class: return parseClassDecl(false);
    case TK::If: return parseIfStmt();
    case TK::For: return parseForStmt();
    case TK::While: return parseWhileStmt();
    case TK::Do: return parseDoWhileStmt();
    case TK::Return: return parseReturnStmt();
    case TK::Throw: return parseThrowStmt();
    case TK::Try: return parseTryStmt();
    case TK::Switch: return parseSwitchStmt();
    case TK::Break:
    case TK::Continue: return parseJumpStmt();
    case TK::Semicolon: {
      auto empty = std::make_unique<ast::EmptyStmt>();
      stamp(*empty, tok);
      get();
      finish(*empty);
      return empty;
    }
    case TK::Debugger: {
      auto dbg = std::make_unique<ast::DebuggerStmt>();
      stamp(*dbg, tok);
      get();
      consumeSemicolon();
      finish(*dbg);
      return dbg;
    }
    case TK::With: fail(tok, "'with' statements are not allowed in module code");
    case TK::Import:
      if (peek(1).kind != TK::LParen && peek(1).kind != TK::Dot) {
        fail(tok, "import declarations may only appear at the top level of a module");
      }
      return parseExprStmt();
    case TK::Export: fail(tok, "export declarations may only appear at the top level of a module");
    case TK::Enum: fail(tok, "'enum' is a reserved word");
    default: break;
  }
  if (atLexicalDecl()) {
    auto decl = parseVarDecl();
    consumeSemicolon();
    finish(*decl);
    return decl;
  }
  if (isIdent("async") && peek(1).kind == TK::Function && !peek(1).newlineBefore) { return parseFunctionDecl(false); }
  if (tok.kind == TK::Ident && peek(1).kind == TK::Colon) { return parseLabeledStmt(); }
  return parseExprStmt();
}

std::unique_ptr<ast::Stmt> Parser::parseExprStmt() {
  auto value = parseExpression();
  auto stmt = std::make_unique<ast::ExprStmt>(std::move(value));
  stampFrom(*stmt, *stmt->value);
  consumeSemicolon();
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::VarDecl> Parser::parseVarDecl() {
  const auto kindTok = get(); // var / let / const
  auto decl = std::make_unique<ast::VarDecl>(kindTok.text);
  stamp(*decl, kindTok);
  do {
    ast::VarDeclarator declarator;
    declarator.target = parseBindingTarget();
    if (match(TK::Equal)) { declarator.init = parseAssignment(); }
    decl->declarations.push_back(std::move(declarator));
  } while (match(TK::Comma));
  finish(*decl);
  return decl;
}

std::unique_ptr<ast::FunctionDecl> Parser::parseFunctionDecl(const bool allowAnonymous) {
  auto fn = std::make_unique<ast::FunctionDecl>();
  stamp(*fn, peek());
  if (isIdent("async")) {
    get();
    fn->isAsync = true;
  }
  expect(TK::Function, "'function'");
  fn->isGenerator = match(TK::Star);
  if (check(TK::Ident)) {
    fn->name = get().text;
  } else if (!allowAnonymous) {
    fail(peek(), "expected function name");
  }
  const bool savedGen = inGenerator_;
  inGenerator_ = fn->isGenerator;
  parseParams(fn->params);
  parseFunctionBody(fn->body);
  inGenerator_ = savedGen;
  finish(*fn);
  return fn;
}

std::unique_ptr<ast::ClassDecl> Parser::parseClassDecl(const bool allowAnonymous) {
  auto cls = std::make_unique<ast::ClassDecl>();
  stamp(*cls, peek());
  expect(TK::Class, "'class'");
  if (check(TK::Ident)) {
    cls->name = get().text;
  } else if (!allowAnonymous) {
    fail(peek(), "expected class name");
  }
  parseClassTail(*cls);
  finish(*cls);
  return cls;
}

std::unique_ptr<ast::BlockStmt> Parser::parseBlock() {
  auto block = std::make_unique<ast::BlockStmt>();
  stamp(*block, peek());
  expect(TK::LBrace, "'{'");
  while (!check(TK::RBrace)) {
    if (check(TK::End)) { fail(peek(), "expected '}'"); }
    block->body.emplace_back(parseStatement());
  }
  get();
  finish(*block);
  return block;
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  auto stmt = std::make_unique<ast::IfStmt>();
  stamp(*stmt, get());
  expect(TK::LParen, "'(' after 'if'");
  stmt->cond = parseExpression();
  expect(TK::RParen, "')'");
  stmt->consequent = parseStatement();
  if (match(TK::Else)) { stmt->alternate = parseStatement(); }
  finish(*stmt);
  return stmt;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseForStmt() {
  const auto forTok = get();
  bool isAwait = false;
  if (isIdent("await")) {
    get();
    isAwait = true;
  }
  expect(TK::LParen, "'(' after 'for'");
  std::unique_ptr<ast::Node> init;
  if (!check(TK::Semicolon)) {
    const bool savedNoIn = noIn_;
    noIn_ = true;
    if (check(TK::Var) || check(TK::Const) || atLexicalDecl()) {
      init = parseVarDecl();
    } else {
      init = parseExpression();
    }
    noIn_ = savedNoIn;
    const bool isOf = isIdent("of");
    if (check(TK::In) || isOf) {
      get();
      auto loop = std::make_unique<ast::ForInStmt>();
      stamp(*loop, forTok);
      loop->loopKind = isOf ? ast::ForInKind::Of : ast::ForInKind::In;
      loop->isAwait = isAwait;
      loop->left = std::move(init);
      loop->right = isOf ? parseAssignment() : parseExpression();
      expect(TK::RParen, "')'");
      loop->body = parseStatement();
      finish(*loop);
      return loop;
    }
  }
  if (isAwait) { fail(peek(), "expected 'of' in 'for await'"); }
  auto loop = std::make_unique<ast::ForStmt>();
  stamp(*loop, forTok);
  loop->init = std::move(init);
  expect(TK::Semicolon, "';'");
  if (!check(TK::Semicolon)) { loop->test = parseExpression(); }
  expect(TK::Semicolon, "';'");
  if (!check(TK::RParen)) { loop->update = parseExpression(); }
  expect(TK::RParen, "')'");
  loop->body = parseStatement();
  finish(*loop);
  return loop;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  auto stmt = std::make_unique<ast::WhileStmt>();
  stamp(*stmt, get());
  expect(TK::LParen, "'(' after 'while'");
  stmt->cond = parseExpression();
  expect(TK::RParen, "')'");
  stmt->body = parseStatement();
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDoWhileStmt() {
  auto stmt = std::make_unique<ast::DoWhileStmt>();
  stamp(*stmt, get());
  stmt->body = parseStatement();
  expect(TK::While, "'while'");
  expect(TK::LParen, "'('");
  stmt->cond = parseExpression();
  expect(TK::RParen, "')'");
  match(TK::Semicolon); // always optional after do-while
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseReturnStmt() {
  const auto retTok = get();
  std::unique_ptr<ast::Expr> value;
  if (!check(TK::Semicolon) && !check(TK::RBrace) && !check(TK::End) && !peek().newlineBefore) {
    value = parseExpression();
  }
  auto stmt = std::make_unique<ast::ReturnStmt>(std::move(value));
  stamp(*stmt, retTok);
  consumeSemicolon();
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseThrowStmt() {
  const auto throwTok = get();
  if (peek().newlineBefore) { fail(peek(), "illegal newline after 'throw'"); }
  auto stmt = std::make_unique<ast::ThrowStmt>(parseExpression());
  stamp(*stmt, throwTok);
  consumeSemicolon();
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  auto stmt = std::make_unique<ast::TryStmt>();
  stamp(*stmt, get());
  stmt->block = parseBlock();
  if (match(TK::Catch)) {
    if (match(TK::LParen)) {
      stmt->param = parseBindingTarget();
      expect(TK::RParen, "')'");
    }
    stmt->handler = parseBlock();
  }
  if (match(TK::Finally)) { stmt->finalizer = parseBlock(); }
  if (!stmt->handler && !stmt->finalizer) { fail(peek(), "expected 'catch' or 'finally'"); }
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseSwitchStmt() {
  auto stmt = std::make_unique<ast::SwitchStmt>();
  stamp(*stmt, get());
  expect(TK::LParen, "'(' after 'switch'");
  stmt->discriminant = parseExpression();
  expect(TK::RParen, "')'");
  expect(TK::LBrace, "'{'");
  bool seenDefault = false;
  while (!match(TK::RBrace)) {
    ast::SwitchCase switchCase;
    if (match(TK::Case)) {
      switchCase.test = parseExpression();
    } else if (check(TK::Default)) {
      if (seenDefault) { fail(peek(), "more than one 'default' clause"); }
      seenDefault = true;
      get();
    } else {
      fail(peek(), "expected 'case' or 'default'");
    }
    expect(TK::Colon, "':'");
    while (!check(TK::Case) && !check(TK::Default) && !check(TK::RBrace)) {
      if (check(TK::End)) { fail(peek(), "expected '}'"); }
      switchCase.body.emplace_back(parseStatement());
    }
    stmt->cases.push_back(std::move(switchCase));
  }
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseJumpStmt() {
  const auto jumpTok = get();
  std::string label;
  if (check(TK::Ident) && !peek().newlineBefore) { label = get().text; }
  std::unique_ptr<ast::Stmt> stmt;
  if (jumpTok.kind == TK::Break) {
    auto brk = std::make_unique<ast::BreakStmt>();
    brk->label = std::move(label);
    stmt = std::move(brk);
  } else {
    auto cont = std::make_unique<ast::ContinueStmt>();
    cont->label = std::move(label);
    stmt = std::move(cont);
  }
  stamp(*stmt, jumpTok);
  consumeSemicolon();
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseLabeledStmt() {
  auto stmt = std::make_unique<ast::LabeledStmt>();
  const auto labelTok = get();
  stamp(*stmt, labelTok);
  stmt->label = labelTok.text;
  expect(TK::Colon, "':'");
  stmt->body = parseStatement();
  finish(*stmt);
  return stmt;
}

void Parser::parseParams(std::vector<std::unique_ptr<ast::Expr>>& out) {
  expect(TK::LParen, "'('");
  while (!match(TK::RParen)) {
    if (check(TK::Ellipsis)) {
      const auto dots = get();
      auto rest = std::make_unique<ast::Spread>(parseBindingTarget());
      stamp(*rest, dots);
      finish(*rest);
      out.emplace_back(std::move(rest));
    } else {
      out.emplace_back(parseBindingElement());
    }
    if (!check(TK::RParen)) { expect(TK::Comma, "',' or ')'"); }
  }
}

void Parser::parseFunctionBody(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  expect(TK::LBrace, "'{'");
  const bool savedNoIn = noIn_;
  noIn_ = false;
  while (!check(TK::RBrace)) {
    if (check(TK::End)) { fail(peek(), "expected '}'"); }
    out.emplace_back(parseStatement());
  }
  get();
  noIn_ = savedNoIn;
}

void Parser::parseClassTail(ast::HasClassBody& cls) {
  if (match(TK::Extends)) { cls.superClass = parseLeftHandSide(); }
  expect(TK::LBrace, "'{'");
  while (!match(TK::RBrace)) {
    if (match(TK::Semicolon)) { continue; }
    if (check(TK::End)) { fail(peek(), "expected '}'"); }
    cls.members.emplace_back(parseClassMember());
  }
}

bool Parser::isPropertyKeyStart(size_t k) const {
  const auto& tok = peek(k);
  return isIdentifierName(tok) || tok.kind == TK::String || tok.kind == TK::Number || tok.kind == TK::BigInt ||
         tok.kind == TK::LBracket || tok.kind == TK::PrivateName;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::ClassMember> Parser::parseClassMember() {
  auto member = std::make_unique<ast::ClassMember>();
  stamp(*member, peek());
  if (isIdent("static") && (isPropertyKeyStart(1) || peek(1).kind == TK::Star || peek(1).kind == TK::LBrace)) {
    get();
    member->isStatic = true;
    if (check(TK::LBrace)) {
      member->memberKind = ast::ClassMemberKind::StaticBlock;
      const bool savedGen = inGenerator_;
      inGenerator_ = false;
      parseFunctionBody(member->body);
      inGenerator_ = savedGen;
      finish(*member);
      return member;
    }
  }
  bool isAsync = false;
  bool isGenerator = false;
  auto kind = ast::ClassMemberKind::Method;
  if (isIdent("async") && (isPropertyKeyStart(1) || peek(1).kind == TK::Star) && !peek(1).newlineBefore) {
    get();
    isAsync = true;
  }
  if (match(TK::Star)) {
    isGenerator = true;
  } else if (!isAsync && (isIdent("get") || isIdent("set")) && isPropertyKeyStart(1)) {
    kind = get().text == "get" ? ast::ClassMemberKind::Getter : ast::ClassMemberKind::Setter;
  }
  const auto keyTok = peek();
  member->key = parsePropertyKey(member->computed);
  if (check(TK::LParen)) {
    if (kind == ast::ClassMemberKind::Method && !member->isStatic && !member->computed && keyTok.kind == TK::Ident &&
        keyTok.text == "constructor") {
      kind = ast::ClassMemberKind::Constructor;
    }
    member->memberKind = kind;
    member->value = parseMethod(isAsync, isGenerator);
  } else {
    if (isAsync || isGenerator || kind != ast::ClassMemberKind::Method) { fail(peek(), "expected '(' after method name"); }
    member->memberKind = ast::ClassMemberKind::Field;
    if (match(TK::Equal)) {
      const bool savedGen = inGenerator_;
      inGenerator_ = false;
      member->value = parseAssignment();
      inGenerator_ = savedGen;
    }
    consumeSemicolon();
  }
  finish(*member);
  return member;
}

std::unique_ptr<ast::FunctionExpr> Parser::parseMethod(const bool isAsync, const bool isGenerator) {
  auto fn = std::make_unique<ast::FunctionExpr>();
  stamp(*fn, peek());
  fn->isAsync = isAsync;
  fn->isGenerator = isGenerator;
  const bool savedGen = inGenerator_;
  inGenerator_ = isGenerator;
  parseParams(fn->params);
  parseFunctionBody(fn->body);
  inGenerator_ = savedGen;
  finish(*fn);
  return fn;
}

std::unique_ptr<ast::Expr> Parser::parsePropertyKey(bool& computed) {
  const auto tok = peek();
  std::unique_ptr<ast::Expr> key;
  computed = false;
  if (tok.kind == TK::LBracket) {
    get();
    computed = true;
    const bool savedNoIn = noIn_;
    noIn_ = false;
    key = parseAssignment();
    noIn_ = savedNoIn;
    expect(TK::RBracket, "']'");
    return key;
  }
  if (tok.kind == TK::String) {
    key = std::make_unique<ast::StringLiteral>(tok.text);
  } else if (tok.kind == TK::Number) {
    key = std::make_unique<ast::NumberLiteral>(tok.text);
  } else if (tok.kind == TK::BigInt) {
    key = std::make_unique<ast::BigIntLiteral>(tok.text);
  } else if (tok.kind == TK::PrivateName) {
    key = std::make_unique<ast::PrivateName>(tok.text.substr(1));
  } else if (isIdentifierName(tok)) {
    key = std::make_unique<ast::Name>(tok.text);
  } else {
    fail(tok, "expected property name");
  }
  get();
  stamp(*key, tok);
  finish(*key);
  return key;
}

} // namespace puretop::parse
