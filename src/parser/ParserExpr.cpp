/***
 * Name: puretop::parse::Parser (expressions)
 * Purpose: Expression grammar: assignment, conditional, binary precedence
 *   climbing, unary/update, call/member chains, `new`, and primaries.
 */
#include "parser/Parser.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace puretop::parse {

using TK = lex::TokenKind;

namespace {

ast::BinaryOperator toBinaryOperator(const TK kind) {
  switch (kind) {
    case TK::Plus: return ast::BinaryOperator::Add;
    case TK::Minus: return ast::BinaryOperator::Sub;
    case TK::Star: return ast::BinaryOperator::Mul;
    case TK::Slash: return ast::BinaryOperator::Div;
    case TK::Percent: return ast::BinaryOperator::Mod;
    case TK::StarStar: return ast::BinaryOperator::Pow;
    case TK::LShift: return ast::BinaryOperator::LShift;
    case TK::RShift: return ast::BinaryOperator::RShift;
    case TK::URShift: return ast::BinaryOperator::URShift;
    case TK::Amp: return ast::BinaryOperator::BitAnd;
    case TK::Pipe: return ast::BinaryOperator::BitOr;
    case TK::Caret: return ast::BinaryOperator::BitXor;
    case TK::EqEq: return ast::BinaryOperator::Eq;
    case TK::NotEq: return ast::BinaryOperator::Ne;
    case TK::EqEqEq: return ast::BinaryOperator::StrictEq;
    case TK::NotEqEq: return ast::BinaryOperator::StrictNe;
    case TK::Lt: return ast::BinaryOperator::Lt;
    case TK::Le: return ast::BinaryOperator::Le;
    case TK::Gt: return ast::BinaryOperator::Gt;
    case TK::Ge: return ast::BinaryOperator::Ge;
    case TK::In: return ast::BinaryOperator::In;
    case TK::Instanceof: return ast::BinaryOperator::InstanceOf;
    case TK::AmpAmp: return ast::BinaryOperator::And;
    case TK::PipePipe: return ast::BinaryOperator::Or;
    default: return ast::BinaryOperator::Nullish;
  }
}

bool endsOperand(const TK kind) {
  switch (kind) {
    case TK::RParen:
    case TK::RBracket:
    case TK::RBrace:
    case TK::Comma:
    case TK::Semicolon:
    case TK::Colon:
    case TK::End:
    case TK::TemplateMiddle:
    case TK::TemplateTail:
      return true;
    default:
      return false;
  }
}

} // namespace

int Parser::binaryPrecedence(const lex::Token& tok) const {
  switch (tok.kind) {
    case TK::QuestionQuestion:
    case TK::PipePipe: return 1;
    case TK::AmpAmp: return 2;
    case TK::Pipe: return 3;
    case TK::Caret: return 4;
    case TK::Amp: return 5;
    case TK::EqEq:
    case TK::NotEq:
    case TK::EqEqEq:
    case TK::NotEqEq: return 6;
    case TK::Lt:
    case TK::Gt:
    case TK::Le:
    case TK::Ge:
    case TK::Instanceof: return 7;
    case TK::In: return noIn_ ? 0 : 7;
    case TK::LShift:
    case TK::RShift:
    case TK::URShift: return 8;
    case TK::Plus:
    case TK::Minus: return 9;
    case TK::Star:
    case TK::Slash:
    case TK::Percent: return 10;
    case TK::StarStar: return 11;
    default: return 0;
  }
}

bool Parser::isAssignOp(const TK kind) {
  switch (kind) {
    case TK::Equal:
    case TK::PlusEqual:
    case TK::MinusEqual:
    case TK::StarEqual:
    case TK::SlashEqual:
    case TK::PercentEqual:
    case TK::StarStarEqual:
    case TK::LShiftEqual:
    case TK::RShiftEqual:
    case TK::URShiftEqual:
    case TK::AmpEqual:
    case TK::PipeEqual:
    case TK::CaretEqual:
    case TK::AmpAmpEqual:
    case TK::PipePipeEqual:
    case TK::QuestionQuestionEqual:
      return true;
    default:
      return false;
  }
}

bool Parser::isValidAssignTarget(const ast::Expr& expr, const bool allowPattern) {
  switch (expr.kind) {
    case ast::NodeKind::Name:
      return true;
    case ast::NodeKind::Member:
      return !static_cast<const ast::Member&>(expr).optional;
    case ast::NodeKind::ParenExpr: {
      const auto& inner = *static_cast<const ast::ParenExpr&>(expr).expr;
      return inner.kind == ast::NodeKind::Name || inner.kind == ast::NodeKind::Member;
    }
    case ast::NodeKind::ObjectLiteral:
    case ast::NodeKind::ArrayLiteral:
      return allowPattern;
    default:
      return false;
  }
}

std::unique_ptr<ast::Expr> Parser::parseExpression() {
  auto first = parseAssignment();
  if (!check(TK::Comma)) { return first; }
  auto seq = std::make_unique<ast::Sequence>();
  stampFrom(*seq, *first);
  seq->exprs.emplace_back(std::move(first));
  while (match(TK::Comma)) { seq->exprs.emplace_back(parseAssignment()); }
  finish(*seq);
  return seq;
}

std::unique_ptr<ast::Expr> Parser::parseAssignment() {
  NestingGuard guard(*this);
  guard.deeper();
  if (isArrowAhead()) { return parseArrow(); }
  if (inGenerator_ && isIdent("yield")) { return parseYield(); }
  auto lhs = parseConditional();
  if (!isAssignOp(peek().kind)) { return lhs; }
  const auto opTok = peek();
  if (!isValidAssignTarget(*lhs, opTok.kind == TK::Equal)) { fail(opTok, "invalid assignment target"); }
  get();
  auto value = parseAssignment();
  auto assign = std::make_unique<ast::Assign>(opTok.text, std::move(lhs), std::move(value));
  stampFrom(*assign, *assign->target);
  finish(*assign);
  return assign;
}

std::unique_ptr<ast::Expr> Parser::parseConditional() {
  auto test = parseBinary(1);
  if (!check(TK::Question)) { return test; }
  get();
  auto cond = std::make_unique<ast::Conditional>();
  stampFrom(*cond, *test);
  cond->test = std::move(test);
  const bool savedNoIn = noIn_;
  noIn_ = false;
  cond->consequent = parseAssignment();
  noIn_ = savedNoIn;
  expect(TK::Colon, "':' in conditional expression");
  cond->alternate = parseAssignment();
  finish(*cond);
  return cond;
}

std::unique_ptr<ast::Expr> Parser::parseBinary(const int minPrec) {
  NestingGuard guard(*this);
  auto lhs = parseUnary();
  for (;;) {
    const int prec = binaryPrecedence(peek());
    if (prec == 0 || prec < minPrec) { break; }
    guard.deeper();
    const auto opTok = get();
    // `**` is right-associative
    auto rhs = opTok.kind == TK::StarStar ? parseBinary(prec) : parseBinary(prec + 1);
    auto bin = std::make_unique<ast::Binary>(toBinaryOperator(opTok.kind), std::move(lhs), std::move(rhs));
    stampFrom(*bin, *bin->lhs);
    finish(*bin);
    lhs = std::move(bin);
  }
  return lhs;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseUnary() {
  NestingGuard guard(*this);
  guard.deeper();
  const auto tok = peek();
  ast::UnaryOperator op{};
  bool isUnary = true;
  switch (tok.kind) {
    case TK::Bang: op = ast::UnaryOperator::Not; break;
    case TK::Tilde: op = ast::UnaryOperator::BitNot; break;
    case TK::Plus: op = ast::UnaryOperator::Plus; break;
    case TK::Minus: op = ast::UnaryOperator::Neg; break;
    case TK::Typeof: op = ast::UnaryOperator::TypeOf; break;
    case TK::Void: op = ast::UnaryOperator::Void; break;
    case TK::Delete: op = ast::UnaryOperator::Delete; break;
    default: isUnary = false; break;
  }
  if (isUnary) {
    get();
    auto unary = std::make_unique<ast::Unary>(op, parseUnary());
    stamp(*unary, tok);
    finish(*unary);
    return unary;
  }
  if (tok.kind == TK::PlusPlus || tok.kind == TK::MinusMinus) {
    get();
    auto operand = parseUnary();
    if (!isValidAssignTarget(*operand, false)) { fail(tok, "invalid update target"); }
    auto update = std::make_unique<ast::Update>(tok.text, true, std::move(operand));
    stamp(*update, tok);
    finish(*update);
    return update;
  }
  if (isIdent("await")) {
    get();
    auto await = std::make_unique<ast::AwaitExpr>(parseUnary());
    stamp(*await, tok);
    finish(*await);
    return await;
  }
  auto expr = parseLeftHandSide();
  // Postfix update is a restricted production: no line terminator before the operator
  if ((check(TK::PlusPlus) || check(TK::MinusMinus)) && !peek().newlineBefore) {
    const auto opTok = peek();
    if (!isValidAssignTarget(*expr, false)) { fail(opTok, "invalid update target"); }
    get();
    auto update = std::make_unique<ast::Update>(opTok.text, false, std::move(expr));
    stampFrom(*update, *update->operand);
    finish(*update);
    return update;
  }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseLeftHandSide() {
  std::unique_ptr<ast::Expr> expr;
  const auto tok = peek();
  if (tok.kind == TK::New) {
    expr = parseNew();
  } else if (tok.kind == TK::Import && peek(1).kind == TK::Dot) {
    get();
    get();
    expectIdent("meta");
    expr = std::make_unique<ast::MetaProperty>("import", "meta");
    stamp(*expr, tok);
    finish(*expr);
  } else if (tok.kind == TK::Import) {
    get();
    auto call = std::make_unique<ast::ImportCall>();
    stamp(*call, tok);
    parseArguments(call->args);
    finish(*call);
    expr = std::move(call);
  } else {
    expr = parsePrimary();
  }
  return parseCallTail(std::move(expr), true);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseCallTail(std::unique_ptr<ast::Expr> expr, const bool allowCall) {
  auto memberName = [this]() -> std::unique_ptr<ast::Expr> {
    const auto nameTok = peek();
    std::unique_ptr<ast::Expr> prop;
    if (nameTok.kind == TK::PrivateName) {
      prop = std::make_unique<ast::PrivateName>(nameTok.text.substr(1));
    } else if (isIdentifierName(nameTok)) {
      prop = std::make_unique<ast::Name>(nameTok.text);
    } else {
      fail(nameTok, "expected property name after '.'");
    }
    get();
    stamp(*prop, nameTok);
    finish(*prop);
    return prop;
  };
  NestingGuard guard(*this);
  for (;;) {
    guard.deeper();
    const auto kind = peek().kind;
    if (kind == TK::Dot) {
      get();
      auto prop = memberName();
      auto member = std::make_unique<ast::Member>(std::move(expr), std::move(prop));
      stampFrom(*member, *member->object);
      finish(*member);
      expr = std::move(member);
    } else if (kind == TK::QuestionDot) {
      if (!allowCall) { fail(peek(), "optional chain is not allowed in 'new' callee"); }
      get();
      if (check(TK::LParen)) {
        auto call = std::make_unique<ast::Call>(std::move(expr));
        call->optional = true;
        stampFrom(*call, *call->callee);
        parseArguments(call->args);
        finish(*call);
        expr = std::move(call);
      } else if (match(TK::LBracket)) {
        const bool savedNoIn = noIn_;
        noIn_ = false;
        auto prop = parseExpression();
        noIn_ = savedNoIn;
        expect(TK::RBracket, "']'");
        auto member = std::make_unique<ast::Member>(std::move(expr), std::move(prop));
        member->computed = true;
        member->optional = true;
        stampFrom(*member, *member->object);
        finish(*member);
        expr = std::move(member);
      } else {
        auto member = std::make_unique<ast::Member>(std::move(expr), memberName());
        member->optional = true;
        stampFrom(*member, *member->object);
        finish(*member);
        expr = std::move(member);
      }
    } else if (kind == TK::LBracket) {
      get();
      const bool savedNoIn = noIn_;
      noIn_ = false;
      auto prop = parseExpression();
      noIn_ = savedNoIn;
      expect(TK::RBracket, "']'");
      auto member = std::make_unique<ast::Member>(std::move(expr), std::move(prop));
      member->computed = true;
      stampFrom(*member, *member->object);
      finish(*member);
      expr = std::move(member);
    } else if (kind == TK::LParen && allowCall) {
      auto call = std::make_unique<ast::Call>(std::move(expr));
      stampFrom(*call, *call->callee);
      parseArguments(call->args);
      finish(*call);
      expr = std::move(call);
    } else if (kind == TK::Template || kind == TK::TemplateHead) {
      auto quasi = parseTemplate();
      auto tagged = std::make_unique<ast::TaggedTemplate>(std::move(expr), std::move(quasi));
      stampFrom(*tagged, *tagged->tag);
      finish(*tagged);
      expr = std::move(tagged);
    } else {
      break;
    }
  }
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseNew() {
  NestingGuard guard(*this);
  guard.deeper();
  const auto newTok = get();
  if (match(TK::Dot)) {
    expectIdent("target");
    auto meta = std::make_unique<ast::MetaProperty>("new", "target");
    stamp(*meta, newTok);
    finish(*meta);
    return meta;
  }
  std::unique_ptr<ast::Expr> callee;
  if (check(TK::New)) {
    callee = parseNew();
  } else if (check(TK::Import)) {
    fail(peek(), "cannot use 'new' with 'import'");
  } else {
    callee = parsePrimary();
  }
  callee = parseCallTail(std::move(callee), false);
  auto node = std::make_unique<ast::NewExpr>(std::move(callee));
  stamp(*node, newTok);
  if (check(TK::LParen)) {
    node->hasArgList = true;
    parseArguments(node->args);
  }
  finish(*node);
  return node;
}

void Parser::parseArguments(std::vector<std::unique_ptr<ast::Expr>>& out) {
  expect(TK::LParen, "'('");
  const bool savedNoIn = noIn_;
  noIn_ = false;
  while (!match(TK::RParen)) {
    if (check(TK::Ellipsis)) {
      const auto dots = get();
      auto spread = std::make_unique<ast::Spread>(parseAssignment());
      stamp(*spread, dots);
      finish(*spread);
      out.emplace_back(std::move(spread));
    } else {
      out.emplace_back(parseAssignment());
    }
    if (!check(TK::RParen)) { expect(TK::Comma, "',' or ')' in argument list"); }
  }
  noIn_ = savedNoIn;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity,readability-function-size)
std::unique_ptr<ast::Expr> Parser::parsePrimary() {
  const auto tok = peek();
  std::unique_ptr<ast::Expr> expr;
  switch (tok.kind) {
    case TK::Ident:
      if (tok.text == "async" && peek(1).kind == TK::Function && !peek(1).newlineBefore) { return parseFunctionExpr(); }
      expr = std::make_unique<ast::Name>(tok.text);
      break;
    case TK::PrivateName:
      // Only valid as the left operand of `in`
      if (peek(1).kind != TK::In) { fail(tok, "unexpected private name"); }
      expr = std::make_unique<ast::PrivateName>(tok.text.substr(1));
      break;
    case TK::Number: expr = std::make_unique<ast::NumberLiteral>(tok.text); break;
    case TK::BigInt: expr = std::make_unique<ast::BigIntLiteral>(tok.text); break;
    case TK::String: expr = std::make_unique<ast::StringLiteral>(tok.text); break;
    case TK::True: expr = std::make_unique<ast::BooleanLiteral>(true); break;
    case TK::False: expr = std::make_unique<ast::BooleanLiteral>(false); break;
    case TK::Null: expr = std::make_unique<ast::NullLiteral>(); break;
    case TK::This: expr = std::make_unique<ast::ThisExpr>(); break;
    case TK::Super:
      if (peek(1).kind != TK::LParen && peek(1).kind != TK::Dot && peek(1).kind != TK::LBracket) {
        fail(peek(1), "expected '(', '.' or '[' after 'super'");
      }
      expr = std::make_unique<ast::SuperExpr>();
      break;
    case TK::RegExp: {
      const size_t slash = tok.text.rfind('/');
      expr = std::make_unique<ast::RegExpLiteral>(tok.text.substr(1, slash - 1), tok.text.substr(slash + 1));
      break;
    }
    case TK::Template:
    case TK::TemplateHead: return parseTemplate();
    case TK::LParen: {
      get();
      const bool savedNoIn = noIn_;
      noIn_ = false;
      auto inner = parseExpression();
      noIn_ = savedNoIn;
      expect(TK::RParen, "')'");
      auto paren = std::make_unique<ast::ParenExpr>(std::move(inner));
      stamp(*paren, tok);
      finish(*paren);
      return paren;
    }
    case TK::LBracket: return parseArrayLiteral();
    case TK::LBrace: return parseObjectLiteral();
    case TK::Function: return parseFunctionExpr();
    case TK::Class: return parseClassExpr();
    default:
      fail(tok, "expected expression");
  }
  get();
  stamp(*expr, tok);
  finish(*expr);
  return expr;
}

std::unique_ptr<ast::Expr> Parser::parseArrayLiteral() {
  auto arr = std::make_unique<ast::ArrayLiteral>();
  stamp(*arr, get());
  const bool savedNoIn = noIn_;
  noIn_ = false;
  while (!match(TK::RBracket)) {
    if (match(TK::Comma)) {
      arr->elements.emplace_back(nullptr); // hole
      continue;
    }
    if (check(TK::Ellipsis)) {
      const auto dots = get();
      auto spread = std::make_unique<ast::Spread>(parseAssignment());
      stamp(*spread, dots);
      finish(*spread);
      arr->elements.emplace_back(std::move(spread));
    } else {
      arr->elements.emplace_back(parseAssignment());
    }
    if (!check(TK::RBracket)) { expect(TK::Comma, "',' or ']'"); }
  }
  noIn_ = savedNoIn;
  finish(*arr);
  return arr;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseObjectLiteral() {
  auto obj = std::make_unique<ast::ObjectLiteral>();
  stamp(*obj, get());
  const bool savedNoIn = noIn_;
  noIn_ = false;
  while (!match(TK::RBrace)) {
    auto prop = std::make_unique<ast::Property>();
    stamp(*prop, peek());
    if (match(TK::Ellipsis)) {
      prop->propKind = ast::PropertyKind::Spread;
      prop->value = parseAssignment();
    } else {
      bool isAsync = false;
      bool isGenerator = false;
      auto kind = ast::PropertyKind::Init;
      if (isIdent("async") && (isPropertyKeyStart(1) || peek(1).kind == TK::Star) && !peek(1).newlineBefore) {
        get();
        isAsync = true;
      }
      if (match(TK::Star)) {
        isGenerator = true;
      } else if (!isAsync && (isIdent("get") || isIdent("set")) && isPropertyKeyStart(1)) {
        kind = get().text == "get" ? ast::PropertyKind::Getter : ast::PropertyKind::Setter;
      }
      const auto keyTok = peek();
      prop->key = parsePropertyKey(prop->computed);
      if (check(TK::LParen)) {
        prop->propKind = kind == ast::PropertyKind::Init ? ast::PropertyKind::Method : kind;
        prop->value = parseMethod(isAsync, isGenerator);
      } else if (isAsync || isGenerator || kind != ast::PropertyKind::Init) {
        fail(peek(), "expected '(' after method name");
      } else if (match(TK::Colon)) {
        prop->value = parseAssignment();
      } else if (keyTok.kind == TK::Ident && !prop->computed) {
        prop->propKind = ast::PropertyKind::Shorthand;
        std::unique_ptr<ast::Expr> value = std::make_unique<ast::Name>(keyTok.text);
        stamp(*value, keyTok);
        value->end = keyTok.end;
        if (match(TK::Equal)) {
          // Shorthand default, only meaningful inside a destructuring pattern
          auto init = parseAssignment();
          auto assign = std::make_unique<ast::Assign>("=", std::move(value), std::move(init));
          stampFrom(*assign, *assign->target);
          finish(*assign);
          value = std::move(assign);
        }
        prop->value = std::move(value);
      } else {
        fail(peek(), "expected ':' after property name");
      }
    }
    finish(*prop);
    obj->properties.emplace_back(std::move(prop));
    if (!check(TK::RBrace)) { expect(TK::Comma, "',' or '}'"); }
  }
  noIn_ = savedNoIn;
  finish(*obj);
  return obj;
}

std::unique_ptr<ast::TemplateLiteral> Parser::parseTemplate() {
  auto tpl = std::make_unique<ast::TemplateLiteral>();
  const auto first = get();
  stamp(*tpl, first);
  if (first.kind == TK::Template) {
    tpl->quasis.push_back(first.text.substr(1, first.text.size() - 2));
    finish(*tpl);
    return tpl;
  }
  tpl->quasis.push_back(first.text.substr(1, first.text.size() - 3));
  const bool savedNoIn = noIn_;
  noIn_ = false;
  for (;;) {
    tpl->exprs.emplace_back(parseExpression());
    const auto part = peek();
    if (part.kind == TK::TemplateMiddle) {
      get();
      tpl->quasis.push_back(part.text.substr(1, part.text.size() - 3));
      continue;
    }
    if (part.kind == TK::TemplateTail) {
      get();
      tpl->quasis.push_back(part.text.substr(1, part.text.size() - 2));
      break;
    }
    fail(part, "expected '}' to close template substitution");
  }
  noIn_ = savedNoIn;
  finish(*tpl);
  return tpl;
}

std::unique_ptr<ast::Expr> Parser::parseFunctionExpr() {
  auto fn = std::make_unique<ast::FunctionExpr>();
  stamp(*fn, peek());
  if (isIdent("async")) {
    get();
    fn->isAsync = true;
  }
  expect(TK::Function, "'function'");
  fn->isGenerator = match(TK::Star);
  if (check(TK::Ident)) { fn->name = get().text; }
  const bool savedGen = inGenerator_;
  inGenerator_ = fn->isGenerator;
  parseParams(fn->params);
  parseFunctionBody(fn->body);
  inGenerator_ = savedGen;
  finish(*fn);
  return fn;
}

std::unique_ptr<ast::Expr> Parser::parseClassExpr() {
  auto cls = std::make_unique<ast::ClassExpr>();
  stamp(*cls, get());
  if (check(TK::Ident)) { cls->name = get().text; }
  parseClassTail(*cls);
  finish(*cls);
  return cls;
}

size_t Parser::matchingParen(const size_t openAt) const {
  int depth = 0;
  for (size_t k = openAt;; ++k) {
    const auto kind = peek(k).kind;
    if (kind == TK::End) { return 0; }
    if (kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace) { ++depth; }
    if (kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace) {
      --depth;
      if (depth == 0) { return kind == TK::RParen ? k : 0; }
    }
  }
}

bool Parser::isArrowAhead() const {
  const auto& tok = peek();
  auto arrowAt = [this](size_t k) { return peek(k).kind == TK::Arrow && !peek(k).newlineBefore; };
  if (tok.kind == TK::Ident) {
    if (arrowAt(1)) { return true; }
    if (tok.text == "async" && !peek(1).newlineBefore) {
      if (peek(1).kind == TK::Ident && arrowAt(2)) { return true; }
      if (peek(1).kind == TK::LParen) {
        const size_t close = matchingParen(1);
        return close != 0 && arrowAt(close + 1);
      }
    }
    return false;
  }
  if (tok.kind == TK::LParen) {
    const size_t close = matchingParen(0);
    return close != 0 && arrowAt(close + 1);
  }
  return false;
}

std::unique_ptr<ast::Expr> Parser::parseArrow() {
  auto arrow = std::make_unique<ast::ArrowFunction>();
  stamp(*arrow, peek());
  if (isIdent("async") && peek(1).kind != TK::Arrow) {
    get();
    arrow->isAsync = true;
  }
  if (check(TK::LParen)) {
    parseParams(arrow->params);
  } else {
    const auto paramTok = get();
    auto param = std::make_unique<ast::Name>(paramTok.text);
    stamp(*param, paramTok);
    finish(*param);
    arrow->params.emplace_back(std::move(param));
  }
  expect(TK::Arrow, "'=>'");
  const bool savedGen = inGenerator_;
  inGenerator_ = false;
  if (check(TK::LBrace)) {
    parseFunctionBody(arrow->body);
  } else {
    arrow->exprBody = parseAssignment();
  }
  inGenerator_ = savedGen;
  finish(*arrow);
  return arrow;
}

std::unique_ptr<ast::Expr> Parser::parseYield() {
  auto yield = std::make_unique<ast::YieldExpr>();
  stamp(*yield, get());
  if (!peek().newlineBefore) {
    yield->delegate = match(TK::Star);
    if (yield->delegate || !endsOperand(peek().kind)) { yield->argument = parseAssignment(); }
  }
  finish(*yield);
  return yield;
}

std::unique_ptr<ast::Expr> Parser::parseBindingTarget() {
  const auto tok = peek();
  if (tok.kind == TK::LBracket) { return parseArrayLiteral(); }
  if (tok.kind == TK::LBrace) { return parseObjectLiteral(); }
  if (tok.kind != TK::Ident) { fail(tok, "expected binding identifier or pattern"); }
  get();
  auto name = std::make_unique<ast::Name>(tok.text);
  stamp(*name, tok);
  finish(*name);
  return name;
}

std::unique_ptr<ast::Expr> Parser::parseBindingElement() {
  auto target = parseBindingTarget();
  if (!check(TK::Equal)) { return target; }
  get();
  auto init = parseAssignment();
  auto assign = std::make_unique<ast::Assign>("=", std::move(target), std::move(init));
  stampFrom(*assign, *assign->target);
  finish(*assign);
  return assign;
}

} // namespace puretop::parse
