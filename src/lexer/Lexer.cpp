/***
 * Name: puretop::lex::Lexer
 * Purpose: Tokenize an ECMAScript module source into a single token stream.
 */
#include "lexer/Lexer.h"
#include <unicode/uchar.h>
#include <unicode/umachine.h>
#include <unicode/utf8.h>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "puretop/exceptions/file_read_error.h"
#include "puretop/exceptions/parse_error.h"
#include "puretop/support/fs.h"

namespace puretop::lex {

namespace {

struct Keyword {
  const char* text;
  TokenKind kind;
};

constexpr Keyword kKeywords[] = {
    {"var", TokenKind::Var},           {"const", TokenKind::Const},       {"function", TokenKind::Function},
    {"class", TokenKind::Class},       {"extends", TokenKind::Extends},   {"return", TokenKind::Return},
    {"if", TokenKind::If},             {"else", TokenKind::Else},         {"for", TokenKind::For},
    {"while", TokenKind::While},       {"do", TokenKind::Do},             {"break", TokenKind::Break},
    {"continue", TokenKind::Continue}, {"throw", TokenKind::Throw},       {"try", TokenKind::Try},
    {"catch", TokenKind::Catch},       {"finally", TokenKind::Finally},   {"switch", TokenKind::Switch},
    {"case", TokenKind::Case},         {"default", TokenKind::Default},   {"new", TokenKind::New},
    {"delete", TokenKind::Delete},     {"typeof", TokenKind::Typeof},     {"void", TokenKind::Void},
    {"instanceof", TokenKind::Instanceof}, {"in", TokenKind::In},         {"this", TokenKind::This},
    {"super", TokenKind::Super},       {"null", TokenKind::Null},         {"true", TokenKind::True},
    {"false", TokenKind::False},       {"import", TokenKind::Import},     {"export", TokenKind::Export},
    {"debugger", TokenKind::Debugger}, {"with", TokenKind::With},         {"enum", TokenKind::Enum},
};

// Longest first so the first match is the maximal munch
constexpr Keyword kPunctuators[] = {
    {">>>=", TokenKind::URShiftEqual},
    {"...", TokenKind::Ellipsis},      {"===", TokenKind::EqEqEq},        {"!==", TokenKind::NotEqEq},
    {"**=", TokenKind::StarStarEqual}, {"<<=", TokenKind::LShiftEqual},   {">>=", TokenKind::RShiftEqual},
    {">>>", TokenKind::URShift},       {"&&=", TokenKind::AmpAmpEqual},   {"||=", TokenKind::PipePipeEqual},
    {"?\?=", TokenKind::QuestionQuestionEqual},
    {"=>", TokenKind::Arrow},          {"==", TokenKind::EqEq},           {"!=", TokenKind::NotEq},
    {"<=", TokenKind::Le},             {">=", TokenKind::Ge},             {"&&", TokenKind::AmpAmp},
    {"||", TokenKind::PipePipe},       {"?\?", TokenKind::QuestionQuestion}, {"?.", TokenKind::QuestionDot},
    {"++", TokenKind::PlusPlus},       {"--", TokenKind::MinusMinus},     {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},     {"*=", TokenKind::StarEqual},      {"/=", TokenKind::SlashEqual},
    {"%=", TokenKind::PercentEqual},   {"&=", TokenKind::AmpEqual},       {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},     {"**", TokenKind::StarStar},       {"<<", TokenKind::LShift},
    {">>", TokenKind::RShift},
    {"{", TokenKind::LBrace},          {"}", TokenKind::RBrace},          {"(", TokenKind::LParen},
    {")", TokenKind::RParen},          {"[", TokenKind::LBracket},        {"]", TokenKind::RBracket},
    {".", TokenKind::Dot},             {";", TokenKind::Semicolon},       {",", TokenKind::Comma},
    {":", TokenKind::Colon},           {"?", TokenKind::Question},        {"<", TokenKind::Lt},
    {">", TokenKind::Gt},              {"+", TokenKind::Plus},            {"-", TokenKind::Minus},
    {"*", TokenKind::Star},            {"/", TokenKind::Slash},           {"%", TokenKind::Percent},
    {"&", TokenKind::Amp},             {"|", TokenKind::Pipe},            {"^", TokenKind::Caret},
    {"!", TokenKind::Bang},            {"~", TokenKind::Tilde},           {"=", TokenKind::Equal},
};

TokenKind keywordKind(std::string_view word) {
  for (const auto& kw : kKeywords) {
    if (word == kw.text) { return kw.kind; }
  }
  return TokenKind::Ident;
}

bool isAsciiIdentStart(char chr) {
  return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_' || chr == '$';
}
bool isAsciiIdentChar(char chr) {
  return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_' || chr == '$';
}

bool isIdStart(UChar32 cp) { return u_hasBinaryProperty(cp, UCHAR_ID_START) != 0; }
bool isIdContinue(UChar32 cp) {
  return u_hasBinaryProperty(cp, UCHAR_ID_CONTINUE) != 0 || cp == 0x200C || cp == 0x200D;
}
bool isUnicodeSpace(UChar32 cp) {
  return cp == 0xA0 || cp == 0xFEFF || u_charType(cp) == U_SPACE_SEPARATOR;
}

// Decodes the code point at `at`; negative on malformed UTF-8
UChar32 decodeAt(const std::string& text, size_t at, size_t& len) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  auto idx = static_cast<int32_t>(at);
  const auto length = static_cast<int32_t>(text.size());
  UChar32 cp = 0;
  U8_NEXT(data, idx, length, cp);
  len = static_cast<size_t>(idx) - at;
  return cp;
}

bool isDigitIn(char chr, int radix) {
  switch (radix) {
    case 2: return chr == '0' || chr == '1';
    case 8: return chr >= '0' && chr <= '7';
    case 16: return std::isxdigit(static_cast<unsigned char>(chr)) != 0;
    default: return std::isdigit(static_cast<unsigned char>(chr)) != 0;
  }
}

} // namespace

// FileInput implementation
FileInput::FileInput(std::string path) : path_(std::move(path)) {}

void FileInput::read(std::string& out) {
  std::string err;
  if (!support::ReadFile(path_, out, err)) { throw exceptions::FileReadError(err); }
}

// StringInput implementation
StringInput::StringInput(std::string text, std::string name)
  : text_(std::move(text)), name_(std::move(name)) {}

void StringInput::read(std::string& out) { out = text_; }


void Lexer::pushFile(const std::string& path) {
  src_ = std::make_unique<FileInput>(path);
  finalized_ = false;
}

void Lexer::pushString(const std::string& text, const std::string& name) {
  src_ = std::make_unique<StringInput>(text, name);
  finalized_ = false;
}

void Lexer::fail(const int line, const int col, const std::string& msg) const {
  throw exceptions::ParseError(msg, line, col);
}

size_t Lexer::lineTerminatorAt(const size_t at) const {
  if (at >= text_.size()) { return 0; }
  const char chr = text_[at];
  if (chr == '\n') { return 1; }
  if (chr == '\r') { return (at + 1 < text_.size() && text_[at + 1] == '\n') ? 2 : 1; }
  // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
  if (static_cast<unsigned char>(chr) == 0xE2 && at + 2 < text_.size() &&
      static_cast<unsigned char>(text_[at + 1]) == 0x80 &&
      (static_cast<unsigned char>(text_[at + 2]) == 0xA8 || static_cast<unsigned char>(text_[at + 2]) == 0xA9)) {
    return 3;
  }
  return 0;
}

void Lexer::consumeLineTerminator(State& state) {
  state.index += lineTerminatorAt(state.index);
  ++state.lineNo;
  state.lineStart = state.index;
}

Token Lexer::makeToken(const State& state, const TokenKind kind, const size_t start, const int line, const int col) const {
  Token tok;
  tok.kind = kind;
  tok.text = text_.substr(start, state.index - start);
  tok.file = name_;
  tok.line = line;
  tok.col = col;
  tok.begin = start;
  tok.end = state.index;
  return tok;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Lexer::skipTrivia(State& state) {
  for (;;) {
    if (state.index >= text_.size()) { return; }
    if (lineTerminatorAt(state.index) != 0) {
      consumeLineTerminator(state);
      state.sawNewline = true;
      continue;
    }
    const char chr = text_[state.index];
    if (chr == ' ' || chr == '\t' || chr == '\v' || chr == '\f') { ++state.index; continue; }
    const char nextChr = state.index + 1 < text_.size() ? text_[state.index + 1] : '\0';
    if (chr == '/' && nextChr == '/') {
      ast::Comment comment;
      comment.kind = ast::CommentKind::Line;
      comment.begin = state.index;
      comment.line = state.lineNo;
      comment.col = static_cast<int>(state.index - state.lineStart) + 1;
      size_t idx = state.index + 2;
      while (idx < text_.size() && lineTerminatorAt(idx) == 0) { ++idx; }
      comment.text = text_.substr(state.index + 2, idx - state.index - 2);
      comment.end = idx;
      state.index = idx;
      state.pending.push_back(std::move(comment));
      continue;
    }
    if (chr == '/' && nextChr == '*') {
      ast::Comment comment;
      comment.kind = ast::CommentKind::Block;
      comment.begin = state.index;
      comment.line = state.lineNo;
      comment.col = static_cast<int>(state.index - state.lineStart) + 1;
      const size_t close = text_.find("*/", state.index + 2);
      if (close == std::string::npos) { fail(comment.line, comment.col, "unterminated block comment"); }
      comment.text = text_.substr(state.index + 2, close - state.index - 2);
      state.index += 2;
      while (state.index < close) {
        if (lineTerminatorAt(state.index) != 0) {
          consumeLineTerminator(state);
          state.sawNewline = true;
        } else {
          ++state.index;
        }
      }
      state.index = close + 2;
      comment.end = state.index;
      state.pending.push_back(std::move(comment));
      continue;
    }
    if (static_cast<unsigned char>(chr) >= 0x80) {
      size_t len = 0;
      const UChar32 cp = decodeAt(text_, state.index, len);
      if (cp >= 0 && isUnicodeSpace(cp)) { state.index += len; continue; }
    }
    return;
  }
}

bool Lexer::regexAllowed() const {
  if (tokens_.empty()) { return true; }
  switch (tokens_.back().kind) {
    case TokenKind::Ident:
    case TokenKind::PrivateName:
    case TokenKind::Number:
    case TokenKind::BigInt:
    case TokenKind::String:
    case TokenKind::Template:
    case TokenKind::TemplateTail:
    case TokenKind::RegExp:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::This:
    case TokenKind::Super:
    case TokenKind::Null:
    case TokenKind::True:
    case TokenKind::False:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      return false;
    default:
      return true;
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanIdentifierOrKeyword(State& state, const size_t start, const bool isPrivate) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  size_t idx = start + (isPrivate ? 1 : 0);
  bool first = true;
  bool escaped = false;
  while (idx < text_.size()) {
    const char chr = text_[idx];
    if (static_cast<unsigned char>(chr) < 0x80) {
      if (chr == '\\') {
        if (idx + 1 >= text_.size() || text_[idx + 1] != 'u') { fail(line, col, "invalid escape in identifier"); }
        escaped = true;
        idx += 2;
        if (idx < text_.size() && text_[idx] == '{') {
          const size_t close = text_.find('}', idx);
          if (close == std::string::npos) { fail(line, col, "unterminated unicode escape in identifier"); }
          idx = close + 1;
        } else {
          for (int i = 0; i < 4; ++i, ++idx) {
            if (idx >= text_.size() || !isDigitIn(text_[idx], 16)) { fail(line, col, "invalid unicode escape in identifier"); }
          }
        }
        first = false;
        continue;
      }
      if (first ? isAsciiIdentStart(chr) : isAsciiIdentChar(chr)) {
        ++idx;
        first = false;
        continue;
      }
      break;
    }
    size_t len = 0;
    const UChar32 cp = decodeAt(text_, idx, len);
    if (cp < 0) { fail(line, static_cast<int>(idx - state.lineStart) + 1, "invalid UTF-8 sequence"); }
    if (first ? isIdStart(cp) : isIdContinue(cp)) {
      idx += len;
      first = false;
      continue;
    }
    break;
  }
  if (first) { fail(line, col, isPrivate ? "expected identifier after '#'" : "unexpected character"); }
  state.index = idx;
  TokenKind kind = TokenKind::PrivateName;
  if (!isPrivate) {
    kind = escaped ? TokenKind::Ident : keywordKind(std::string_view(text_).substr(start, idx - start));
  }
  return makeToken(state, kind, start, line, col);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanNumber(State& state, const size_t start) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  size_t idx = start;
  TokenKind kind = TokenKind::Number;
  auto digits = [&](int radix) {
    const size_t from = idx;
    while (idx < text_.size() && (isDigitIn(text_[idx], radix) || text_[idx] == '_')) { ++idx; }
    return idx > from;
  };
  if (text_[idx] == '0' && idx + 1 < text_.size() && std::strchr("xXoObB", text_[idx + 1]) != nullptr &&
      text_[idx + 1] != '\0') {
    const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(text_[idx + 1])));
    const int radix = prefix == 'x' ? 16 : (prefix == 'o' ? 8 : 2);
    idx += 2;
    if (!digits(radix)) { fail(line, col, "missing digits after radix prefix"); }
    if (idx < text_.size() && text_[idx] == 'n') { ++idx; kind = TokenKind::BigInt; }
  } else {
    bool integral = true;
    digits(10);
    if (idx < text_.size() && text_[idx] == '.') {
      integral = false;
      ++idx;
      digits(10);
    }
    if (idx < text_.size() && (text_[idx] == 'e' || text_[idx] == 'E')) {
      integral = false;
      ++idx;
      if (idx < text_.size() && (text_[idx] == '+' || text_[idx] == '-')) { ++idx; }
      if (!digits(10)) { fail(line, col, "missing exponent digits"); }
    }
    if (integral && idx < text_.size() && text_[idx] == 'n') { ++idx; kind = TokenKind::BigInt; }
  }
  if (idx < text_.size() && (isAsciiIdentChar(text_[idx]) || text_[idx] == '\\')) {
    fail(line, static_cast<int>(idx - state.lineStart) + 1, "identifier starts immediately after numeric literal");
  }
  state.index = idx;
  return makeToken(state, kind, start, line, col);
}

Token Lexer::scanString(State& state, const size_t start) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  const char quote = text_[start];
  state.index = start + 1;
  for (;;) {
    if (state.index >= text_.size()) { fail(line, col, "unterminated string literal"); }
    const char chr = text_[state.index];
    if (chr == quote) { ++state.index; break; }
    if (chr == '\\') {
      ++state.index;
      if (state.index >= text_.size()) { fail(line, col, "unterminated string literal"); }
      if (lineTerminatorAt(state.index) != 0) {
        consumeLineTerminator(state); // line continuation
      } else {
        ++state.index;
      }
      continue;
    }
    if (chr == '\n' || chr == '\r') { fail(line, col, "unterminated string literal"); }
    ++state.index;
  }
  return makeToken(state, TokenKind::String, start, line, col);
}

Token Lexer::scanTemplatePart(State& state, const size_t start, const bool head) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  state.index = start + 1;
  TokenKind kind = head ? TokenKind::Template : TokenKind::TemplateTail;
  for (;;) {
    if (state.index >= text_.size()) { fail(line, col, "unterminated template literal"); }
    const char chr = text_[state.index];
    if (chr == '\\') {
      ++state.index;
      if (lineTerminatorAt(state.index) != 0) {
        consumeLineTerminator(state);
      } else if (state.index < text_.size()) {
        ++state.index;
      }
      continue;
    }
    if (chr == '`') {
      ++state.index;
      break;
    }
    if (chr == '$' && state.index + 1 < text_.size() && text_[state.index + 1] == '{') {
      state.index += 2;
      kind = head ? TokenKind::TemplateHead : TokenKind::TemplateMiddle;
      state.templateBraces.push_back(state.braceDepth);
      break;
    }
    if (lineTerminatorAt(state.index) != 0) {
      consumeLineTerminator(state);
      continue;
    }
    ++state.index;
  }
  return makeToken(state, kind, start, line, col);
}

Token Lexer::scanRegExp(State& state, const size_t start) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  size_t idx = start + 1;
  bool inClass = false;
  for (;;) {
    if (idx >= text_.size() || lineTerminatorAt(idx) != 0) { fail(line, col, "unterminated regular expression"); }
    const char chr = text_[idx];
    if (chr == '\\') {
      ++idx;
      if (idx >= text_.size() || lineTerminatorAt(idx) != 0) { fail(line, col, "unterminated regular expression"); }
      ++idx;
      continue;
    }
    if (chr == '[') {
      inClass = true;
    } else if (chr == ']') {
      inClass = false;
    } else if (chr == '/' && !inClass) {
      ++idx;
      break;
    }
    ++idx;
  }
  while (idx < text_.size() && isAsciiIdentChar(text_[idx])) { ++idx; }
  state.index = idx;
  return makeToken(state, TokenKind::RegExp, start, line, col);
}

Token Lexer::scanPunctuator(State& state, const size_t start) {
  const int line = state.lineNo;
  const int col = static_cast<int>(start - state.lineStart) + 1;
  for (const auto& punct : kPunctuators) {
    const size_t len = std::strlen(punct.text);
    if (text_.compare(start, len, punct.text) != 0) { continue; }
    // `a?.5:b` is a conditional, not optional chaining
    if (punct.kind == TokenKind::QuestionDot && start + 2 < text_.size() &&
        std::isdigit(static_cast<unsigned char>(text_[start + 2])) != 0) {
      continue;
    }
    state.index = start + len;
    if (punct.kind == TokenKind::LBrace) { ++state.braceDepth; }
    if (punct.kind == TokenKind::RBrace) { --state.braceDepth; }
    return makeToken(state, punct.kind, start, line, col);
  }
  char buf[48];
  std::snprintf(buf, sizeof(buf), "unexpected character '%c'", text_[start]);
  fail(line, col, buf);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state) {
  const size_t start = state.index;
  if (start >= text_.size()) {
    return makeToken(state, TokenKind::End, start, state.lineNo, static_cast<int>(start - state.lineStart) + 1);
  }
  const char chr = text_[start];
  const char nextChr = start + 1 < text_.size() ? text_[start + 1] : '\0';
  if (isAsciiIdentStart(chr) || chr == '\\') { return scanIdentifierOrKeyword(state, start, false); }
  if (chr == '#') { return scanIdentifierOrKeyword(state, start, true); }
  if (std::isdigit(static_cast<unsigned char>(chr)) != 0 ||
      (chr == '.' && std::isdigit(static_cast<unsigned char>(nextChr)) != 0)) {
    return scanNumber(state, start);
  }
  if (chr == '"' || chr == '\'') { return scanString(state, start); }
  if (chr == '`') { return scanTemplatePart(state, start, true); }
  if (chr == '}' && !state.templateBraces.empty() && state.templateBraces.back() == state.braceDepth) {
    state.templateBraces.pop_back();
    return scanTemplatePart(state, start, false);
  }
  if (chr == '/' && regexAllowed()) { return scanRegExp(state, start); }
  if (static_cast<unsigned char>(chr) >= 0x80) {
    size_t len = 0;
    const UChar32 cp = decodeAt(text_, start, len);
    const int col = static_cast<int>(start - state.lineStart) + 1;
    if (cp < 0) { fail(state.lineNo, col, "invalid UTF-8 sequence"); }
    if (isIdStart(cp)) { return scanIdentifierOrKeyword(state, start, false); }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "unexpected character U+%04X", static_cast<unsigned>(cp));
    fail(state.lineNo, col, buf);
  }
  return scanPunctuator(state, start);
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  tokens_.clear();
  pos_ = 0;
  comments_ = ast::SourceComments{};
  text_.clear();
  name_.clear();
  if (src_) {
    src_->read(text_);
    name_ = src_->name();
  }
  State state;
  // Hashbang line is kept as a line comment
  if (text_.rfind("#!", 0) == 0) {
    ast::Comment comment;
    comment.kind = ast::CommentKind::Line;
    comment.line = 1;
    comment.col = 1;
    size_t idx = 2;
    while (idx < text_.size() && lineTerminatorAt(idx) == 0) { ++idx; }
    comment.text = text_.substr(2, idx - 2);
    comment.end = idx;
    state.index = idx;
    state.pending.push_back(std::move(comment));
  }
  for (;;) {
    skipTrivia(state);
    Token tok = scanOne(state);
    tok.newlineBefore = state.sawNewline;
    state.sawNewline = false;
    for (auto& comment : state.pending) { comments_.addLeading(tok.begin, std::move(comment)); }
    state.pending.clear();
    const bool atEnd = tok.kind == TokenKind::End;
    tokens_.push_back(std::move(tok));
    if (atEnd) { break; }
  }
  if (!state.templateBraces.empty()) {
    fail(tokens_.back().line, tokens_.back().col, "unterminated template literal");
  }
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

ast::SourceComments Lexer::takeComments() {
  if (!finalized_) { buildAll(); }
  return std::move(comments_);
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

const std::string& Lexer::source() {
  if (!finalized_) { buildAll(); }
  return text_;
}

} // namespace puretop::lex
