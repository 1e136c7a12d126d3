/**
 * Name: puretop::lex::TokenKind
 * Purpose: Token kinds for the ECMAScript lexer.
 */
#pragma once

namespace puretop::lex {

enum class TokenKind {
    End, // EOF
    Ident, // identifier (contextual keywords included)
    PrivateName, // #name
    Number, // numeric literal
    BigInt, // bigint literal (123n)
    String, // string literal, quotes included
    Template, // `...` without substitutions
    TemplateHead, // `...${
    TemplateMiddle, // }...${
    TemplateTail, // }...`
    RegExp, // /pattern/flags

    Var, // var
    Const, // const
    Function, // function
    Class, // class
    Extends, // extends
    Return, // return
    If, // if
    Else, // else
    For, // for
    While, // while
    Do, // do
    Break, // break
    Continue, // continue
    Throw, // throw
    Try, // try
    Catch, // catch
    Finally, // finally
    Switch, // switch
    Case, // case
    Default, // default
    New, // new
    Delete, // delete
    Typeof, // typeof
    Void, // void
    Instanceof, // instanceof
    In, // in
    This, // this
    Super, // super
    Null, // null
    True, // true
    False, // false
    Import, // import
    Export, // export
    Debugger, // debugger
    With, // with
    Enum, // enum

    LBrace, // {
    RBrace, // }
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    Dot, // .
    Ellipsis, // ...
    Semicolon, // ;
    Comma, // ,
    Colon, // :
    Question, // ?
    QuestionDot, // ?.
    Arrow, // =>
    Lt, // <
    Gt, // >
    Le, // <=
    Ge, // >=
    EqEq, // ==
    NotEq, // !=
    EqEqEq, // ===
    NotEqEq, // !==
    Plus, // +
    Minus, // -
    Star, // *
    Slash, // /
    Percent, // %
    StarStar, // **
    PlusPlus, // ++
    MinusMinus, // --
    LShift, // <<
    RShift, // >>
    URShift, // >>>
    Amp, // &
    Pipe, // |
    Caret, // ^
    Bang, // !
    Tilde, // ~
    AmpAmp, // &&
    PipePipe, // ||
    QuestionQuestion, // ??
    Equal, // =
    PlusEqual, // +=
    MinusEqual, // -=
    StarEqual, // *=
    SlashEqual, // /=
    PercentEqual, // %=
    StarStarEqual, // **=
    LShiftEqual, // <<=
    RShiftEqual, // >>=
    URShiftEqual, // >>>=
    AmpEqual, // &=
    PipeEqual, // |=
    CaretEqual, // ^=
    AmpAmpEqual, // &&=
    PipePipeEqual, // ||=
    QuestionQuestionEqual // ??=
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace puretop::lex
