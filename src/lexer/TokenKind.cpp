/**
 * Name: puretop::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace puretop::lex {
    const char *to_string(const TokenKind k) {
        using enum puretop::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Ident: return "Ident";
            case PrivateName: return "PrivateName";
            case Number: return "Number";
            case BigInt: return "BigInt";
            case String: return "String";
            case Template: return "Template";
            case TemplateHead: return "TemplateHead";
            case TemplateMiddle: return "TemplateMiddle";
            case TemplateTail: return "TemplateTail";
            case RegExp: return "RegExp";
            case Var: return "Var";
            case Const: return "Const";
            case Function: return "Function";
            case Class: return "Class";
            case Extends: return "Extends";
            case Return: return "Return";
            case If: return "If";
            case Else: return "Else";
            case For: return "For";
            case While: return "While";
            case Do: return "Do";
            case Break: return "Break";
            case Continue: return "Continue";
            case Throw: return "Throw";
            case Try: return "Try";
            case Catch: return "Catch";
            case Finally: return "Finally";
            case Switch: return "Switch";
            case Case: return "Case";
            case Default: return "Default";
            case New: return "New";
            case Delete: return "Delete";
            case Typeof: return "Typeof";
            case Void: return "Void";
            case Instanceof: return "Instanceof";
            case In: return "In";
            case This: return "This";
            case Super: return "Super";
            case Null: return "Null";
            case True: return "True";
            case False: return "False";
            case Import: return "Import";
            case Export: return "Export";
            case Debugger: return "Debugger";
            case With: return "With";
            case Enum: return "Enum";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case Dot: return "Dot";
            case Ellipsis: return "Ellipsis";
            case Semicolon: return "Semicolon";
            case Comma: return "Comma";
            case Colon: return "Colon";
            case Question: return "Question";
            case QuestionDot: return "QuestionDot";
            case Arrow: return "Arrow";
            case Lt: return "Lt";
            case Gt: return "Gt";
            case Le: return "Le";
            case Ge: return "Ge";
            case EqEq: return "EqEq";
            case NotEq: return "NotEq";
            case EqEqEq: return "EqEqEq";
            case NotEqEq: return "NotEqEq";
            case Plus: return "Plus";
            case Minus: return "Minus";
            case Star: return "Star";
            case Slash: return "Slash";
            case Percent: return "Percent";
            case StarStar: return "StarStar";
            case PlusPlus: return "PlusPlus";
            case MinusMinus: return "MinusMinus";
            case LShift: return "LShift";
            case RShift: return "RShift";
            case URShift: return "URShift";
            case Amp: return "Amp";
            case Pipe: return "Pipe";
            case Caret: return "Caret";
            case Bang: return "Bang";
            case Tilde: return "Tilde";
            case AmpAmp: return "AmpAmp";
            case PipePipe: return "PipePipe";
            case QuestionQuestion: return "QuestionQuestion";
            case Equal: return "Equal";
            case PlusEqual: return "PlusEqual";
            case MinusEqual: return "MinusEqual";
            case StarEqual: return "StarEqual";
            case SlashEqual: return "SlashEqual";
            case PercentEqual: return "PercentEqual";
            case StarStarEqual: return "StarStarEqual";
            case LShiftEqual: return "LShiftEqual";
            case RShiftEqual: return "RShiftEqual";
            case URShiftEqual: return "URShiftEqual";
            case AmpEqual: return "AmpEqual";
            case PipeEqual: return "PipeEqual";
            case CaretEqual: return "CaretEqual";
            case AmpAmpEqual: return "AmpAmpEqual";
            case PipePipeEqual: return "PipePipeEqual";
            case QuestionQuestionEqual: return "QuestionQuestionEqual";
        }
        return "Unknown";
    }
} // namespace puretop::lex
