#pragma once

namespace puretop::ast {
    enum class NodeKind {
        Module,
        // statements
        VarDecl,
        FunctionDecl,
        ClassDecl,
        ExprStmt,
        BlockStmt,
        IfStmt,
        ForStmt,
        ForInStmt,
        WhileStmt,
        DoWhileStmt,
        ReturnStmt,
        ThrowStmt,
        TryStmt,
        SwitchStmt,
        BreakStmt,
        ContinueStmt,
        LabeledStmt,
        EmptyStmt,
        DebuggerStmt,
        ImportDecl,
        ExportNamedDecl,
        ExportDefaultDecl,
        ExportAllDecl,
        // expressions
        Name,
        PrivateName,
        NumberLiteral,
        BigIntLiteral,
        StringLiteral,
        BooleanLiteral,
        NullLiteral,
        RegExpLiteral,
        TemplateLiteral,
        TaggedTemplate,
        ArrayLiteral,
        ObjectLiteral,
        Property,
        FunctionExpr,
        ArrowFunction,
        ClassExpr,
        ClassMember,
        ThisExpr,
        SuperExpr,
        Member,
        Call,
        NewExpr,
        UnaryExpr,
        UpdateExpr,
        BinaryExpr,
        AssignExpr,
        Conditional,
        Sequence,
        Spread,
        YieldExpr,
        AwaitExpr,
        ParenExpr,
        MetaProperty,
        ImportCall
    };

    const char* to_string(NodeKind kind);
} // namespace puretop::ast
