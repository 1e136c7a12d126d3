#pragma once

#include <memory>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasFunctionFlags.h"
#include "ast/HasName.h"
#include "ast/HasParams.h"
#include "ast/Stmt.h"

namespace puretop::ast {
    // `name` is empty only for `export default function () {}`
    struct FunctionDecl final : Stmt, Acceptable<FunctionDecl, NodeKind::FunctionDecl>, HasName,
                                HasParams<std::unique_ptr<Expr>>, HasBody<Stmt>, HasFunctionFlags {
        FunctionDecl() : Stmt(NodeKind::FunctionDecl) {}
    };

} // namespace puretop::ast
