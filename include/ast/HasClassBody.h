/**
 * @file
 * @brief AST utility declarations (heritage and members shared by class forms).
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/ClassMember.h"
#include "ast/Expr.h"

namespace puretop::ast {

struct HasClassBody {
    std::unique_ptr<Expr> superClass;
    std::vector<std::unique_ptr<ClassMember>> members;
};

}
