/**
 * @file
 * @brief Umbrella include for every AST node.
 */
#pragma once

#include "ast/Acceptable.h"
#include "ast/ArrayLiteral.h"
#include "ast/ArrowFunction.h"
#include "ast/Assign.h"
#include "ast/AwaitExpr.h"
#include "ast/Binary.h"
#include "ast/BinaryOperator.h"
#include "ast/BlockStmt.h"
#include "ast/BreakStmt.h"
#include "ast/Call.h"
#include "ast/ClassDecl.h"
#include "ast/ClassExpr.h"
#include "ast/ClassMember.h"
#include "ast/Comment.h"
#include "ast/Conditional.h"
#include "ast/ContinueStmt.h"
#include "ast/DebuggerStmt.h"
#include "ast/DoWhileStmt.h"
#include "ast/EmptyStmt.h"
#include "ast/ExportDecl.h"
#include "ast/Expr.h"
#include "ast/ExprStmt.h"
#include "ast/ForInStmt.h"
#include "ast/ForStmt.h"
#include "ast/FunctionDecl.h"
#include "ast/FunctionExpr.h"
#include "ast/IfStmt.h"
#include "ast/ImportCall.h"
#include "ast/ImportDecl.h"
#include "ast/LabeledStmt.h"
#include "ast/Literals.h"
#include "ast/Member.h"
#include "ast/MetaProperty.h"
#include "ast/Module.h"
#include "ast/Name.h"
#include "ast/NewExpr.h"
#include "ast/Node.h"
#include "ast/NodeKind.h"
#include "ast/NullLiteral.h"
#include "ast/ObjectLiteral.h"
#include "ast/ParenExpr.h"
#include "ast/PrivateName.h"
#include "ast/Property.h"
#include "ast/RegExpLiteral.h"
#include "ast/ReturnStmt.h"
#include "ast/Sequence.h"
#include "ast/SourceComments.h"
#include "ast/Spread.h"
#include "ast/Stmt.h"
#include "ast/SuperExpr.h"
#include "ast/SwitchStmt.h"
#include "ast/TaggedTemplate.h"
#include "ast/TemplateLiteral.h"
#include "ast/ThisExpr.h"
#include "ast/ThrowStmt.h"
#include "ast/TryStmt.h"
#include "ast/Unary.h"
#include "ast/UnaryOperator.h"
#include "ast/Update.h"
#include "ast/VarDecl.h"
#include "ast/WhileStmt.h"
#include "ast/YieldExpr.h"
