/***
 * Name: puretop::purity::classify
 * Purpose: Decide whether a call-like node may be marked pure.
 * Inputs:
 *   - node: the call-like node view
 *   - context: its lexical context
 *   - denylist: callee names excluded from annotation
 * Outputs:
 *   - Verdict, first matching rule wins:
 *       1. inside any function or method body -> NotTopLevel
 *       2. one or more arguments             -> HasArguments
 *       3. resolved callee in the denylist   -> DenylistedCallee
 *       4. otherwise                         -> Eligible
 * Theory of Operation:
 *   Pure function of its inputs. Unresolved callees never match the denylist.
 */
#pragma once

#include "purity/CallLikeNode.h"
#include "purity/Denylist.h"
#include "purity/LexicalContext.h"
#include "purity/Verdict.h"

namespace puretop::purity {

Verdict classify(const CallLikeNode& node, const LexicalContext& context, const Denylist& denylist);

} // namespace puretop::purity
