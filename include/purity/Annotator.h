/***
 * Name: puretop::purity::annotate
 * Purpose: Attach the pure marker to an Eligible call-like node.
 * Inputs:
 *   - node: the call-like node view
 *   - verdict: the classifier's verdict for it
 *   - comments: the module's position-keyed comment store
 * Outputs:
 *   - Applied when a marker was added at node.begin; Skipped for any other
 *     verdict; AlreadyMarked when node.begin already carries a marker.
 * Theory of Operation:
 *   The marker is keyed by the node's start offset, so nested call-like nodes
 *   that share a start (`a().b()`) receive a single marker.
 */
#pragma once

#include "ast/SourceComments.h"
#include "purity/CallLikeNode.h"
#include "purity/Verdict.h"

namespace puretop::purity {

MutationOutcome annotate(const CallLikeNode& node, Verdict verdict, ast::SourceComments& comments);

} // namespace puretop::purity
