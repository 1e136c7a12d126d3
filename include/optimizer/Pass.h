/***
 * Name: puretop::opt::Pass
 * Purpose: Interface for passes that annotate a module in place.
 * Inputs:
 *   - ast::Module (mutable; passes only add to its comment store)
 * Outputs:
 *   - Count of annotations added by this run.
 *   - name(): key used for the pass in metrics breakdowns.
 */
#pragma once

#include <cstddef>
#include "ast/Nodes.h"

namespace puretop::opt {
    class Pass {
    public:
        virtual ~Pass() = default;

        virtual const char* name() const = 0;
        virtual size_t run(ast::Module &m) = 0;
    };
} // namespace puretop::opt
