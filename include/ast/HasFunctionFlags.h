/**
 * @file
 * @brief AST utility declarations (async/generator flags shared by function forms).
 */
#pragma once

namespace puretop::ast {

struct HasFunctionFlags {
    bool isAsync{false};
    bool isGenerator{false};
};

}
