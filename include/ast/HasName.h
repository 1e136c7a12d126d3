/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace puretop::ast {

struct HasName {
    std::string name;
};

}
