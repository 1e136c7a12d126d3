/**
 * Name: puretop::lex::InputSource
 * Purpose: Abstract whole-text input source.
 */
#pragma once

#include <string>

namespace puretop::lex {

class InputSource {
public:
    virtual ~InputSource() = default;

    virtual void read(std::string& out) = 0; // full contents
    virtual const std::string& name() const = 0;
};

} // namespace puretop::lex
