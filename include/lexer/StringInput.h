/**
 * Name: puretop::lex::StringInput
 * Purpose: String-backed input source implementation.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace puretop::lex {

class StringInput : public InputSource {
public:
    StringInput(std::string text, std::string name);

    void read(std::string& out) override;

    const std::string& name() const override { return name_; }

private:
    std::string text_{};
    std::string name_{};
};

} // namespace puretop::lex
