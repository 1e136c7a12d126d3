/**
 * Name: puretop::lex::FileInput
 * Purpose: File-backed input source implementation.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace puretop::lex {

class FileInput : public InputSource {
public:
    explicit FileInput(std::string path);

    // Throws exceptions::FileReadError when the file cannot be read
    void read(std::string& out) override;

    const std::string& name() const override { return path_; }

private:
    std::string path_{};
};

} // namespace puretop::lex
