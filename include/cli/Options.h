#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"

namespace puretop::cli {

    enum class AstLogMode {
        None,
        Before,
        After,
        Both
    };

    struct Options {
        bool showHelp{false};
        bool inPlace{false};          // --in-place
        bool report{false};           // --report
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool noDefaultDeny{false};    // --no-default-deny
        std::string outputFile{};     // -o <file>; empty writes to stdout
        std::vector<std::string> inputs{};
        std::vector<std::string> denyNames{}; // --deny=<names>
        std::vector<std::string> denyFiles{}; // --deny-file=<path>
        ColorMode color{ColorMode::Auto};
        int diagContext{1};
        AstLogMode astLog{AstLogMode::None};
        std::string logPath{"."};    // --log-path=<dir> (defaults to ./)
        bool logLexer{false};         // --log-lexer
        bool logAst{false};           // --log-ast (file logging; not to stderr)
    };

} // namespace puretop::cli
