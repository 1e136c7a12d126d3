#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"
#include "Options.h"

namespace puretop::cli {

    // Parse argv into Options. Returns false on fatal parse error (reported on stderr).
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace puretop::cli
