#pragma once

#include <string>

namespace puretop::cli {

    // Help text printed for -h/--help and after argument errors
    std::string Usage();

} // namespace puretop::cli
