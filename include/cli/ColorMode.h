#pragma once

namespace puretop::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace puretop::cli
