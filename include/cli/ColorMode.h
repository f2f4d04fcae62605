#pragma once

namespace cmfmt::cli {

    enum class ColorMode {
        Auto,
        Always,
        Never
    };

} // namespace cmfmt::cli
