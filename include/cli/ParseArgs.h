#pragma once

#include <string>
#include <vector>

#include "ColorMode.h"
#include "Options.h"

namespace cmfmt::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace cmfmt::cli
