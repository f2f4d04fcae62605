#pragma once

#include <string>

namespace cmfmt::cli {

    // Help text printed for -h/--help and after usage errors
    std::string Usage();

} // namespace cmfmt::cli
