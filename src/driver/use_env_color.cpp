#include "driver/App.h"
#include <cstdlib>
#include <string_view>

#include "config/ParseBool.h"
#include "diag/DiagnosticSink.h"

namespace cmfmt {
    // CMFMT_COLOR uses the same truthy spellings as the config file
    bool App::use_env_color() {
        const char *env_value = std::getenv("CMFMT_COLOR");
        if (env_value == nullptr) { return false; }
        diag::DiagnosticSink ignored;
        return config::ParseBool(std::string_view{env_value}, ignored);
    }
} // namespace cmfmt
