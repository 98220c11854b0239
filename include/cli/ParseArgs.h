#pragma once

#include "cli/Options.h"

namespace pyrite::cli {

    // Parse argv into Options. Returns false on fatal parse error.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pyrite::cli
