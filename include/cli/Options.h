#pragma once

#include <string>
#include <vector>

namespace pyrite::cli {

    struct Options {
        bool showHelp{false};
        bool dumpTokens{false};   // --tokens
        bool metrics{false};      // --metrics
        bool metricsJson{false};  // --json (metrics as JSON)
        bool noAst{false};        // --no-ast
        int tabWidth{8};          // --tab-width=N
        int maxDepth{1000};       // --max-depth=N
        std::vector<std::string> inputs{};
        std::string error{};      // first invalid option value, empty when none
    };

} // namespace pyrite::cli
