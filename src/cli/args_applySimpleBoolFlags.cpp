#include "cli/ParseArgsInternals.h"

namespace pyrite::cli::detail {
    /***
     * Name: pyrite::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--tokens")) {
            out.dumpTokens = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--no-ast")) {
            out.noAst = true;
            return true;
        }
        return false;
    }
} // namespace pyrite::cli::detail
