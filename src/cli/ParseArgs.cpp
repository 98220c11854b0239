#include "cli/ParseArgs.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>
#include <string>

namespace pyrite::cli {
    /***
     * Name: pyrite::cli::ParseArgs
     * Purpose: Minimal CLI argument parser for pyrite-astdump.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(static_cast<std::size_t>(i) + 1, argc, argv, out);
                break;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) {
                if (!out.error.empty()) {
                    std::cerr << "pyrite-astdump: " << out.error << "\n";
                    return false;
                }
                continue;
            }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pyrite-astdump: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }
        return true;
    }
} // namespace pyrite::cli
