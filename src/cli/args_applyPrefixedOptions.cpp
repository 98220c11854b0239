#include "cli/ParseArgsInternals.h"

#include <string>

namespace pyrite::cli::detail {
    namespace {
    constexpr int kMaxTabWidth = 64;
    constexpr int kMaxDepthLimit = 100000;
    } // namespace

    /***
     * Name: pyrite::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options (tab-width, max-depth).
     *   An invalid value is recorded in out.error; the option still counts as handled.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view tabPrefix{"--tab-width="}; arg.rfind(tabPrefix, 0) == 0) {
            const auto value = arg.substr(tabPrefix.size());
            if (!parseIntValue(value, 1, kMaxTabWidth, out.tabWidth) && out.error.empty()) {
                out.error = "invalid --tab-width value '" + std::string(value) + "'";
            }
            return true;
        }

        if (constexpr std::string_view depthPrefix{"--max-depth="}; arg.rfind(depthPrefix, 0) == 0) {
            const auto value = arg.substr(depthPrefix.size());
            if (!parseIntValue(value, 1, kMaxDepthLimit, out.maxDepth) && out.error.empty()) {
                out.error = "invalid --max-depth value '" + std::string(value) + "'";
            }
            return true;
        }
        return false;
    }
} // namespace pyrite::cli::detail
