#include "cli/ParseArgsInternals.h"

#include <charconv>
#include <system_error>

namespace pyrite::cli::detail {
    /***
     * Name: pyrite::cli::detail::isFlag
     * Purpose: Check if an argument exactly matches a flag.
     */
    bool isFlag(const std::string_view arg, const std::string_view flag) {
        return arg == flag;
    }

    /***
     * Name: pyrite::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments; a lone "-" is a path.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }

    /***
     * Name: pyrite::cli::detail::collectRemainingAsInputs
     * Purpose: Gather argv entries after "--" as positional input paths.
     */
    void collectRemainingAsInputs(std::size_t startIndex, int argc, char **argv, Options &out) {
        for (int j = static_cast<int>(startIndex); j < argc; ++j) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            out.inputs.emplace_back(argv[j]);
        }
    }

    /***
     * Name: pyrite::cli::detail::parseIntValue
     * Purpose: Strict decimal parse of an option value; value is left untouched on failure.
     */
    bool parseIntValue(const std::string_view text, const int minValue, const int maxValue, int &value) {
        if (text.empty()) { return false; }
        int parsed = 0;
        const char *first = text.data();
        const char *last = text.data() + text.size(); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        const auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (ec != std::errc() || ptr != last) { return false; }
        if (parsed < minValue || parsed > maxValue) { return false; }
        value = parsed;
        return true;
    }
} // namespace pyrite::cli::detail
