/**
 * @file
 * @brief Declarations for pyrite-astdump argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"

namespace pyrite::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse a whole decimal integer in [minValue, maxValue]; false on junk or overflow. */
bool parseIntValue(std::string_view text, int minValue, int maxValue, int& value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Handle boolean, flag-only options like -h, --tokens, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (tab-width, max-depth). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

} // namespace pyrite::cli::detail
