/***
 * Name: pyrite::parse::ParserOptions
 * Purpose: Parser configuration.
 */
#pragma once

namespace pyrite::parse {

inline constexpr int kDefaultMaxNestingDepth = 1000;

struct ParserOptions {
  // Bound on nested brackets, expression re-entries and blocks. Exceeding it
  // is reported as an error instead of growing the native stack further.
  // Each bracket level costs a few KB of native stack in unoptimized builds,
  // so the default needs about 4 MB; run the parse on a thread with at least
  // 8 MB of stack (the usual main-thread size) or lower the bound to match.
  int maxNestingDepth{kDefaultMaxNestingDepth};
};

} // namespace pyrite::parse
