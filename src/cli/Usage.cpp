#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pyrite::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(pyrite-astdump [options] file.py

Options:
  -h, --help           Print this help and exit
  --tokens             Print the token stream before the AST
  --no-ast             Do not print the AST
  --metrics            Print timings, counters and AST geometry
  --json               Print metrics as JSON (implies --metrics)
  --tab-width=<N>      Tab stop width for indentation (default: 8)
  --max-depth=<N>      Maximum nesting depth accepted by the parser (default: 1000)
  --                   End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyrite::cli
