#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace puretop::cli {

namespace {
constexpr std::string_view kUsageText = R"(puretop [options] file...

Marks zero-argument top-level calls and constructor calls with /*#__PURE__*/.

Options:
  -h, --help             Print this help and exit
  -o <file>              Write output to <file> (single input only; default: stdout)
  --in-place             Rewrite each input file
  --deny=<names>         Add comma-separated callee names to the denylist
  --deny-file=<path>     Add callee names listed in <path> (one per line, # comments)
  --no-default-deny      Do not start from the built-in helper denylist
  --report               Print each call's verdict to stderr
  --metrics              Print stage timings and counters (stderr)
  --metrics-json         Print metrics in JSON (stderr)
  --ast-log[=<mode>]     Dump AST to stderr: before|after|both (default: before)
  --log-path=<dir>       Directory where logs are written (lexer/ast/metrics)
  --log-lexer            Enable lexer token log (requires --log-path)
  --log-ast              Enable AST file logs (requires --log-path)
  --color=<mode>         Color diagnostics: always|never|auto (default: auto)
  --diag-context=<N>     Lines of context to show around errors (default: 1)
  --                     End of options
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace puretop::cli
