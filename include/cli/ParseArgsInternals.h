/**
 * @file
 * @brief Declarations for puretop CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace puretop::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--ast-log=<value>` to AstLogMode; throws ConfigError on unknown values. */
AstLogMode parseAstLogValue(std::string_view value);

/** Parse `--color=<value>` to ColorMode; throws ConfigError on unknown values. */
ColorMode parseColorValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible output modes (-o together with --in-place). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --in-place, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (deny, deny-file, ast-log, log-path, color, diag-context). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-o <file>` output flag by consuming the next argv item; throws ConfigError when it is missing. */
bool handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace puretop::cli::detail
