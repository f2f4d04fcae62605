/**
 * @file
 * @brief Declarations for cmfmt CLI argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cli/Options.h"
#include "cli/ColorMode.h"

namespace cmfmt::cli::detail {

/** Return true if `arg` exactly matches the `flag`. */
bool isFlag(std::string_view arg, std::string_view flag);

/** Parse `--dump=<value>`; nullopt for an unknown mode. */
std::optional<DumpMode> parseDumpValue(std::string_view value);

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Collect remaining argv items as input paths starting at index. */
void collectRemainingAsInputs(std::size_t startIndex, int argc, char** argv, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible modes (e.g., --check with a non-roundtrip dump). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h, --check, --metrics, etc. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (config-file, dump, log-path, color, diag-context). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-o <file>` output flag by consuming the next argv item. */
bool handleOutputFileFlag(int& idx, int argc, char** argv, Options& out);

/** Handle `-c <file>` config flag by consuming the next argv item. */
bool handleConfigFileFlag(int& idx, int argc, char** argv, Options& out);

} // namespace cmfmt::cli::detail
