/***
 * Name: cmfmt::config loader / writer
 * Purpose: Read `key = value` configuration files and write them back.
 * Inputs:
 *   - Text (or a file path) in the configuration file format:
 *       # comment
 *       line_width = 100
 *       always_wrap = ['add_library',
 *                      'target_link_libraries']
 *       additional_commands.my_cmd.kwargs.SOURCES = '*'
 *       per_command.my_cmd.command_case = 'upper'
 *   - sink: unknown keys and ambiguous booleans are reported here
 * Outputs:
 *   - Configuration with the values applied over the defaults
 * Theory of Operation:
 *   A value continues onto following lines while its brackets are open.
 *   Malformed literals and invalid values raise ConfigError; unknown keys
 *   only warn.
 */
#pragma once

#include <ostream>
#include <string>

#include "config/Configuration.h"
#include "diag/DiagnosticSink.h"
#include "grammar/CommandRegistry.h"

namespace cmfmt::config {

void ApplyConfigString(Configuration& cfg, const std::string& text, const std::string& name,
                       diag::DiagnosticSink& sink);

Configuration LoadConfigString(const std::string& text, const std::string& name, diag::DiagnosticSink& sink);

// Throws ConfigError if the file cannot be read
Configuration LoadConfigFile(const std::string& path, diag::DiagnosticSink& sink);

void DumpConfig(std::ostream& os, const Configuration& cfg);

// Built-in commands plus the configuration's additional_commands
grammar::CommandRegistry BuildRegistry(const Configuration& cfg);

} // namespace cmfmt::config
