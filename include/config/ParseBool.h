/***
 * Name: cmfmt::config::ParseBool
 * Purpose: Interpret yes/no style strings.
 * Inputs:
 *   - text: compared case-insensitively against the truthy/falsy spellings
 *   - sink: receives a warning for anything ambiguous
 *   - where: location attached to that warning
 * Outputs:
 *   - true for y/yes/t/true/1/yup/yeah/yada; false otherwise
 */
#pragma once

#include <string_view>

#include "diag/DiagnosticSink.h"
#include "lexer/SourceLocation.h"

namespace cmfmt::config {

bool ParseBool(std::string_view text, diag::DiagnosticSink& sink, const lex::SourceLocation& where = {});

} // namespace cmfmt::config
