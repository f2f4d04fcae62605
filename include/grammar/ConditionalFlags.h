/***
 * Name: cmfmt::grammar conditional vocabulary
 * Purpose: Unary/binary operators of if()/while() expressions and the boolean
 *   connectives that split them.
 */
#pragma once

#include <string>
#include <vector>

namespace cmfmt::grammar {

// Non-breaking flags inside a conditional positional run (normalized)
const std::vector<std::string>& ConditionalFlags();

// Keywords whose body is another conditional group: AND, OR
const std::vector<std::string>& ConditionalKeywords();

} // namespace cmfmt::grammar
