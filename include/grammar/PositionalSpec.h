/***
 * Name: cmfmt::grammar::PositionalSpec
 * Purpose: (arity, flags) pair recorded on every positional group node.
 */
#pragma once

#include <string>
#include <vector>

#include "grammar/NArgs.h"

namespace cmfmt::grammar {

struct PositionalSpec {
  NArgs npargs{};
  std::vector<std::string> flags{}; // normalized spellings
};

} // namespace cmfmt::grammar
