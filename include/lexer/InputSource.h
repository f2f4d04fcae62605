/**
 * Name: cmfmt::lex::InputSource
 * Purpose: Abstract whole-buffer input source.
 */
#pragma once

#include <string>

namespace cmfmt::lex {

class InputSource {
public:
    virtual ~InputSource() = default;

    virtual bool read(std::string& out) = 0; // entire contents; false if unavailable
    virtual const std::string& name() const = 0;
};

} // namespace cmfmt::lex
