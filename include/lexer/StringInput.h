/**
 * Name: cmfmt::lex::StringInput
 * Purpose: String-backed input source implementation.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace cmfmt::lex {

class StringInput : public InputSource {
public:
    StringInput(std::string text, std::string name);

    bool read(std::string& out) override;

    const std::string& name() const override { return name_; }

private:
    std::string name_{};
    std::string text_{};
};

} // namespace cmfmt::lex
