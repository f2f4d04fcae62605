/**
 * Name: cmfmt::lex::FileInput
 * Purpose: File-backed input source implementation.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace cmfmt::lex {

class FileInput : public InputSource {
public:
    explicit FileInput(std::string path);

    bool read(std::string& out) override;

    const std::string& name() const override { return path_; }

private:
    std::string path_{};
};

} // namespace cmfmt::lex
