#pragma once

namespace cmfmt::cst {
    enum class NodeKind {
        Body,
        Statement,
        FunName,
        FlowControl,
        OnOffSwitch,
        ArgGroup,
        KwargGroup,
        PargGroup,
        ParenGroup,
        Keyword,
        Argument,
        Flag,
        Comment,
        LParen,
        RParen,
    };

    // Upper-case display name (e.g. "KWARGGROUP")
    const char* to_string(NodeKind kind);
} // namespace cmfmt::cst
