#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace anamnesis::parser {

    struct FencedBlock {
        std::string language;   // empty when the fence has no tag
        std::string body;
    };

    // Triple-backtick blocks in order of appearance. An opening fence is
    // ``` optionally followed by a language tag on the same line; the block
    // runs to the next ``` . An unterminated fence yields nothing.
    [[nodiscard]] std::vector<FencedBlock> find_fenced_blocks(std::string_view text);

} // namespace anamnesis::parser
