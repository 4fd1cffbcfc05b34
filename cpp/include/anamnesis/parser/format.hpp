#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::parser {
    using anamnesis::core::Conversation;
    using anamnesis::core::FormatTag;
    using anamnesis::core::Status;

    // Tries Claude, ChatGpt, Generic in that order; first structural match wins.
    // DetectionFailed for non-JSON input or when nothing matches.
    [[nodiscard]] Status detect(std::string_view raw, FormatTag* out);

    // Decodes raw as the given format into the canonical model, then detects
    // fenced-code artifacts, derives missing lifecycle histories and fills
    // content fingerprints. DetectionFailed for non-JSON input; SchemaViolation
    // (description in *error) for missing or ill-typed fields.
    [[nodiscard]] Status parse(std::string_view raw, FormatTag format, Conversation* out, std::string* error);

    // detect() then parse(); a given hint skips detection.
    [[nodiscard]] Status parse_auto(std::string_view raw, std::optional<FormatTag> hint,
                                    Conversation* out, std::string* error);

} // namespace anamnesis::parser
