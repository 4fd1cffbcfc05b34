#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

// Canonical JSON form of the data model. It is both the "generic" export format
// and the representation carried inside worker envelopes.
namespace anamnesis::core {

    [[nodiscard]] nlohmann::json conversation_to_json(const Conversation& conv);
    [[nodiscard]] nlohmann::json inferences_to_json(const Inferences& inf);

    // Decoding never throws; schema problems return SchemaViolation (domain Parser)
    // with a description in *error when error is non-null.
    [[nodiscard]] Status conversation_from_json(const nlohmann::json& doc, Conversation* out, std::string* error);
    [[nodiscard]] Status inferences_from_json(const nlohmann::json& doc, Inferences* out, std::string* error);

    [[nodiscard]] std::string conversation_to_text(const Conversation& conv);
    [[nodiscard]] std::string inferences_to_text(const Inferences& inf);
    [[nodiscard]] Status conversation_from_text(std::string_view text, Conversation* out, std::string* error);
    [[nodiscard]] Status inferences_from_text(std::string_view text, Inferences* out, std::string* error);

    // Floors a JSON number of seconds. False for NaN, infinities and values
    // outside the Timestamp range.
    [[nodiscard]] bool timestamp_from_seconds(double seconds, Timestamp* out) noexcept;

    // "frag" or "conversation#frag"
    [[nodiscard]] FragmentRef fragment_ref_from_string(std::string_view s);
    [[nodiscard]] std::string fragment_ref_to_string(const FragmentRef& ref);

} // namespace anamnesis::core
