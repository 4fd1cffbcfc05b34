#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

// Per-format structural predicates and decoders. Decoders produce the raw
// canonical conversation; artifact detection, history derivation and
// fingerprints are applied afterwards by parse().
namespace anamnesis::parser {

    // Top-level "uuid" string and "chat_messages" array.
    [[nodiscard]] bool looks_like_claude(const nlohmann::json& doc) noexcept;
    // Top-level "mapping" object and "create_time" number.
    [[nodiscard]] bool looks_like_chatgpt(const nlohmann::json& doc) noexcept;
    // Top-level "id" string and "messages" array.
    [[nodiscard]] bool looks_like_generic(const nlohmann::json& doc) noexcept;

    [[nodiscard]] core::Status decode_claude(const nlohmann::json& doc, core::Conversation* out, std::string* error);
    [[nodiscard]] core::Status decode_chatgpt(const nlohmann::json& doc, core::Conversation* out, std::string* error);
    [[nodiscard]] core::Status decode_generic(const nlohmann::json& doc, core::Conversation* out, std::string* error);

} // namespace anamnesis::parser
