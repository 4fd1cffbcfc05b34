#pragma once

#include <string>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::parser {

    enum class ValidationRule : core::u8 {
        EmptyConversationId = 0,
        DuplicateMessageId,
        NegativeTimestamp,
        EmptyArtifactId,
        DuplicateArtifactId,
        UnresolvedCreatedIn,
        UnresolvedModifiedIn,
        IllegalTransition,
    };

    [[nodiscard]] const char* validation_rule_name(ValidationRule rule) noexcept;

    // Referential rules are the created_in / modified_in ones.
    [[nodiscard]] constexpr bool validation_rule_referential(ValidationRule rule) noexcept {
        return rule == ValidationRule::UnresolvedCreatedIn || rule == ValidationRule::UnresolvedModifiedIn;
    }

    struct ValidationError {
        ValidationRule rule{ValidationRule::EmptyConversationId};
        std::string subject;   // offending message / artifact id, empty for the conversation
        std::string message;
    };

    // Every violation, in check order; empty when the conversation is valid.
    [[nodiscard]] std::vector<ValidationError> validate(const core::Conversation& conv);

    // "rule subject: message"
    [[nodiscard]] std::string validation_error_text(const ValidationError& e);

    // Status for a violation list: Ok when empty, otherwise ReferentialIntegrity
    // (domain Validation) with aux = number of violations.
    [[nodiscard]] core::Status validation_status(const std::vector<ValidationError>& errors) noexcept;

} // namespace anamnesis::parser
