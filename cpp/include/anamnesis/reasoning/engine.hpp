#pragma once

#include <string>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::reasoning {

    struct ReasoningFailure {
        std::string subject;   // artifact or category id
        std::string detail;
    };

    // Derives Inferences from a validated conversation.
    //   IllegalTransition: first artifact whose history is illegal
    //   MalformedRuleSet: empty category id or conflicting primary memberships
    // On failure *failure names the offending subject.
    [[nodiscard]] core::Status reason(const core::Conversation& conv, core::Inferences* out, ReasoningFailure* failure);

} // namespace anamnesis::reasoning
