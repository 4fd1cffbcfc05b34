#pragma once

#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::rdf {

    inline constexpr core::u32 kMissingConversationId = 1;
    inline constexpr core::u32 kMissingMessageId = 2;
    inline constexpr core::u32 kMissingArtifactId = 3;
    inline constexpr core::u32 kMissingCreatedIn = 4;

    // Deterministic, order-preserving triples for a conversation and its
    // inferences: conversation, memberships, messages, then artifacts.
    // MissingField (domain Rdf, aux = kMissing*) when a required id is empty.
    [[nodiscard]] core::Status generate(const core::Conversation& conv, const core::Inferences& inf,
                                        std::vector<core::Triple>* out);

} // namespace anamnesis::rdf
