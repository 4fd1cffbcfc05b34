#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::reasoning {
    using anamnesis::core::ConversationProfile;

    // Profile of a parsed conversation: its primary category (none when absent
    // or ambiguous) and the content fingerprints of its artifacts.
    [[nodiscard]] ConversationProfile profile_of(const core::Conversation& conv);

    // True iff both have primary categories, they differ, and the two share at
    // least one artifact key.
    [[nodiscard]] bool profiles_contaminate(const ConversationProfile& a, const ConversationProfile& b);

    class ContaminationIndex {
    public:
        // Invalid for an empty or duplicate id.
        [[nodiscard]] core::Status add(ConversationProfile profile);

        [[nodiscard]] bool contains(const std::string& id) const;
        [[nodiscard]] size_t size() const noexcept { return profiles_.size(); }

        // False when either id is unknown.
        [[nodiscard]] bool contaminates(const std::string& a, const std::string& b) const;

        // Transitive closure of contaminates() from seed, deduplicated, sorted,
        // seed excluded. NotFound for an unknown seed.
        [[nodiscard]] core::Status contamination_spread(const std::string& seed, std::vector<std::string>* out) const;

    private:
        std::vector<size_t> neighbours(size_t index) const;

        std::vector<ConversationProfile> profiles_;
        std::unordered_map<std::string, size_t> by_id_;
        // artifact key -> profiles holding it
        std::unordered_map<std::string, std::vector<size_t>> by_key_;
    };

} // namespace anamnesis::reasoning
