#pragma once

#include <string>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::reasoning {
    using anamnesis::core::CategoryScore;
    using anamnesis::core::MembershipType;
    using anamnesis::core::ProjectMembership;

    [[nodiscard]] constexpr double membership_weight(MembershipType t) noexcept {
        switch (t) {
        case MembershipType::Primary: return 1.0;
        case MembershipType::Secondary: return 0.6;
        case MembershipType::Tangential: return 0.3;
        }
        return 0.0;
    }

    struct MembershipScores {
        std::vector<CategoryScore> scores;   // ordered by category id
        bool uncategorized{true};
    };

    // Raw score per category is its strongest membership weight; normalized
    // scores divide by the total. A zero total yields uncategorized and no scores.
    [[nodiscard]] core::Status normalize_membership(const std::vector<ProjectMembership>& memberships,
                                                    MembershipScores* out);

    // NotFound without a primary membership; MalformedRuleSet when more than
    // one distinct category is primary.
    [[nodiscard]] core::Status primary_category(const std::vector<ProjectMembership>& memberships, std::string* out);

    // Fraction of memberships whose category is not the primary category, in
    // [0, 1]. 0 for no memberships; with no primary every membership counts.
    [[nodiscard]] double contamination_risk(const std::vector<ProjectMembership>& memberships);

} // namespace anamnesis::reasoning
