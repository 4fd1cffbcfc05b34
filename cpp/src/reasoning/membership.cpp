#include "anamnesis/reasoning/membership.hpp"

#include <algorithm>
#include <map>
#include <utility>

namespace anamnesis::reasoning {
    core::Status normalize_membership(const std::vector<ProjectMembership>& memberships, MembershipScores* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        std::map<std::string, double> raw;
        for (const ProjectMembership& m : memberships) {
            double& slot = raw[m.category];
            slot = std::max(slot, membership_weight(m.type));
        }

        double total = 0.0;
        for (const auto& [category, score] : raw) {
            total += score;
        }

        MembershipScores result;
        if (total <= 0.0) {
            result.uncategorized = true;
            *out = std::move(result);
            return core::ok_status();
        }

        result.uncategorized = false;
        result.scores.reserve(raw.size());
        for (const auto& [category, score] : raw) {
            result.scores.push_back(CategoryScore{category, score, score / total});
        }
        *out = std::move(result);
        return core::ok_status();
    }

    core::Status primary_category(const std::vector<ProjectMembership>& memberships, std::string* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        const std::string* primary = nullptr;
        for (const ProjectMembership& m : memberships) {
            if (m.type != MembershipType::Primary) {
                continue;
            }
            if (primary != nullptr && *primary != m.category) {
                return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::MalformedRuleSet);
            }
            primary = &m.category;
        }

        if (primary == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::NotFound);
        }
        *out = *primary;
        return core::ok_status();
    }

    double contamination_risk(const std::vector<ProjectMembership>& memberships) {
        if (memberships.empty()) {
            return 0.0;
        }

        const ProjectMembership* primary = nullptr;
        for (const ProjectMembership& m : memberships) {
            if (m.type == MembershipType::Primary) {
                primary = &m;
                break;
            }
        }

        size_t foreign = 0;
        for (const ProjectMembership& m : memberships) {
            if (primary == nullptr || m.category != primary->category) {
                ++foreign;
            }
        }
        return static_cast<double>(foreign) / static_cast<double>(memberships.size());
    }
} // namespace anamnesis::reasoning
