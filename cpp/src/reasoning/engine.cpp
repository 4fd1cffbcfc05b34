#include "anamnesis/reasoning/engine.hpp"

#include <algorithm>
#include <utility>

#include "anamnesis/reasoning/lifecycle.hpp"
#include "anamnesis/reasoning/membership.hpp"
#include "anamnesis/reasoning/references.hpp"

namespace anamnesis::reasoning {
    namespace {
        core::Status fail(ReasoningFailure* failure, core::StatusCode code, std::string subject, std::string detail) {
            if (failure != nullptr) {
                failure->subject = std::move(subject);
                failure->detail = std::move(detail);
            }
            return core::make_status(core::StatusDomain::Reasoning, code);
        }
    } // namespace

    core::Status reason(const core::Conversation& conv, core::Inferences* out, ReasoningFailure* failure) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        core::Inferences inf;
        inf.conversation_id = conv.id;

        for (const core::Artifact& a : conv.artifacts) {
            TransitionViolation v;
            if (!core::is_ok(validate_lifecycle(a.history, &v))) {
                return fail(failure, core::StatusCode::IllegalTransition, a.id,
                            std::string(core::lifecycle_state_name(v.from)) + " -> " +
                                core::lifecycle_state_name(v.to) + " at " + std::to_string(v.at));
            }

            core::ArtifactInference ai;
            ai.artifact_id = a.id;
            ai.current = a.state;
            if (!a.history.empty()) {
                for (const core::LifecycleEvent& e : a.history) {
                    ai.as_of = std::max(ai.as_of, e.at);
                }
                if (!core::is_ok(current_state(a.history, ai.as_of, &ai.current))) {
                    ai.current = a.state;
                }
                ai.transitions = static_cast<core::u32>(a.history.size() - 1);
            }
            inf.artifacts.push_back(std::move(ai));
        }

        for (const core::ProjectMembership& m : conv.memberships) {
            if (m.category.empty()) {
                return fail(failure, core::StatusCode::MalformedRuleSet, std::string(), "empty category id");
            }
        }

        std::string primary;
        const core::Status ps = primary_category(conv.memberships, &primary);
        if (ps.code == core::StatusCode::MalformedRuleSet) {
            std::string names;
            for (const core::ProjectMembership& m : conv.memberships) {
                if (m.type == core::MembershipType::Primary) {
                    if (!names.empty()) names += ", ";
                    names += m.category;
                }
            }
            return fail(failure, core::StatusCode::MalformedRuleSet, conv.id, "conflicting primary categories: " + names);
        }
        if (core::is_ok(ps)) {
            inf.primary_category = primary;
        }

        MembershipScores scores;
        const core::Status ns = normalize_membership(conv.memberships, &scores);
        if (!core::is_ok(ns)) {
            return ns;
        }
        inf.memberships = std::move(scores.scores);
        inf.uncategorized = scores.uncategorized;
        inf.contamination_risk = contamination_risk(conv.memberships);

        const ReferenceGraph graph = reference_graph_of(conv);
        for (const core::Message& m : conv.messages) {
            std::vector<Fragment> linked;
            if (core::is_ok(graph.linked(Fragment{conv.id, m.id}, &linked)) && !linked.empty()) {
                inf.links.push_back(core::FragmentLinks{m.id, std::move(linked)});
            }
        }
        inf.cross_references = graph.cross_conversation_refs();

        *out = std::move(inf);
        return core::ok_status();
    }
} // namespace anamnesis::reasoning
