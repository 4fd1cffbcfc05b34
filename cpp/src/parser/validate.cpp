#include "anamnesis/parser/validate.hpp"

#include <unordered_set>

#include "anamnesis/reasoning/lifecycle.hpp"

namespace anamnesis::parser {
    namespace {
        void add(std::vector<ValidationError>* out, ValidationRule rule, std::string subject, std::string message) {
            out->push_back(ValidationError{rule, std::move(subject), std::move(message)});
        }
    } // namespace

    const char* validation_rule_name(ValidationRule rule) noexcept {
        switch (rule) {
        case ValidationRule::EmptyConversationId: return "empty_conversation_id";
        case ValidationRule::DuplicateMessageId: return "duplicate_message_id";
        case ValidationRule::NegativeTimestamp: return "negative_timestamp";
        case ValidationRule::EmptyArtifactId: return "empty_artifact_id";
        case ValidationRule::DuplicateArtifactId: return "duplicate_artifact_id";
        case ValidationRule::UnresolvedCreatedIn: return "unresolved_created_in";
        case ValidationRule::UnresolvedModifiedIn: return "unresolved_modified_in";
        case ValidationRule::IllegalTransition: return "illegal_transition";
        }
        return "unknown";
    }

    std::vector<ValidationError> validate(const core::Conversation& conv) {
        std::vector<ValidationError> out;

        if (conv.id.empty()) {
            add(&out, ValidationRule::EmptyConversationId, std::string(), "conversation id is empty");
        }
        if (conv.timestamp < 0) {
            add(&out, ValidationRule::NegativeTimestamp, conv.id,
                "conversation timestamp " + std::to_string(conv.timestamp) + " is negative");
        }

        std::unordered_set<std::string> message_ids;
        for (const core::Message& m : conv.messages) {
            if (!message_ids.insert(m.id).second) {
                add(&out, ValidationRule::DuplicateMessageId, m.id, "message id appears more than once");
            }
            if (m.timestamp < 0) {
                add(&out, ValidationRule::NegativeTimestamp, m.id,
                    "message timestamp " + std::to_string(m.timestamp) + " is negative");
            }
        }

        std::unordered_set<std::string> artifact_ids;
        for (const core::Artifact& a : conv.artifacts) {
            if (a.id.empty()) {
                add(&out, ValidationRule::EmptyArtifactId, std::string(), "artifact id is empty");
            } else if (!artifact_ids.insert(a.id).second) {
                add(&out, ValidationRule::DuplicateArtifactId, a.id, "artifact id appears more than once");
            }

            if (message_ids.count(a.created_in) == 0) {
                add(&out, ValidationRule::UnresolvedCreatedIn, a.id,
                    "created_in '" + a.created_in + "' names no message");
            }
            for (const std::string& id : a.modified_in) {
                if (message_ids.count(id) == 0) {
                    add(&out, ValidationRule::UnresolvedModifiedIn, a.id, "modified_in '" + id + "' names no message");
                }
            }

            for (const core::LifecycleEvent& e : a.history) {
                if (e.at < 0) {
                    add(&out, ValidationRule::NegativeTimestamp, a.id,
                        "lifecycle event timestamp " + std::to_string(e.at) + " is negative");
                }
            }

            reasoning::TransitionViolation v;
            if (!core::is_ok(reasoning::validate_lifecycle(a.history, &v))) {
                add(&out, ValidationRule::IllegalTransition, a.id,
                    std::string(core::lifecycle_state_name(v.from)) + " -> " + core::lifecycle_state_name(v.to) +
                        " at " + std::to_string(v.at));
            }
        }

        return out;
    }

    std::string validation_error_text(const ValidationError& e) {
        std::string out = validation_rule_name(e.rule);
        if (!e.subject.empty()) {
            out += " ";
            out += e.subject;
        }
        out += ": ";
        out += e.message;
        return out;
    }

    core::Status validation_status(const std::vector<ValidationError>& errors) noexcept {
        if (errors.empty()) {
            return core::ok_status();
        }
        return core::make_status(core::StatusDomain::Validation, core::StatusCode::ReferentialIntegrity,
                                 static_cast<core::u32>(errors.size()));
    }
} // namespace anamnesis::parser
