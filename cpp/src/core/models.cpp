#include "anamnesis/core/models.hpp"

#include <cstring>

namespace anamnesis::core {
    const char* lifecycle_state_name(LifecycleState s) noexcept {
        switch (s) {
        case LifecycleState::Created: return "created";
        case LifecycleState::Modified: return "modified";
        case LifecycleState::Removed: return "removed";
        case LifecycleState::Evaluated: return "evaluated";
        }
        return "created";
    }

    bool lifecycle_state_from_name(const char* name, LifecycleState* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (LifecycleState s : {LifecycleState::Created, LifecycleState::Modified,
                                 LifecycleState::Removed, LifecycleState::Evaluated}) {
            if (std::strcmp(lifecycle_state_name(s), name) == 0) {
                *out = s;
                return true;
            }
        }
        return false;
    }

    const char* membership_type_name(MembershipType t) noexcept {
        switch (t) {
        case MembershipType::Primary: return "primary";
        case MembershipType::Secondary: return "secondary";
        case MembershipType::Tangential: return "tangential";
        }
        return "primary";
    }

    bool membership_type_from_name(const char* name, MembershipType* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (MembershipType t : {MembershipType::Primary, MembershipType::Secondary, MembershipType::Tangential}) {
            if (std::strcmp(membership_type_name(t), name) == 0) {
                *out = t;
                return true;
            }
        }
        return false;
    }

    const char* format_name(FormatTag f) noexcept {
        switch (f) {
        case FormatTag::Claude: return "claude";
        case FormatTag::ChatGpt: return "chatgpt";
        case FormatTag::Generic: return "generic";
        }
        return "generic";
    }

    bool format_from_name(const char* name, FormatTag* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (FormatTag f : {FormatTag::Claude, FormatTag::ChatGpt, FormatTag::Generic}) {
            if (std::strcmp(format_name(f), name) == 0) {
                *out = f;
                return true;
            }
        }
        return false;
    }

    const Message* find_message(const Conversation& conv, const std::string& id) noexcept {
        for (const Message& m : conv.messages) {
            if (m.id == id) {
                return &m;
            }
        }
        return nullptr;
    }

    const Artifact* find_artifact(const Conversation& conv, const std::string& id) noexcept {
        for (const Artifact& a : conv.artifacts) {
            if (a.id == id) {
                return &a;
            }
        }
        return nullptr;
    }
} // namespace anamnesis::core
