#pragma once

#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"

namespace anamnesis::reasoning {
    using anamnesis::core::LifecycleEvent;
    using anamnesis::core::LifecycleState;
    using anamnesis::core::Status;
    using anamnesis::core::Timestamp;

    // Created -> {Modified, Removed}
    // Modified -> {Modified, Evaluated, Removed}
    // Evaluated -> {Removed}
    // Removed is terminal.
    [[nodiscard]] constexpr bool transition_legal(LifecycleState from, LifecycleState to) noexcept {
        switch (from) {
        case LifecycleState::Created:
            return to == LifecycleState::Modified || to == LifecycleState::Removed;
        case LifecycleState::Modified:
            return to == LifecycleState::Modified || to == LifecycleState::Evaluated || to == LifecycleState::Removed;
        case LifecycleState::Evaluated:
            return to == LifecycleState::Removed;
        case LifecycleState::Removed:
            return false;
        }
        return false;
    }

    // Stable sort by timestamp; equal timestamps keep their given order.
    [[nodiscard]] std::vector<LifecycleEvent> ordered_events(const std::vector<LifecycleEvent>& events);

    // State of the latest event with timestamp <= at_time; NotFound when none.
    [[nodiscard]] Status current_state(const std::vector<LifecycleEvent>& events, Timestamp at_time,
                                       LifecycleState* out);

    struct TransitionViolation {
        LifecycleState from{LifecycleState::Created};
        LifecycleState to{LifecycleState::Created};
        Timestamp at{0};   // time of the offending 'to' event
    };

    // Checks consecutive pairs in timestamp order. IllegalTransition reports
    // the first illegal pair in *out. Empty and single-event sequences pass.
    [[nodiscard]] Status validate_lifecycle(const std::vector<LifecycleEvent>& events, TransitionViolation* out);

} // namespace anamnesis::reasoning
