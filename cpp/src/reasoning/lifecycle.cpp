#include "anamnesis/reasoning/lifecycle.hpp"

#include <algorithm>

namespace anamnesis::reasoning {
    std::vector<LifecycleEvent> ordered_events(const std::vector<LifecycleEvent>& events) {
        std::vector<LifecycleEvent> out = events;
        std::stable_sort(out.begin(), out.end(), [](const LifecycleEvent& a, const LifecycleEvent& b) {
            return a.at < b.at;
        });
        return out;
    }

    Status current_state(const std::vector<LifecycleEvent>& events, Timestamp at_time, LifecycleState* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        bool found = false;
        LifecycleState state = LifecycleState::Created;
        for (const LifecycleEvent& e : ordered_events(events)) {
            if (e.at > at_time) {
                break;
            }
            state = e.state;
            found = true;
        }

        if (!found) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::NotFound);
        }
        *out = state;
        return core::ok_status();
    }

    Status validate_lifecycle(const std::vector<LifecycleEvent>& events, TransitionViolation* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::Invalid);
        }

        const std::vector<LifecycleEvent> ordered = ordered_events(events);
        for (size_t i = 1; i < ordered.size(); ++i) {
            if (!transition_legal(ordered[i - 1].state, ordered[i].state)) {
                *out = TransitionViolation{ordered[i - 1].state, ordered[i].state, ordered[i].at};
                return core::make_status(core::StatusDomain::Reasoning, core::StatusCode::IllegalTransition,
                                         static_cast<core::u32>(i));
            }
        }
        return core::ok_status();
    }
} // namespace anamnesis::reasoning
