#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>

#include "anamnesis/core/types.hpp"

namespace anamnesis::worker {
    using anamnesis::core::u64;

    // One-shot cancellation flag with wake-up callbacks. Callbacks run on the
    // thread calling cancel(), or inline in subscribe() when already cancelled.
    class CancelToken {
    public:
        using Callback = std::function<void()>;

        CancelToken() = default;
        CancelToken(const CancelToken&) = delete;
        CancelToken& operator=(const CancelToken&) = delete;

        void cancel();
        [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

        // Returns an id for unsubscribe(); 0 when the callback already ran.
        [[nodiscard]] u64 subscribe(Callback cb) const;
        void unsubscribe(u64 id) const;

    private:
        std::atomic<bool> cancelled_{false};
        mutable std::mutex mu_;
        mutable std::map<u64, Callback> callbacks_;
        mutable u64 next_id_{1};
    };

} // namespace anamnesis::worker
