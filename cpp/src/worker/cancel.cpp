#include "anamnesis/worker/cancel.hpp"

#include <utility>
#include <vector>

namespace anamnesis::worker {

    void CancelToken::cancel() {
        std::vector<Callback> fire;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            fire.reserve(callbacks_.size());
            for (auto& [id, cb] : callbacks_) {
                fire.push_back(std::move(cb));
            }
            callbacks_.clear();
        }
        for (Callback& cb : fire) {
            cb();
        }
    }

    u64 CancelToken::subscribe(Callback cb) const {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                const u64 id = next_id_++;
                callbacks_.emplace(id, std::move(cb));
                return id;
            }
        }
        cb();
        return 0;
    }

    void CancelToken::unsubscribe(u64 id) const {
        if (id == 0) return;
        std::lock_guard<std::mutex> lock(mu_);
        callbacks_.erase(id);
    }

} // namespace anamnesis::worker
