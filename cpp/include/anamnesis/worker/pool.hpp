#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/types.hpp"
#include "anamnesis/worker/cancel.hpp"
#include "anamnesis/worker/channel.hpp"

namespace anamnesis::worker {

    // aux values of Exhausted returned by checkout.
    inline constexpr u32 kPoolAuxTimedOut = 1;
    inline constexpr u32 kPoolAuxCeiling = 2;
    inline constexpr u32 kPoolAuxShutdown = 3;

    struct PoolConfig {
        std::string name{"pool"};
        u32 size{1};
        u32 max_restarts{5};
        u32 restart_window_ms{60000};
    };

    // Creates one connected channel. The pool passes the observer the new
    // channel must be constructed with.
    using ChannelFactory =
        std::function<Status(WorkerChannel::ClosedCallback on_closed, std::unique_ptr<WorkerChannel>* out)>;

    struct PoolStats {
        u32 live{0};
        u32 idle{0};
        u32 restarts_in_window{0};
        u64 total_restarts{0};
        bool exhausted{false};
    };

    class WorkerPool;

    // Checked-out channel, returned to its pool on destruction.
    class ChannelLease {
    public:
        ChannelLease() = default;
        ChannelLease(WorkerPool* pool, WorkerChannel* channel) noexcept : pool_(pool), channel_(channel) {}
        ~ChannelLease() { release(); }

        ChannelLease(const ChannelLease&) = delete;
        ChannelLease& operator=(const ChannelLease&) = delete;
        ChannelLease(ChannelLease&& other) noexcept;
        ChannelLease& operator=(ChannelLease&& other) noexcept;

        [[nodiscard]] WorkerChannel* get() const noexcept { return channel_; }
        WorkerChannel* operator->() const noexcept { return channel_; }
        explicit operator bool() const noexcept { return channel_ != nullptr; }

        void release() noexcept;

    private:
        WorkerPool* pool_{nullptr};
        WorkerChannel* channel_{nullptr};
    };

    // Fixed-size set of worker channels. Closed channels are replaced by a
    // respawn thread, at most max_restarts times per sliding window; past that
    // the pool is exhausted until reset(). Leases must be returned before the
    // pool is destroyed.
    class WorkerPool {
    public:
        WorkerPool(PoolConfig config, ChannelFactory factory);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // Creates config.size channels. Invalid for a zero size or a second
        // call; otherwise the first factory failure.
        [[nodiscard]] Status start();

        // Blocks only the caller. Exhausted (aux kPoolAux*) or Cancelled.
        [[nodiscard]] Status checkout(u32 timeout_ms, const CancelToken* cancel, WorkerChannel** out);
        [[nodiscard]] Status lease(u32 timeout_ms, const CancelToken* cancel, ChannelLease* out);
        void checkin(WorkerChannel* channel);

        // Forgets the restart history and respawns up to size.
        void reset();
        void shutdown();

        [[nodiscard]] PoolStats stats() const;
        [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

    private:
        using Clock = std::chrono::steady_clock;

        WorkerChannel::ClosedCallback closed_observer();
        void on_channel_closed(WorkerChannel* channel, Status cause);
        void register_locked(std::unique_ptr<WorkerChannel> channel);
        void bury_locked(std::vector<std::unique_ptr<WorkerChannel>>* from, WorkerChannel* channel);
        void prune_locked(Clock::time_point now) const;
        void respawn_loop();

        PoolConfig config_;
        ChannelFactory factory_;

        mutable std::mutex mu_;
        std::condition_variable available_;
        std::condition_variable respawn_;

        std::vector<std::unique_ptr<WorkerChannel>> channels_;   // open, registered
        std::vector<std::unique_ptr<WorkerChannel>> retired_;    // closed while checked out
        std::vector<std::unique_ptr<WorkerChannel>> graveyard_;  // awaiting destruction
        std::deque<WorkerChannel*> idle_;
        std::unordered_set<WorkerChannel*> busy_;
        mutable std::deque<Clock::time_point> restarts_;

        u32 wanted_{0};
        u32 spawning_{0};
        u64 total_restarts_{0};
        bool exhausted_{false};
        bool started_{false};
        bool stopping_{false};

        std::thread respawner_;
    };

} // namespace anamnesis::worker
