#include "anamnesis/worker/pool.hpp"

#include <algorithm>
#include <utility>

#include "anamnesis/core/log.hpp"

namespace anamnesis::worker {
    namespace {
        Status pool_status(core::StatusCode code, u32 aux = 0) noexcept {
            return core::make_status(core::StatusDomain::Pool, code, aux);
        }

        std::unique_ptr<WorkerChannel> take(std::vector<std::unique_ptr<WorkerChannel>>* from,
                                            WorkerChannel* channel) {
            auto it = std::find_if(from->begin(), from->end(),
                                   [channel](const std::unique_ptr<WorkerChannel>& c) { return c.get() == channel; });
            if (it == from->end()) {
                return nullptr;
            }
            std::unique_ptr<WorkerChannel> owned = std::move(*it);
            from->erase(it);
            return owned;
        }
    } // namespace

    // ------------------------------------------------------------------------
    // ChannelLease
    // ------------------------------------------------------------------------

    ChannelLease::ChannelLease(ChannelLease&& other) noexcept
        : pool_(std::exchange(other.pool_, nullptr)), channel_(std::exchange(other.channel_, nullptr)) {}

    ChannelLease& ChannelLease::operator=(ChannelLease&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = std::exchange(other.pool_, nullptr);
            channel_ = std::exchange(other.channel_, nullptr);
        }
        return *this;
    }

    void ChannelLease::release() noexcept {
        if (pool_ != nullptr && channel_ != nullptr) {
            pool_->checkin(channel_);
        }
        pool_ = nullptr;
        channel_ = nullptr;
    }

    // ------------------------------------------------------------------------
    // WorkerPool
    // ------------------------------------------------------------------------

    WorkerPool::WorkerPool(PoolConfig config, ChannelFactory factory)
        : config_(std::move(config)), factory_(std::move(factory)) {}

    WorkerPool::~WorkerPool() {
        shutdown();
    }

    WorkerChannel::ClosedCallback WorkerPool::closed_observer() {
        return [this](WorkerChannel* channel, Status cause) { on_channel_closed(channel, cause); };
    }

    Status WorkerPool::start() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (started_ || config_.size == 0 || !factory_) {
                return pool_status(core::StatusCode::Invalid);
            }
            started_ = true;
        }

        std::vector<std::unique_ptr<WorkerChannel>> created;
        for (u32 i = 0; i < config_.size; ++i) {
            std::unique_ptr<WorkerChannel> channel;
            const Status st = factory_(closed_observer(), &channel);
            if (!core::is_ok(st) || !channel) {
                core::log_error("pool", "%s: cannot start worker %u: %s/%s", config_.name.c_str(), i,
                                core::status_domain_name(st.domain), core::status_code_name(st.code));
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    stopping_ = true;
                }
                created.clear();
                return core::is_ok(st) ? pool_status(core::StatusCode::Unavailable) : st;
            }
            created.push_back(std::move(channel));
        }

        {
            std::lock_guard<std::mutex> lock(mu_);
            for (auto& channel : created) {
                register_locked(std::move(channel));
            }
        }
        respawner_ = std::thread([this] { respawn_loop(); });
        respawn_.notify_one();

        core::log_info("pool", "%s: started %u workers", config_.name.c_str(), config_.size);
        return core::ok_status();
    }

    Status WorkerPool::checkout(u32 timeout_ms, const CancelToken* cancel, WorkerChannel** out) {
        if (out == nullptr) {
            return pool_status(core::StatusCode::Invalid);
        }

        u64 subscription = 0;
        if (cancel != nullptr) {
            subscription = cancel->subscribe([this] {
                std::lock_guard<std::mutex> lock(mu_);
                available_.notify_all();
            });
        }

        const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        Status result{};
        {
            std::unique_lock<std::mutex> lock(mu_);
            for (;;) {
                if (cancel != nullptr && cancel->cancelled()) {
                    result = pool_status(core::StatusCode::Cancelled);
                    break;
                }
                if (stopping_) {
                    result = pool_status(core::StatusCode::Exhausted, kPoolAuxShutdown);
                    break;
                }
                if (exhausted_) {
                    result = pool_status(core::StatusCode::Exhausted, kPoolAuxCeiling);
                    break;
                }
                if (!idle_.empty()) {
                    WorkerChannel* channel = idle_.front();
                    idle_.pop_front();
                    busy_.insert(channel);
                    *out = channel;
                    break;
                }
                if (Clock::now() >= deadline) {
                    result = pool_status(core::StatusCode::Exhausted, kPoolAuxTimedOut);
                    break;
                }
                available_.wait_until(lock, deadline);
            }
        }

        if (cancel != nullptr) {
            cancel->unsubscribe(subscription);
        }
        return result;
    }

    Status WorkerPool::lease(u32 timeout_ms, const CancelToken* cancel, ChannelLease* out) {
        if (out == nullptr) {
            return pool_status(core::StatusCode::Invalid);
        }
        WorkerChannel* channel = nullptr;
        const Status st = checkout(timeout_ms, cancel, &channel);
        if (core::is_ok(st)) {
            *out = ChannelLease(this, channel);
        }
        return st;
    }

    void WorkerPool::checkin(WorkerChannel* channel) {
        if (channel == nullptr) return;

        std::lock_guard<std::mutex> lock(mu_);
        if (busy_.erase(channel) == 0) {
            core::log_warn("pool", "%s: checkin of a channel that is not checked out", config_.name.c_str());
            return;
        }

        if (std::unique_ptr<WorkerChannel> gone = take(&retired_, channel)) {
            graveyard_.push_back(std::move(gone));
            respawn_.notify_one();
            return;
        }
        if (channel->closed()) {
            // Its close notification has not been handled yet and will find nothing.
            bury_locked(&channels_, channel);
            return;
        }
        idle_.push_back(channel);
        available_.notify_one();
    }

    void WorkerPool::reset() {
        std::lock_guard<std::mutex> lock(mu_);
        restarts_.clear();
        exhausted_ = false;
        const u32 present = static_cast<u32>(channels_.size()) + spawning_;
        wanted_ = present < config_.size ? config_.size - present : 0;
        core::log_info("pool", "%s: reset, respawning %u", config_.name.c_str(), wanted_);
        respawn_.notify_one();
        available_.notify_all();
    }

    void WorkerPool::shutdown() {
        std::vector<std::unique_ptr<WorkerChannel>> doomed;
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopping_ = true;
            available_.notify_all();
            respawn_.notify_one();
        }
        if (respawner_.joinable()) {
            respawner_.join();
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            idle_.clear();
            busy_.clear();
            for (auto* list : {&channels_, &retired_, &graveyard_}) {
                for (auto& channel : *list) {
                    doomed.push_back(std::move(channel));
                }
                list->clear();
            }
        }
        // Channel destructors join their read threads, whose close
        // notifications need mu_.
        doomed.clear();
    }

    PoolStats WorkerPool::stats() const {
        std::lock_guard<std::mutex> lock(mu_);
        prune_locked(Clock::now());
        PoolStats s;
        s.live = static_cast<u32>(channels_.size());
        s.idle = static_cast<u32>(idle_.size());
        s.restarts_in_window = static_cast<u32>(restarts_.size());
        s.total_restarts = total_restarts_;
        s.exhausted = exhausted_;
        return s;
    }

    void WorkerPool::on_channel_closed(WorkerChannel* channel, Status cause) {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) return;

        if (busy_.count(channel) != 0) {
            if (std::unique_ptr<WorkerChannel> owned = take(&channels_, channel)) {
                retired_.push_back(std::move(owned));
                ++wanted_;
                respawn_.notify_one();
            }
        } else {
            auto it = std::find(idle_.begin(), idle_.end(), channel);
            if (it != idle_.end()) {
                idle_.erase(it);
            }
            bury_locked(&channels_, channel);
        }
        core::log_warn("pool", "%s: worker closed (%s/%s)", config_.name.c_str(),
                       core::status_domain_name(cause.domain), core::status_code_name(cause.code));
    }

    void WorkerPool::register_locked(std::unique_ptr<WorkerChannel> channel) {
        if (channel->closed()) {
            graveyard_.push_back(std::move(channel));
            ++wanted_;
            respawn_.notify_one();
            return;
        }
        idle_.push_back(channel.get());
        channels_.push_back(std::move(channel));
        available_.notify_one();
    }

    void WorkerPool::bury_locked(std::vector<std::unique_ptr<WorkerChannel>>* from, WorkerChannel* channel) {
        if (std::unique_ptr<WorkerChannel> owned = take(from, channel)) {
            graveyard_.push_back(std::move(owned));
            ++wanted_;
            respawn_.notify_one();
        }
    }

    void WorkerPool::prune_locked(Clock::time_point now) const {
        const auto window = std::chrono::milliseconds(config_.restart_window_ms);
        while (!restarts_.empty() && now - restarts_.front() >= window) {
            restarts_.pop_front();
        }
    }

    void WorkerPool::respawn_loop() {
        std::unique_lock<std::mutex> lock(mu_);
        for (;;) {
            respawn_.wait(lock, [this] { return stopping_ || !graveyard_.empty() || (wanted_ > 0 && !exhausted_); });
            if (stopping_) {
                return;
            }

            std::vector<std::unique_ptr<WorkerChannel>> dead;
            dead.swap(graveyard_);

            bool spawn = false;
            if (wanted_ > 0 && !exhausted_) {
                const Clock::time_point now = Clock::now();
                prune_locked(now);
                if (restarts_.size() >= config_.max_restarts) {
                    exhausted_ = true;
                    core::log_error("pool", "%s: restart ceiling of %u in %u ms reached", config_.name.c_str(),
                                    config_.max_restarts, config_.restart_window_ms);
                    available_.notify_all();
                } else {
                    restarts_.push_back(now);
                    ++total_restarts_;
                    --wanted_;
                    ++spawning_;
                    spawn = true;
                }
            }

            lock.unlock();
            dead.clear();

            std::unique_ptr<WorkerChannel> channel;
            Status st{};
            if (spawn) {
                core::log_info("pool", "%s: respawning worker", config_.name.c_str());
                st = factory_(closed_observer(), &channel);
            }

            lock.lock();
            if (spawn) {
                --spawning_;
                if (core::is_ok(st) && channel) {
                    register_locked(std::move(channel));
                } else {
                    core::log_warn("pool", "%s: respawn failed: %s/%s", config_.name.c_str(),
                                   core::status_domain_name(st.domain), core::status_code_name(st.code));
                    ++wanted_;
                    if (channel) {
                        graveyard_.push_back(std::move(channel));
                    }
                }
            }
        }
    }

} // namespace anamnesis::worker
