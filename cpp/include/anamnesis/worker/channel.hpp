#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "anamnesis/core/config.hpp"
#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/types.hpp"
#include "anamnesis/net/protocol.hpp"
#include "anamnesis/worker/transport.hpp"

namespace anamnesis::worker {
    using anamnesis::core::u64;

    struct ChannelConfig {
        std::string name{"worker"};
        u32 max_frame_bytes{core::kDefaultMaxFrameBytes};
    };

    // Multiplexes concurrent calls over one duplex transport. A read thread
    // owned by the channel matches each response to its caller by correlation
    // id; the pending table is the only state shared with callers.
    class WorkerChannel {
    public:
        // Invoked once, from the read thread or from the closing caller, when
        // the channel closes for any reason other than destruction.
        using ClosedCallback = std::function<void(WorkerChannel*, Status cause)>;

        WorkerChannel(std::unique_ptr<Transport> transport, ChannelConfig config,
                      ClosedCallback on_closed = {});
        ~WorkerChannel();

        WorkerChannel(const WorkerChannel&) = delete;
        WorkerChannel& operator=(const WorkerChannel&) = delete;

        // Ok with *out filled (a worker-side error is carried in out->status),
        // Timeout, Closed, or FrameTooLarge when the request exceeds the frame
        // limit. Only the calling thread blocks.
        [[nodiscard]] Status submit(const net::Request& req, u32 timeout_ms, net::Response* out);

        // Fails every pending call with Closed and rejects later submits.
        void close(Status cause);

        [[nodiscard]] bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }
        [[nodiscard]] Status close_cause() const;
        [[nodiscard]] u64 pending() const;
        [[nodiscard]] u64 dropped_responses() const noexcept { return dropped_.load(std::memory_order_relaxed); }
        [[nodiscard]] u64 discarded_late() const noexcept { return discarded_.load(std::memory_order_relaxed); }
        [[nodiscard]] const std::string& name() const noexcept { return config_.name; }

    private:
        struct Delivery {
            Status status{};
            net::Response response;
        };

        struct PendingCall {
            std::promise<Delivery> promise;
            bool abandoned{false};
        };

        void read_loop();
        void close_internal(Status cause, bool notify);

        std::unique_ptr<Transport> transport_;
        ChannelConfig config_;
        ClosedCallback on_closed_;

        std::atomic<u64> next_id_{1};
        std::atomic<bool> closed_{false};
        std::atomic<u64> dropped_{0};
        std::atomic<u64> discarded_{0};

        mutable std::mutex mu_;
        std::unordered_map<u64, std::shared_ptr<PendingCall>> pending_;
        Status close_cause_{};
        bool notified_{false};

        std::mutex write_mu_;

        // Started last in the constructor, so every member above is ready.
        std::thread reader_;
    };

} // namespace anamnesis::worker
