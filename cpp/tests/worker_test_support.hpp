#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include "anamnesis/net/framing.hpp"
#include "anamnesis/net/protocol.hpp"
#include "anamnesis/worker/channel.hpp"
#include "anamnesis/worker/pool.hpp"
#include "anamnesis/worker/server.hpp"
#include "anamnesis/worker/transport.hpp"

namespace anamnesis::test_support {

    // Counts the frames a channel sends; the channel writes each request with
    // a single write_all.
    class CountingTransport final : public worker::Transport {
    public:
        CountingTransport(std::unique_ptr<worker::Transport> inner, std::atomic<core::u64>* writes)
            : inner_(std::move(inner)), writes_(writes) {}

        core::Status read_exact(core::u8* buf, core::u32 len) override { return inner_->read_exact(buf, len); }

        core::Status write_all(const core::u8* buf, core::u32 len) override {
            writes_->fetch_add(1);
            return inner_->write_all(buf, len);
        }

        void shutdown() noexcept override { inner_->shutdown(); }

    private:
        std::unique_ptr<worker::Transport> inner_;
        std::atomic<core::u64>* writes_;
    };

    // Workers served on threads of the test process over socketpairs. Declare
    // before any pool using its factories so the pools are destroyed first.
    class InProcessWorkers {
    public:
        InProcessWorkers() { (void)std::signal(SIGPIPE, SIG_IGN); }

        ~InProcessWorkers() {
            std::lock_guard<std::mutex> lock(mu_);
            for (std::thread& t : threads_) {
                if (t.joinable()) t.join();
            }
            for (int fd : fds_) {
                (void)::close(fd);
            }
        }

        InProcessWorkers(const InProcessWorkers&) = delete;
        InProcessWorkers& operator=(const InProcessWorkers&) = delete;

        worker::ChannelFactory factory(worker::WorkerKind kind, core::u32 max_frame = core::kDefaultMaxFrameBytes) {
            return [this, kind, max_frame](worker::WorkerChannel::ClosedCallback on_closed,
                                           std::unique_ptr<worker::WorkerChannel>* out) -> core::Status {
                int fds[2];
                if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
                    return core::make_status(core::StatusDomain::Net, core::StatusCode::Io);
                }
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    fds_.push_back(fds[1]);
                    threads_.emplace_back([fd = fds[1], kind, max_frame] {
                        (void)worker::serve(fd, fd, kind, max_frame);
                        (void)::shutdown(fd, SHUT_RDWR);
                    });
                }
                worker::ChannelConfig cfg;
                cfg.name = worker::worker_kind_name(kind);
                cfg.max_frame_bytes = max_frame;
                auto transport = std::make_unique<CountingTransport>(
                    std::make_unique<worker::FdTransport>(fds[0], fds[0]), &requests_[static_cast<size_t>(kind)]);
                *out = std::make_unique<worker::WorkerChannel>(std::move(transport), cfg, std::move(on_closed));
                return core::ok_status();
            };
        }

        // Requests sent to workers of this kind so far.
        core::u64 requests(worker::WorkerKind kind) const { return requests_[static_cast<size_t>(kind)].load(); }

        // A single channel outside any pool.
        std::unique_ptr<worker::WorkerChannel> channel(worker::WorkerKind kind) {
            std::unique_ptr<worker::WorkerChannel> out;
            (void)factory(kind)({}, &out);
            return out;
        }

    private:
        std::mutex mu_;
        std::vector<std::thread> threads_;
        std::vector<int> fds_;
        std::array<std::atomic<core::u64>, 3> requests_{};
    };

    // A channel whose worker end is driven by the test.
    struct ScriptedWorker {
        std::unique_ptr<worker::WorkerChannel> channel;
        int fd{-1};

        explicit ScriptedWorker(core::u32 max_frame = core::kDefaultMaxFrameBytes,
                                worker::WorkerChannel::ClosedCallback on_closed = {}) {
            (void)std::signal(SIGPIPE, SIG_IGN);
            int fds[2];
            if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
                return;
            }
            fd = fds[1];
            worker::ChannelConfig cfg;
            cfg.name = "scripted";
            cfg.max_frame_bytes = max_frame;
            channel = std::make_unique<worker::WorkerChannel>(std::make_unique<worker::FdTransport>(fds[0], fds[0]),
                                                              cfg, std::move(on_closed));
        }

        ~ScriptedWorker() {
            channel.reset();
            if (fd >= 0) (void)::close(fd);
        }

        ScriptedWorker(const ScriptedWorker&) = delete;
        ScriptedWorker& operator=(const ScriptedWorker&) = delete;

        // Makes the channel's next read see end of stream.
        void hang_up() const { (void)::shutdown(fd, SHUT_RDWR); }
    };

    inline bool read_request(int fd, core::CorrelationId* id, net::Request* req) {
        core::u8 header[net::kFrameLengthBytes];
        if (!core::is_ok(worker::fd_read_exact(fd, header, net::kFrameLengthBytes))) return false;
        std::vector<core::u8> payload(net::get_u32_be(header));
        if (!payload.empty() &&
            !core::is_ok(worker::fd_read_exact(fd, payload.data(), static_cast<core::u32>(payload.size())))) {
            return false;
        }
        return core::is_ok(
            net::decode_request(core::BufferView{payload.data(), static_cast<core::u32>(payload.size())}, id, req));
    }

    inline bool write_raw(int fd, const std::vector<core::u8>& bytes) {
        return core::is_ok(worker::fd_write_all(fd, bytes.data(), static_cast<core::u32>(bytes.size())));
    }

    inline std::vector<core::u8> framed(const std::vector<core::u8>& payload) {
        std::vector<core::u8> out(net::kFrameLengthBytes);
        net::put_u32_be(out.data(), static_cast<core::u32>(payload.size()));
        out.insert(out.end(), payload.begin(), payload.end());
        return out;
    }

    inline bool write_response(int fd, const net::Response& resp) {
        std::vector<core::u8> payload;
        if (!core::is_ok(net::encode_response(resp, &payload))) return false;
        return write_raw(fd, framed(payload));
    }

    // Polls pred every few milliseconds until it holds or timeout_ms passes.
    inline bool eventually(const std::function<bool()>& pred, int timeout_ms = 5000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

} // namespace anamnesis::test_support
