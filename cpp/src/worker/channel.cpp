#include "anamnesis/worker/channel.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include "anamnesis/core/log.hpp"
#include "anamnesis/net/framing.hpp"

namespace anamnesis::worker {
    namespace {
        Status channel_status(core::StatusCode code, u32 aux = 0) noexcept {
            return core::make_status(core::StatusDomain::Channel, code, aux);
        }
    } // namespace

    WorkerChannel::WorkerChannel(std::unique_ptr<Transport> transport, ChannelConfig config,
                                 ClosedCallback on_closed)
        : transport_(std::move(transport)), config_(std::move(config)), on_closed_(std::move(on_closed)) {
        if (!transport_) {
            closed_.store(true, std::memory_order_release);
            close_cause_ = channel_status(core::StatusCode::Invalid);
            return;
        }
        reader_ = std::thread([this] { read_loop(); });
    }

    WorkerChannel::~WorkerChannel() {
        close_internal(channel_status(core::StatusCode::Closed), false);
        if (reader_.joinable()) {
            reader_.join();
        }
    }

    Status WorkerChannel::submit(const net::Request& req, u32 timeout_ms, net::Response* out) {
        if (out == nullptr) {
            return channel_status(core::StatusCode::Invalid);
        }
        if (closed()) {
            return channel_status(core::StatusCode::Closed);
        }

        const u64 id = next_id_.fetch_add(1, std::memory_order_relaxed);

        std::vector<u8> frame(net::kFrameLengthBytes);
        std::vector<u8> payload;
        Status st = net::encode_request(core::CorrelationId{id}, req, &payload);
        if (!core::is_ok(st)) {
            return st;
        }
        if (payload.size() > UINT32_MAX ||
            !net::frame_length_valid(static_cast<u32>(payload.size()), config_.max_frame_bytes)) {
            core::log_warn("channel", "%s: request of %zu bytes exceeds frame limit %u",
                           config_.name.c_str(), payload.size(), config_.max_frame_bytes);
            return channel_status(core::StatusCode::FrameTooLarge);
        }
        net::put_u32_be(frame.data(), static_cast<u32>(payload.size()));
        frame.insert(frame.end(), payload.begin(), payload.end());

        auto call = std::make_shared<PendingCall>();
        std::future<Delivery> result = call->promise.get_future();
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed()) {
                return channel_status(core::StatusCode::Closed);
            }
            pending_.emplace(id, call);
        }

        {
            std::lock_guard<std::mutex> lock(write_mu_);
            st = transport_->write_all(frame.data(), static_cast<u32>(frame.size()));
        }
        if (!core::is_ok(st)) {
            close(st);
        }

        if (result.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(mu_);
            // The read thread fulfils under mu_, so readiness is stable here.
            if (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                auto it = pending_.find(id);
                if (it != pending_.end()) {
                    it->second->abandoned = true;
                }
                return channel_status(core::StatusCode::Timeout);
            }
        }

        Delivery d = result.get();
        if (!core::is_ok(d.status)) {
            return d.status;
        }
        *out = std::move(d.response);
        return core::ok_status();
    }

    void WorkerChannel::close(Status cause) {
        close_internal(cause, true);
    }

    Status WorkerChannel::close_cause() const {
        std::lock_guard<std::mutex> lock(mu_);
        return close_cause_;
    }

    u64 WorkerChannel::pending() const {
        std::lock_guard<std::mutex> lock(mu_);
        return pending_.size();
    }

    void WorkerChannel::close_internal(Status cause, bool notify) {
        std::unordered_map<u64, std::shared_ptr<PendingCall>> failed;
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed()) {
                return;
            }
            closed_.store(true, std::memory_order_release);
            close_cause_ = cause;
            failed.swap(pending_);

            for (auto& [id, call] : failed) {
                if (!call->abandoned) {
                    call->promise.set_value(Delivery{channel_status(core::StatusCode::Closed), {}});
                }
            }
        }

        if (notify) {
            core::log_warn("channel", "%s closed: %s/%s (%zu pending failed)", config_.name.c_str(),
                           core::status_domain_name(cause.domain), core::status_code_name(cause.code),
                           failed.size());
        }

        if (transport_) {
            transport_->shutdown();
        }

        if (notify && on_closed_) {
            on_closed_(this, cause);
        }
    }

    void WorkerChannel::read_loop() {
        std::vector<u8> payload;
        u8 header[net::kFrameLengthBytes];

        while (!closed()) {
            Status st = transport_->read_exact(header, net::kFrameLengthBytes);
            if (!core::is_ok(st)) {
                close(st);
                return;
            }

            u32 len = 0;
            const net::FrameParseResult fr =
                net::frame_read_length(core::BufferView{header, net::kFrameLengthBytes}, config_.max_frame_bytes, &len);
            if (fr != net::FrameParseResult::Ok) {
                close(channel_status(core::StatusCode::FrameTooLarge, net::get_u32_be(header)));
                return;
            }

            payload.resize(len);
            if (len > 0) {
                st = transport_->read_exact(payload.data(), len);
                if (!core::is_ok(st)) {
                    close(st);
                    return;
                }
            }

            net::Response resp;
            st = net::decode_response(core::BufferView{payload.data(), len}, &resp);
            if (!core::is_ok(st)) {
                close(st);
                return;
            }

            std::lock_guard<std::mutex> lock(mu_);
            auto it = pending_.find(resp.id.v);
            if (it == pending_.end()) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                core::log_warn("channel", "%s: dropped response with unknown id %llu", config_.name.c_str(),
                               static_cast<unsigned long long>(resp.id.v));
                continue;
            }
            if (it->second->abandoned) {
                discarded_.fetch_add(1, std::memory_order_relaxed);
                core::log_debug("channel", "%s: discarded late response %llu", config_.name.c_str(),
                                static_cast<unsigned long long>(resp.id.v));
            } else {
                it->second->promise.set_value(Delivery{core::ok_status(), std::move(resp)});
            }
            pending_.erase(it);
        }
    }

} // namespace anamnesis::worker
