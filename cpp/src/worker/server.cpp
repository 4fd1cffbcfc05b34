#include "anamnesis/worker/server.hpp"

#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "anamnesis/core/log.hpp"
#include "anamnesis/net/framing.hpp"
#include "anamnesis/parser/format.hpp"
#include "anamnesis/parser/validate.hpp"
#include "anamnesis/rdf/generator.hpp"
#include "anamnesis/rdf/ntriples.hpp"
#include "anamnesis/reasoning/contamination.hpp"
#include "anamnesis/reasoning/engine.hpp"
#include "anamnesis/worker/transport.hpp"

namespace anamnesis::worker {
    namespace {
        using core::CorrelationId;
        using net::Response;

        Response ok_response(CorrelationId id, net::ReplyBody body) {
            Response r;
            r.id = id;
            r.body = std::move(body);
            return r;
        }

        std::string status_text(Status st) {
            return std::string(core::status_domain_name(st.domain)) + "/" + core::status_code_name(st.code);
        }

        struct Dispatch {
            CorrelationId id;

            Response operator()(const net::PingRequest& req) const {
                return ok_response(id, net::PingReply{req.nonce, req.payload});
            }

            Response operator()(const net::DetectRequest& req) const {
                core::FormatTag format{};
                const Status st = parser::detect(req.content, &format);
                if (!core::is_ok(st)) {
                    return net::make_error_response(id, st, "no known export format matches the input");
                }
                return ok_response(id, net::DetectReply{format});
            }

            Response operator()(const net::ParseRequest& req) const {
                net::ParseReply reply;
                std::string error;
                const Status st = parser::parse_auto(req.content, req.format, &reply.conversation, &error);
                if (!core::is_ok(st)) {
                    return net::make_error_response(id, st, error.empty() ? status_text(st) : error);
                }
                return ok_response(id, std::move(reply));
            }

            Response operator()(const net::ValidateRequest& req) const {
                net::ValidateReply reply;
                for (const parser::ValidationError& e : parser::validate(req.conversation)) {
                    reply.violations.push_back(parser::validation_error_text(e));
                }
                return ok_response(id, std::move(reply));
            }

            Response operator()(const net::ReasonRequest& req) const {
                net::ReasonReply reply;
                reasoning::ReasoningFailure failure;
                const Status st = reasoning::reason(req.conversation, &reply.inferences, &failure);
                if (!core::is_ok(st)) {
                    return net::make_error_response(id, st, failure.subject + ": " + failure.detail);
                }
                return ok_response(id, std::move(reply));
            }

            Response operator()(const net::GenerateRdfRequest& req) const {
                std::vector<core::Triple> triples;
                const Status st = rdf::generate(req.conversation, req.inferences, &triples);
                if (!core::is_ok(st)) {
                    return net::make_error_response(id, st, status_text(st));
                }
                net::GenerateRdfReply reply;
                reply.ntriples = rdf::to_ntriples(triples);
                reply.triple_count = static_cast<u32>(triples.size());
                return ok_response(id, std::move(reply));
            }

            Response operator()(const net::SpreadRequest& req) const {
                reasoning::ContaminationIndex index;
                for (const core::ConversationProfile& p : req.profiles) {
                    const Status st = index.add(p);
                    if (!core::is_ok(st)) {
                        return net::make_error_response(id, st, "bad profile '" + p.id + "'");
                    }
                }
                net::SpreadReply reply;
                const Status st = index.contamination_spread(req.seed, &reply.members);
                if (!core::is_ok(st)) {
                    return net::make_error_response(id, st, "unknown seed '" + req.seed + "'");
                }
                return ok_response(id, std::move(reply));
            }
        };

        Status write_response(int out_fd, const Response& resp, u32 max_frame_bytes) {
            std::vector<u8> payload;
            Status st = net::encode_response(resp, &payload);
            if (!core::is_ok(st)) {
                return st;
            }
            if (payload.size() > max_frame_bytes) {
                core::log_warn("worker", "response %llu of %zu bytes exceeds frame limit",
                               static_cast<unsigned long long>(resp.id.v), payload.size());
                payload.clear();
                st = net::encode_response(
                    net::make_error_response(resp.id,
                                             core::make_status(core::StatusDomain::Worker,
                                                               core::StatusCode::FrameTooLarge),
                                             "response exceeds frame limit"),
                    &payload);
                if (!core::is_ok(st)) {
                    return st;
                }
            }

            u8 header[net::kFrameLengthBytes];
            net::put_u32_be(header, static_cast<u32>(payload.size()));
            st = fd_write_all(out_fd, header, net::kFrameLengthBytes);
            if (!core::is_ok(st)) {
                return st;
            }
            return fd_write_all(out_fd, payload.data(), static_cast<u32>(payload.size()));
        }
    } // namespace

    const char* worker_kind_name(WorkerKind kind) noexcept {
        switch (kind) {
        case WorkerKind::Parser: return "parser";
        case WorkerKind::Reasoner: return "reasoner";
        case WorkerKind::Rdf: return "rdf";
        }
        return "unknown";
    }

    bool worker_kind_from_name(const char* name, WorkerKind* out) noexcept {
        if (name == nullptr || out == nullptr) return false;
        for (WorkerKind k : {WorkerKind::Parser, WorkerKind::Reasoner, WorkerKind::Rdf}) {
            if (std::strcmp(name, worker_kind_name(k)) == 0) {
                *out = k;
                return true;
            }
        }
        return false;
    }

    bool kind_serves(WorkerKind kind, net::Action action) noexcept {
        if (action == net::Action::Ping) {
            return true;
        }
        switch (kind) {
        case WorkerKind::Parser:
            return action == net::Action::Detect || action == net::Action::Parse || action == net::Action::Validate;
        case WorkerKind::Reasoner:
            return action == net::Action::Reason || action == net::Action::Spread;
        case WorkerKind::Rdf:
            return action == net::Action::GenerateRdf;
        }
        return false;
    }

    net::Response handle_request(WorkerKind kind, core::CorrelationId id, const net::Request& req) {
        const net::Action action = net::request_action(req);
        if (!kind_serves(kind, action)) {
            return net::make_error_response(
                id, core::make_status(core::StatusDomain::Worker, core::StatusCode::Unsupported),
                std::string(net::action_name(action)) + " is not served by " + worker_kind_name(kind) + " workers");
        }
        return std::visit(Dispatch{id}, req);
    }

    Status serve(int in_fd, int out_fd, WorkerKind kind, u32 max_frame_bytes) {
        core::log_debug("worker", "%s worker serving", worker_kind_name(kind));

        std::vector<u8> payload;
        u8 header[net::kFrameLengthBytes];

        for (;;) {
            Status st = fd_read_exact(in_fd, header, net::kFrameLengthBytes);
            if (!core::is_ok(st)) {
                if (st.code == core::StatusCode::Closed && st.aux == 0) {
                    return core::ok_status();
                }
                return st;
            }

            u32 len = 0;
            if (net::frame_read_length(core::BufferView{header, net::kFrameLengthBytes}, max_frame_bytes, &len) !=
                net::FrameParseResult::Ok) {
                core::log_error("worker", "frame of %u bytes exceeds limit %u", net::get_u32_be(header),
                                max_frame_bytes);
                return core::make_status(core::StatusDomain::Worker, core::StatusCode::FrameTooLarge);
            }

            payload.resize(len);
            if (len > 0) {
                st = fd_read_exact(in_fd, payload.data(), len);
                if (!core::is_ok(st)) {
                    core::log_error("worker", "short frame: %u of %u bytes", st.aux, len);
                    return st;
                }
            }

            core::CorrelationId id = core::CorrelationId::invalid();
            net::Request req;
            st = net::decode_request(core::BufferView{payload.data(), len}, &id, &req);

            Response resp;
            if (!core::is_ok(st)) {
                if (!id.is_valid()) {
                    core::log_warn("worker", "skipping undecodable request of %u bytes", len);
                    continue;
                }
                resp = net::make_error_response(id, st, st.aux == 1 ? "unknown action" : "malformed request body");
            } else {
                resp = handle_request(kind, id, req);
            }

            st = write_response(out_fd, resp, max_frame_bytes);
            if (!core::is_ok(st)) {
                return st;
            }
        }
    }

} // namespace anamnesis::worker
