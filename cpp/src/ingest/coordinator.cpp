#include "anamnesis/ingest/coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <thread>
#include <utility>

#include "anamnesis/core/log.hpp"
#include "anamnesis/net/protocol.hpp"

namespace anamnesis::ingest {
    namespace {
        using Clock = std::chrono::steady_clock;
        using core::StatusCode;
        using core::StatusDomain;

        Status ingest_status(StatusCode code, u32 aux = 0) noexcept {
            return core::make_status(StatusDomain::Ingest, code, aux);
        }

        Status read_file(const std::string& path, std::string* out) {
            FILE* f = std::fopen(path.c_str(), "rb");
            if (!f) {
                return ingest_status(errno == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                                     static_cast<u32>(errno));
            }

            std::string data;
            char buf[65536];
            size_t n = 0;
            while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
                data.append(buf, n);
            }
            const bool failed = std::ferror(f) != 0;
            std::fclose(f);
            if (failed) {
                return ingest_status(StatusCode::Io);
            }

            *out = std::move(data);
            return core::ok_status();
        }

        // State of one ingestion: the shared deadline and the channels it holds
        // until it ends.
        class Run {
        public:
            Run(const CoordinatorConfig& config, const worker::CancelToken* cancel, IngestResult* result)
                : config_(config), cancel_(cancel), result_(result),
                  deadline_(Clock::now() + std::chrono::milliseconds(config.overall_timeout_ms)) {}

            Status fail(Stage stage, Status cause, std::vector<std::string> details = {}) {
                core::log_warn("ingest", "%s failed: %s/%s%s%s", stage_name(stage),
                               core::status_domain_name(cause.domain), core::status_code_name(cause.code),
                               details.empty() ? "" : ": ", details.empty() ? "" : details.front().c_str());
                result_->error = StageError{stage, cause, std::move(details)};
                return cause;
            }

            // Remaining budget in ms, 0 when spent.
            [[nodiscard]] u32 remaining_ms() const {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
                return left.count() > 0 ? static_cast<u32>(left.count()) : 0;
            }

            // Checks out a channel of the pool once per ingestion.
            Status acquire(worker::WorkerPool& pool, worker::ChannelLease* lease) {
                if (*lease) {
                    return core::ok_status();
                }
                const u32 left = remaining_ms();
                if (left == 0) {
                    return ingest_status(StatusCode::Timeout);
                }
                return pool.lease(std::min(config_.checkout_timeout_ms, left), cancel_, lease);
            }

            // One call on a held channel. A worker error response becomes the
            // stage cause with its detail.
            Status call(worker::WorkerChannel* channel, const net::Request& req, net::Response* resp,
                        std::vector<std::string>* details) {
                if (cancel_ != nullptr && cancel_->cancelled()) {
                    return ingest_status(StatusCode::Cancelled);
                }
                const u32 left = remaining_ms();
                if (left == 0) {
                    return ingest_status(StatusCode::Timeout);
                }
                const Status st = channel->submit(req, std::min(config_.call_timeout_ms, left), resp);
                if (!core::is_ok(st)) {
                    return st;
                }
                if (!core::is_ok(resp->status)) {
                    if (!resp->detail.empty()) {
                        details->push_back(resp->detail);
                    }
                    return resp->status;
                }
                return core::ok_status();
            }

            worker::ChannelLease parser;
            worker::ChannelLease reasoner;
            worker::ChannelLease rdf;

        private:
            const CoordinatorConfig& config_;
            const worker::CancelToken* cancel_;
            IngestResult* result_;
            Clock::time_point deadline_;
        };
    } // namespace

    const char* stage_name(Stage stage) noexcept {
        switch (stage) {
        case Stage::Read: return "read";
        case Stage::Parse: return "parse";
        case Stage::Validate: return "validate";
        case Stage::Reason: return "reasoning";
        case Stage::Generate: return "rdf_generation";
        case Stage::Store: return "store";
        }
        return "unknown";
    }

    IngestionCoordinator::IngestionCoordinator(worker::WorkerPool& parsers, worker::WorkerPool& reasoners,
                                               worker::WorkerPool& rdf, store::TripleStore& store,
                                               CoordinatorConfig config)
        : parsers_(parsers), reasoners_(reasoners), rdf_(rdf), store_(store), config_(std::move(config)) {}

    Status IngestionCoordinator::ingest_file(const std::string& path, IngestResult* out,
                                             std::optional<core::FormatTag> format,
                                             const worker::CancelToken* cancel) const {
        if (out == nullptr) {
            return ingest_status(StatusCode::Invalid);
        }
        *out = IngestResult{};

        std::string content;
        const Status st = read_file(path, &content);
        if (!core::is_ok(st)) {
            Run run(config_, cancel, out);
            return run.fail(Stage::Read, st, {path});
        }
        return ingest_content(content, format, out, cancel);
    }

    Status IngestionCoordinator::ingest_content(std::string_view content, std::optional<core::FormatTag> format,
                                                IngestResult* out, const worker::CancelToken* cancel) const {
        if (out == nullptr) {
            return ingest_status(StatusCode::Invalid);
        }
        *out = IngestResult{};
        Run run(config_, cancel, out);
        std::vector<std::string> details;
        Status st{};

        // parse
        st = run.acquire(parsers_, &run.parser);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Parse, st);
        }
        net::Response resp;
        st = run.call(run.parser.get(), net::ParseRequest{std::string(content), format}, &resp, &details);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Parse, st, std::move(details));
        }
        const net::ParseReply* parsed = nullptr;
        st = net::expect_reply(resp, &parsed);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Parse, st, {"unexpected reply"});
        }
        core::Conversation conv = parsed->conversation;
        std::string conversation_id = conv.id;

        // validate
        st = run.call(run.parser.get(), net::ValidateRequest{conv}, &resp, &details);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Validate, st, std::move(details));
        }
        const net::ValidateReply* validated = nullptr;
        st = net::expect_reply(resp, &validated);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Validate, st, {"unexpected reply"});
        }
        if (!validated->violations.empty()) {
            const u32 count = static_cast<u32>(validated->violations.size());
            return run.fail(Stage::Validate,
                            core::make_status(StatusDomain::Validation, StatusCode::ReferentialIntegrity, count),
                            validated->violations);
        }

        // reasoning
        st = run.acquire(reasoners_, &run.reasoner);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Reason, st);
        }
        st = run.call(run.reasoner.get(), net::ReasonRequest{conv}, &resp, &details);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Reason, st, std::move(details));
        }
        const net::ReasonReply* reasoned = nullptr;
        st = net::expect_reply(resp, &reasoned);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Reason, st, {"unexpected reply"});
        }
        core::Inferences inferences = reasoned->inferences;

        // rdf generation
        st = run.acquire(rdf_, &run.rdf);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Generate, st);
        }
        st = run.call(run.rdf.get(), net::GenerateRdfRequest{std::move(conv), std::move(inferences)}, &resp,
                      &details);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Generate, st, std::move(details));
        }
        const net::GenerateRdfReply* generated = nullptr;
        st = net::expect_reply(resp, &generated);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Generate, st, {"unexpected reply"});
        }

        // store
        if (run.remaining_ms() == 0) {
            return run.fail(Stage::Store, ingest_status(StatusCode::Timeout));
        }
        st = store_.insert(config_.store_endpoint, generated->ntriples);
        if (!core::is_ok(st)) {
            return run.fail(Stage::Store, st, {config_.store_endpoint});
        }

        out->conversation_id = std::move(conversation_id);
        out->triple_count = generated->triple_count;
        core::log_info("ingest", "%s: %u triples", out->conversation_id.c_str(), out->triple_count);
        return core::ok_status();
    }

    Status IngestionCoordinator::ingest_files(const std::vector<std::string>& paths, u32 concurrency,
                                              std::vector<Status>* statuses, std::vector<IngestResult>* results,
                                              std::optional<core::FormatTag> format,
                                              const worker::CancelToken* cancel) const {
        if (statuses == nullptr || results == nullptr || concurrency == 0) {
            return ingest_status(StatusCode::Invalid);
        }
        statuses->assign(paths.size(), Status{});
        results->assign(paths.size(), IngestResult{});

        std::atomic<size_t> next{0};
        auto drain = [&] {
            for (size_t i = next.fetch_add(1); i < paths.size(); i = next.fetch_add(1)) {
                (*statuses)[i] = ingest_file(paths[i], &(*results)[i], format, cancel);
            }
        };

        const size_t threads = std::min<size_t>(concurrency, paths.size());
        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (size_t t = 0; t < threads; ++t) {
            pool.emplace_back(drain);
        }
        for (std::thread& t : pool) {
            t.join();
        }
        return core::ok_status();
    }

} // namespace anamnesis::ingest
