#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <unistd.h>

#include "anamnesis/ingest/coordinator.hpp"
#include "worker_test_support.hpp"

namespace ts = anamnesis::test_support;
using anamnesis::core::StatusCode;
using anamnesis::core::StatusDomain;
using anamnesis::ingest::Stage;
using anamnesis::worker::WorkerKind;

namespace {
    class FakeStore final : public anamnesis::store::TripleStore {
    public:
        anamnesis::core::Status insert(const std::string& endpoint, std::string_view ntriples) override {
            std::lock_guard<std::mutex> lock(mu_);
            if (fail_) {
                return anamnesis::core::make_status(StatusDomain::Store, StatusCode::Network);
            }
            inserts.emplace_back(endpoint, std::string(ntriples));
            return anamnesis::core::ok_status();
        }

        anamnesis::core::Status query(const std::string&, std::string_view, anamnesis::store::QueryResult*) override {
            return anamnesis::core::make_status(StatusDomain::Store, StatusCode::Unsupported);
        }

        void fail_inserts() {
            std::lock_guard<std::mutex> lock(mu_);
            fail_ = true;
        }

        std::vector<std::pair<std::string, std::string>> inserts;

    private:
        std::mutex mu_;
        bool fail_{false};
    };

    anamnesis::worker::PoolConfig pool_config(const char* name, anamnesis::core::u32 size) {
        anamnesis::worker::PoolConfig cfg;
        cfg.name = name;
        cfg.size = size;
        return cfg;
    }

    // Pools and store wired like the CLI wires them, with workers in-process.
    struct Pipeline {
        ts::InProcessWorkers workers;
        anamnesis::worker::WorkerPool parsers{pool_config("parser", 2), workers.factory(WorkerKind::Parser)};
        anamnesis::worker::WorkerPool reasoners{pool_config("reasoner", 1), workers.factory(WorkerKind::Reasoner)};
        anamnesis::worker::WorkerPool rdf{pool_config("rdf", 1), workers.factory(WorkerKind::Rdf)};
        FakeStore store;
        anamnesis::ingest::IngestionCoordinator coordinator;

        explicit Pipeline(anamnesis::ingest::CoordinatorConfig cfg = default_config())
            : coordinator(parsers, reasoners, rdf, store, std::move(cfg)) {}

        bool start() {
            return anamnesis::core::is_ok(parsers.start()) && anamnesis::core::is_ok(reasoners.start()) &&
                   anamnesis::core::is_ok(rdf.start());
        }

        static anamnesis::ingest::CoordinatorConfig default_config() {
            anamnesis::ingest::CoordinatorConfig cfg;
            cfg.call_timeout_ms = 5000;
            cfg.checkout_timeout_ms = 5000;
            cfg.overall_timeout_ms = 20000;
            cfg.store_endpoint = "test-graph";
            return cfg;
        }
    };

    std::string generic_doc(const std::string& messages, const std::string& extra = "") {
        return R"({"id": "conv-1", "timestamp": 1700000000, "messages": [)" + messages + "]" + extra + "}";
    }

    std::string message(const char* id, const char* text, const char* refs = "[]") {
        return std::string(R"({"id": ")") + id + R"(", "speaker": {"kind": "human", "name": "sam"}, "content": ")" +
               text + R"(", "timestamp": 1700000001, "references": )" + refs + "}";
    }
} // namespace

TEST(IngestCoordinator, StageNames) {
    EXPECT_STREQ(anamnesis::ingest::stage_name(Stage::Reason), "reasoning");
    EXPECT_STREQ(anamnesis::ingest::stage_name(Stage::Generate), "rdf_generation");
}

TEST(IngestCoordinator, IngestsConversationIntoStore) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    const std::string doc = generic_doc(message("m1", "see ```py\\nx = 1\\n```") + "," + message("m2", "ok"),
                                        R"(, "memberships": [{"category": "demo", "type": "primary"}])");
    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_content(doc, std::nullopt, &result);
    ASSERT_TRUE(anamnesis::core::is_ok(st)) << (result.error ? result.error->details.size() : 0);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.conversation_id, "conv-1");
    EXPECT_GT(result.triple_count, 0u);

    ASSERT_EQ(p.store.inserts.size(), 1u);
    EXPECT_EQ(p.store.inserts[0].first, "test-graph");
    const std::string& nt = p.store.inserts[0].second;
    EXPECT_NE(nt.find("<http://anamnesis.hyperpolymath.org/ns#conv:conv-1>"), std::string::npos);
    EXPECT_NE(nt.find("<http://anamnesis.hyperpolymath.org/ns#project:demo>"), std::string::npos);
    EXPECT_EQ(static_cast<anamnesis::core::u32>(std::count(nt.begin(), nt.end(), '\n')), result.triple_count);
}

TEST(IngestCoordinator, IngestsFileWithExplicitFormat) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    char path[] = "/tmp/anamnesis-ingest-XXXXXX";
    const int fd = ::mkstemp(path);
    ASSERT_GE(fd, 0);
    const std::string doc = generic_doc(message("m1", "hello"));
    ASSERT_EQ(::write(fd, doc.data(), doc.size()), static_cast<ssize_t>(doc.size()));
    (void)::close(fd);

    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st =
        p.coordinator.ingest_file(path, &result, anamnesis::core::FormatTag::Generic);
    (void)std::remove(path);
    ASSERT_TRUE(anamnesis::core::is_ok(st));
    EXPECT_EQ(result.conversation_id, "conv-1");
    EXPECT_EQ(p.store.inserts.size(), 1u);
}

TEST(IngestCoordinator, ReadFailure) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_file("/nonexistent/export.json", &result);
    EXPECT_EQ(st.code, StatusCode::NotFound);
    EXPECT_EQ(st.domain, StatusDomain::Ingest);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Read);
    EXPECT_EQ(result.error->details, std::vector<std::string>{"/nonexistent/export.json"});
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, ParseFailure) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_content("not json", std::nullopt, &result);
    EXPECT_EQ(st.code, StatusCode::DetectionFailed);
    EXPECT_EQ(st.domain, StatusDomain::Parser);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Parse);
    EXPECT_EQ(result.error->details, std::vector<std::string>{"no known export format matched"});
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, ValidationFailureListsEveryViolation) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    const std::string doc = generic_doc(message("m1", "a") + "," + message("m1", "b"),
                                        R"(, "artifacts": [{"id": "x", "content": "c", "created_in": "ghost"}])");
    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_content(doc, anamnesis::core::FormatTag::Generic, &result);
    EXPECT_EQ(st.code, StatusCode::ReferentialIntegrity);
    EXPECT_EQ(st.domain, StatusDomain::Validation);
    EXPECT_EQ(st.aux, 2u);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Validate);
    EXPECT_TRUE(result.conversation_id.empty());
    EXPECT_EQ(p.workers.requests(WorkerKind::Reasoner), 0u);
    ASSERT_EQ(result.error->details.size(), 2u);
    EXPECT_EQ(result.error->details[0], "duplicate_message_id m1: message id appears more than once");
    EXPECT_EQ(result.error->details[1], "unresolved_created_in x: created_in 'ghost' names no message");
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, ReasoningFailure) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    const std::string doc = generic_doc(message("m1", "a"), R"(, "memberships": [
        {"category": "web", "type": "primary"}, {"category": "db", "type": "primary"}])");
    const anamnesis::core::u64 reasoner_before = p.workers.requests(WorkerKind::Reasoner);
    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_content(doc, std::nullopt, &result);
    EXPECT_EQ(st.code, StatusCode::MalformedRuleSet);
    EXPECT_EQ(st.domain, StatusDomain::Reasoning);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Reason);
    EXPECT_STREQ(anamnesis::ingest::stage_name(result.error->stage), "reasoning");
    ASSERT_EQ(result.error->details.size(), 1u);
    EXPECT_NE(result.error->details[0].find("conflicting primary categories"), std::string::npos);
    EXPECT_TRUE(result.conversation_id.empty());
    EXPECT_EQ(result.triple_count, 0u);

    // the pipeline stopped at reasoning
    EXPECT_EQ(p.workers.requests(WorkerKind::Reasoner) - reasoner_before, 1u);
    EXPECT_EQ(p.workers.requests(WorkerKind::Rdf), 0u);
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, GenerationFailure) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    // an empty message id passes validation but has no RDF resource
    const std::string doc = generic_doc(message("", "a"));
    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st = p.coordinator.ingest_content(doc, anamnesis::core::FormatTag::Generic, &result);
    EXPECT_EQ(st.code, StatusCode::MissingField);
    EXPECT_EQ(st.domain, StatusDomain::Rdf);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Generate);
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, StoreFailure) {
    Pipeline p;
    ASSERT_TRUE(p.start());
    p.store.fail_inserts();

    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st =
        p.coordinator.ingest_content(generic_doc(message("m1", "a")), std::nullopt, &result);
    EXPECT_EQ(st.code, StatusCode::Network);
    EXPECT_EQ(st.domain, StatusDomain::Store);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Store);
    EXPECT_EQ(result.error->details, std::vector<std::string>{"test-graph"});
    EXPECT_TRUE(result.conversation_id.empty());
}

TEST(IngestCoordinator, CancelledBeforeStart) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    anamnesis::worker::CancelToken token;
    token.cancel();
    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st =
        p.coordinator.ingest_content(generic_doc(message("m1", "a")), std::nullopt, &result, &token);
    EXPECT_EQ(st.code, StatusCode::Cancelled);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Parse);
    EXPECT_TRUE(p.store.inserts.empty());
}

TEST(IngestCoordinator, ParserPoolExhaustion) {
    anamnesis::ingest::CoordinatorConfig cfg = Pipeline::default_config();
    cfg.checkout_timeout_ms = 50;
    Pipeline p(cfg);
    ASSERT_TRUE(p.start());

    anamnesis::worker::ChannelLease a;
    anamnesis::worker::ChannelLease b;
    ASSERT_TRUE(anamnesis::core::is_ok(p.parsers.lease(1000, nullptr, &a)));
    ASSERT_TRUE(anamnesis::core::is_ok(p.parsers.lease(1000, nullptr, &b)));

    anamnesis::ingest::IngestResult result;
    const anamnesis::core::Status st =
        p.coordinator.ingest_content(generic_doc(message("m1", "a")), std::nullopt, &result);
    EXPECT_EQ(st.code, StatusCode::Exhausted);
    EXPECT_EQ(st.domain, StatusDomain::Pool);
    EXPECT_EQ(st.aux, anamnesis::worker::kPoolAuxTimedOut);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->stage, Stage::Parse);
}

TEST(IngestCoordinator, IngestsMoreFilesThanThreads) {
    Pipeline p;
    ASSERT_TRUE(p.start());

    std::vector<std::string> paths;
    for (int i = 0; i < 9; ++i) {
        char path[] = "/tmp/anamnesis-batch-XXXXXX";
        const int fd = ::mkstemp(path);
        ASSERT_GE(fd, 0);
        const std::string doc = R"({"id": "batch-)" + std::to_string(i) + R"(", "timestamp": 1700000000, "messages": [)" +
                                message("m1", "hello") + "]}";
        ASSERT_EQ(::write(fd, doc.data(), doc.size()), static_cast<ssize_t>(doc.size()));
        (void)::close(fd);
        paths.emplace_back(path);
    }

    std::vector<anamnesis::core::Status> statuses;
    std::vector<anamnesis::ingest::IngestResult> results;
    const anamnesis::core::Status st = p.coordinator.ingest_files(paths, 2, &statuses, &results);
    for (const std::string& path : paths) {
        (void)std::remove(path.c_str());
    }
    ASSERT_TRUE(anamnesis::core::is_ok(st));
    ASSERT_EQ(statuses.size(), paths.size());
    ASSERT_EQ(results.size(), paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        EXPECT_TRUE(anamnesis::core::is_ok(statuses[i])) << paths[i];
        EXPECT_EQ(results[i].conversation_id, "batch-" + std::to_string(i));
        EXPECT_FALSE(results[i].error.has_value());
    }
    EXPECT_EQ(p.store.inserts.size(), paths.size());
}

TEST(IngestCoordinator, IngestFilesRejectsZeroConcurrency) {
    Pipeline p;
    std::vector<anamnesis::core::Status> statuses;
    std::vector<anamnesis::ingest::IngestResult> results;
    const anamnesis::core::Status st = p.coordinator.ingest_files({"a.json"}, 0, &statuses, &results);
    EXPECT_EQ(st.code, StatusCode::Invalid);
    EXPECT_EQ(st.domain, StatusDomain::Ingest);
    EXPECT_TRUE(statuses.empty());
}
