#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"
#include "anamnesis/store/triple_store.hpp"
#include "anamnesis/worker/cancel.hpp"
#include "anamnesis/worker/pool.hpp"

namespace anamnesis::ingest {
    using anamnesis::core::Status;
    using anamnesis::core::u32;
    using anamnesis::core::u8;

    enum class Stage : u8 {
        Read = 0,
        Parse,
        Validate,
        Reason,
        Generate,
        Store,
    };

    // "read", "parse", "validate", "reasoning", "rdf_generation", "store"
    [[nodiscard]] const char* stage_name(Stage stage) noexcept;

    struct StageError {
        Stage stage{Stage::Read};
        Status cause{};                     // domain of the originating module
        std::vector<std::string> details;   // every violation for Validate
    };

    struct IngestResult {
        std::string conversation_id;        // set only when every stage succeeded
        u32 triple_count{0};
        std::optional<StageError> error;
    };

    struct CoordinatorConfig {
        u32 call_timeout_ms{30000};
        u32 checkout_timeout_ms{30000};
        u32 overall_timeout_ms{120000};
        std::string store_endpoint{"http://localhost:8890/sparql"};
    };

    // Runs read -> parse -> validate -> reason -> generate -> store, strictly
    // in sequence, aborting on the first failure without retry. Holds only
    // references, so concurrent ingestions are safe.
    class IngestionCoordinator {
    public:
        IngestionCoordinator(worker::WorkerPool& parsers, worker::WorkerPool& reasoners, worker::WorkerPool& rdf,
                             store::TripleStore& store, CoordinatorConfig config);

        // Returns the failing stage's cause (also in out->error), or Ok.
        // Without a format the parser detects it.
        [[nodiscard]] Status ingest_file(const std::string& path, IngestResult* out,
                                         std::optional<core::FormatTag> format = std::nullopt,
                                         const worker::CancelToken* cancel = nullptr) const;
        [[nodiscard]] Status ingest_content(std::string_view content, std::optional<core::FormatTag> format,
                                            IngestResult* out, const worker::CancelToken* cancel = nullptr) const;

        // Ingests every path on at most `concurrency` threads, each pulling the
        // next unclaimed index. statuses and results are resized to match paths
        // and filled by index.
        [[nodiscard]] Status ingest_files(const std::vector<std::string>& paths, u32 concurrency,
                                          std::vector<Status>* statuses, std::vector<IngestResult>* results,
                                          std::optional<core::FormatTag> format = std::nullopt,
                                          const worker::CancelToken* cancel = nullptr) const;

        [[nodiscard]] const CoordinatorConfig& config() const noexcept { return config_; }

    private:
        worker::WorkerPool& parsers_;
        worker::WorkerPool& reasoners_;
        worker::WorkerPool& rdf_;
        store::TripleStore& store_;
        CoordinatorConfig config_;
    };

} // namespace anamnesis::ingest
