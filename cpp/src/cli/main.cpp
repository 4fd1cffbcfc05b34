#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "anamnesis/cli/commands.hpp"
#include "anamnesis/cli/options.hpp"
#include "anamnesis/core/config.hpp"
#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/log.hpp"
#include "anamnesis/core/models.hpp"
#include "anamnesis/ingest/coordinator.hpp"
#include "anamnesis/net/protocol.hpp"
#include "anamnesis/reasoning/contamination.hpp"
#include "anamnesis/store/sqlite_store.hpp"
#include "anamnesis/worker/factory.hpp"
#include "anamnesis/worker/pool.hpp"

namespace {

using anamnesis::cli::CommandId;
using anamnesis::cli::CommandSpec;
using anamnesis::cli::OptionId;
using anamnesis::cli::OptionSpec;
using anamnesis::cli::OptionType;
using anamnesis::core::Status;

// ========================================================================
// Tables
// ========================================================================

const OptionSpec kOptions[] = {
    {OptionId::Worker, OptionType::String, "worker", 'w'},
    {OptionId::Store, OptionType::String, "store", 's'},
    {OptionId::Endpoint, OptionType::String, "endpoint", 'e'},
    {OptionId::Format, OptionType::String, "format", 'f'},
    {OptionId::PoolSize, OptionType::I64, "pool-size", 'p'},
    {OptionId::TimeoutMs, OptionType::I64, "timeout-ms", 't'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
};

const CommandSpec kCommands[] = {
    {CommandId::Help, "help", 0},
    {CommandId::Ingest, "ingest", 1},
    {CommandId::Detect, "detect", 1},
    {CommandId::Validate, "validate", 1},
    {CommandId::Count, "count", 0},
    {CommandId::Spread, "spread", 2},
};

struct CliConfig {
    anamnesis::core::Config core;
    std::optional<anamnesis::core::FormatTag> format;
};

// ========================================================================
// Error Handling
// ========================================================================

void print_status_error(const char* context, Status s) {
    fprintf(stderr, "error: %s failed (%s/%s, aux=%u)\n", context,
            anamnesis::core::status_domain_name(s.domain),
            anamnesis::core::status_code_name(s.code), s.aux);
}

void print_response_error(const char* context, const anamnesis::net::Response& resp) {
    fprintf(stderr, "error: %s: %s/%s: %s\n", context,
            anamnesis::core::status_domain_name(resp.status.domain),
            anamnesis::core::status_code_name(resp.status.code), resp.detail.c_str());
}

void handle_help() {
    printf("usage: anamnesis [options] <command> [args]\n\n");
    printf("Commands:\n");
    printf("  ingest <file>...          Parse, reason, generate RDF and store each export\n");
    printf("  detect <file>             Print the export format of a file\n");
    printf("  validate <file>           Parse a file and print every violation\n");
    printf("  count                     Print the number of triples stored for the endpoint\n");
    printf("  spread <seed> <file>...   Conversations contaminated from seed, transitively\n");
    printf("  help                      Show this help\n\n");
    printf("Options:\n");
    printf("  -w, --worker <path>       Worker executable (ANAMNESIS_WORKER_PATH)\n");
    printf("  -s, --store <path>        SQLite store database (ANAMNESIS_STORE_PATH)\n");
    printf("  -e, --endpoint <name>     Store graph / endpoint (ANAMNESIS_STORE_ENDPOINT)\n");
    printf("  -f, --format <name>       claude, chatgpt or generic; detected when omitted\n");
    printf("  -p, --pool-size <n>       Parser workers (ANAMNESIS_PARSER_POOL_SIZE)\n");
    printf("  -t, --timeout-ms <n>      Overall ingestion timeout (ANAMNESIS_INGEST_TIMEOUT_MS)\n");
    printf("  -v, --verbose             Debug logging\n");
}

// ========================================================================
// Configuration
// ========================================================================

bool apply_options(const anamnesis::cli::ParsedOptions& opts, CliConfig* cfg) {
    for (anamnesis::cli::u32 i = 0; i < opts.len; ++i) {
        const anamnesis::cli::ParsedOption& o = opts.data[i];
        switch (o.id) {
        case OptionId::Worker:
            cfg->core.worker_path = o.value.str;
            break;
        case OptionId::Store:
            cfg->core.store_path = o.value.str;
            break;
        case OptionId::Endpoint:
            cfg->core.store_endpoint = o.value.str;
            break;
        case OptionId::Format: {
            anamnesis::core::FormatTag f{};
            if (!anamnesis::core::format_from_name(o.value.str, &f)) {
                fprintf(stderr, "error: unknown format '%s'\n", o.value.str);
                return false;
            }
            cfg->format = f;
            break;
        }
        case OptionId::PoolSize:
            if (o.value.i64v <= 0 || o.value.i64v > 256) {
                fprintf(stderr, "error: --pool-size must be between 1 and 256\n");
                return false;
            }
            cfg->core.parser_pool_size = static_cast<anamnesis::core::u32>(o.value.i64v);
            break;
        case OptionId::TimeoutMs:
            if (o.value.i64v <= 0 || o.value.i64v > 0xffffffffLL) {
                fprintf(stderr, "error: --timeout-ms must be positive\n");
                return false;
            }
            cfg->core.ingest_timeout_ms = static_cast<anamnesis::core::u32>(o.value.i64v);
            break;
        case OptionId::Verbose:
            cfg->core.log_level = anamnesis::core::LogLevel::Debug;
            break;
        default:
            break;
        }
    }
    return true;
}

// ========================================================================
// Worker pools
// ========================================================================

std::unique_ptr<anamnesis::worker::WorkerPool> make_pool(const CliConfig& cfg, anamnesis::worker::WorkerKind kind,
                                                         anamnesis::core::u32 size) {
    anamnesis::worker::PoolConfig pc;
    pc.name = anamnesis::worker::worker_kind_name(kind);
    pc.size = size;
    pc.max_restarts = cfg.core.max_restarts;
    pc.restart_window_ms = cfg.core.restart_window_ms;
    auto pool = std::make_unique<anamnesis::worker::WorkerPool>(
        pc, anamnesis::worker::worker_process_factory(cfg.core.worker_path, kind, cfg.core.max_frame_bytes));
    const Status s = pool->start();
    if (!anamnesis::core::is_ok(s)) {
        fprintf(stderr, "error: cannot start %s workers from '%s'\n", pc.name.c_str(), cfg.core.worker_path.c_str());
        print_status_error("pool start", s);
        return nullptr;
    }
    return pool;
}

// One call on a freshly leased channel; worker-side errors are printed.
bool call_worker(const CliConfig& cfg, anamnesis::worker::WorkerPool& pool, const anamnesis::net::Request& req,
                 anamnesis::net::Response* resp, const char* context) {
    anamnesis::worker::ChannelLease lease;
    Status s = pool.lease(cfg.core.checkout_timeout_ms, nullptr, &lease);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error(context, s);
        return false;
    }
    s = lease->submit(req, cfg.core.call_timeout_ms, resp);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error(context, s);
        return false;
    }
    if (!anamnesis::core::is_ok(resp->status)) {
        print_response_error(context, *resp);
        return false;
    }
    return true;
}

bool read_file(const char* path, std::string* out) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        fprintf(stderr, "error: cannot open %s: %s\n", path, std::strerror(errno));
        return false;
    }
    std::string data;
    char buf[65536];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        data.append(buf, n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);
    if (failed) {
        fprintf(stderr, "error: cannot read %s\n", path);
        return false;
    }
    *out = std::move(data);
    return true;
}

bool parse_file(const CliConfig& cfg, anamnesis::worker::WorkerPool& parsers, const char* path,
                anamnesis::core::Conversation* out) {
    std::string content;
    if (!read_file(path, &content)) {
        return false;
    }
    anamnesis::net::Response resp;
    if (!call_worker(cfg, parsers, anamnesis::net::ParseRequest{std::move(content), cfg.format}, &resp, path)) {
        return false;
    }
    const anamnesis::net::ParseReply* parsed = nullptr;
    const Status s = anamnesis::net::expect_reply(resp, &parsed);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error(path, s);
        return false;
    }
    *out = parsed->conversation;
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

int handle_ingest(const CliConfig& cfg, const anamnesis::cli::CliArgs& args) {
    std::unique_ptr<anamnesis::store::SqliteTripleStore> store;
    Status s = anamnesis::store::SqliteTripleStore::open(cfg.core.store_path, &store);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("store open", s);
        return EXIT_FAILURE;
    }

    auto parsers = make_pool(cfg, anamnesis::worker::WorkerKind::Parser, cfg.core.parser_pool_size);
    auto reasoners = make_pool(cfg, anamnesis::worker::WorkerKind::Reasoner, cfg.core.reasoner_pool_size);
    auto rdf = make_pool(cfg, anamnesis::worker::WorkerKind::Rdf, cfg.core.rdf_pool_size);
    if (!parsers || !reasoners || !rdf) {
        return EXIT_FAILURE;
    }

    anamnesis::ingest::CoordinatorConfig cc;
    cc.call_timeout_ms = cfg.core.call_timeout_ms;
    cc.checkout_timeout_ms = cfg.core.checkout_timeout_ms;
    cc.overall_timeout_ms = cfg.core.ingest_timeout_ms;
    cc.store_endpoint = cfg.core.store_endpoint;
    const anamnesis::ingest::IngestionCoordinator coordinator(*parsers, *reasoners, *rdf, *store, cc);

    std::vector<std::string> paths(args.argv, args.argv + args.argc);
    std::vector<anamnesis::ingest::IngestResult> results;
    std::vector<Status> statuses;
    s = coordinator.ingest_files(paths, std::max<anamnesis::cli::u32>(cfg.core.parser_pool_size, 1), &statuses,
                                 &results, cfg.format);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("ingest", s);
        return EXIT_FAILURE;
    }

    int rc = EXIT_SUCCESS;
    for (anamnesis::cli::u32 i = 0; i < args.argc; ++i) {
        const anamnesis::ingest::IngestResult& r = results[i];
        if (anamnesis::core::is_ok(statuses[i])) {
            printf("ok %s %u\n", r.conversation_id.c_str(), r.triple_count);
            continue;
        }
        rc = EXIT_FAILURE;
        if (!r.error) {
            print_status_error(args.argv[i], statuses[i]);
            continue;
        }
        const anamnesis::ingest::StageError& e = *r.error;
        printf("error %s %s: %s\n", anamnesis::ingest::stage_name(e.stage),
               anamnesis::core::status_code_name(e.cause.code),
               e.details.empty() ? args.argv[i] : e.details.front().c_str());
        for (size_t d = 1; d < e.details.size(); ++d) {
            printf("  %s\n", e.details[d].c_str());
        }
    }
    return rc;
}

int handle_detect(const CliConfig& cfg, const anamnesis::cli::CliArgs& args) {
    auto parsers = make_pool(cfg, anamnesis::worker::WorkerKind::Parser, 1);
    if (!parsers) {
        return EXIT_FAILURE;
    }
    std::string content;
    if (!read_file(args.argv[0], &content)) {
        return EXIT_FAILURE;
    }
    anamnesis::net::Response resp;
    if (!call_worker(cfg, *parsers, anamnesis::net::DetectRequest{std::move(content)}, &resp, "detect")) {
        return EXIT_FAILURE;
    }
    const anamnesis::net::DetectReply* detected = nullptr;
    const Status s = anamnesis::net::expect_reply(resp, &detected);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("detect", s);
        return EXIT_FAILURE;
    }
    printf("%s\n", anamnesis::core::format_name(detected->format));
    return EXIT_SUCCESS;
}

int handle_validate(const CliConfig& cfg, const anamnesis::cli::CliArgs& args) {
    auto parsers = make_pool(cfg, anamnesis::worker::WorkerKind::Parser, 1);
    if (!parsers) {
        return EXIT_FAILURE;
    }
    anamnesis::core::Conversation conv;
    if (!parse_file(cfg, *parsers, args.argv[0], &conv)) {
        return EXIT_FAILURE;
    }
    anamnesis::net::Response resp;
    if (!call_worker(cfg, *parsers, anamnesis::net::ValidateRequest{conv}, &resp, "validate")) {
        return EXIT_FAILURE;
    }
    const anamnesis::net::ValidateReply* validated = nullptr;
    const Status s = anamnesis::net::expect_reply(resp, &validated);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("validate", s);
        return EXIT_FAILURE;
    }
    const std::vector<std::string>& violations = validated->violations;
    for (const std::string& v : violations) {
        printf("%s\n", v.c_str());
    }
    if (violations.empty()) {
        printf("ok %s\n", conv.id.c_str());
        return EXIT_SUCCESS;
    }
    return EXIT_FAILURE;
}

int handle_count(const CliConfig& cfg) {
    std::unique_ptr<anamnesis::store::SqliteTripleStore> store;
    Status s = anamnesis::store::SqliteTripleStore::open(cfg.core.store_path, &store);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("store open", s);
        return EXIT_FAILURE;
    }
    anamnesis::core::u64 n = 0;
    s = store->count(cfg.core.store_endpoint, &n);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("count", s);
        return EXIT_FAILURE;
    }
    printf("%s %llu\n", cfg.core.store_endpoint.c_str(), static_cast<unsigned long long>(n));
    return EXIT_SUCCESS;
}

int handle_spread(const CliConfig& cfg, const anamnesis::cli::CliArgs& args) {
    auto parsers = make_pool(cfg, anamnesis::worker::WorkerKind::Parser, 1);
    auto reasoners = make_pool(cfg, anamnesis::worker::WorkerKind::Reasoner, 1);
    if (!parsers || !reasoners) {
        return EXIT_FAILURE;
    }

    anamnesis::net::SpreadRequest req;
    req.seed = args.argv[0];
    for (anamnesis::cli::u32 i = 1; i < args.argc; ++i) {
        anamnesis::core::Conversation conv;
        if (!parse_file(cfg, *parsers, args.argv[i], &conv)) {
            return EXIT_FAILURE;
        }
        req.profiles.push_back(anamnesis::reasoning::profile_of(conv));
    }

    anamnesis::net::Response resp;
    if (!call_worker(cfg, *reasoners, req, &resp, "spread")) {
        return EXIT_FAILURE;
    }
    const anamnesis::net::SpreadReply* spread = nullptr;
    const Status s = anamnesis::net::expect_reply(resp, &spread);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("spread", s);
        return EXIT_FAILURE;
    }
    for (const std::string& id : spread->members) {
        printf("%s\n", id.c_str());
    }
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    signal(SIGPIPE, SIG_IGN);

    CliConfig cfg;
    Status s = anamnesis::core::config_load_env(&cfg.core);
    if (!anamnesis::core::is_ok(s)) {
        print_status_error("environment configuration", s);
        return EXIT_FAILURE;
    }

    anamnesis::cli::ParsedOption parsed[32];
    anamnesis::cli::ParsedOptions opts{parsed, 0, 32};
    anamnesis::cli::u32 consumed = 0;
    const anamnesis::cli::CliArgs args{argv + 1, static_cast<anamnesis::cli::u32>(argc > 0 ? argc - 1 : 0)};
    s = anamnesis::cli::parse_options(args, kOptions, sizeof(kOptions) / sizeof(kOptions[0]), &opts, &consumed);
    if (!anamnesis::core::is_ok(s)) {
        fprintf(stderr, "error: bad option '%s'\n", s.aux < args.argc ? args.argv[s.aux] : "");
        return EXIT_FAILURE;
    }
    if (!apply_options(opts, &cfg)) {
        return EXIT_FAILURE;
    }
    anamnesis::core::log_set_level(cfg.core.log_level);

    const anamnesis::cli::CliArgs rest{args.argv + consumed, args.argc - consumed};
    if (rest.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    anamnesis::cli::CommandInvocation inv;
    s = anamnesis::cli::parse_command(rest, kCommands, sizeof(kCommands) / sizeof(kCommands[0]), &inv, &consumed);
    if (!anamnesis::core::is_ok(s)) {
        if (s.code == anamnesis::core::StatusCode::NotFound) {
            fprintf(stderr, "error: unknown command '%s'\n", rest.argv[0]);
        } else {
            fprintf(stderr, "error: '%s' needs at least %u argument(s)\n", rest.argv[0], s.aux);
        }
        return EXIT_FAILURE;
    }

    switch (inv.id) {
    case CommandId::Help:
        handle_help();
        return EXIT_SUCCESS;
    case CommandId::Ingest:
        return handle_ingest(cfg, inv.args);
    case CommandId::Detect:
        return handle_detect(cfg, inv.args);
    case CommandId::Validate:
        return handle_validate(cfg, inv.args);
    case CommandId::Count:
        return handle_count(cfg);
    case CommandId::Spread:
        return handle_spread(cfg, inv.args);
    case CommandId::None:
        break;
    }
    handle_help();
    return EXIT_FAILURE;
}
