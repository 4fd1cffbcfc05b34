// anamnesis-worker: serves one worker kind over stdin/stdout with 4-byte
// length-prefixed frames.

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "anamnesis/cli/options.hpp"
#include "anamnesis/core/config.hpp"
#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/log.hpp"
#include "anamnesis/worker/server.hpp"

namespace {

using anamnesis::cli::OptionId;
using anamnesis::cli::OptionSpec;
using anamnesis::cli::OptionType;

const OptionSpec kWorkerOptions[] = {
    {OptionId::Kind, OptionType::String, "kind", 'k'},
    {OptionId::MaxFrame, OptionType::I64, "max-frame", '\0'},
    {OptionId::Verbose, OptionType::Flag, "verbose", 'v'},
};

void print_usage() {
    fprintf(stderr, "usage: anamnesis-worker --kind <parser|reasoner|rdf> [--max-frame N] [--verbose]\n");
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries frames; a closed parent must not kill us mid-write.
    signal(SIGPIPE, SIG_IGN);

    anamnesis::core::Config cfg;
    anamnesis::core::Status s = anamnesis::core::config_load_env(&cfg);
    if (!anamnesis::core::is_ok(s)) {
        fprintf(stderr, "error: bad ANAMNESIS_* environment (variable %u)\n", s.aux);
        return EXIT_FAILURE;
    }
    anamnesis::core::log_set_level(cfg.log_level);

    anamnesis::cli::ParsedOption parsed[8];
    anamnesis::cli::ParsedOptions opts{parsed, 0, 8};
    anamnesis::cli::u32 consumed = 0;
    const anamnesis::cli::CliArgs args{argv + 1, static_cast<anamnesis::cli::u32>(argc > 0 ? argc - 1 : 0)};
    s = anamnesis::cli::parse_options(args, kWorkerOptions, sizeof(kWorkerOptions) / sizeof(kWorkerOptions[0]),
                                      &opts, &consumed);
    if (!anamnesis::core::is_ok(s) || consumed != args.argc) {
        print_usage();
        return EXIT_FAILURE;
    }

    const anamnesis::cli::ParsedOption* kind_opt = anamnesis::cli::find_option(opts, OptionId::Kind);
    anamnesis::worker::WorkerKind kind{};
    if (kind_opt == nullptr || !anamnesis::worker::worker_kind_from_name(kind_opt->value.str, &kind)) {
        print_usage();
        return EXIT_FAILURE;
    }

    if (const anamnesis::cli::ParsedOption* o = anamnesis::cli::find_option(opts, OptionId::MaxFrame)) {
        if (o->value.i64v <= 0 || o->value.i64v > 0xffffffffLL) {
            print_usage();
            return EXIT_FAILURE;
        }
        cfg.max_frame_bytes = static_cast<anamnesis::core::u32>(o->value.i64v);
    }
    if (anamnesis::cli::find_option(opts, OptionId::Verbose) != nullptr) {
        anamnesis::core::log_set_level(anamnesis::core::LogLevel::Debug);
    }

    s = anamnesis::worker::serve(STDIN_FILENO, STDOUT_FILENO, kind, cfg.max_frame_bytes);
    if (!anamnesis::core::is_ok(s)) {
        anamnesis::core::log_error("worker", "%s worker stopped: %s/%s", anamnesis::worker::worker_kind_name(kind),
                                   anamnesis::core::status_domain_name(s.domain),
                                   anamnesis::core::status_code_name(s.code));
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
