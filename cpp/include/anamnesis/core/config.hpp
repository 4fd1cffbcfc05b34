#pragma once

#include <string>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/log.hpp"
#include "anamnesis/core/types.hpp"

namespace anamnesis::core {

    inline constexpr u32 kDefaultMaxFrameBytes = 16u * 1024u * 1024u;

    struct Config {
        std::string worker_path{"anamnesis-worker"};
        std::string store_path{"/tmp/anamnesis.db"};
        std::string store_endpoint{"http://localhost:8890/sparql"};

        u32 parser_pool_size{4};
        u32 reasoner_pool_size{1};
        u32 rdf_pool_size{1};

        u32 max_restarts{5};
        u32 restart_window_ms{60000};

        u32 call_timeout_ms{30000};
        u32 checkout_timeout_ms{30000};
        u32 ingest_timeout_ms{120000};

        u32 max_frame_bytes{kDefaultMaxFrameBytes};

        LogLevel log_level{LogLevel::Info};
    };

    // Overlays ANAMNESIS_* environment variables onto *cfg. On a malformed value
    // returns Invalid (aux = index of the offending variable) and leaves *cfg unchanged.
    [[nodiscard]] Status config_load_env(Config* cfg);

    // Same as config_load_env with an injectable lookup, used by tests.
    using EnvLookup = const char* (*)(const char* name);
    [[nodiscard]] Status config_load(EnvLookup lookup, Config* cfg);

} // namespace anamnesis::core
