#include "anamnesis/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace anamnesis::core {
    namespace {
        enum class FieldKind : u8 {
            Text = 0,
            U32 = 1,
            PoolSize = 2,
            Level = 3,
        };

        struct EnvField {
            const char* name;
            FieldKind kind;
            std::string Config::*text;
            u32 Config::*number;
        };

        const EnvField kFields[] = {
            {"ANAMNESIS_WORKER_PATH", FieldKind::Text, &Config::worker_path, nullptr},
            {"ANAMNESIS_STORE_PATH", FieldKind::Text, &Config::store_path, nullptr},
            {"ANAMNESIS_STORE_ENDPOINT", FieldKind::Text, &Config::store_endpoint, nullptr},
            {"ANAMNESIS_PARSER_POOL_SIZE", FieldKind::PoolSize, nullptr, &Config::parser_pool_size},
            {"ANAMNESIS_REASONER_POOL_SIZE", FieldKind::PoolSize, nullptr, &Config::reasoner_pool_size},
            {"ANAMNESIS_RDF_POOL_SIZE", FieldKind::PoolSize, nullptr, &Config::rdf_pool_size},
            {"ANAMNESIS_MAX_RESTARTS", FieldKind::U32, nullptr, &Config::max_restarts},
            {"ANAMNESIS_RESTART_WINDOW_MS", FieldKind::U32, nullptr, &Config::restart_window_ms},
            {"ANAMNESIS_CALL_TIMEOUT_MS", FieldKind::U32, nullptr, &Config::call_timeout_ms},
            {"ANAMNESIS_CHECKOUT_TIMEOUT_MS", FieldKind::U32, nullptr, &Config::checkout_timeout_ms},
            {"ANAMNESIS_INGEST_TIMEOUT_MS", FieldKind::U32, nullptr, &Config::ingest_timeout_ms},
            {"ANAMNESIS_MAX_FRAME_BYTES", FieldKind::U32, nullptr, &Config::max_frame_bytes},
            {"ANAMNESIS_LOG_LEVEL", FieldKind::Level, nullptr, nullptr},
        };

        [[nodiscard]] bool parse_u32(const char* s, u32* out) noexcept {
            if (s == nullptr || out == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u32 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        const char* getenv_lookup(const char* name) {
            return std::getenv(name);
        }
    } // namespace

    Status config_load(EnvLookup lookup, Config* cfg) {
        if (lookup == nullptr || cfg == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        Config next = *cfg;
        u32 index = 0;
        for (const EnvField& f : kFields) {
            const char* value = lookup(f.name);
            if (value != nullptr) {
                switch (f.kind) {
                case FieldKind::Text:
                    if (*value == '\0') {
                        return make_status(StatusDomain::Core, StatusCode::Invalid, index);
                    }
                    next.*(f.text) = value;
                    break;
                case FieldKind::U32:
                case FieldKind::PoolSize: {
                    u32 v = 0;
                    if (!parse_u32(value, &v)) {
                        return make_status(StatusDomain::Core, StatusCode::Invalid, index);
                    }
                    if (f.kind == FieldKind::PoolSize && v == 0) {
                        return make_status(StatusDomain::Core, StatusCode::Invalid, index);
                    }
                    next.*(f.number) = v;
                    break;
                }
                case FieldKind::Level:
                    if (!log_level_from_name(value, &next.log_level)) {
                        return make_status(StatusDomain::Core, StatusCode::Invalid, index);
                    }
                    break;
                }
            }
            ++index;
        }

        *cfg = std::move(next);
        return ok_status();
    }

    Status config_load_env(Config* cfg) {
        return config_load(&getenv_lookup, cfg);
    }
} // namespace anamnesis::core
