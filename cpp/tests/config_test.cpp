#include <cstring>

#include <gtest/gtest.h>

#include "anamnesis/core/config.hpp"

namespace {
    const char* no_env(const char*) {
        return nullptr;
    }

    const char* tuned_env(const char* name) {
        if (std::strcmp(name, "ANAMNESIS_WORKER_PATH") == 0) return "/opt/anamnesis/bin/anamnesis-worker";
        if (std::strcmp(name, "ANAMNESIS_PARSER_POOL_SIZE") == 0) return "8";
        if (std::strcmp(name, "ANAMNESIS_CALL_TIMEOUT_MS") == 0) return "1500";
        if (std::strcmp(name, "ANAMNESIS_LOG_LEVEL") == 0) return "debug";
        return nullptr;
    }

    const char* zero_pool_env(const char* name) {
        if (std::strcmp(name, "ANAMNESIS_STORE_PATH") == 0) return "/var/lib/x.db";
        if (std::strcmp(name, "ANAMNESIS_RDF_POOL_SIZE") == 0) return "0";
        return nullptr;
    }

    const char* bad_number_env(const char* name) {
        if (std::strcmp(name, "ANAMNESIS_MAX_FRAME_BYTES") == 0) return "16MiB";
        return nullptr;
    }

    const char* bad_level_env(const char* name) {
        if (std::strcmp(name, "ANAMNESIS_LOG_LEVEL") == 0) return "chatty";
        return nullptr;
    }
} // namespace

TEST(CoreConfig, DefaultsWithoutEnvironment) {
    anamnesis::core::Config cfg;
    ASSERT_EQ(anamnesis::core::config_load(&no_env, &cfg).code, anamnesis::core::StatusCode::Ok);
    EXPECT_EQ(cfg.worker_path, "anamnesis-worker");
    EXPECT_EQ(cfg.parser_pool_size, 4u);
    EXPECT_EQ(cfg.reasoner_pool_size, 1u);
    EXPECT_EQ(cfg.rdf_pool_size, 1u);
    EXPECT_EQ(cfg.max_restarts, 5u);
    EXPECT_EQ(cfg.restart_window_ms, 60000u);
    EXPECT_EQ(cfg.max_frame_bytes, anamnesis::core::kDefaultMaxFrameBytes);
    EXPECT_EQ(cfg.log_level, anamnesis::core::LogLevel::Info);
}

TEST(CoreConfig, OverlaysEnvironment) {
    anamnesis::core::Config cfg;
    ASSERT_EQ(anamnesis::core::config_load(&tuned_env, &cfg).code, anamnesis::core::StatusCode::Ok);
    EXPECT_EQ(cfg.worker_path, "/opt/anamnesis/bin/anamnesis-worker");
    EXPECT_EQ(cfg.parser_pool_size, 8u);
    EXPECT_EQ(cfg.call_timeout_ms, 1500u);
    EXPECT_EQ(cfg.log_level, anamnesis::core::LogLevel::Debug);
    EXPECT_EQ(cfg.checkout_timeout_ms, 30000u);
}

TEST(CoreConfig, ZeroPoolSizeRejectedAndConfigUntouched) {
    anamnesis::core::Config cfg;
    const anamnesis::core::Status s = anamnesis::core::config_load(&zero_pool_env, &cfg);
    EXPECT_EQ(s.code, anamnesis::core::StatusCode::Invalid);
    EXPECT_EQ(s.domain, anamnesis::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 5u);
    EXPECT_EQ(cfg.store_path, "/tmp/anamnesis.db");
    EXPECT_EQ(cfg.rdf_pool_size, 1u);
}

TEST(CoreConfig, MalformedValuesRejected) {
    anamnesis::core::Config cfg;
    EXPECT_EQ(anamnesis::core::config_load(&bad_number_env, &cfg).code, anamnesis::core::StatusCode::Invalid);
    EXPECT_EQ(anamnesis::core::config_load(&bad_level_env, &cfg).code, anamnesis::core::StatusCode::Invalid);
    EXPECT_EQ(anamnesis::core::config_load(nullptr, &cfg).code, anamnesis::core::StatusCode::Invalid);
}
