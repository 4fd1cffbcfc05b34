#include <string>

#include <gtest/gtest.h>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/log.hpp"
#include "anamnesis/core/models.hpp"
#include "anamnesis/net/framing.hpp"

TEST(Status, DefaultIsOk){
    anamnesis::core::Status s{};
    EXPECT_EQ(s.code, anamnesis::core::StatusCode::Ok);
    EXPECT_EQ(s.domain, anamnesis::core::StatusDomain::Core);
    EXPECT_EQ(s.aux, 0u);
    EXPECT_TRUE(anamnesis::core::is_ok(s));
}

TEST(Status, NamesRoundTrip){
    for (anamnesis::core::StatusCode c : {anamnesis::core::StatusCode::Timeout,
                                          anamnesis::core::StatusCode::FrameTooLarge,
                                          anamnesis::core::StatusCode::MalformedRuleSet,
                                          anamnesis::core::StatusCode::Unavailable}) {
        anamnesis::core::StatusCode out{};
        ASSERT_TRUE(anamnesis::core::status_code_from_name(anamnesis::core::status_code_name(c), &out));
        EXPECT_EQ(out, c);
    }
    for (anamnesis::core::StatusDomain d : {anamnesis::core::StatusDomain::Parser,
                                            anamnesis::core::StatusDomain::Channel,
                                            anamnesis::core::StatusDomain::Worker}) {
        anamnesis::core::StatusDomain out{};
        ASSERT_TRUE(anamnesis::core::status_domain_from_name(anamnesis::core::status_domain_name(d), &out));
        EXPECT_EQ(out, d);
    }

    anamnesis::core::StatusCode code{};
    EXPECT_FALSE(anamnesis::core::status_code_from_name("nope", &code));
    EXPECT_STREQ(anamnesis::core::status_code_name(anamnesis::core::StatusCode::DetectionFailed), "detection_failed");
}

TEST(CoreModels, EnumNamesRoundTrip){
    anamnesis::core::FormatTag f{};
    ASSERT_TRUE(anamnesis::core::format_from_name("chatgpt", &f));
    EXPECT_EQ(f, anamnesis::core::FormatTag::ChatGpt);
    EXPECT_FALSE(anamnesis::core::format_from_name("auto", &f));

    anamnesis::core::LifecycleState s{};
    ASSERT_TRUE(anamnesis::core::lifecycle_state_from_name("evaluated", &s));
    EXPECT_EQ(s, anamnesis::core::LifecycleState::Evaluated);

    anamnesis::core::MembershipType t{};
    ASSERT_TRUE(anamnesis::core::membership_type_from_name("tangential", &t));
    EXPECT_EQ(t, anamnesis::core::MembershipType::Tangential);
}

TEST(CoreLog, LevelNames){
    anamnesis::core::LogLevel level{};
    ASSERT_TRUE(anamnesis::core::log_level_from_name("debug", &level));
    EXPECT_EQ(level, anamnesis::core::LogLevel::Debug);
    EXPECT_FALSE(anamnesis::core::log_level_from_name("loud", &level));
    EXPECT_STREQ(anamnesis::core::log_level_name(anamnesis::core::LogLevel::Warn), "warn");
}

TEST(CoreLog, WritesEnabledLevelsOnly){
    const anamnesis::core::LogLevel saved = anamnesis::core::log_level();
    anamnesis::core::log_set_level(anamnesis::core::LogLevel::Warn);

    testing::internal::CaptureStderr();
    anamnesis::core::log_warn("pool", "%s: started %u workers", "parser", 3u);
    anamnesis::core::log_info("pool", "hidden %d", 1);
    anamnesis::core::log_error(nullptr, "boom");
    const std::string out = testing::internal::GetCapturedStderr();
    anamnesis::core::log_set_level(saved);

    EXPECT_EQ(out, "[warn] pool: parser: started 3 workers\n[error] anamnesis: boom\n");
}

TEST(NetFraming, FrameLengthValid){
    EXPECT_TRUE(anamnesis::net::frame_length_valid(16, 1024));
    EXPECT_TRUE(anamnesis::net::frame_length_valid(1024, 1024));
    EXPECT_FALSE(anamnesis::net::frame_length_valid(2048, 1024));
}

TEST(CoreTypes, CorrelationIdInvalidSentinel){
    EXPECT_FALSE(anamnesis::core::CorrelationId::invalid().is_valid());
    EXPECT_TRUE(anamnesis::core::CorrelationId{1}.is_valid());
}
