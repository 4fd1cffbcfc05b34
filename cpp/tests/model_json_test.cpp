#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "anamnesis/core/model_json.hpp"

TEST(CoreModelJson, DecodesMinimalConversation) {
    const char* text = R"json({
        "id": "c1",
        "timestamp": 1700000000,
        "messages": [
            {"id": "m1", "speaker": {"kind": "human", "name": "alice"}, "content": "hi", "timestamp": 1700000001.9}
        ]
    })json";

    anamnesis::core::Conversation conv;
    std::string error;
    ASSERT_EQ(anamnesis::core::conversation_from_text(text, &conv, &error).code, anamnesis::core::StatusCode::Ok) << error;
    EXPECT_EQ(conv.id, "c1");
    EXPECT_FALSE(conv.platform.has_value());
    ASSERT_EQ(conv.messages.size(), 1u);
    EXPECT_EQ(conv.messages[0].timestamp, 1700000001);
    EXPECT_EQ(conv.messages[0].speaker, anamnesis::core::Speaker{anamnesis::core::HumanSpeaker{"alice"}});
    EXPECT_TRUE(conv.artifacts.empty());
    EXPECT_TRUE(conv.memberships.empty());
}

TEST(CoreModelJson, DecodesArtifactsMembershipsAndReferences) {
    const char* text = R"json({
        "id": "c1",
        "platform": "generic",
        "timestamp": 10,
        "messages": [
            {"id": "m1", "speaker": {"kind": "llm", "model": "gpt-4"}, "content": "x", "timestamp": 11,
             "references": ["m0", "other#m5", {"conversation": "c9", "fragment": "a3"}]}
        ],
        "artifacts": [
            {"id": "a1", "name": "main.rs", "artifact_type": {"kind": "code", "language": "rust"},
             "content": "fn main() {}", "created_in": "m1", "state": "modified",
             "history": [{"state": "created", "timestamp": 11}, {"state": "modified", "timestamp": 12}]},
            {"id": "a2", "artifact_type": {"kind": "diagram"}, "content": "", "created_in": "m1"}
        ],
        "memberships": [{"category": "alpha", "type": "secondary"}],
        "metadata": {"name": "demo", "turns": 3}
    })json";

    anamnesis::core::Conversation conv;
    std::string error;
    ASSERT_EQ(anamnesis::core::conversation_from_text(text, &conv, &error).code, anamnesis::core::StatusCode::Ok) << error;

    const auto& refs = conv.messages[0].references;
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_EQ(refs[0], (anamnesis::core::FragmentRef{"", "m0"}));
    EXPECT_EQ(refs[1], (anamnesis::core::FragmentRef{"other", "m5"}));
    EXPECT_EQ(refs[2], (anamnesis::core::FragmentRef{"c9", "a3"}));

    ASSERT_EQ(conv.artifacts.size(), 2u);
    EXPECT_EQ(conv.artifacts[0].name, std::optional<std::string>("main.rs"));
    EXPECT_EQ(conv.artifacts[0].type, anamnesis::core::ArtifactType{anamnesis::core::CodeArtifact{"rust"}});
    EXPECT_EQ(conv.artifacts[0].state, anamnesis::core::LifecycleState::Modified);
    ASSERT_EQ(conv.artifacts[0].history.size(), 2u);
    EXPECT_EQ(conv.artifacts[0].history[1].at, 12);
    // unknown kinds are kept as tags
    EXPECT_EQ(conv.artifacts[1].type, anamnesis::core::ArtifactType{anamnesis::core::OtherArtifact{"diagram"}});
    EXPECT_EQ(conv.artifacts[1].state, anamnesis::core::LifecycleState::Created);

    ASSERT_EQ(conv.memberships.size(), 1u);
    EXPECT_EQ(conv.memberships[0].type, anamnesis::core::MembershipType::Secondary);
    EXPECT_EQ(conv.metadata.at("name"), "demo");
    EXPECT_EQ(conv.metadata.at("turns"), "3");
}

TEST(CoreModelJson, SchemaViolationNamesTheField) {
    const char* text = R"json({"id": "c1", "timestamp": 1, "messages": [{"id": "m1", "content": "x", "timestamp": 1}]})json";

    anamnesis::core::Conversation conv;
    std::string error;
    const anamnesis::core::Status s = anamnesis::core::conversation_from_text(text, &conv, &error);
    EXPECT_EQ(s.code, anamnesis::core::StatusCode::SchemaViolation);
    EXPECT_EQ(s.domain, anamnesis::core::StatusDomain::Parser);
    EXPECT_EQ(error, "messages[0].speaker: missing");
}

TEST(CoreModelJson, RejectsTimestampsOutsideRange) {
    for (const char* ts : {"1e300", "-1e300", "9.3e18", "18446744073709551615"}) {
        const std::string text = std::string(R"json({"id": "c1", "timestamp": )json") + ts + R"json(, "messages": []})json";
        anamnesis::core::Conversation conv;
        std::string error;
        EXPECT_EQ(anamnesis::core::conversation_from_text(text, &conv, &error).code,
                  anamnesis::core::StatusCode::SchemaViolation) << ts;
        EXPECT_EQ(error, "conversation.timestamp: expected finite number in timestamp range") << ts;
    }

    anamnesis::core::Conversation conv;
    std::string error;
    ASSERT_EQ(anamnesis::core::conversation_from_text(R"json({"id": "c1", "timestamp": 1700000000.75, "messages": []})json",
                                                      &conv, &error).code,
              anamnesis::core::StatusCode::Ok) << error;
    EXPECT_EQ(conv.timestamp, 1700000000);
}

TEST(CoreModelJson, TimestampFromSecondsBounds) {
    anamnesis::core::Timestamp ts = 0;
    EXPECT_TRUE(anamnesis::core::timestamp_from_seconds(-0.5, &ts));
    EXPECT_EQ(ts, -1);
    EXPECT_TRUE(anamnesis::core::timestamp_from_seconds(-9223372036854775808.0, &ts));
    EXPECT_EQ(ts, std::numeric_limits<anamnesis::core::Timestamp>::min());
    EXPECT_FALSE(anamnesis::core::timestamp_from_seconds(9223372036854775808.0, &ts));
    EXPECT_FALSE(anamnesis::core::timestamp_from_seconds(1e300, &ts));
    EXPECT_FALSE(anamnesis::core::timestamp_from_seconds(std::numeric_limits<double>::quiet_NaN(), &ts));
    EXPECT_FALSE(anamnesis::core::timestamp_from_seconds(std::numeric_limits<double>::infinity(), &ts));
}

TEST(CoreModelJson, RejectsUnknownMembershipType) {
    const char* text = R"json({"id": "c1", "timestamp": 1, "messages": [],
                               "memberships": [{"category": "a", "type": "core"}]})json";
    anamnesis::core::Conversation conv;
    std::string error;
    EXPECT_EQ(anamnesis::core::conversation_from_text(text, &conv, &error).code,
              anamnesis::core::StatusCode::SchemaViolation);
    EXPECT_EQ(error, "memberships[0].type: expected primary, secondary or tangential");
}

TEST(CoreModelJson, MalformedJsonIsSchemaViolation) {
    anamnesis::core::Conversation conv;
    std::string error;
    EXPECT_EQ(anamnesis::core::conversation_from_text("{", &conv, &error).code,
              anamnesis::core::StatusCode::SchemaViolation);
    EXPECT_FALSE(error.empty());
}

TEST(CoreModelJson, EncodedConversationDecodesToSameModel) {
    anamnesis::core::Conversation conv;
    conv.id = "c2";
    conv.timestamp = 5;
    anamnesis::core::Message m;
    m.id = "m1";
    m.speaker = anamnesis::core::LlmSpeaker{"claude", std::string("anthropic")};
    m.content = "line1\nline2 \"quoted\"";
    m.timestamp = 6;
    conv.messages.push_back(m);
    anamnesis::core::Artifact a;
    a.id = "a1";
    a.type = anamnesis::core::ConfigurationArtifact{};
    a.content = "key = 1";
    a.created_in = "m1";
    a.content_hash = "abc";
    conv.artifacts.push_back(a);

    const nlohmann::json doc = anamnesis::core::conversation_to_json(conv);
    EXPECT_TRUE(doc["platform"].is_null());
    EXPECT_EQ(doc["artifacts"][0]["artifact_type"]["kind"], "configuration");

    anamnesis::core::Conversation back;
    std::string error;
    ASSERT_EQ(anamnesis::core::conversation_from_json(doc, &back, &error).code, anamnesis::core::StatusCode::Ok) << error;
    EXPECT_EQ(back.messages[0].content, m.content);
    EXPECT_EQ(back.artifacts[0].type, a.type);
    EXPECT_EQ(back.artifacts[0].content_hash, "abc");
}

TEST(CoreModelJson, InferencesRoundTrip) {
    anamnesis::core::Inferences inf;
    inf.conversation_id = "c1";
    inf.artifacts.push_back({"a1", anamnesis::core::LifecycleState::Evaluated, 30, 2});
    inf.memberships.push_back({"alpha", 1.0, 0.625});
    inf.uncategorized = false;
    inf.primary_category = "alpha";
    inf.contamination_risk = 0.5;
    inf.links.push_back({"m1", {{"c1", "a1"}}});
    inf.cross_references.push_back({{"c1", "m1"}, {"c2", "m7"}});

    anamnesis::core::Inferences back;
    std::string error;
    ASSERT_EQ(anamnesis::core::inferences_from_text(anamnesis::core::inferences_to_text(inf), &back, &error).code,
              anamnesis::core::StatusCode::Ok) << error;
    EXPECT_EQ(back.conversation_id, "c1");
    ASSERT_EQ(back.artifacts.size(), 1u);
    EXPECT_EQ(back.artifacts[0].current, anamnesis::core::LifecycleState::Evaluated);
    EXPECT_EQ(back.artifacts[0].transitions, 2u);
    EXPECT_DOUBLE_EQ(back.memberships[0].normalized, 0.625);
    EXPECT_FALSE(back.uncategorized);
    EXPECT_EQ(back.primary_category, std::optional<std::string>("alpha"));
    EXPECT_DOUBLE_EQ(back.contamination_risk, 0.5);
    ASSERT_EQ(back.links.size(), 1u);
    EXPECT_EQ(back.links[0].linked[0], (anamnesis::core::FragmentRef{"c1", "a1"}));
    ASSERT_EQ(back.cross_references.size(), 1u);
    EXPECT_EQ(back.cross_references[0].to, (anamnesis::core::FragmentRef{"c2", "m7"}));
}

TEST(CoreModelJson, FragmentRefStrings) {
    EXPECT_EQ(anamnesis::core::fragment_ref_from_string("m1"), (anamnesis::core::FragmentRef{"", "m1"}));
    EXPECT_EQ(anamnesis::core::fragment_ref_from_string("c#m1"), (anamnesis::core::FragmentRef{"c", "m1"}));
    EXPECT_EQ(anamnesis::core::fragment_ref_to_string({"c", "m1"}), "c#m1");
    EXPECT_EQ(anamnesis::core::fragment_ref_to_string({"", "m1"}), "m1");
}
