#include <algorithm>
#include <string>

#include <gtest/gtest.h>

#include "anamnesis/rdf/generator.hpp"
#include "anamnesis/rdf/schema.hpp"

namespace {
    std::string s(std::string_view v) {
        return std::string(v);
    }

    bool contains(const std::vector<anamnesis::core::Triple>& triples, const anamnesis::core::Triple& t) {
        return std::find(triples.begin(), triples.end(), t) != triples.end();
    }
} // namespace

TEST(RdfGenerator, MinimalConversationInOrder) {
    anamnesis::core::Conversation conv;
    conv.id = "c 1";
    anamnesis::core::Message m;
    m.id = "m1";
    m.speaker = anamnesis::core::HumanSpeaker{"sam"};
    m.content = "hi";
    m.timestamp = 60;
    conv.messages.push_back(m);

    std::vector<anamnesis::core::Triple> triples;
    ASSERT_TRUE(anamnesis::core::is_ok(anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples)));

    namespace sc = anamnesis::rdf::schema;
    const std::string conv_uri = "anamnesis:conv:c%201";
    const std::string msg_uri = "anamnesis:msg:c%201%2Fm1";
    const std::vector<anamnesis::core::Triple> expected{
        {conv_uri, s(sc::kType), s(sc::kConversation)},
        {conv_uri, s(sc::kTimestamp), "\"1970-01-01T00:00:00Z\"^^<" + s(sc::kXsdDateTime) + ">"},
        {conv_uri, s(sc::kUncategorized), "\"true\"^^<" + s(sc::kXsdBoolean) + ">"},
        {conv_uri, s(sc::kContaminationRisk), "\"0\"^^<" + s(sc::kXsdDouble) + ">"},
        {msg_uri, s(sc::kType), s(sc::kHumanMessage)},
        {msg_uri, s(sc::kSpeaker), "anamnesis:speaker:sam"},
        {"anamnesis:speaker:sam", s(sc::kType), s(sc::kHuman)},
        {msg_uri, s(sc::kPartOf), conv_uri},
        {msg_uri, s(sc::kContent), "\"hi\""},
        {msg_uri, s(sc::kTimestamp), "\"1970-01-01T00:01:00Z\"^^<" + s(sc::kXsdDateTime) + ">"},
    };
    EXPECT_EQ(triples, expected);
}

TEST(RdfGenerator, MembershipsArtifactsAndReferences) {
    namespace sc = anamnesis::rdf::schema;

    anamnesis::core::Conversation conv;
    conv.id = "c1";
    conv.platform = "claude";
    conv.metadata["name"] = "Refactor";
    for (const char* id : {"m1", "m2"}) {
        anamnesis::core::Message m;
        m.id = id;
        m.speaker = anamnesis::core::LlmSpeaker{"claude", std::string("anthropic")};
        conv.messages.push_back(m);
    }
    conv.messages[1].references = {{"", "a1"}, {"", "m1"}, {"c9", "a1"}};

    anamnesis::core::Artifact a;
    a.id = "a1";
    a.name = "main.rs";
    a.type = anamnesis::core::CodeArtifact{"rust"};
    a.content = "fn main() {}";
    a.content_hash = "abc";
    a.created_in = "m1";
    a.modified_in = {"m2"};
    conv.artifacts.push_back(a);

    anamnesis::core::Inferences inf;
    inf.uncategorized = false;
    inf.memberships = {{"web", 1.0, 0.625}};
    inf.contamination_risk = 0.25;
    inf.artifacts = {{"a1", anamnesis::core::LifecycleState::Evaluated, 20, 2}};

    std::vector<anamnesis::core::Triple> triples;
    ASSERT_TRUE(anamnesis::core::is_ok(anamnesis::rdf::generate(conv, inf, &triples)));

    EXPECT_TRUE(contains(triples, {"anamnesis:conv:c1", s(sc::kPlatform), "\"claude\""}));
    EXPECT_TRUE(contains(triples, {"anamnesis:conv:c1", s(sc::kName), "\"Refactor\""}));
    EXPECT_FALSE(contains(triples, {"anamnesis:conv:c1", s(sc::kUncategorized), "\"true\"^^<" + s(sc::kXsdBoolean) + ">"}));
    EXPECT_TRUE(contains(triples, {"anamnesis:conv:c1", s(sc::kBelongsTo), "anamnesis:membership:c1%2Fweb"}));
    EXPECT_TRUE(contains(triples, {"anamnesis:membership:c1%2Fweb", s(sc::kCategory), "anamnesis:project:web"}));
    EXPECT_TRUE(contains(triples, {"anamnesis:membership:c1%2Fweb", s(sc::kMembershipStrength),
                                   "\"0.625\"^^<" + s(sc::kXsdDouble) + ">"}));
    EXPECT_TRUE(contains(triples, {"anamnesis:conv:c1", s(sc::kContaminationRisk),
                                   "\"0.25\"^^<" + s(sc::kXsdDouble) + ">"}));

    // the speaker is described once
    const auto provider = std::count(triples.begin(), triples.end(),
                                     anamnesis::core::Triple{"anamnesis:speaker:claude", s(sc::kProvider), "\"anthropic\""});
    EXPECT_EQ(provider, 1);

    EXPECT_TRUE(contains(triples, {"anamnesis:msg:c1%2Fm2", s(sc::kReferences), "anamnesis:artifact:c1%2Fa1"}));
    EXPECT_TRUE(contains(triples, {"anamnesis:msg:c1%2Fm2", s(sc::kReferences), "anamnesis:msg:c1%2Fm1"}));
    // a fragment of another conversation is never a local artifact
    EXPECT_TRUE(contains(triples, {"anamnesis:msg:c1%2Fm2", s(sc::kReferences), "anamnesis:msg:c9%2Fa1"}));

    const std::string art = "anamnesis:artifact:c1%2Fa1";
    EXPECT_TRUE(contains(triples, {art, s(sc::kType), s(sc::kCodeArtifact)}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kLanguage), "\"rust\""}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kArtifactName), "\"main.rs\""}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kContentHash), "\"abc\""}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kCreatedIn), "anamnesis:msg:c1%2Fm1"}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kModifiedIn), "anamnesis:msg:c1%2Fm2"}));
    EXPECT_TRUE(contains(triples, {art, s(sc::kState), s(sc::kStateEvaluated)}));
    EXPECT_EQ(triples.back(), (anamnesis::core::Triple{"anamnesis:conv:c1", s(sc::kDiscusses), art}));
}

TEST(RdfGenerator, MessageIdsAreScopedToTheirConversation) {
    namespace sc = anamnesis::rdf::schema;

    std::vector<std::vector<anamnesis::core::Triple>> outputs;
    for (const char* conv_id : {"alpha", "beta"}) {
        anamnesis::core::Conversation conv;
        conv.id = conv_id;
        anamnesis::core::Message m;
        m.id = "m1";
        m.speaker = anamnesis::core::HumanSpeaker{"sam"};
        conv.messages.push_back(m);
        anamnesis::core::Artifact a;
        a.id = "a1";
        a.created_in = "m1";
        conv.artifacts.push_back(a);

        std::vector<anamnesis::core::Triple> triples;
        ASSERT_TRUE(anamnesis::core::is_ok(anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples)));
        outputs.push_back(std::move(triples));
    }

    auto message_subject = [](const std::vector<anamnesis::core::Triple>& triples) {
        for (const anamnesis::core::Triple& t : triples) {
            if (t.predicate == sc::kType && t.object == sc::kHumanMessage) return t.subject;
        }
        return std::string();
    };
    const std::string alpha_msg = message_subject(outputs[0]);
    const std::string beta_msg = message_subject(outputs[1]);
    EXPECT_EQ(alpha_msg, "anamnesis:msg:alpha%2Fm1");
    EXPECT_EQ(beta_msg, "anamnesis:msg:beta%2Fm1");
    EXPECT_NE(alpha_msg, beta_msg);

    EXPECT_TRUE(contains(outputs[0], {"anamnesis:artifact:alpha%2Fa1", s(sc::kCreatedIn), alpha_msg}));
    EXPECT_TRUE(contains(outputs[1], {"anamnesis:artifact:beta%2Fa1", s(sc::kCreatedIn), beta_msg}));
    EXPECT_FALSE(contains(outputs[1], {"anamnesis:artifact:alpha%2Fa1", s(sc::kCreatedIn), alpha_msg}));
}

TEST(RdfGenerator, OutputIsDeterministic) {
    anamnesis::core::Conversation conv;
    conv.id = "c1";
    anamnesis::core::Message m;
    m.id = "m1";
    conv.messages.push_back(m);

    std::vector<anamnesis::core::Triple> first;
    std::vector<anamnesis::core::Triple> second;
    ASSERT_TRUE(anamnesis::core::is_ok(anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &first)));
    ASSERT_TRUE(anamnesis::core::is_ok(anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &second)));
    EXPECT_EQ(first, second);
}

TEST(RdfGenerator, MissingIdsAreReported) {
    anamnesis::core::Conversation conv;
    std::vector<anamnesis::core::Triple> triples{{"keep", "keep", "keep"}};

    anamnesis::core::Status st = anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples);
    EXPECT_EQ(st.code, anamnesis::core::StatusCode::MissingField);
    EXPECT_EQ(st.domain, anamnesis::core::StatusDomain::Rdf);
    EXPECT_EQ(st.aux, anamnesis::rdf::kMissingConversationId);
    EXPECT_EQ(triples.size(), 1u);

    conv.id = "c1";
    conv.messages.emplace_back();
    st = anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples);
    EXPECT_EQ(st.aux, anamnesis::rdf::kMissingMessageId);

    conv.messages[0].id = "m1";
    conv.artifacts.emplace_back();
    st = anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples);
    EXPECT_EQ(st.aux, anamnesis::rdf::kMissingArtifactId);

    conv.artifacts[0].id = "a1";
    st = anamnesis::rdf::generate(conv, anamnesis::core::Inferences{}, &triples);
    EXPECT_EQ(st.aux, anamnesis::rdf::kMissingCreatedIn);
}
