#include <gtest/gtest.h>

#include "anamnesis/parser/validate.hpp"

namespace {
    anamnesis::core::Conversation sample() {
        anamnesis::core::Conversation conv;
        conv.id = "c1";
        conv.timestamp = 100;
        for (const char* id : {"m1", "m2"}) {
            anamnesis::core::Message m;
            m.id = id;
            m.content = "text";
            m.timestamp = 100;
            conv.messages.push_back(m);
        }
        anamnesis::core::Artifact a;
        a.id = "a1";
        a.content = "x";
        a.created_in = "m1";
        a.modified_in = {"m2"};
        a.history = {{anamnesis::core::LifecycleState::Created, 100}, {anamnesis::core::LifecycleState::Modified, 110}};
        conv.artifacts.push_back(a);
        return conv;
    }
} // namespace

TEST(ParserValidate, CleanConversationHasNoViolations) {
    const auto errors = anamnesis::parser::validate(sample());
    EXPECT_TRUE(errors.empty());
    EXPECT_TRUE(anamnesis::core::is_ok(anamnesis::parser::validation_status(errors)));
}

TEST(ParserValidate, EmptyMessageIdIsNotAViolation) {
    anamnesis::core::Conversation conv = sample();
    conv.messages[1].id = "";
    conv.artifacts[0].modified_in.clear();
    EXPECT_TRUE(anamnesis::parser::validate(conv).empty());
}

TEST(ParserValidate, ReportsEveryViolationInCheckOrder) {
    anamnesis::core::Conversation conv = sample();
    conv.id = "";
    conv.messages[1].id = "m1";
    conv.messages[1].timestamp = -5;
    conv.artifacts[0].created_in = "ghost";
    conv.artifacts[0].modified_in = {"m1", "nowhere"};

    anamnesis::core::Artifact dup = conv.artifacts[0];
    dup.created_in = "m1";
    dup.modified_in.clear();
    dup.history.clear();
    conv.artifacts.push_back(dup);

    anamnesis::core::Artifact unnamed;
    unnamed.created_in = "m1";
    conv.artifacts.push_back(unnamed);

    const auto errors = anamnesis::parser::validate(conv);
    ASSERT_EQ(errors.size(), 7u);
    EXPECT_EQ(errors[0].rule, anamnesis::parser::ValidationRule::EmptyConversationId);
    EXPECT_EQ(errors[1].rule, anamnesis::parser::ValidationRule::DuplicateMessageId);
    EXPECT_EQ(errors[2].rule, anamnesis::parser::ValidationRule::NegativeTimestamp);
    EXPECT_EQ(errors[3].rule, anamnesis::parser::ValidationRule::UnresolvedCreatedIn);
    EXPECT_EQ(errors[4].rule, anamnesis::parser::ValidationRule::UnresolvedModifiedIn);
    EXPECT_EQ(errors[5].rule, anamnesis::parser::ValidationRule::DuplicateArtifactId);
    EXPECT_EQ(errors[6].rule, anamnesis::parser::ValidationRule::EmptyArtifactId);

    EXPECT_EQ(anamnesis::parser::validation_error_text(errors[3]),
              "unresolved_created_in a1: created_in 'ghost' names no message");
    EXPECT_EQ(anamnesis::parser::validation_error_text(errors[0]), "empty_conversation_id: conversation id is empty");

    const anamnesis::core::Status s = anamnesis::parser::validation_status(errors);
    EXPECT_EQ(s.code, anamnesis::core::StatusCode::ReferentialIntegrity);
    EXPECT_EQ(s.domain, anamnesis::core::StatusDomain::Validation);
    EXPECT_EQ(s.aux, 7u);
}

TEST(ParserValidate, IllegalHistoryIsFlagged) {
    anamnesis::core::Conversation conv = sample();
    conv.artifacts[0].history = {{anamnesis::core::LifecycleState::Created, 100},
                                 {anamnesis::core::LifecycleState::Removed, 110},
                                 {anamnesis::core::LifecycleState::Modified, 120}};
    const auto errors = anamnesis::parser::validate(conv);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rule, anamnesis::parser::ValidationRule::IllegalTransition);
    EXPECT_EQ(errors[0].subject, "a1");
    EXPECT_EQ(errors[0].message, "removed -> modified at 120");
}

TEST(ParserValidate, ReferentialRules) {
    EXPECT_TRUE(anamnesis::parser::validation_rule_referential(anamnesis::parser::ValidationRule::UnresolvedCreatedIn));
    EXPECT_TRUE(anamnesis::parser::validation_rule_referential(anamnesis::parser::ValidationRule::UnresolvedModifiedIn));
    EXPECT_FALSE(anamnesis::parser::validation_rule_referential(anamnesis::parser::ValidationRule::DuplicateMessageId));
}
