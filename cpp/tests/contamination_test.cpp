#include <gtest/gtest.h>

#include "anamnesis/core/hashing.hpp"
#include "anamnesis/reasoning/contamination.hpp"

namespace {
    anamnesis::core::ConversationProfile profile(const char* id, const char* primary, std::vector<std::string> keys) {
        anamnesis::core::ConversationProfile p;
        p.id = id;
        if (primary != nullptr) {
            p.primary_category = std::string(primary);
        }
        p.artifact_keys = std::move(keys);
        return p;
    }
} // namespace

TEST(ReasoningContamination, ProfileOfConversation) {
    anamnesis::core::Conversation conv;
    conv.id = "c1";
    conv.memberships = {{"web", anamnesis::core::MembershipType::Primary},
                        {"ops", anamnesis::core::MembershipType::Tangential}};
    anamnesis::core::Artifact a;
    a.id = "a1";
    a.content_hash = anamnesis::core::content_fingerprint("x");
    conv.artifacts = {a, a};
    a.id = "a2";
    a.content_hash.clear();
    conv.artifacts.push_back(a);

    const anamnesis::core::ConversationProfile p = anamnesis::reasoning::profile_of(conv);
    EXPECT_EQ(p.id, "c1");
    EXPECT_EQ(p.primary_category, std::optional<std::string>("web"));
    ASSERT_EQ(p.artifact_keys.size(), 1u);
    EXPECT_EQ(p.artifact_keys[0], anamnesis::core::content_fingerprint("x"));

    conv.memberships.push_back({"db", anamnesis::core::MembershipType::Primary});
    EXPECT_FALSE(anamnesis::reasoning::profile_of(conv).primary_category.has_value());
}

TEST(ReasoningContamination, PairwiseRequiresDifferentPrimariesAndSharedKey) {
    EXPECT_TRUE(anamnesis::reasoning::profiles_contaminate(profile("a", "web", {"k1", "k2"}),
                                                           profile("b", "ops", {"k2"})));
    EXPECT_FALSE(anamnesis::reasoning::profiles_contaminate(profile("a", "web", {"k1"}), profile("b", "web", {"k1"})));
    EXPECT_FALSE(anamnesis::reasoning::profiles_contaminate(profile("a", "web", {"k1"}), profile("b", "ops", {"k9"})));
    EXPECT_FALSE(anamnesis::reasoning::profiles_contaminate(profile("a", nullptr, {"k1"}), profile("b", "ops", {"k1"})));
}

TEST(ReasoningContamination, IndexRejectsEmptyAndDuplicateIds) {
    anamnesis::reasoning::ContaminationIndex index;
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("a", "web", {"k"}))));
    EXPECT_EQ(index.add(profile("a", "ops", {})).code, anamnesis::core::StatusCode::Invalid);
    EXPECT_EQ(index.add(profile("", "ops", {})).code, anamnesis::core::StatusCode::Invalid);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.contains("a"));
    EXPECT_FALSE(index.contaminates("a", "missing"));
}

TEST(ReasoningContamination, SpreadIsTransitive) {
    anamnesis::reasoning::ContaminationIndex index;
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("seed", "web", {"k1"}))));
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("hop1", "ops", {"k1", "k2"}))));
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("hop2", "web", {"k2"}))));
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("same", "web", {"k1"}))));
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("loose", nullptr, {"k1"}))));
    ASSERT_TRUE(anamnesis::core::is_ok(index.add(profile("apart", "db", {"k9"}))));

    std::vector<std::string> spread;
    ASSERT_TRUE(anamnesis::core::is_ok(index.contamination_spread("seed", &spread)));
    // "same" is reached through hop1, not directly from the seed
    EXPECT_EQ(spread, (std::vector<std::string>{"hop1", "hop2", "same"}));

    ASSERT_TRUE(anamnesis::core::is_ok(index.contamination_spread("apart", &spread)));
    EXPECT_TRUE(spread.empty());

    EXPECT_EQ(index.contamination_spread("nobody", &spread).code, anamnesis::core::StatusCode::NotFound);
}
