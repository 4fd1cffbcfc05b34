#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "anamnesis/core/types.hpp"

namespace anamnesis::core {

    // ------------------------------------------------------------------------
    // Speakers
    // ------------------------------------------------------------------------

    struct HumanSpeaker {
        std::string name;
        friend bool operator==(const HumanSpeaker&, const HumanSpeaker&) = default;
    };

    struct LlmSpeaker {
        std::string model;
        std::optional<std::string> provider;
        friend bool operator==(const LlmSpeaker&, const LlmSpeaker&) = default;
    };

    using Speaker = std::variant<HumanSpeaker, LlmSpeaker>;

    // ------------------------------------------------------------------------
    // Artifacts
    // ------------------------------------------------------------------------

    struct CodeArtifact {
        std::string language;
        friend bool operator==(const CodeArtifact&, const CodeArtifact&) = default;
    };
    struct DocumentationArtifact {
        friend bool operator==(const DocumentationArtifact&, const DocumentationArtifact&) = default;
    };
    struct ConfigurationArtifact {
        friend bool operator==(const ConfigurationArtifact&, const ConfigurationArtifact&) = default;
    };
    struct OtherArtifact {
        std::string tag;
        friend bool operator==(const OtherArtifact&, const OtherArtifact&) = default;
    };

    using ArtifactType = std::variant<CodeArtifact, DocumentationArtifact, ConfigurationArtifact, OtherArtifact>;

    enum class LifecycleState : u8 {
        Created = 0,
        Modified = 1,
        Removed = 2,
        Evaluated = 3,
    };

    struct LifecycleEvent {
        LifecycleState state{LifecycleState::Created};
        Timestamp at{0};
        friend bool operator==(const LifecycleEvent&, const LifecycleEvent&) = default;
    };

    [[nodiscard]] const char* lifecycle_state_name(LifecycleState s) noexcept;
    [[nodiscard]] bool lifecycle_state_from_name(const char* name, LifecycleState* out) noexcept;

    struct Artifact {
        std::string id;
        std::optional<std::string> name;
        ArtifactType type{CodeArtifact{"unknown"}};
        std::string content;
        std::string created_in;
        std::vector<std::string> modified_in;
        LifecycleState state{LifecycleState::Created};
        std::vector<LifecycleEvent> history;
        std::string content_hash;
    };

    // ------------------------------------------------------------------------
    // Messages and fragments
    // ------------------------------------------------------------------------

    // A message or artifact, addressed within a conversation.
    struct FragmentRef {
        std::string conversation;   // empty: same conversation as the referrer
        std::string fragment;
        friend bool operator==(const FragmentRef&, const FragmentRef&) = default;
        friend auto operator<=>(const FragmentRef&, const FragmentRef&) = default;
    };

    struct Message {
        std::string id;
        Speaker speaker{HumanSpeaker{"user"}};
        std::string content;
        Timestamp timestamp{0};
        std::vector<FragmentRef> references;
    };

    // ------------------------------------------------------------------------
    // Project membership
    // ------------------------------------------------------------------------

    enum class MembershipType : u8 {
        Primary = 0,
        Secondary = 1,
        Tangential = 2,
    };

    [[nodiscard]] const char* membership_type_name(MembershipType t) noexcept;
    [[nodiscard]] bool membership_type_from_name(const char* name, MembershipType* out) noexcept;

    struct ProjectMembership {
        std::string category;
        MembershipType type{MembershipType::Primary};
        friend bool operator==(const ProjectMembership&, const ProjectMembership&) = default;
    };

    // ------------------------------------------------------------------------
    // Conversation
    // ------------------------------------------------------------------------

    struct Conversation {
        std::string id;
        std::optional<std::string> platform;
        Timestamp timestamp{0};
        std::vector<Message> messages;
        std::vector<Artifact> artifacts;
        std::vector<ProjectMembership> memberships;
        std::map<std::string, std::string> metadata;
    };

    [[nodiscard]] const Message* find_message(const Conversation& conv, const std::string& id) noexcept;
    [[nodiscard]] const Artifact* find_artifact(const Conversation& conv, const std::string& id) noexcept;

    // ------------------------------------------------------------------------
    // Inferences produced by reasoning and consumed by RDF generation
    // ------------------------------------------------------------------------

    struct ArtifactInference {
        std::string artifact_id;
        LifecycleState current{LifecycleState::Created};
        Timestamp as_of{0};
        u32 transitions{0};
    };

    struct CategoryScore {
        std::string category;
        double raw{0.0};
        double normalized{0.0};
    };

    struct FragmentLinks {
        std::string fragment;
        std::vector<FragmentRef> linked;
    };

    struct CrossReference {
        FragmentRef from;
        FragmentRef to;
    };

    struct Inferences {
        std::string conversation_id;
        std::vector<ArtifactInference> artifacts;
        std::vector<CategoryScore> memberships;
        bool uncategorized{true};
        std::optional<std::string> primary_category;
        double contamination_risk{0.0};
        std::vector<FragmentLinks> links;
        std::vector<CrossReference> cross_references;
    };

    // ------------------------------------------------------------------------
    // Contamination profile of one conversation
    // ------------------------------------------------------------------------

    struct ConversationProfile {
        std::string id;
        std::optional<std::string> primary_category;
        std::vector<std::string> artifact_keys;   // content fingerprints
        friend bool operator==(const ConversationProfile&, const ConversationProfile&) = default;
    };

    // ------------------------------------------------------------------------
    // Export formats
    // ------------------------------------------------------------------------

    // Detection tries these in declaration order.
    enum class FormatTag : u8 {
        Claude = 0,
        ChatGpt = 1,
        Generic = 2,
    };

    // "claude", "chatgpt", "generic"
    [[nodiscard]] const char* format_name(FormatTag f) noexcept;
    [[nodiscard]] bool format_from_name(const char* name, FormatTag* out) noexcept;

    // ------------------------------------------------------------------------
    // RDF
    // ------------------------------------------------------------------------

    struct Triple {
        std::string subject;
        std::string predicate;
        std::string object;
        friend bool operator==(const Triple&, const Triple&) = default;
    };

} // namespace anamnesis::core
