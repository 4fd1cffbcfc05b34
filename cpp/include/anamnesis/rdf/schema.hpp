#pragma once

#include <string_view>

// Anamnesis vocabulary. Short names ("anamnesis:conv:x") expand against kBase.
namespace anamnesis::rdf::schema {

    inline constexpr std::string_view kBase = "http://anamnesis.hyperpolymath.org/ns#";
    inline constexpr std::string_view kShortPrefix = "anamnesis:";

    inline constexpr std::string_view kRdfNs = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    inline constexpr std::string_view kRdfsNs = "http://www.w3.org/2000/01/rdf-schema#";
    inline constexpr std::string_view kXsdNs = "http://www.w3.org/2001/XMLSchema#";

    inline constexpr std::string_view kType = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
    inline constexpr std::string_view kLabel = "http://www.w3.org/2000/01/rdf-schema#label";

    inline constexpr std::string_view kXsdDateTime = "http://www.w3.org/2001/XMLSchema#dateTime";
    inline constexpr std::string_view kXsdDouble = "http://www.w3.org/2001/XMLSchema#double";
    inline constexpr std::string_view kXsdBoolean = "http://www.w3.org/2001/XMLSchema#boolean";

    // Classes
    inline constexpr std::string_view kConversation = "http://anamnesis.hyperpolymath.org/ns#Conversation";
    inline constexpr std::string_view kMessage = "http://anamnesis.hyperpolymath.org/ns#Message";
    inline constexpr std::string_view kLlmMessage = "http://anamnesis.hyperpolymath.org/ns#LLMMessage";
    inline constexpr std::string_view kHumanMessage = "http://anamnesis.hyperpolymath.org/ns#HumanMessage";
    inline constexpr std::string_view kArtifact = "http://anamnesis.hyperpolymath.org/ns#Artifact";
    inline constexpr std::string_view kCodeArtifact = "http://anamnesis.hyperpolymath.org/ns#CodeArtifact";
    inline constexpr std::string_view kDocumentationArtifact = "http://anamnesis.hyperpolymath.org/ns#DocumentationArtifact";
    inline constexpr std::string_view kConfigurationArtifact = "http://anamnesis.hyperpolymath.org/ns#ConfigurationArtifact";
    inline constexpr std::string_view kProject = "http://anamnesis.hyperpolymath.org/ns#Project";
    inline constexpr std::string_view kMembership = "http://anamnesis.hyperpolymath.org/ns#Membership";
    inline constexpr std::string_view kLlm = "http://anamnesis.hyperpolymath.org/ns#LLM";
    inline constexpr std::string_view kHuman = "http://anamnesis.hyperpolymath.org/ns#Human";

    // Properties
    inline constexpr std::string_view kPartOf = "http://anamnesis.hyperpolymath.org/ns#partOf";
    inline constexpr std::string_view kCreatedIn = "http://anamnesis.hyperpolymath.org/ns#createdIn";
    inline constexpr std::string_view kModifiedIn = "http://anamnesis.hyperpolymath.org/ns#modifiedIn";
    inline constexpr std::string_view kDiscusses = "http://anamnesis.hyperpolymath.org/ns#discusses";
    inline constexpr std::string_view kState = "http://anamnesis.hyperpolymath.org/ns#state";
    inline constexpr std::string_view kSpeaker = "http://anamnesis.hyperpolymath.org/ns#speaker";
    inline constexpr std::string_view kContent = "http://anamnesis.hyperpolymath.org/ns#content";
    inline constexpr std::string_view kTimestamp = "http://anamnesis.hyperpolymath.org/ns#timestamp";
    inline constexpr std::string_view kPlatform = "http://anamnesis.hyperpolymath.org/ns#platform";
    inline constexpr std::string_view kName = "http://anamnesis.hyperpolymath.org/ns#name";
    inline constexpr std::string_view kArtifactName = "http://anamnesis.hyperpolymath.org/ns#artifactName";
    inline constexpr std::string_view kArtifactContent = "http://anamnesis.hyperpolymath.org/ns#artifactContent";
    inline constexpr std::string_view kContentHash = "http://anamnesis.hyperpolymath.org/ns#contentHash";
    inline constexpr std::string_view kLanguage = "http://anamnesis.hyperpolymath.org/ns#language";
    inline constexpr std::string_view kModelName = "http://anamnesis.hyperpolymath.org/ns#modelName";
    inline constexpr std::string_view kProvider = "http://anamnesis.hyperpolymath.org/ns#provider";
    inline constexpr std::string_view kReferences = "http://anamnesis.hyperpolymath.org/ns#references";
    inline constexpr std::string_view kBelongsTo = "http://anamnesis.hyperpolymath.org/ns#belongsTo";
    inline constexpr std::string_view kCategory = "http://anamnesis.hyperpolymath.org/ns#category";
    inline constexpr std::string_view kMembershipStrength = "http://anamnesis.hyperpolymath.org/ns#membershipStrength";
    inline constexpr std::string_view kContaminationRisk = "http://anamnesis.hyperpolymath.org/ns#contaminationRisk";
    inline constexpr std::string_view kUncategorized = "http://anamnesis.hyperpolymath.org/ns#uncategorized";

    // Lifecycle state resources
    inline constexpr std::string_view kStateCreated = "http://anamnesis.hyperpolymath.org/ns#StateCreated";
    inline constexpr std::string_view kStateModified = "http://anamnesis.hyperpolymath.org/ns#StateModified";
    inline constexpr std::string_view kStateRemoved = "http://anamnesis.hyperpolymath.org/ns#StateRemoved";
    inline constexpr std::string_view kStateEvaluated = "http://anamnesis.hyperpolymath.org/ns#StateEvaluated";

} // namespace anamnesis::rdf::schema
