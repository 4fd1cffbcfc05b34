#include "anamnesis/rdf/generator.hpp"

#include <cstdio>
#include <set>
#include <string>
#include <utility>
#include <variant>

#include "anamnesis/parser/timestamp.hpp"
#include "anamnesis/rdf/ntriples.hpp"
#include "anamnesis/rdf/schema.hpp"

namespace anamnesis::rdf {
    namespace {
        template <class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        std::string resource(std::string_view kind, std::string_view id) {
            std::string out(schema::kShortPrefix);
            out += kind;
            out.push_back(':');
            out += encode_resource_id(id);
            return out;
        }

        // Message and artifact ids are only unique within their conversation.
        std::string scoped(std::string_view kind, const std::string& conversation, std::string_view id) {
            std::string key = conversation;
            key.push_back('/');
            key += id;
            return resource(kind, key);
        }

        std::string date_time(core::Timestamp ts) {
            return make_typed_literal(parser::format_rfc3339(ts), schema::kXsdDateTime);
        }

        std::string decimal(double v) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.6g", v);
            return make_typed_literal(buf, schema::kXsdDouble);
        }

        std::string_view state_resource(core::LifecycleState s) noexcept {
            switch (s) {
            case core::LifecycleState::Created: return schema::kStateCreated;
            case core::LifecycleState::Modified: return schema::kStateModified;
            case core::LifecycleState::Removed: return schema::kStateRemoved;
            case core::LifecycleState::Evaluated: return schema::kStateEvaluated;
            }
            return schema::kStateCreated;
        }

        struct Emitter {
            std::vector<core::Triple>* out;

            void add(std::string s, std::string_view p, std::string o) {
                out->push_back(core::Triple{std::move(s), std::string(p), std::move(o)});
            }
        };
    } // namespace

    core::Status generate(const core::Conversation& conv, const core::Inferences& inf, std::vector<core::Triple>* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Rdf, core::StatusCode::Invalid);
        }
        if (conv.id.empty()) {
            return core::make_status(core::StatusDomain::Rdf, core::StatusCode::MissingField, kMissingConversationId);
        }
        for (const core::Message& m : conv.messages) {
            if (m.id.empty()) {
                return core::make_status(core::StatusDomain::Rdf, core::StatusCode::MissingField, kMissingMessageId);
            }
        }
        for (const core::Artifact& a : conv.artifacts) {
            if (a.id.empty()) {
                return core::make_status(core::StatusDomain::Rdf, core::StatusCode::MissingField, kMissingArtifactId);
            }
            if (a.created_in.empty()) {
                return core::make_status(core::StatusDomain::Rdf, core::StatusCode::MissingField, kMissingCreatedIn);
            }
        }

        std::vector<core::Triple> triples;
        Emitter e{&triples};
        const std::string conv_uri = resource("conv", conv.id);

        e.add(conv_uri, schema::kType, std::string(schema::kConversation));
        e.add(conv_uri, schema::kTimestamp, date_time(conv.timestamp));
        if (conv.platform) {
            e.add(conv_uri, schema::kPlatform, make_literal(*conv.platform));
        }
        auto name = conv.metadata.find("name");
        if (name != conv.metadata.end()) {
            e.add(conv_uri, schema::kName, make_literal(name->second));
        }

        if (inf.uncategorized) {
            e.add(conv_uri, schema::kUncategorized, make_typed_literal("true", schema::kXsdBoolean));
        }
        for (const core::CategoryScore& s : inf.memberships) {
            const std::string project = resource("project", s.category);
            const std::string membership = resource("membership", conv.id + "/" + s.category);
            e.add(conv_uri, schema::kBelongsTo, membership);
            e.add(membership, schema::kType, std::string(schema::kMembership));
            e.add(membership, schema::kCategory, project);
            e.add(membership, schema::kMembershipStrength, decimal(s.normalized));
            e.add(project, schema::kType, std::string(schema::kProject));
        }
        e.add(conv_uri, schema::kContaminationRisk, decimal(inf.contamination_risk));

        // Speaker resources are described once per conversation.
        std::set<std::string> speakers;
        for (const core::Message& m : conv.messages) {
            const std::string msg_uri = scoped("msg", conv.id, m.id);

            std::visit(overloaded{
                [&](const core::HumanSpeaker& h) {
                    const std::string speaker = resource("speaker", h.name);
                    e.add(msg_uri, schema::kType, std::string(schema::kHumanMessage));
                    e.add(msg_uri, schema::kSpeaker, speaker);
                    if (speakers.insert(speaker).second) {
                        e.add(speaker, schema::kType, std::string(schema::kHuman));
                    }
                },
                [&](const core::LlmSpeaker& l) {
                    const std::string speaker = resource("speaker", l.model);
                    e.add(msg_uri, schema::kType, std::string(schema::kLlmMessage));
                    e.add(msg_uri, schema::kSpeaker, speaker);
                    if (speakers.insert(speaker).second) {
                        e.add(speaker, schema::kType, std::string(schema::kLlm));
                        e.add(speaker, schema::kModelName, make_literal(l.model));
                        if (l.provider) {
                            e.add(speaker, schema::kProvider, make_literal(*l.provider));
                        }
                    }
                },
            }, m.speaker);

            e.add(msg_uri, schema::kPartOf, conv_uri);
            e.add(msg_uri, schema::kContent, make_literal(m.content));
            e.add(msg_uri, schema::kTimestamp, date_time(m.timestamp));

            for (const core::FragmentRef& ref : m.references) {
                const bool local = ref.conversation.empty() || ref.conversation == conv.id;
                const bool artifact = local && core::find_artifact(conv, ref.fragment) != nullptr;
                e.add(msg_uri, schema::kReferences,
                      scoped(artifact ? "artifact" : "msg", local ? conv.id : ref.conversation, ref.fragment));
            }
        }

        for (const core::Artifact& a : conv.artifacts) {
            const std::string art_uri = scoped("artifact", conv.id, a.id);

            std::visit(overloaded{
                [&](const core::CodeArtifact& c) {
                    e.add(art_uri, schema::kType, std::string(schema::kCodeArtifact));
                    e.add(art_uri, schema::kLanguage, make_literal(c.language));
                },
                [&](const core::DocumentationArtifact&) {
                    e.add(art_uri, schema::kType, std::string(schema::kDocumentationArtifact));
                },
                [&](const core::ConfigurationArtifact&) {
                    e.add(art_uri, schema::kType, std::string(schema::kConfigurationArtifact));
                },
                [&](const core::OtherArtifact&) {
                    e.add(art_uri, schema::kType, std::string(schema::kArtifact));
                },
            }, a.type);

            if (a.name) {
                e.add(art_uri, schema::kArtifactName, make_literal(*a.name));
            }
            e.add(art_uri, schema::kArtifactContent, make_literal(a.content));
            if (!a.content_hash.empty()) {
                e.add(art_uri, schema::kContentHash, make_literal(a.content_hash));
            }
            e.add(art_uri, schema::kCreatedIn, scoped("msg", conv.id, a.created_in));
            for (const std::string& id : a.modified_in) {
                e.add(art_uri, schema::kModifiedIn, scoped("msg", conv.id, id));
            }

            core::LifecycleState state = a.state;
            for (const core::ArtifactInference& ai : inf.artifacts) {
                if (ai.artifact_id == a.id) {
                    state = ai.current;
                    break;
                }
            }
            e.add(art_uri, schema::kState, std::string(state_resource(state)));
            e.add(conv_uri, schema::kDiscusses, art_uri);
        }

        *out = std::move(triples);
        return core::ok_status();
    }
} // namespace anamnesis::rdf
