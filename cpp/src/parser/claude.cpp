#include "anamnesis/parser/decoders.hpp"

#include <utility>

#include "anamnesis/parser/timestamp.hpp"

namespace anamnesis::parser {
    using json = nlohmann::json;

    namespace {
        core::Status schema_error(std::string* error, std::string text) {
            if (error != nullptr) {
                *error = std::move(text);
            }
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::SchemaViolation);
        }

        const json* string_field(const json& obj, const char* key) {
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_string()) {
                return nullptr;
            }
            return &*it;
        }

        core::ArtifactType attachment_type(const json& att) {
            if (const json* lang = string_field(att, "language")) {
                return core::CodeArtifact{lang->get<std::string>()};
            }

            const json* type = string_field(att, "type");
            if (type == nullptr) {
                type = string_field(att, "file_type");
            }
            if (type == nullptr) {
                return core::DocumentationArtifact{};
            }

            const std::string t = type->get<std::string>();
            if (t == "code") return core::CodeArtifact{"unknown"};
            if (t == "document" || t == "documentation" || t == "text" || t == "markdown" ||
                t == "txt" || t == "md" || t == "text/plain" || t == "text/markdown") {
                return core::DocumentationArtifact{};
            }
            if (t == "config" || t == "configuration") return core::ConfigurationArtifact{};
            if (t.empty()) return core::DocumentationArtifact{};
            return core::OtherArtifact{t};
        }
    } // namespace

    bool looks_like_claude(const json& doc) noexcept {
        if (!doc.is_object()) return false;
        auto uuid = doc.find("uuid");
        auto msgs = doc.find("chat_messages");
        return uuid != doc.end() && uuid->is_string() && msgs != doc.end() && msgs->is_array();
    }

    core::Status decode_claude(const json& doc, core::Conversation* out, std::string* error) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::Invalid);
        }
        if (!looks_like_claude(doc)) {
            return schema_error(error, "claude: expected uuid and chat_messages");
        }

        core::Conversation conv;
        conv.id = doc["uuid"].get<std::string>();
        conv.platform = "claude";

        const json* created = string_field(doc, "created_at");
        if (created == nullptr || !parse_rfc3339(created->get<std::string>(), &conv.timestamp)) {
            return schema_error(error, "claude: created_at missing or not RFC 3339");
        }
        if (const json* name = string_field(doc, "name")) {
            conv.metadata["name"] = name->get<std::string>();
        }

        const json& msgs = doc["chat_messages"];
        for (size_t i = 0; i < msgs.size(); ++i) {
            const json& jm = msgs[i];
            const std::string where = "claude: chat_messages[" + std::to_string(i) + "]";
            if (!jm.is_object()) {
                return schema_error(error, where + " is not an object");
            }

            core::Message m;
            const json* uuid = string_field(jm, "uuid");
            if (uuid == nullptr) {
                return schema_error(error, where + ".uuid missing");
            }
            m.id = uuid->get<std::string>();

            const json* text = string_field(jm, "text");
            if (text == nullptr) {
                return schema_error(error, where + ".text missing");
            }
            m.content = text->get<std::string>();

            const json* sender = string_field(jm, "sender");
            if (sender == nullptr) {
                return schema_error(error, where + ".sender missing");
            }
            if (*sender == "human") {
                m.speaker = core::HumanSpeaker{"user"};
            } else if (*sender == "assistant") {
                m.speaker = core::LlmSpeaker{"claude", std::string("anthropic")};
            } else {
                return schema_error(error, where + ".sender must be human or assistant");
            }

            const json* at = string_field(jm, "created_at");
            if (at == nullptr || !parse_rfc3339(at->get<std::string>(), &m.timestamp)) {
                return schema_error(error, where + ".created_at missing or not RFC 3339");
            }

            auto atts = jm.find("attachments");
            if (atts != jm.end() && atts->is_array()) {
                size_t k = 0;
                for (const json& att : *atts) {
                    if (!att.is_object()) continue;
                    const json* body = string_field(att, "content");
                    if (body == nullptr) {
                        body = string_field(att, "extracted_content");
                    }
                    if (body == nullptr) continue;

                    ++k;
                    core::Artifact a;
                    if (const json* id = string_field(att, "id")) {
                        a.id = id->get<std::string>();
                    } else {
                        a.id = "attachment-" + m.id + "-" + std::to_string(k);
                    }
                    if (const json* title = string_field(att, "title")) {
                        a.name = title->get<std::string>();
                    } else if (const json* file = string_field(att, "file_name")) {
                        a.name = file->get<std::string>();
                    }
                    a.type = attachment_type(att);
                    a.content = body->get<std::string>();
                    a.created_in = m.id;
                    a.state = core::LifecycleState::Created;
                    conv.artifacts.push_back(std::move(a));
                }
            }

            conv.messages.push_back(std::move(m));
        }

        *out = std::move(conv);
        return core::ok_status();
    }
} // namespace anamnesis::parser
