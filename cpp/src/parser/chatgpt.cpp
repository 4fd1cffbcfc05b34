#include "anamnesis/parser/decoders.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "anamnesis/core/model_json.hpp"

namespace anamnesis::parser {
    using json = nlohmann::json;

    namespace {
        core::Status schema_error(std::string* error, std::string text) {
            if (error != nullptr) {
                *error = std::move(text);
            }
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::SchemaViolation);
        }

        bool seconds(const json& v, core::Timestamp* out) {
            if (!v.is_number()) return false;
            return core::timestamp_from_seconds(v.get<double>(), out);
        }

        std::string string_or(const json& obj, const char* key, std::string fallback) {
            if (!obj.is_object()) return fallback;
            auto it = obj.find(key);
            if (it == obj.end() || !it->is_string()) return fallback;
            return it->get<std::string>();
        }

        // Text parts joined by newlines; non-text parts are skipped.
        std::string message_text(const json& msg) {
            auto content = msg.find("content");
            if (content == msg.end() || !content->is_object()) return std::string();

            auto parts = content->find("parts");
            if (parts != content->end() && parts->is_array()) {
                std::string out;
                bool first = true;
                for (const json& p : *parts) {
                    if (!p.is_string()) continue;
                    if (!first) out.push_back('\n');
                    out += p.get<std::string>();
                    first = false;
                }
                return out;
            }
            return string_or(*content, "text", std::string());
        }

        struct NodeRef {
            std::string key;
            const json* node{nullptr};
            core::Timestamp at{0};
        };
    } // namespace

    bool looks_like_chatgpt(const json& doc) noexcept {
        if (!doc.is_object()) return false;
        auto mapping = doc.find("mapping");
        auto created = doc.find("create_time");
        return mapping != doc.end() && mapping->is_object() && created != doc.end() && created->is_number();
    }

    core::Status decode_chatgpt(const json& doc, core::Conversation* out, std::string* error) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::Invalid);
        }
        if (!looks_like_chatgpt(doc)) {
            return schema_error(error, "chatgpt: expected mapping and create_time");
        }

        core::Conversation conv;
        conv.platform = "chatgpt";
        conv.id = string_or(doc, "conversation_id", string_or(doc, "id", std::string()));
        if (conv.id.empty()) {
            return schema_error(error, "chatgpt: conversation_id missing");
        }
        if (!seconds(doc["create_time"], &conv.timestamp)) {
            return schema_error(error, "chatgpt: create_time is not a finite number in timestamp range");
        }
        auto title = doc.find("title");
        if (title != doc.end() && title->is_string()) {
            conv.metadata["name"] = title->get<std::string>();
        }

        const json& mapping = doc["mapping"];
        std::vector<NodeRef> path;

        auto current = doc.find("current_node");
        if (current != doc.end() && current->is_string()) {
            // Walk parents from the current node back to the root.
            std::string key = current->get<std::string>();
            while (!key.empty()) {
                if (path.size() > mapping.size()) {
                    return schema_error(error, "chatgpt: mapping parent chain has a cycle");
                }
                auto it = mapping.find(key);
                if (it == mapping.end() || !it->is_object()) {
                    return schema_error(error, "chatgpt: mapping has no node " + key);
                }
                path.push_back(NodeRef{key, &*it, conv.timestamp});
                key = string_or(*it, "parent", std::string());
            }
            std::reverse(path.begin(), path.end());
        } else {
            for (auto it = mapping.begin(); it != mapping.end(); ++it) {
                if (!it->is_object()) {
                    return schema_error(error, "chatgpt: mapping node " + it.key() + " is not an object");
                }
                path.push_back(NodeRef{it.key(), &*it, conv.timestamp});
            }
        }

        for (NodeRef& ref : path) {
            auto msg = ref.node->find("message");
            if (msg != ref.node->end() && msg->is_object()) {
                auto ct = msg->find("create_time");
                if (ct != msg->end() && !ct->is_null() && !seconds(*ct, &ref.at)) {
                    return schema_error(error, "chatgpt: message create_time in node " + ref.key + " is not a timestamp");
                }
            }
        }

        if (current == doc.end() || !current->is_string()) {
            std::stable_sort(path.begin(), path.end(), [](const NodeRef& a, const NodeRef& b) {
                if (a.at != b.at) return a.at < b.at;
                return a.key < b.key;
            });
        }

        for (const NodeRef& ref : path) {
            auto msg = ref.node->find("message");
            if (msg == ref.node->end() || !msg->is_object()) continue;

            const std::string role = string_or(msg->value("author", json::object()), "role", std::string());
            core::Message m;
            if (role == "user") {
                m.speaker = core::HumanSpeaker{"user"};
            } else if (role == "assistant") {
                const std::string model = string_or(msg->value("metadata", json::object()), "model_slug", "chatgpt");
                m.speaker = core::LlmSpeaker{model, std::string("openai")};
            } else {
                // system, tool and other internal roles
                continue;
            }

            m.content = message_text(*msg);
            if (m.content.empty()) continue;

            m.id = string_or(*msg, "id", ref.key);
            m.timestamp = ref.at;
            conv.messages.push_back(std::move(m));
        }

        *out = std::move(conv);
        return core::ok_status();
    }
} // namespace anamnesis::parser
