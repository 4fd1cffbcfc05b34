#include "anamnesis/core/model_json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace anamnesis::core {
    using json = nlohmann::json;

    namespace {
        template <class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        // Records the first schema problem; later checks become no-ops.
        struct Reader {
            std::string error;

            [[nodiscard]] bool ok() const noexcept { return error.empty(); }

            void fail(const std::string& where, const char* what) {
                if (error.empty()) {
                    error = where + ": " + what;
                }
            }

            bool object(const json& v, const std::string& where) {
                if (!ok()) return false;
                if (!v.is_object()) {
                    fail(where, "expected object");
                    return false;
                }
                return true;
            }

            bool string(const json& obj, const char* key, const std::string& where, std::string* out) {
                if (!ok()) return false;
                auto it = obj.find(key);
                if (it == obj.end() || !it->is_string()) {
                    fail(where + "." + key, "expected string");
                    return false;
                }
                *out = it->get<std::string>();
                return true;
            }

            bool opt_string(const json& obj, const char* key, const std::string& where, std::optional<std::string>* out) {
                if (!ok()) return false;
                auto it = obj.find(key);
                if (it == obj.end() || it->is_null()) {
                    out->reset();
                    return true;
                }
                if (!it->is_string()) {
                    fail(where + "." + key, "expected string or null");
                    return false;
                }
                *out = it->get<std::string>();
                return true;
            }

            bool timestamp(const json& obj, const char* key, const std::string& where, Timestamp* out) {
                if (!ok()) return false;
                auto it = obj.find(key);
                if (it == obj.end() || !it->is_number()) {
                    fail(where + "." + key, "expected number");
                    return false;
                }
                if (it->is_number_float()) {
                    if (!timestamp_from_seconds(it->get<double>(), out)) {
                        fail(where + "." + key, "expected finite number in timestamp range");
                        return false;
                    }
                } else if (it->is_number_unsigned() &&
                           it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<Timestamp>::max())) {
                    fail(where + "." + key, "expected finite number in timestamp range");
                    return false;
                } else {
                    *out = it->get<Timestamp>();
                }
                return true;
            }

            bool number(const json& obj, const char* key, const std::string& where, double* out) {
                if (!ok()) return false;
                auto it = obj.find(key);
                if (it == obj.end() || !it->is_number()) {
                    fail(where + "." + key, "expected number");
                    return false;
                }
                *out = it->get<double>();
                return true;
            }

            const json* opt_array(const json& obj, const char* key, const std::string& where) {
                if (!ok()) return nullptr;
                auto it = obj.find(key);
                if (it == obj.end() || it->is_null()) {
                    return nullptr;
                }
                if (!it->is_array()) {
                    fail(where + "." + key, "expected array");
                    return nullptr;
                }
                return &*it;
            }
        };

        json fragment_ref_json(const FragmentRef& ref) {
            json j = json::object();
            if (!ref.conversation.empty()) {
                j["conversation"] = ref.conversation;
            }
            j["fragment"] = ref.fragment;
            return j;
        }

        bool read_fragment_ref(Reader& r, const json& v, const std::string& where, FragmentRef* out) {
            if (v.is_string()) {
                *out = fragment_ref_from_string(v.get<std::string>());
                if (out->fragment.empty()) {
                    r.fail(where, "empty reference");
                    return false;
                }
                return true;
            }
            if (!r.object(v, where)) return false;
            std::optional<std::string> conv;
            if (!r.opt_string(v, "conversation", where, &conv)) return false;
            if (!r.string(v, "fragment", where, &out->fragment)) return false;
            out->conversation = conv.value_or(std::string());
            return true;
        }

        json speaker_json(const Speaker& s) {
            return std::visit(overloaded{
                [](const HumanSpeaker& h) {
                    return json{{"kind", "human"}, {"name", h.name}};
                },
                [](const LlmSpeaker& l) {
                    json j{{"kind", "llm"}, {"model", l.model}};
                    if (l.provider) {
                        j["provider"] = *l.provider;
                    }
                    return j;
                },
            }, s);
        }

        bool read_speaker(Reader& r, const json& v, const std::string& where, Speaker* out) {
            if (!r.object(v, where)) return false;
            std::string kind;
            if (!r.string(v, "kind", where, &kind)) return false;
            if (kind == "human") {
                HumanSpeaker h;
                if (!r.string(v, "name", where, &h.name)) return false;
                *out = std::move(h);
                return true;
            }
            if (kind == "llm") {
                LlmSpeaker l;
                if (!r.string(v, "model", where, &l.model)) return false;
                if (!r.opt_string(v, "provider", where, &l.provider)) return false;
                *out = std::move(l);
                return true;
            }
            r.fail(where + ".kind", "expected \"human\" or \"llm\"");
            return false;
        }

        json artifact_type_json(const ArtifactType& t) {
            return std::visit(overloaded{
                [](const CodeArtifact& c) { return json{{"kind", "code"}, {"language", c.language}}; },
                [](const DocumentationArtifact&) { return json{{"kind", "documentation"}}; },
                [](const ConfigurationArtifact&) { return json{{"kind", "configuration"}}; },
                [](const OtherArtifact& o) { return json{{"kind", "other"}, {"tag", o.tag}}; },
            }, t);
        }

        bool read_artifact_type(Reader& r, const json& v, const std::string& where, ArtifactType* out) {
            if (!r.object(v, where)) return false;
            std::string kind;
            if (!r.string(v, "kind", where, &kind)) return false;
            if (kind == "code") {
                CodeArtifact c;
                std::optional<std::string> lang;
                if (!r.opt_string(v, "language", where, &lang)) return false;
                c.language = lang.value_or("unknown");
                *out = std::move(c);
            } else if (kind == "documentation") {
                *out = DocumentationArtifact{};
            } else if (kind == "configuration") {
                *out = ConfigurationArtifact{};
            } else if (kind == "other") {
                OtherArtifact o;
                if (!r.string(v, "tag", where, &o.tag)) return false;
                *out = std::move(o);
            } else {
                // An unrecognised kind is kept as its own tag.
                *out = OtherArtifact{kind};
            }
            return true;
        }

        bool read_state(Reader& r, const json& obj, const char* key, const std::string& where, LifecycleState* out) {
            std::string name;
            if (!r.string(obj, key, where, &name)) return false;
            if (!lifecycle_state_from_name(name.c_str(), out)) {
                r.fail(where + "." + key, "unknown lifecycle state");
                return false;
            }
            return true;
        }
    } // namespace

    bool timestamp_from_seconds(double seconds, Timestamp* out) noexcept {
        if (out == nullptr || !std::isfinite(seconds)) {
            return false;
        }
        // -2^63 and 2^63 are exact doubles; everything in between converts.
        const double floored = std::floor(seconds);
        if (floored < -9223372036854775808.0 || floored >= 9223372036854775808.0) {
            return false;
        }
        *out = static_cast<Timestamp>(floored);
        return true;
    }

    FragmentRef fragment_ref_from_string(std::string_view s) {
        FragmentRef ref;
        const auto hash = s.find('#');
        if (hash == std::string_view::npos) {
            ref.fragment = std::string(s);
        } else {
            ref.conversation = std::string(s.substr(0, hash));
            ref.fragment = std::string(s.substr(hash + 1));
        }
        return ref;
    }

    std::string fragment_ref_to_string(const FragmentRef& ref) {
        if (ref.conversation.empty()) {
            return ref.fragment;
        }
        return ref.conversation + "#" + ref.fragment;
    }

    json conversation_to_json(const Conversation& conv) {
        json doc = json::object();
        doc["id"] = conv.id;
        doc["platform"] = conv.platform ? json(*conv.platform) : json(nullptr);
        doc["timestamp"] = conv.timestamp;

        json messages = json::array();
        for (const Message& m : conv.messages) {
            json jm = json::object();
            jm["id"] = m.id;
            jm["speaker"] = speaker_json(m.speaker);
            jm["content"] = m.content;
            jm["timestamp"] = m.timestamp;
            if (!m.references.empty()) {
                json refs = json::array();
                for (const FragmentRef& ref : m.references) {
                    refs.push_back(fragment_ref_json(ref));
                }
                jm["references"] = std::move(refs);
            }
            messages.push_back(std::move(jm));
        }
        doc["messages"] = std::move(messages);

        json artifacts = json::array();
        for (const Artifact& a : conv.artifacts) {
            json ja = json::object();
            ja["id"] = a.id;
            if (a.name) {
                ja["name"] = *a.name;
            }
            ja["artifact_type"] = artifact_type_json(a.type);
            ja["content"] = a.content;
            ja["created_in"] = a.created_in;
            ja["modified_in"] = a.modified_in;
            ja["state"] = lifecycle_state_name(a.state);
            json history = json::array();
            for (const LifecycleEvent& e : a.history) {
                history.push_back(json{{"state", lifecycle_state_name(e.state)}, {"timestamp", e.at}});
            }
            ja["history"] = std::move(history);
            if (!a.content_hash.empty()) {
                ja["content_hash"] = a.content_hash;
            }
            artifacts.push_back(std::move(ja));
        }
        doc["artifacts"] = std::move(artifacts);

        json memberships = json::array();
        for (const ProjectMembership& pm : conv.memberships) {
            memberships.push_back(json{{"category", pm.category}, {"type", membership_type_name(pm.type)}});
        }
        doc["memberships"] = std::move(memberships);

        json metadata = json::object();
        for (const auto& [k, v] : conv.metadata) {
            metadata[k] = v;
        }
        doc["metadata"] = std::move(metadata);
        return doc;
    }

    Status conversation_from_json(const json& doc, Conversation* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Parser, StatusCode::Invalid);
        }

        Reader r;
        Conversation conv;
        if (r.object(doc, "conversation")) {
            r.string(doc, "id", "conversation", &conv.id);
            r.opt_string(doc, "platform", "conversation", &conv.platform);
            r.timestamp(doc, "timestamp", "conversation", &conv.timestamp);

            auto msgs = doc.find("messages");
            if (r.ok() && (msgs == doc.end() || !msgs->is_array())) {
                r.fail("conversation.messages", "expected array");
            }
            for (size_t i = 0; r.ok() && i < msgs->size(); ++i) {
                const json& jm = (*msgs)[i];
                const std::string where = "messages[" + std::to_string(i) + "]";
                Message m;
                if (!r.object(jm, where)) break;
                r.string(jm, "id", where, &m.id);
                if (r.ok()) {
                    auto sp = jm.find("speaker");
                    if (sp == jm.end()) {
                        r.fail(where + ".speaker", "missing");
                    } else {
                        read_speaker(r, *sp, where + ".speaker", &m.speaker);
                    }
                }
                r.string(jm, "content", where, &m.content);
                r.timestamp(jm, "timestamp", where, &m.timestamp);
                if (const json* refs = r.opt_array(jm, "references", where)) {
                    for (size_t k = 0; r.ok() && k < refs->size(); ++k) {
                        FragmentRef ref;
                        if (read_fragment_ref(r, (*refs)[k], where + ".references[" + std::to_string(k) + "]", &ref)) {
                            m.references.push_back(std::move(ref));
                        }
                    }
                }
                conv.messages.push_back(std::move(m));
            }

            if (const json* arts = r.opt_array(doc, "artifacts", "conversation")) {
                for (size_t i = 0; r.ok() && i < arts->size(); ++i) {
                    const json& ja = (*arts)[i];
                    const std::string where = "artifacts[" + std::to_string(i) + "]";
                    Artifact a;
                    if (!r.object(ja, where)) break;
                    r.string(ja, "id", where, &a.id);
                    r.opt_string(ja, "name", where, &a.name);
                    if (r.ok()) {
                        auto t = ja.find("artifact_type");
                        if (t != ja.end()) {
                            read_artifact_type(r, *t, where + ".artifact_type", &a.type);
                        }
                    }
                    r.string(ja, "content", where, &a.content);
                    r.string(ja, "created_in", where, &a.created_in);
                    if (const json* mods = r.opt_array(ja, "modified_in", where)) {
                        for (size_t k = 0; r.ok() && k < mods->size(); ++k) {
                            if (!(*mods)[k].is_string()) {
                                r.fail(where + ".modified_in", "expected string elements");
                                break;
                            }
                            a.modified_in.push_back((*mods)[k].get<std::string>());
                        }
                    }
                    if (r.ok()) {
                        if (ja.contains("state")) {
                            read_state(r, ja, "state", where, &a.state);
                        }
                    }
                    if (const json* hist = r.opt_array(ja, "history", where)) {
                        for (size_t k = 0; r.ok() && k < hist->size(); ++k) {
                            const std::string hw = where + ".history[" + std::to_string(k) + "]";
                            LifecycleEvent e;
                            if (!r.object((*hist)[k], hw)) break;
                            read_state(r, (*hist)[k], "state", hw, &e.state);
                            r.timestamp((*hist)[k], "timestamp", hw, &e.at);
                            a.history.push_back(e);
                        }
                    }
                    std::optional<std::string> hash;
                    r.opt_string(ja, "content_hash", where, &hash);
                    a.content_hash = hash.value_or(std::string());
                    conv.artifacts.push_back(std::move(a));
                }
            }

            if (const json* mems = r.opt_array(doc, "memberships", "conversation")) {
                for (size_t i = 0; r.ok() && i < mems->size(); ++i) {
                    const std::string where = "memberships[" + std::to_string(i) + "]";
                    ProjectMembership pm;
                    std::string type;
                    if (!r.object((*mems)[i], where)) break;
                    r.string((*mems)[i], "category", where, &pm.category);
                    r.string((*mems)[i], "type", where, &type);
                    if (r.ok() && !membership_type_from_name(type.c_str(), &pm.type)) {
                        r.fail(where + ".type", "expected primary, secondary or tangential");
                    }
                    conv.memberships.push_back(std::move(pm));
                }
            }

            if (r.ok()) {
                auto meta = doc.find("metadata");
                if (meta != doc.end() && !meta->is_null()) {
                    if (!meta->is_object()) {
                        r.fail("conversation.metadata", "expected object");
                    } else {
                        for (auto it = meta->begin(); it != meta->end(); ++it) {
                            if (it->is_string()) {
                                conv.metadata[it.key()] = it->get<std::string>();
                            } else {
                                conv.metadata[it.key()] = it->dump();
                            }
                        }
                    }
                }
            }
        }

        if (!r.ok()) {
            if (error != nullptr) {
                *error = r.error;
            }
            return make_status(StatusDomain::Parser, StatusCode::SchemaViolation);
        }
        *out = std::move(conv);
        return ok_status();
    }

    json inferences_to_json(const Inferences& inf) {
        json doc = json::object();
        doc["conversation_id"] = inf.conversation_id;

        json arts = json::array();
        for (const ArtifactInference& a : inf.artifacts) {
            arts.push_back(json{
                {"artifact_id", a.artifact_id},
                {"current", lifecycle_state_name(a.current)},
                {"as_of", a.as_of},
                {"transitions", a.transitions},
            });
        }
        doc["artifacts"] = std::move(arts);

        json mems = json::array();
        for (const CategoryScore& s : inf.memberships) {
            mems.push_back(json{{"category", s.category}, {"raw", s.raw}, {"normalized", s.normalized}});
        }
        doc["memberships"] = std::move(mems);
        doc["uncategorized"] = inf.uncategorized;
        doc["primary_category"] = inf.primary_category ? json(*inf.primary_category) : json(nullptr);
        doc["contamination_risk"] = inf.contamination_risk;

        json links = json::array();
        for (const FragmentLinks& fl : inf.links) {
            json linked = json::array();
            for (const FragmentRef& ref : fl.linked) {
                linked.push_back(fragment_ref_json(ref));
            }
            links.push_back(json{{"fragment", fl.fragment}, {"linked", std::move(linked)}});
        }
        doc["links"] = std::move(links);

        json cross = json::array();
        for (const CrossReference& c : inf.cross_references) {
            cross.push_back(json{{"from", fragment_ref_json(c.from)}, {"to", fragment_ref_json(c.to)}});
        }
        doc["cross_references"] = std::move(cross);
        return doc;
    }

    Status inferences_from_json(const json& doc, Inferences* out, std::string* error) {
        if (out == nullptr) {
            return make_status(StatusDomain::Reasoning, StatusCode::Invalid);
        }

        Reader r;
        Inferences inf;
        if (r.object(doc, "inferences")) {
            r.string(doc, "conversation_id", "inferences", &inf.conversation_id);

            if (const json* arts = r.opt_array(doc, "artifacts", "inferences")) {
                for (size_t i = 0; r.ok() && i < arts->size(); ++i) {
                    const std::string where = "inferences.artifacts[" + std::to_string(i) + "]";
                    const json& ja = (*arts)[i];
                    ArtifactInference a;
                    double transitions = 0;
                    if (!r.object(ja, where)) break;
                    r.string(ja, "artifact_id", where, &a.artifact_id);
                    read_state(r, ja, "current", where, &a.current);
                    r.timestamp(ja, "as_of", where, &a.as_of);
                    r.number(ja, "transitions", where, &transitions);
                    a.transitions = transitions < 0 ? 0u : static_cast<u32>(transitions);
                    inf.artifacts.push_back(std::move(a));
                }
            }

            if (const json* mems = r.opt_array(doc, "memberships", "inferences")) {
                for (size_t i = 0; r.ok() && i < mems->size(); ++i) {
                    const std::string where = "inferences.memberships[" + std::to_string(i) + "]";
                    CategoryScore s;
                    if (!r.object((*mems)[i], where)) break;
                    r.string((*mems)[i], "category", where, &s.category);
                    r.number((*mems)[i], "raw", where, &s.raw);
                    r.number((*mems)[i], "normalized", where, &s.normalized);
                    inf.memberships.push_back(std::move(s));
                }
            }

            if (r.ok()) {
                auto u = doc.find("uncategorized");
                if (u == doc.end() || !u->is_boolean()) {
                    r.fail("inferences.uncategorized", "expected boolean");
                } else {
                    inf.uncategorized = u->get<bool>();
                }
            }
            r.opt_string(doc, "primary_category", "inferences", &inf.primary_category);
            r.number(doc, "contamination_risk", "inferences", &inf.contamination_risk);

            if (const json* links = r.opt_array(doc, "links", "inferences")) {
                for (size_t i = 0; r.ok() && i < links->size(); ++i) {
                    const std::string where = "inferences.links[" + std::to_string(i) + "]";
                    FragmentLinks fl;
                    if (!r.object((*links)[i], where)) break;
                    r.string((*links)[i], "fragment", where, &fl.fragment);
                    if (const json* linked = r.opt_array((*links)[i], "linked", where)) {
                        for (size_t k = 0; r.ok() && k < linked->size(); ++k) {
                            FragmentRef ref;
                            if (read_fragment_ref(r, (*linked)[k], where + ".linked", &ref)) {
                                fl.linked.push_back(std::move(ref));
                            }
                        }
                    }
                    inf.links.push_back(std::move(fl));
                }
            }

            if (const json* cross = r.opt_array(doc, "cross_references", "inferences")) {
                for (size_t i = 0; r.ok() && i < cross->size(); ++i) {
                    const std::string where = "inferences.cross_references[" + std::to_string(i) + "]";
                    const json& jc = (*cross)[i];
                    CrossReference c;
                    if (!r.object(jc, where)) break;
                    if (!jc.contains("from") || !jc.contains("to")) {
                        r.fail(where, "expected from and to");
                        break;
                    }
                    read_fragment_ref(r, jc["from"], where + ".from", &c.from);
                    read_fragment_ref(r, jc["to"], where + ".to", &c.to);
                    inf.cross_references.push_back(std::move(c));
                }
            }
        }

        if (!r.ok()) {
            if (error != nullptr) {
                *error = r.error;
            }
            return make_status(StatusDomain::Reasoning, StatusCode::SchemaViolation);
        }
        *out = std::move(inf);
        return ok_status();
    }

    std::string conversation_to_text(const Conversation& conv) {
        return conversation_to_json(conv).dump();
    }

    std::string inferences_to_text(const Inferences& inf) {
        return inferences_to_json(inf).dump();
    }

    Status conversation_from_text(std::string_view text, Conversation* out, std::string* error) {
        json doc = json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            if (error != nullptr) {
                *error = "conversation: malformed JSON";
            }
            return make_status(StatusDomain::Parser, StatusCode::SchemaViolation);
        }
        return conversation_from_json(doc, out, error);
    }

    Status inferences_from_text(std::string_view text, Inferences* out, std::string* error) {
        json doc = json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            if (error != nullptr) {
                *error = "inferences: malformed JSON";
            }
            return make_status(StatusDomain::Reasoning, StatusCode::SchemaViolation);
        }
        return inferences_from_json(doc, out, error);
    }
} // namespace anamnesis::core
