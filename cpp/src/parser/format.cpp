#include "anamnesis/parser/format.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

#include "anamnesis/core/hashing.hpp"
#include "anamnesis/core/model_json.hpp"
#include "anamnesis/parser/decoders.hpp"
#include "anamnesis/parser/fences.hpp"

namespace anamnesis::parser {
    using json = nlohmann::json;

    namespace {
        Status detection_failed() noexcept {
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::DetectionFailed);
        }

        // Fenced code blocks become Code artifacts, numbered across the
        // conversation in message order. Messages named by an explicit
        // artifact's created_in are skipped.
        void detect_inline_artifacts(Conversation* conv) {
            std::unordered_set<std::string> explicit_sources;
            for (const core::Artifact& a : conv->artifacts) {
                explicit_sources.insert(a.created_in);
            }

            unsigned n = 0;
            for (const core::Message& m : conv->messages) {
                if (explicit_sources.count(m.id) != 0) {
                    continue;
                }
                for (FencedBlock& block : find_fenced_blocks(m.content)) {
                    ++n;
                    core::Artifact a;
                    a.id = "artifact-" + m.id + "-" + std::to_string(n);
                    a.type = core::CodeArtifact{block.language.empty() ? std::string("unknown") : block.language};
                    a.content = std::move(block.body);
                    a.created_in = m.id;
                    a.state = core::LifecycleState::Created;
                    conv->artifacts.push_back(std::move(a));
                }
            }
        }

        // Created at the created_in message time, Modified at each resolvable
        // modified_in message time, then the declared state when it differs
        // from the derived one and is not Created.
        void derive_history(const Conversation& conv, core::Artifact* a) {
            const core::Message* origin = core::find_message(conv, a->created_in);
            if (origin == nullptr) {
                return;
            }

            std::vector<core::LifecycleEvent> events;
            events.push_back(core::LifecycleEvent{core::LifecycleState::Created, origin->timestamp});

            std::vector<core::LifecycleEvent> mods;
            for (const std::string& id : a->modified_in) {
                if (const core::Message* m = core::find_message(conv, id)) {
                    mods.push_back(core::LifecycleEvent{core::LifecycleState::Modified, m->timestamp});
                }
            }
            std::stable_sort(mods.begin(), mods.end(), [](const core::LifecycleEvent& x, const core::LifecycleEvent& y) {
                return x.at < y.at;
            });
            events.insert(events.end(), mods.begin(), mods.end());

            const core::LifecycleEvent last = events.back();
            if (a->state != last.state && a->state != core::LifecycleState::Created) {
                events.push_back(core::LifecycleEvent{a->state, last.at});
            }
            a->history = std::move(events);
        }

        void finish(Conversation* conv) {
            detect_inline_artifacts(conv);
            for (core::Artifact& a : conv->artifacts) {
                if (a.history.empty()) {
                    derive_history(*conv, &a);
                }
                a.content_hash = core::content_fingerprint(a.content);
            }
        }
    } // namespace

    bool looks_like_generic(const json& doc) noexcept {
        if (!doc.is_object()) return false;
        auto id = doc.find("id");
        auto msgs = doc.find("messages");
        return id != doc.end() && id->is_string() && msgs != doc.end() && msgs->is_array();
    }

    core::Status decode_generic(const json& doc, Conversation* out, std::string* error) {
        return core::conversation_from_json(doc, out, error);
    }

    Status detect(std::string_view raw, FormatTag* out) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::Invalid);
        }

        const json doc = json::parse(raw.begin(), raw.end(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return detection_failed();
        }

        if (looks_like_claude(doc)) {
            *out = FormatTag::Claude;
        } else if (looks_like_chatgpt(doc)) {
            *out = FormatTag::ChatGpt;
        } else if (looks_like_generic(doc)) {
            *out = FormatTag::Generic;
        } else {
            return detection_failed();
        }
        return core::ok_status();
    }

    Status parse(std::string_view raw, FormatTag format, Conversation* out, std::string* error) {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Parser, core::StatusCode::Invalid);
        }

        const json doc = json::parse(raw.begin(), raw.end(), nullptr, false);
        if (doc.is_discarded()) {
            if (error != nullptr) {
                *error = "input is not JSON";
            }
            return detection_failed();
        }

        Conversation conv;
        Status s{};
        switch (format) {
        case FormatTag::Claude:
            s = decode_claude(doc, &conv, error);
            break;
        case FormatTag::ChatGpt:
            s = decode_chatgpt(doc, &conv, error);
            break;
        case FormatTag::Generic:
            s = decode_generic(doc, &conv, error);
            break;
        }
        if (!core::is_ok(s)) {
            return s;
        }

        finish(&conv);
        *out = std::move(conv);
        return core::ok_status();
    }

    Status parse_auto(std::string_view raw, std::optional<FormatTag> hint, Conversation* out, std::string* error) {
        FormatTag format = FormatTag::Generic;
        if (hint) {
            format = *hint;
        } else {
            const Status s = detect(raw, &format);
            if (!core::is_ok(s)) {
                if (error != nullptr) {
                    *error = "no known export format matched";
                }
                return s;
            }
        }
        return parse(raw, format, out, error);
    }
} // namespace anamnesis::parser
