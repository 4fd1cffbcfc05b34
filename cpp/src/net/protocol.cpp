#include "anamnesis/net/protocol.hpp"

#include <string_view>
#include <utility>

#include "anamnesis/core/model_json.hpp"

namespace anamnesis::net {
    namespace {
        template <class... Ts>
        struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        constexpr Action kAllActions[] = {
            Action::Ping, Action::Detect, Action::Parse, Action::Validate,
            Action::Reason, Action::GenerateRdf, Action::Spread,
        };

        Status invalid() noexcept {
            return core::make_status(core::StatusDomain::Net, core::StatusCode::Invalid);
        }

        bool expect_tuple(TermDecoder& dec, u32 arity) noexcept {
            u32 a = 0;
            return dec.read_tuple_header(&a) && a == arity;
        }

        void write_conversation(TermEncoder& enc, const core::Conversation& conv) {
            enc.write_binary(core::conversation_to_text(conv));
        }

        void write_inferences(TermEncoder& enc, const core::Inferences& inf) {
            enc.write_binary(core::inferences_to_text(inf));
        }

        bool read_conversation(TermDecoder& dec, core::Conversation* out) {
            std::string text;
            if (!dec.read_binary(&text)) return false;
            return core::is_ok(core::conversation_from_text(text, out, nullptr));
        }

        bool read_inferences(TermDecoder& dec, core::Inferences* out) {
            std::string text;
            if (!dec.read_binary(&text)) return false;
            return core::is_ok(core::inferences_from_text(text, out, nullptr));
        }

        void write_string_list(TermEncoder& enc, const std::vector<std::string>& items) {
            if (!items.empty()) {
                enc.write_list_header(static_cast<u32>(items.size()));
                for (const std::string& s : items) {
                    enc.write_binary(s);
                }
            }
            enc.write_nil();
        }

        bool read_string_list(TermDecoder& dec, std::vector<std::string>* out) {
            u32 count = 0;
            if (!dec.read_list_header(&count)) return false;
            out->clear();
            out->reserve(count);
            for (u32 i = 0; i < count; ++i) {
                std::string s;
                if (!dec.read_binary(&s)) return false;
                out->push_back(std::move(s));
            }
            return count == 0 || dec.read_list_tail();
        }

        bool read_format_atom(TermDecoder& dec, core::FormatTag* out) {
            std::string atom;
            return dec.read_atom(&atom) && core::format_from_name(atom.c_str(), out);
        }

        void write_request_body(TermEncoder& enc, const Request& req) {
            std::visit(overloaded{
                [&](const PingRequest& r) {
                    enc.write_tuple_header(2);
                    enc.write_u64(r.nonce);
                    enc.write_binary(r.payload);
                },
                [&](const DetectRequest& r) {
                    enc.write_tuple_header(1);
                    enc.write_binary(r.content);
                },
                [&](const ParseRequest& r) {
                    enc.write_tuple_header(2);
                    enc.write_binary(r.content);
                    enc.write_atom(r.format ? core::format_name(*r.format) : "auto");
                },
                [&](const ValidateRequest& r) {
                    enc.write_tuple_header(1);
                    write_conversation(enc, r.conversation);
                },
                [&](const ReasonRequest& r) {
                    enc.write_tuple_header(1);
                    write_conversation(enc, r.conversation);
                },
                [&](const GenerateRdfRequest& r) {
                    enc.write_tuple_header(2);
                    write_conversation(enc, r.conversation);
                    write_inferences(enc, r.inferences);
                },
                [&](const SpreadRequest& r) {
                    enc.write_tuple_header(2);
                    if (!r.profiles.empty()) {
                        enc.write_list_header(static_cast<u32>(r.profiles.size()));
                        for (const core::ConversationProfile& p : r.profiles) {
                            // {Id, Primary, Keys}; an empty Primary means none
                            enc.write_tuple_header(3);
                            enc.write_binary(p.id);
                            enc.write_binary(p.primary_category.value_or(std::string()));
                            write_string_list(enc, p.artifact_keys);
                        }
                    }
                    enc.write_nil();
                    enc.write_binary(r.seed);
                },
            }, req);
        }

        bool read_request_body(TermDecoder& dec, Action action, Request* out) {
            switch (action) {
            case Action::Ping: {
                PingRequest r;
                if (!expect_tuple(dec, 2) || !dec.read_u64(&r.nonce) || !dec.read_binary(&r.payload)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Detect: {
                DetectRequest r;
                if (!expect_tuple(dec, 1) || !dec.read_binary(&r.content)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Parse: {
                ParseRequest r;
                std::string atom;
                if (!expect_tuple(dec, 2) || !dec.read_binary(&r.content) || !dec.read_atom(&atom)) return false;
                if (atom != "auto") {
                    core::FormatTag f{};
                    if (!core::format_from_name(atom.c_str(), &f)) return false;
                    r.format = f;
                }
                *out = std::move(r);
                return true;
            }
            case Action::Validate: {
                ValidateRequest r;
                if (!expect_tuple(dec, 1) || !read_conversation(dec, &r.conversation)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Reason: {
                ReasonRequest r;
                if (!expect_tuple(dec, 1) || !read_conversation(dec, &r.conversation)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::GenerateRdf: {
                GenerateRdfRequest r;
                if (!expect_tuple(dec, 2) || !read_conversation(dec, &r.conversation) ||
                    !read_inferences(dec, &r.inferences)) {
                    return false;
                }
                *out = std::move(r);
                return true;
            }
            case Action::Spread: {
                SpreadRequest r;
                u32 count = 0;
                if (!expect_tuple(dec, 2) || !dec.read_list_header(&count)) return false;
                for (u32 i = 0; i < count; ++i) {
                    core::ConversationProfile p;
                    std::string primary;
                    if (!expect_tuple(dec, 3) || !dec.read_binary(&p.id) || !dec.read_binary(&primary) ||
                        !read_string_list(dec, &p.artifact_keys)) {
                        return false;
                    }
                    if (!primary.empty()) {
                        p.primary_category = std::move(primary);
                    }
                    r.profiles.push_back(std::move(p));
                }
                if (count > 0 && !dec.read_list_tail()) return false;
                if (!dec.read_binary(&r.seed)) return false;
                *out = std::move(r);
                return true;
            }
            }
            return false;
        }

        // Writes {ActionAtom, Body}; false for an error body.
        bool write_reply(TermEncoder& enc, const ReplyBody& body) {
            return std::visit(overloaded{
                [&](const std::monostate&) { return false; },
                [&](const PingReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Ping));
                    enc.write_tuple_header(2);
                    enc.write_u64(r.nonce);
                    enc.write_binary(r.payload);
                    return true;
                },
                [&](const DetectReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Detect));
                    enc.write_tuple_header(1);
                    enc.write_atom(core::format_name(r.format));
                    return true;
                },
                [&](const ParseReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Parse));
                    enc.write_tuple_header(1);
                    write_conversation(enc, r.conversation);
                    return true;
                },
                [&](const ValidateReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Validate));
                    enc.write_tuple_header(1);
                    write_string_list(enc, r.violations);
                    return true;
                },
                [&](const ReasonReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Reason));
                    enc.write_tuple_header(1);
                    write_inferences(enc, r.inferences);
                    return true;
                },
                [&](const GenerateRdfReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::GenerateRdf));
                    enc.write_tuple_header(2);
                    enc.write_binary(r.ntriples);
                    enc.write_u64(r.triple_count);
                    return true;
                },
                [&](const SpreadReply& r) {
                    enc.write_tuple_header(2);
                    enc.write_atom(action_name(Action::Spread));
                    enc.write_tuple_header(1);
                    write_string_list(enc, r.members);
                    return true;
                },
            }, body);
        }

        bool read_reply(TermDecoder& dec, ReplyBody* out) {
            std::string atom;
            Action action{};
            if (!expect_tuple(dec, 2) || !dec.read_atom(&atom) || !action_from_name(atom.c_str(), &action)) {
                return false;
            }

            switch (action) {
            case Action::Ping: {
                PingReply r;
                if (!expect_tuple(dec, 2) || !dec.read_u64(&r.nonce) || !dec.read_binary(&r.payload)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Detect: {
                DetectReply r;
                if (!expect_tuple(dec, 1) || !read_format_atom(dec, &r.format)) return false;
                *out = r;
                return true;
            }
            case Action::Parse: {
                ParseReply r;
                if (!expect_tuple(dec, 1) || !read_conversation(dec, &r.conversation)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Validate: {
                ValidateReply r;
                if (!expect_tuple(dec, 1) || !read_string_list(dec, &r.violations)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::Reason: {
                ReasonReply r;
                if (!expect_tuple(dec, 1) || !read_inferences(dec, &r.inferences)) return false;
                *out = std::move(r);
                return true;
            }
            case Action::GenerateRdf: {
                GenerateRdfReply r;
                u64 count = 0;
                if (!expect_tuple(dec, 2) || !dec.read_binary(&r.ntriples) || !dec.read_u64(&count)) return false;
                if (count > 0xFFFFFFFFull) return false;
                r.triple_count = static_cast<u32>(count);
                *out = std::move(r);
                return true;
            }
            case Action::Spread: {
                SpreadReply r;
                if (!expect_tuple(dec, 1) || !read_string_list(dec, &r.members)) return false;
                *out = std::move(r);
                return true;
            }
            }
            return false;
        }
    } // namespace

    const char* action_name(Action a) noexcept {
        switch (a) {
        case Action::Ping: return "ping";
        case Action::Detect: return "detect";
        case Action::Parse: return "parse";
        case Action::Validate: return "validate";
        case Action::Reason: return "reason";
        case Action::GenerateRdf: return "generate_rdf";
        case Action::Spread: return "spread";
        }
        return "ping";
    }

    bool action_from_name(const char* name, Action* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (Action a : kAllActions) {
            if (std::string_view(action_name(a)) == name) {
                *out = a;
                return true;
            }
        }
        return false;
    }

    Action request_action(const Request& req) noexcept {
        return std::visit(overloaded{
            [](const PingRequest&) { return Action::Ping; },
            [](const DetectRequest&) { return Action::Detect; },
            [](const ParseRequest&) { return Action::Parse; },
            [](const ValidateRequest&) { return Action::Validate; },
            [](const ReasonRequest&) { return Action::Reason; },
            [](const GenerateRdfRequest&) { return Action::GenerateRdf; },
            [](const SpreadRequest&) { return Action::Spread; },
        }, req);
    }

    Response make_error_response(CorrelationId id, Status status, std::string detail) {
        Response r;
        r.id = id;
        r.status = status;
        r.detail = std::move(detail);
        return r;
    }

    Status encode_request(CorrelationId id, const Request& req, std::vector<u8>* out) {
        if (out == nullptr || !id.is_valid()) {
            return invalid();
        }

        TermEncoder enc;
        enc.write_version();
        enc.write_tuple_header(3);
        enc.write_u64(id.v);
        enc.write_atom(action_name(request_action(req)));
        write_request_body(enc, req);

        *out = std::move(enc.buf);
        return core::ok_status();
    }

    Status decode_request(core::BufferView in, CorrelationId* id, Request* out) {
        if (id == nullptr || out == nullptr) {
            return invalid();
        }
        *id = CorrelationId::invalid();
        if (in.data == nullptr) {
            return invalid();
        }

        TermDecoder dec(in.data, in.len);
        u64 raw_id = 0;
        if (!dec.read_version() || !expect_tuple(dec, 3) || !dec.read_u64(&raw_id)) {
            return invalid();
        }
        const CorrelationId cid{raw_id};
        if (!cid.is_valid()) {
            return invalid();
        }
        *id = cid;

        std::string atom;
        Action action{};
        if (!dec.read_atom(&atom) || !action_from_name(atom.c_str(), &action)) {
            return core::make_status(core::StatusDomain::Net, core::StatusCode::Invalid, 1);
        }

        Request req;
        if (!read_request_body(dec, action, &req) || !dec.at_end()) {
            return core::make_status(core::StatusDomain::Net, core::StatusCode::Invalid, 2);
        }

        *out = std::move(req);
        return core::ok_status();
    }

    Status encode_response(const Response& resp, std::vector<u8>* out) {
        if (out == nullptr || !resp.id.is_valid()) {
            return invalid();
        }

        TermEncoder enc;
        enc.write_version();
        enc.write_tuple_header(3);
        enc.write_u64(resp.id.v);

        if (core::is_ok(resp.status)) {
            enc.write_atom("ok");
            if (!write_reply(enc, resp.body)) {
                return invalid();
            }
        } else {
            enc.write_atom("error");
            enc.write_tuple_header(3);
            enc.write_atom(core::status_code_name(resp.status.code));
            enc.write_atom(core::status_domain_name(resp.status.domain));
            enc.write_binary(resp.detail);
        }

        *out = std::move(enc.buf);
        return core::ok_status();
    }

    Status decode_response(core::BufferView in, Response* out) {
        if (out == nullptr || in.data == nullptr) {
            return invalid();
        }

        TermDecoder dec(in.data, in.len);
        u64 raw_id = 0;
        std::string tag;
        if (!dec.read_version() || !expect_tuple(dec, 3) || !dec.read_u64(&raw_id) || !dec.read_atom(&tag)) {
            return invalid();
        }

        Response resp;
        resp.id = CorrelationId{raw_id};
        if (!resp.id.is_valid()) {
            return invalid();
        }

        if (tag == "ok") {
            if (!read_reply(dec, &resp.body)) {
                return invalid();
            }
        } else if (tag == "error") {
            std::string code_atom;
            std::string domain_atom;
            if (!expect_tuple(dec, 3) || !dec.read_atom(&code_atom) || !dec.read_atom(&domain_atom) ||
                !dec.read_binary(&resp.detail)) {
                return invalid();
            }
            core::StatusCode code{};
            core::StatusDomain domain{};
            if (!core::status_code_from_name(code_atom.c_str(), &code) || code == core::StatusCode::Ok) {
                code = core::StatusCode::Unknown;
            }
            if (!core::status_domain_from_name(domain_atom.c_str(), &domain)) {
                domain = core::StatusDomain::Worker;
            }
            resp.status = core::make_status(domain, code);
        } else {
            return invalid();
        }

        if (!dec.at_end()) {
            return invalid();
        }

        *out = std::move(resp);
        return core::ok_status();
    }
} // namespace anamnesis::net
