#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/models.hpp"
#include "anamnesis/core/types.hpp"
#include "anamnesis/net/term.hpp"

// Call and response envelopes exchanged with worker processes.
//
//   call:     {CorrelationId, ActionAtom, Body}
//   response: {CorrelationId, ok, {ActionAtom, Body}}
//           | {CorrelationId, error, {CodeAtom, DomainAtom, Detail}}
//
// Conversations and inferences travel as canonical JSON binaries.
namespace anamnesis::net {
    using anamnesis::core::CorrelationId;
    using anamnesis::core::Status;

    enum class Action : u8 {
        Ping = 0,
        Detect,
        Parse,
        Validate,
        Reason,
        GenerateRdf,
        Spread,
    };

    [[nodiscard]] const char* action_name(Action a) noexcept;
    [[nodiscard]] bool action_from_name(const char* name, Action* out) noexcept;

    // ------------------------------------------------------------------------
    // Requests
    // ------------------------------------------------------------------------

    struct PingRequest {
        u64 nonce{0};
        std::string payload;
    };

    struct DetectRequest {
        std::string content;
    };

    struct ParseRequest {
        std::string content;
        std::optional<core::FormatTag> format;   // none: detect
    };

    struct ValidateRequest {
        core::Conversation conversation;
    };

    struct ReasonRequest {
        core::Conversation conversation;
    };

    struct GenerateRdfRequest {
        core::Conversation conversation;
        core::Inferences inferences;
    };

    struct SpreadRequest {
        std::vector<core::ConversationProfile> profiles;
        std::string seed;
    };

    // The action tag is derived from the alternative.
    using Request = std::variant<PingRequest, DetectRequest, ParseRequest, ValidateRequest,
                                 ReasonRequest, GenerateRdfRequest, SpreadRequest>;

    [[nodiscard]] Action request_action(const Request& req) noexcept;

    // ------------------------------------------------------------------------
    // Replies
    // ------------------------------------------------------------------------

    struct PingReply {
        u64 nonce{0};
        std::string payload;
    };

    struct DetectReply {
        core::FormatTag format{core::FormatTag::Generic};
    };

    struct ParseReply {
        core::Conversation conversation;
    };

    // Empty when the conversation is valid.
    struct ValidateReply {
        std::vector<std::string> violations;
    };

    struct ReasonReply {
        core::Inferences inferences;
    };

    struct GenerateRdfReply {
        std::string ntriples;
        u32 triple_count{0};
    };

    struct SpreadReply {
        std::vector<std::string> members;
    };

    // monostate: error response.
    using ReplyBody = std::variant<std::monostate, PingReply, DetectReply, ParseReply, ValidateReply,
                                   ReasonReply, GenerateRdfReply, SpreadReply>;

    struct Response {
        CorrelationId id{CorrelationId::invalid()};
        Status status{};             // worker-side outcome
        std::string detail;          // error detail when status is not ok
        ReplyBody body{};
    };

    [[nodiscard]] Response make_error_response(CorrelationId id, Status status, std::string detail);

    // Points *out at the reply when resp.body holds a Reply. Invalid (domain
    // Net, aux = index of the body actually held) otherwise.
    template <typename Reply>
    [[nodiscard]] Status expect_reply(const Response& resp, const Reply** out) noexcept {
        const Reply* reply = std::get_if<Reply>(&resp.body);
        if (reply == nullptr || out == nullptr) {
            return core::make_status(core::StatusDomain::Net, core::StatusCode::Invalid,
                                     static_cast<u32>(resp.body.index()));
        }
        *out = reply;
        return core::ok_status();
    }

    // ------------------------------------------------------------------------
    // Codec. Payloads exclude the frame length prefix.
    // ------------------------------------------------------------------------

    [[nodiscard]] Status encode_request(CorrelationId id, const Request& req, std::vector<u8>* out);

    // On Invalid, *id is still set when the correlation id was readable, so the
    // worker can answer with an error.
    [[nodiscard]] Status decode_request(core::BufferView in, CorrelationId* id, Request* out);

    [[nodiscard]] Status encode_response(const Response& resp, std::vector<u8>* out);
    [[nodiscard]] Status decode_response(core::BufferView in, Response* out);

} // namespace anamnesis::net
