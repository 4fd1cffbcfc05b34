#pragma once

#include "anamnesis/core/config.hpp"
#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/types.hpp"
#include "anamnesis/net/protocol.hpp"

namespace anamnesis::worker {
    using anamnesis::core::Status;
    using anamnesis::core::u32;
    using anamnesis::core::u8;

    enum class WorkerKind : u8 {
        Parser = 0,   // detect, parse, validate
        Reasoner,     // reason, spread
        Rdf,          // generate_rdf
    };

    // "parser", "reasoner", "rdf"
    [[nodiscard]] const char* worker_kind_name(WorkerKind kind) noexcept;
    [[nodiscard]] bool worker_kind_from_name(const char* name, WorkerKind* out) noexcept;

    // Ping is served by every kind.
    [[nodiscard]] bool kind_serves(WorkerKind kind, net::Action action) noexcept;

    // Runs one request to completion. Failures come back as error responses;
    // actions outside the kind answer Unsupported.
    [[nodiscard]] net::Response handle_request(WorkerKind kind, core::CorrelationId id, const net::Request& req);

    // Port loop: framed requests from in_fd, framed responses to out_fd.
    // Ok on end of input at a frame boundary; Closed on a short frame,
    // FrameTooLarge on a declared length above max_frame_bytes, Io otherwise.
    [[nodiscard]] Status serve(int in_fd, int out_fd, WorkerKind kind,
                               u32 max_frame_bytes = core::kDefaultMaxFrameBytes);

} // namespace anamnesis::worker
