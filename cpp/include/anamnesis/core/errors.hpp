#pragma once
#include <cstdint>
#include <type_traits>

namespace anamnesis::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Io,
        Closed,
        Timeout,
        FrameTooLarge,
        Exhausted,
        Cancelled,
        DetectionFailed,
        SchemaViolation,
        ReferentialIntegrity,
        IllegalTransition,
        MalformedRuleSet,
        MissingField,
        Network,
        Remote,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Parser,
        Validation,
        Reasoning,
        Rdf,
        Net,
        Channel,
        Pool,
        Ingest,
        Store,
        Cli,
        Worker,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Stable lower-case names, used in logs and as wire atoms.
    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    // Inverse of the name functions; false when the name is unknown.
    [[nodiscard]] bool status_code_from_name(const char* name, StatusCode* out) noexcept;
    [[nodiscard]] bool status_domain_from_name(const char* name, StatusDomain* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace anamnesis::core
