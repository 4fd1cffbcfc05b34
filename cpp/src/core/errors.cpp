#include "anamnesis/core/errors.hpp"

#include <cstring>

namespace anamnesis::core {
    namespace {
        constexpr StatusCode kAllCodes[] = {
            StatusCode::Ok,
            StatusCode::Unknown,
            StatusCode::Invalid,
            StatusCode::NotFound,
            StatusCode::Io,
            StatusCode::Closed,
            StatusCode::Timeout,
            StatusCode::FrameTooLarge,
            StatusCode::Exhausted,
            StatusCode::Cancelled,
            StatusCode::DetectionFailed,
            StatusCode::SchemaViolation,
            StatusCode::ReferentialIntegrity,
            StatusCode::IllegalTransition,
            StatusCode::MalformedRuleSet,
            StatusCode::MissingField,
            StatusCode::Network,
            StatusCode::Remote,
            StatusCode::Unsupported,
            StatusCode::Unavailable,
        };

        constexpr StatusDomain kAllDomains[] = {
            StatusDomain::Core,
            StatusDomain::Parser,
            StatusDomain::Validation,
            StatusDomain::Reasoning,
            StatusDomain::Rdf,
            StatusDomain::Net,
            StatusDomain::Channel,
            StatusDomain::Pool,
            StatusDomain::Ingest,
            StatusDomain::Store,
            StatusDomain::Cli,
            StatusDomain::Worker,
        };
    } // namespace

    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Unknown: return "unknown";
        case StatusCode::Invalid: return "invalid";
        case StatusCode::NotFound: return "not_found";
        case StatusCode::Io: return "io";
        case StatusCode::Closed: return "closed";
        case StatusCode::Timeout: return "timeout";
        case StatusCode::FrameTooLarge: return "frame_too_large";
        case StatusCode::Exhausted: return "exhausted";
        case StatusCode::Cancelled: return "cancelled";
        case StatusCode::DetectionFailed: return "detection_failed";
        case StatusCode::SchemaViolation: return "schema_violation";
        case StatusCode::ReferentialIntegrity: return "referential_integrity";
        case StatusCode::IllegalTransition: return "illegal_transition";
        case StatusCode::MalformedRuleSet: return "malformed_rule_set";
        case StatusCode::MissingField: return "missing_field";
        case StatusCode::Network: return "network";
        case StatusCode::Remote: return "remote";
        case StatusCode::Unsupported: return "unsupported";
        case StatusCode::Unavailable: return "unavailable";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "core";
        case StatusDomain::Parser: return "parser";
        case StatusDomain::Validation: return "validation";
        case StatusDomain::Reasoning: return "reasoning";
        case StatusDomain::Rdf: return "rdf";
        case StatusDomain::Net: return "net";
        case StatusDomain::Channel: return "channel";
        case StatusDomain::Pool: return "pool";
        case StatusDomain::Ingest: return "ingest";
        case StatusDomain::Store: return "store";
        case StatusDomain::Cli: return "cli";
        case StatusDomain::Worker: return "worker";
        }
        return "core";
    }

    bool status_code_from_name(const char* name, StatusCode* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (StatusCode c : kAllCodes) {
            if (std::strcmp(status_code_name(c), name) == 0) {
                *out = c;
                return true;
            }
        }
        return false;
    }

    bool status_domain_from_name(const char* name, StatusDomain* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (StatusDomain d : kAllDomains) {
            if (std::strcmp(status_domain_name(d), name) == 0) {
                *out = d;
                return true;
            }
        }
        return false;
    }
} // namespace anamnesis::core
