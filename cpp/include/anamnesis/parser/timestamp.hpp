#pragma once

#include <string>
#include <string_view>

#include "anamnesis/core/types.hpp"

namespace anamnesis::parser {

    // RFC 3339 date-time ("2024-01-15T10:30:00Z", fractional seconds and
    // +hh:mm offsets accepted) to whole seconds since the epoch.
    [[nodiscard]] bool parse_rfc3339(std::string_view text, core::Timestamp* out) noexcept;

    // Seconds to "YYYY-MM-DDThh:mm:ssZ".
    [[nodiscard]] std::string format_rfc3339(core::Timestamp ts);

} // namespace anamnesis::parser
