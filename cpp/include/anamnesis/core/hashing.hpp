#pragma once

#include <string>
#include <string_view>

#include "anamnesis/core/errors.hpp"
#include "anamnesis/core/types.hpp"

namespace anamnesis::core {
    [[nodiscard]] constexpr bool hash_is_zero(const Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    Status hash_compute(BufferView data, Hash256* out) noexcept;

    // Lower-case hex of the BLAKE3 digest of text.
    [[nodiscard]] std::string content_fingerprint(std::string_view text);

} // namespace anamnesis::core
