#pragma once

#include <cstdint>
#include <type_traits>

#include "anamnesis/core/types.hpp"

namespace anamnesis::net {
    using u8 = anamnesis::core::u8;
    using u16 = anamnesis::core::u16;
    using u32 = anamnesis::core::u32;
    using anamnesis::core::BufferMut;
    using anamnesis::core::BufferView;

    // Layout (big-endian / network order):
    // 0..3 payload_len(u32), followed by exactly payload_len bytes.
    inline constexpr u32 kFrameLengthBytes = 4;

    enum class FrameParseResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] constexpr bool frame_length_valid(u32 payload_len, u32 max_payload) noexcept {
        return payload_len <= max_payload;
    }

    // Big-endian on wire. Returns bytes written (0 on failure).
    [[nodiscard]] u32 frame_write_length(u32 payload_len, BufferMut out) noexcept;

    // Parses the length prefix from the first bytes of 'in' (does not consume).
    // A length above max_payload is Invalid.
    [[nodiscard]] FrameParseResult frame_read_length(BufferView in, u32 max_payload, u32* out) noexcept;

    [[nodiscard]] inline u32 get_u32_be(const u8* p) noexcept {
        return (static_cast<u32>(p[0]) << 24) |
               (static_cast<u32>(p[1]) << 16) |
               (static_cast<u32>(p[2]) << 8) |
               (static_cast<u32>(p[3]) << 0);
    }

    inline void put_u32_be(u8* p, u32 v) noexcept {
        p[0] = static_cast<u8>((v >> 24) & 0xffu);
        p[1] = static_cast<u8>((v >> 16) & 0xffu);
        p[2] = static_cast<u8>((v >> 8) & 0xffu);
        p[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

} // namespace anamnesis::net
