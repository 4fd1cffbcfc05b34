#include "anamnesis/net/framing.hpp"

namespace anamnesis::net {
    u32 frame_write_length(u32 payload_len, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kFrameLengthBytes) {
            return 0;
        }

        put_u32_be(out.data, payload_len);
        return kFrameLengthBytes;
    }

    FrameParseResult frame_read_length(BufferView in, u32 max_payload, u32* out) noexcept {
        if (out == nullptr) return FrameParseResult::Invalid;
        if (in.data == nullptr) return FrameParseResult::NeedMore;
        if (in.len < kFrameLengthBytes) return FrameParseResult::NeedMore;

        const u32 payload_len = get_u32_be(in.data);
        if (!frame_length_valid(payload_len, max_payload)) return FrameParseResult::Invalid;

        *out = payload_len;
        return FrameParseResult::Ok;
    }
} // namespace anamnesis::net
