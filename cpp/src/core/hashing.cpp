#include "anamnesis/core/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace anamnesis::core {
    Status hash_compute(BufferView data, Hash256* out) noexcept {
        if (out == nullptr){
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ok_status();
    }

    std::string content_fingerprint(std::string_view text) {
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        if (!text.empty()) {
            blake3_hasher_update(&hasher, text.data(), text.size());
        }

        Hash256 h{};
        blake3_hasher_finalize(&hasher, h.b.data(), h.b.size());

        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (u8 b : h.b) {
            out.push_back(kHex[(b >> 4) & 0x0fu]);
            out.push_back(kHex[b & 0x0fu]);
        }
        return out;
    }
} // namespace anamnesis::core
