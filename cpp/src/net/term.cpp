#include "anamnesis/net/term.hpp"

#include <cstdint>

namespace anamnesis::net {
    void TermEncoder::write_u16(u16 val) {
        buf.push_back(static_cast<u8>((val >> 8) & 0xFF));
        buf.push_back(static_cast<u8>(val & 0xFF));
    }

    void TermEncoder::write_u32(u32 val) {
        buf.push_back(static_cast<u8>((val >> 24) & 0xFF));
        buf.push_back(static_cast<u8>((val >> 16) & 0xFF));
        buf.push_back(static_cast<u8>((val >> 8) & 0xFF));
        buf.push_back(static_cast<u8>(val & 0xFF));
    }

    void TermEncoder::write_atom(std::string_view name) {
        if (name.size() <= 255) {
            write_u8(kTagSmallAtomUtf8);
            write_u8(static_cast<u8>(name.size()));
        } else {
            write_u8(kTagAtomUtf8);
            write_u16(static_cast<u16>(name.size() > 0xFFFF ? 0xFFFF : name.size()));
            name = name.substr(0, 0xFFFF);
        }
        buf.insert(buf.end(), name.begin(), name.end());
    }

    void TermEncoder::write_u64(u64 val) {
        if (val <= 255) {
            write_u8(kTagSmallInteger);
            write_u8(static_cast<u8>(val));
            return;
        }
        if (val <= 0x7FFFFFFFull) {
            write_u8(kTagInteger);
            write_u32(static_cast<u32>(val));
            return;
        }

        // SMALL_BIG_EXT: n, sign, little-endian magnitude
        u8 digits[8];
        u8 n = 0;
        while (val != 0) {
            digits[n++] = static_cast<u8>(val & 0xFF);
            val >>= 8;
        }
        write_u8(kTagSmallBig);
        write_u8(n);
        write_u8(0);
        for (u8 i = 0; i < n; ++i) {
            write_u8(digits[i]);
        }
    }

    void TermEncoder::write_i64(i64 val) {
        if (val >= 0) {
            write_u64(static_cast<u64>(val));
            return;
        }
        if (val >= -2147483648LL) {
            write_u8(kTagInteger);
            write_u32(static_cast<u32>(static_cast<std::int32_t>(val)));
            return;
        }

        u64 mag = static_cast<u64>(-(val + 1)) + 1;
        u8 digits[8];
        u8 n = 0;
        while (mag != 0) {
            digits[n++] = static_cast<u8>(mag & 0xFF);
            mag >>= 8;
        }
        write_u8(kTagSmallBig);
        write_u8(n);
        write_u8(1);
        for (u8 i = 0; i < n; ++i) {
            write_u8(digits[i]);
        }
    }

    void TermEncoder::write_binary(const u8* data, u32 len) {
        write_u8(kTagBinary);
        write_u32(len);
        if (len > 0) {
            buf.insert(buf.end(), data, data + len);
        }
    }

    void TermEncoder::write_binary(std::string_view s) {
        write_binary(reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size()));
    }

    void TermEncoder::write_tuple_header(u32 arity) {
        if (arity <= 255) {
            write_u8(kTagSmallTuple);
            write_u8(static_cast<u8>(arity));
        } else {
            write_u8(kTagLargeTuple);
            write_u32(arity);
        }
    }

    void TermEncoder::write_list_header(u32 count) {
        write_u8(kTagList);
        write_u32(count);
    }

    void TermEncoder::write_raw(const u8* data, u32 len) {
        if (len > 0) {
            buf.insert(buf.end(), data, data + len);
        }
    }

    bool TermDecoder::peek_u8(u8* out) const noexcept {
        if (!has_bytes(1)) return false;
        *out = data[pos];
        return true;
    }

    bool TermDecoder::read_u8(u8* out) noexcept {
        if (!has_bytes(1)) return false;
        *out = data[pos++];
        return true;
    }

    bool TermDecoder::read_u16(u16* out) noexcept {
        if (!has_bytes(2)) return false;
        *out = static_cast<u16>((static_cast<u16>(data[pos]) << 8) | data[pos + 1]);
        pos += 2;
        return true;
    }

    bool TermDecoder::read_u32(u32* out) noexcept {
        if (!has_bytes(4)) return false;
        *out = (static_cast<u32>(data[pos]) << 24) |
               (static_cast<u32>(data[pos + 1]) << 16) |
               (static_cast<u32>(data[pos + 2]) << 8) |
               static_cast<u32>(data[pos + 3]);
        pos += 4;
        return true;
    }

    bool TermDecoder::read_version() noexcept {
        u8 v = 0;
        return read_u8(&v) && v == kTermVersion;
    }

    bool TermDecoder::read_tuple_header(u32* arity) noexcept {
        if (arity == nullptr) return false;
        u8 tag = 0;
        if (!read_u8(&tag)) return false;
        if (tag == kTagSmallTuple) {
            u8 a = 0;
            if (!read_u8(&a)) return false;
            *arity = a;
            return true;
        }
        if (tag == kTagLargeTuple) {
            return read_u32(arity);
        }
        return false;
    }

    bool TermDecoder::read_list_header(u32* count) noexcept {
        if (count == nullptr) return false;
        u8 tag = 0;
        if (!read_u8(&tag)) return false;
        if (tag == kTagNil) {
            *count = 0;
            return true;
        }
        if (tag != kTagList) return false;
        if (!read_u32(count)) return false;
        // Each element takes at least one byte, plus the tail.
        return has_bytes(*count);
    }

    bool TermDecoder::read_list_tail() noexcept {
        u8 tag = 0;
        return read_u8(&tag) && tag == kTagNil;
    }

    bool TermDecoder::read_atom(std::string* out) {
        if (out == nullptr) return false;
        u8 tag = 0;
        if (!read_u8(&tag)) return false;

        u32 n = 0;
        switch (tag) {
        case kTagSmallAtom:
        case kTagSmallAtomUtf8: {
            u8 len8 = 0;
            if (!read_u8(&len8)) return false;
            n = len8;
            break;
        }
        case kTagAtom:
        case kTagAtomUtf8: {
            u16 len16 = 0;
            if (!read_u16(&len16)) return false;
            n = len16;
            break;
        }
        default:
            return false;
        }

        if (!has_bytes(n)) return false;
        out->assign(reinterpret_cast<const char*>(data + pos), n);
        pos += n;
        return true;
    }

    bool TermDecoder::read_u64(u64* out) noexcept {
        i64 signed_val = 0;
        u8 tag = 0;
        if (out == nullptr || !peek_u8(&tag)) return false;

        if (tag == kTagSmallBig) {
            pos += 1;
            u8 n = 0;
            u8 sign = 0;
            if (!read_u8(&n) || !read_u8(&sign)) return false;
            if (sign != 0 || n > 8 || !has_bytes(n)) return false;
            u64 v = 0;
            for (u8 i = 0; i < n; ++i) {
                v |= static_cast<u64>(data[pos + i]) << (8 * i);
            }
            pos += n;
            *out = v;
            return true;
        }

        if (!read_i64(&signed_val) || signed_val < 0) return false;
        *out = static_cast<u64>(signed_val);
        return true;
    }

    bool TermDecoder::read_i64(i64* out) noexcept {
        if (out == nullptr) return false;
        u8 tag = 0;
        if (!read_u8(&tag)) return false;

        switch (tag) {
        case kTagSmallInteger: {
            u8 v = 0;
            if (!read_u8(&v)) return false;
            *out = v;
            return true;
        }
        case kTagInteger: {
            u32 v = 0;
            if (!read_u32(&v)) return false;
            *out = static_cast<std::int32_t>(v);
            return true;
        }
        case kTagSmallBig: {
            u8 n = 0;
            u8 sign = 0;
            if (!read_u8(&n) || !read_u8(&sign)) return false;
            if (n > 8 || !has_bytes(n)) return false;
            u64 mag = 0;
            for (u8 i = 0; i < n; ++i) {
                mag |= static_cast<u64>(data[pos + i]) << (8 * i);
            }
            pos += n;
            if (sign == 0) {
                if (mag > static_cast<u64>(INT64_MAX)) return false;
                *out = static_cast<i64>(mag);
            } else {
                if (mag > static_cast<u64>(INT64_MAX) + 1) return false;
                *out = mag == static_cast<u64>(INT64_MAX) + 1 ? INT64_MIN : -static_cast<i64>(mag);
            }
            return true;
        }
        default:
            return false;
        }
    }

    bool TermDecoder::read_binary_view(const u8** out_data, u32* out_len) noexcept {
        if (out_data == nullptr || out_len == nullptr) return false;
        u8 tag = 0;
        if (!read_u8(&tag) || tag != kTagBinary) return false;
        u32 size = 0;
        if (!read_u32(&size)) return false;
        if (!has_bytes(size)) return false;
        *out_data = data + pos;
        *out_len = size;
        pos += size;
        return true;
    }

    bool TermDecoder::read_binary(std::string* out) {
        if (out == nullptr) return false;
        const u8* ptr = nullptr;
        u32 size = 0;
        if (!read_binary_view(&ptr, &size)) return false;
        out->assign(reinterpret_cast<const char*>(ptr), size);
        return true;
    }

    // Iterative: nested containers only add to the count of terms left to skip.
    bool TermDecoder::skip() noexcept {
        u64 remaining = 1;
        while (remaining > 0) {
            --remaining;
            u8 tag = 0;
            if (!read_u8(&tag)) return false;

            switch (tag) {
            case kTagSmallInteger:
                if (!has_bytes(1)) return false;
                pos += 1;
                break;
            case kTagInteger:
                if (!has_bytes(4)) return false;
                pos += 4;
                break;
            case kTagSmallBig: {
                u8 n = 0;
                if (!read_u8(&n) || !has_bytes(1u + n)) return false;
                pos += 1u + n;
                break;
            }
            case kTagAtom:
            case kTagAtomUtf8:
            case kTagString: {
                u16 n = 0;
                if (!read_u16(&n) || !has_bytes(n)) return false;
                pos += n;
                break;
            }
            case kTagSmallAtom:
            case kTagSmallAtomUtf8: {
                u8 n = 0;
                if (!read_u8(&n) || !has_bytes(n)) return false;
                pos += n;
                break;
            }
            case kTagBinary: {
                u32 n = 0;
                if (!read_u32(&n) || !has_bytes(n)) return false;
                pos += n;
                break;
            }
            case kTagNil:
                break;
            case kTagSmallTuple: {
                u8 n = 0;
                if (!read_u8(&n)) return false;
                remaining += n;
                break;
            }
            case kTagLargeTuple: {
                u32 n = 0;
                if (!read_u32(&n) || !has_bytes(n)) return false;
                remaining += n;
                break;
            }
            case kTagList: {
                u32 n = 0;
                if (!read_u32(&n) || !has_bytes(n)) return false;
                remaining += static_cast<u64>(n) + 1;
                break;
            }
            default:
                return false;
            }
        }
        return true;
    }
} // namespace anamnesis::net
