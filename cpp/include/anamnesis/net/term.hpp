#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "anamnesis/core/types.hpp"

// Subset of the Erlang external term format used on the worker wire.
namespace anamnesis::net {
    using u8 = anamnesis::core::u8;
    using u16 = anamnesis::core::u16;
    using u32 = anamnesis::core::u32;
    using u64 = anamnesis::core::u64;
    using i64 = anamnesis::core::i64;

    inline constexpr u8 kTermVersion = 131;
    inline constexpr u8 kTagSmallInteger = 97;
    inline constexpr u8 kTagInteger = 98;
    inline constexpr u8 kTagAtom = 100;
    inline constexpr u8 kTagSmallTuple = 104;
    inline constexpr u8 kTagLargeTuple = 105;
    inline constexpr u8 kTagNil = 106;
    inline constexpr u8 kTagString = 107;
    inline constexpr u8 kTagList = 108;
    inline constexpr u8 kTagBinary = 109;
    inline constexpr u8 kTagSmallBig = 110;
    inline constexpr u8 kTagSmallAtom = 115;
    inline constexpr u8 kTagAtomUtf8 = 118;
    inline constexpr u8 kTagSmallAtomUtf8 = 119;

    struct TermEncoder {
        std::vector<u8> buf;

        void write_version() { write_u8(kTermVersion); }
        void write_u8(u8 val) { buf.push_back(val); }
        void write_u16(u16 val);
        void write_u32(u32 val);

        // Atoms longer than 255 bytes are written as ATOM_UTF8_EXT.
        void write_atom(std::string_view name);
        void write_u64(u64 val);
        void write_i64(i64 val);
        void write_binary(const u8* data, u32 len);
        void write_binary(std::string_view s);
        void write_tuple_header(u32 arity);
        // Follow the elements with write_nil().
        void write_list_header(u32 count);
        void write_nil() { write_u8(kTagNil); }
        void write_raw(const u8* data, u32 len);
    };

    // Every read is bounds-checked; a false return leaves pos unspecified and
    // the decoder should be discarded.
    struct TermDecoder {
        const u8* data{nullptr};
        u32 len{0};
        u32 pos{0};

        TermDecoder(const u8* d, u32 l) noexcept : data(d), len(l), pos(0) {}

        [[nodiscard]] bool has_bytes(u32 n) const noexcept { return n <= len - pos; }
        [[nodiscard]] bool at_end() const noexcept { return pos == len; }
        [[nodiscard]] bool peek_u8(u8* out) const noexcept;

        [[nodiscard]] bool read_u8(u8* out) noexcept;
        [[nodiscard]] bool read_u16(u16* out) noexcept;
        [[nodiscard]] bool read_u32(u32* out) noexcept;

        [[nodiscard]] bool read_version() noexcept;
        [[nodiscard]] bool read_tuple_header(u32* arity) noexcept;
        // An empty list (NIL_EXT) reads as count 0. For count > 0 the caller
        // reads the elements and then read_list_tail().
        [[nodiscard]] bool read_list_header(u32* count) noexcept;
        [[nodiscard]] bool read_list_tail() noexcept;
        [[nodiscard]] bool read_atom(std::string* out);
        [[nodiscard]] bool read_u64(u64* out) noexcept;
        [[nodiscard]] bool read_i64(i64* out) noexcept;
        [[nodiscard]] bool read_binary_view(const u8** out_data, u32* out_len) noexcept;
        [[nodiscard]] bool read_binary(std::string* out);
        [[nodiscard]] bool skip() noexcept;
    };

} // namespace anamnesis::net
