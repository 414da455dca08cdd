#pragma once

#include <cstring>

#include "frameisa/core/types.hpp"

// Big-endian field helpers shared by the instruction and payload codecs.
namespace frameisa::isa::wire {
    using frameisa::core::u8;
    using frameisa::core::u16;
    using frameisa::core::u32;
    using frameisa::core::u64;

    inline void put_u16_be(u8* p, u16 v) noexcept {
        p[0] = static_cast<u8>((v >> 8) & 0xffu);
        p[1] = static_cast<u8>((v >> 0) & 0xffu);
    }

    inline void put_u32_be(u8* p, u32 v) noexcept {
        p[0] = static_cast<u8>((v >> 24) & 0xffu);
        p[1] = static_cast<u8>((v >> 16) & 0xffu);
        p[2] = static_cast<u8>((v >> 8) & 0xffu);
        p[3] = static_cast<u8>((v >> 0) & 0xffu);
    }

    inline void put_u64_be(u8* p, u64 v) noexcept {
        p[0] = static_cast<u8>((v >> 56) & 0xffu);
        p[1] = static_cast<u8>((v >> 48) & 0xffu);
        p[2] = static_cast<u8>((v >> 40) & 0xffu);
        p[3] = static_cast<u8>((v >> 32) & 0xffu);
        p[4] = static_cast<u8>((v >> 24) & 0xffu);
        p[5] = static_cast<u8>((v >> 16) & 0xffu);
        p[6] = static_cast<u8>((v >> 8) & 0xffu);
        p[7] = static_cast<u8>((v >> 0) & 0xffu);
    }

    inline u16 get_u16_be(const u8* p) noexcept {
        return static_cast<u16>((static_cast<u16>(p[0]) << 8) | static_cast<u16>(p[1]));
    }

    inline u32 get_u32_be(const u8* p) noexcept {
        return (static_cast<u32>(p[0]) << 24) |
               (static_cast<u32>(p[1]) << 16) |
               (static_cast<u32>(p[2]) << 8) |
               (static_cast<u32>(p[3]) << 0);
    }

    inline u64 get_u64_be(const u8* p) noexcept {
        return (static_cast<u64>(p[0]) << 56) |
               (static_cast<u64>(p[1]) << 48) |
               (static_cast<u64>(p[2]) << 40) |
               (static_cast<u64>(p[3]) << 32) |
               (static_cast<u64>(p[4]) << 24) |
               (static_cast<u64>(p[5]) << 16) |
               (static_cast<u64>(p[6]) << 8) |
               (static_cast<u64>(p[7]) << 0);
    }

    // IEEE-754 binary64, transported as its raw bit pattern.
    inline void put_f64_be(u8* p, double v) noexcept {
        u64 bits{};
        static_assert(sizeof(bits) == sizeof(v));
        std::memcpy(&bits, &v, sizeof(bits));
        put_u64_be(p, bits);
    }

    inline double get_f64_be(const u8* p) noexcept {
        const u64 bits = get_u64_be(p);
        double v{};
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }
} // namespace frameisa::isa::wire
