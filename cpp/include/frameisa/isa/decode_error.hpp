#pragma once

#include <type_traits>

#include "frameisa/core/errors.hpp"
#include "frameisa/core/types.hpp"

namespace frameisa::isa {
    using u32 = frameisa::core::u32;

    inline constexpr u32 kDecodeErrorTextBytes = 96;

    // Detail for a failed decode. The Status returned alongside carries the
    // error kind; this records what was seen.
    //   InvalidLength:     actual = bytes given, expected = size or multiple.
    //   InvalidOpcodeText: text = offending input, truncated to its first
    //                      kDecodeErrorTextBytes - 1 (95) chars, or a message
    //                      naming an unknown tag byte. Always NUL-terminated.
    struct DecodeError {
        u32 actual{0};
        u32 expected{0};
        char text[kDecodeErrorTextBytes]{};
    };

    void decode_error_clear(DecodeError* err) noexcept;
    void decode_error_set_length(DecodeError* err, u32 actual, u32 expected) noexcept;
    void decode_error_set_text(DecodeError* err, const char* text, u32 len) noexcept;

    static_assert(std::is_trivially_copyable_v<DecodeError>);
    static_assert(std::is_standard_layout_v<DecodeError>);
} // namespace frameisa::isa
