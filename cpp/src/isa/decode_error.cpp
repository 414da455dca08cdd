#include "frameisa/isa/decode_error.hpp"

#include <cstring>

namespace frameisa::isa {
    void decode_error_clear(DecodeError* err) noexcept {
        if (err == nullptr) return;
        *err = DecodeError{};
    }

    void decode_error_set_length(DecodeError* err, u32 actual, u32 expected) noexcept {
        if (err == nullptr) return;
        *err = DecodeError{};
        err->actual = actual;
        err->expected = expected;
    }

    void decode_error_set_text(DecodeError* err, const char* text, u32 len) noexcept {
        if (err == nullptr) return;
        *err = DecodeError{};
        if (text == nullptr) return;
        const u32 n = len < kDecodeErrorTextBytes - 1 ? len : kDecodeErrorTextBytes - 1;
        std::memcpy(err->text, text, n);
        err->text[n] = '\0';
    }
} // namespace frameisa::isa
