#pragma once

#include <string>
#include <vector>

#include "frameisa/core/buffer.hpp"
#include "frameisa/core/errors.hpp"
#include "frameisa/core/types.hpp"
#include "frameisa/isa/instruction.hpp"

namespace frameisa::storage {
    using u8 = frameisa::core::u8;
    using BufferView = frameisa::core::BufferView;

    [[nodiscard]] constexpr bool hash_is_zero(const frameisa::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, 32-byte output.
    frameisa::core::Status hash_compute(BufferView data, frameisa::core::Hash256* out) noexcept;

    // Digest of the canonical wire encoding; equal programs hash equal.
    frameisa::core::Status program_digest(const std::vector<frameisa::isa::Instruction>& program, frameisa::core::Hash256* out);

    // 64 lowercase hex characters.
    [[nodiscard]] std::string hash_to_hex(const frameisa::core::Hash256& h);
} // namespace frameisa::storage
