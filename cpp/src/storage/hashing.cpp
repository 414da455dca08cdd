#include "frameisa/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace frameisa::storage {
    frameisa::core::Status hash_compute(BufferView data, frameisa::core::Hash256* out) noexcept {
        if (out == nullptr){
            return frameisa::core::make_status(frameisa::core::StatusDomain::Storage, frameisa::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return frameisa::core::make_status(frameisa::core::StatusDomain::Storage, frameisa::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return frameisa::core::ok_status();
    }

    frameisa::core::Status program_digest(const std::vector<frameisa::isa::Instruction>& program, frameisa::core::Hash256* out) {
        if (out == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Storage, frameisa::core::StatusCode::Invalid);
        }
        const std::vector<u8> bytes = frameisa::isa::instruction_to_bytes_all(program);
        return hash_compute(BufferView{bytes.data(), static_cast<frameisa::core::u32>(bytes.size())}, out);
    }

    std::string hash_to_hex(const frameisa::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string s;
        s.reserve(h.b.size() * 2);
        for (u8 b : h.b) {
            s.push_back(hex[(b >> 4) & 0xF]);
            s.push_back(hex[b & 0xF]);
        }
        return s;
    }
} // namespace frameisa::storage
