#include "frameisa/isa/instruction.hpp"

#include <charconv>
#include <cstdio>
#include <utility>

#include "wire.hpp"

namespace frameisa::isa {
    namespace {
        using frameisa::core::Status;
        using frameisa::core::StatusCode;
        using frameisa::core::StatusDomain;

        [[nodiscard]] Status invalid_length(DecodeError* err, u32 actual, u32 expected) noexcept {
            decode_error_set_length(err, actual, expected);
            return frameisa::core::make_status(StatusDomain::Isa, StatusCode::InvalidLength, expected);
        }

        [[nodiscard]] Status invalid_text(DecodeError* err, std::string_view text) noexcept {
            decode_error_set_text(err, text.data(), static_cast<u32>(text.size()));
            return frameisa::core::make_status(StatusDomain::Isa, StatusCode::InvalidOpcodeText);
        }

        // One leading '+' is allowed per group.
        [[nodiscard]] bool parse_hex_u16(std::string_view s, u16* out) noexcept {
            if (!s.empty() && s.front() == '+') {
                s.remove_prefix(1);
            }
            if (s.empty()) {
                return false;
            }
            u16 v{};
            const char* end = s.data() + s.size();
            const auto r = std::from_chars(s.data(), end, v, 16);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        Instruction read_fields(const u8* p) noexcept {
            Instruction i{};
            i.action = Action::from_u16(wire::get_u16_be(p + 0));
            i.subject = Subject::from_u16(wire::get_u16_be(p + 2));
            i.modifier = Modifier::from_u16(wire::get_u16_be(p + 4));
            return i;
        }
    } // namespace

    u32 instruction_write(const Instruction& i, BufferMut out) noexcept {
        if (out.data == nullptr || out.len < kInstructionBytes) {
            return 0;
        }
        wire::put_u16_be(out.data + 0, i.action.as_u16());
        wire::put_u16_be(out.data + 2, i.subject.as_u16());
        wire::put_u16_be(out.data + 4, i.modifier.as_u16());
        return kInstructionBytes;
    }

    std::array<u8, kInstructionBytes> instruction_to_bytes(const Instruction& i) noexcept {
        std::array<u8, kInstructionBytes> buf{};
        (void)instruction_write(i, {buf.data(), kInstructionBytes});
        return buf;
    }

    std::vector<u8> instruction_to_bytes_all(const std::vector<Instruction>& program) {
        std::vector<u8> bytes(program.size() * kInstructionBytes);
        for (size_t n = 0; n < program.size(); ++n) {
            (void)instruction_write(program[n], {bytes.data() + n * kInstructionBytes, kInstructionBytes});
        }
        return bytes;
    }

    Status instruction_parse_one(BufferView in, Instruction* out, DecodeError* err) noexcept {
        if (out == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len > 0 && in.data == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len != kInstructionBytes) {
            return invalid_length(err, in.len, kInstructionBytes);
        }

        *out = read_fields(in.data);
        decode_error_clear(err);
        return frameisa::core::ok_status();
    }

    Status instruction_parse_all(BufferView in, std::vector<Instruction>* out, DecodeError* err) {
        if (out == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len > 0 && in.data == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len % kInstructionBytes != 0) {
            return invalid_length(err, in.len, kInstructionBytes);
        }

        std::vector<Instruction> program;
        program.reserve(in.len / kInstructionBytes);
        for (u32 off = 0; off < in.len; off += kInstructionBytes) {
            program.push_back(read_fields(in.data + off));
        }

        *out = std::move(program);
        decode_error_clear(err);
        return frameisa::core::ok_status();
    }

    std::string instruction_to_opcode_string(const Instruction& i) {
        char buf[16]{};
        std::snprintf(buf, sizeof(buf), "%04X:%04X:%04X",
                      static_cast<unsigned>(i.action.as_u16()),
                      static_cast<unsigned>(i.subject.as_u16()),
                      static_cast<unsigned>(i.modifier.as_u16()));
        return std::string(buf);
    }

    Status instruction_from_opcode_string(std::string_view text, Instruction* out, DecodeError* err) noexcept {
        if (out == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);

        std::string_view parts[3]{};
        size_t count = 0;
        size_t start = 0;
        for (;;) {
            const size_t colon = text.find(':', start);
            const std::string_view part = text.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start);
            if (count == 3) {
                return invalid_text(err, text);
            }
            parts[count++] = part;
            if (colon == std::string_view::npos) {
                break;
            }
            start = colon + 1;
        }
        if (count != 3) {
            return invalid_text(err, text);
        }

        u16 fields[3]{};
        for (size_t n = 0; n < 3; ++n) {
            if (!parse_hex_u16(parts[n], &fields[n])) {
                return invalid_text(err, text);
            }
        }

        *out = Instruction{Action::from_u16(fields[0]), Subject::from_u16(fields[1]), Modifier::from_u16(fields[2])};
        decode_error_clear(err);
        return frameisa::core::ok_status();
    }

    std::string instruction_to_string(const Instruction& i) {
        std::string s;
        s.reserve(96);
        s += '[';
        s += action_to_string(i.action);
        s += " | ";
        s += subject_to_string(i.subject);
        s += " | ";
        s += modifier_to_string(i.modifier);
        s += ']';
        return s;
    }
} // namespace frameisa::isa
