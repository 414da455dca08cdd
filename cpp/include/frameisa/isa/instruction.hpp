#pragma once

#include <array>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "frameisa/core/buffer.hpp"
#include "frameisa/core/errors.hpp"
#include "frameisa/core/types.hpp"
#include "frameisa/isa/action.hpp"
#include "frameisa/isa/decode_error.hpp"
#include "frameisa/isa/modifier.hpp"
#include "frameisa/isa/subject.hpp"

namespace frameisa::isa {
    using u8 = frameisa::core::u8;
    using u32 = frameisa::core::u32;
    using BufferView = frameisa::core::BufferView;
    using BufferMut = frameisa::core::BufferMut;

    // Layout (big-endian / network order):
    // 0..1 action(u16), 2..3 subject(u16), 4..5 modifier(u16).
    inline constexpr u32 kInstructionBytes = 6;

    struct Instruction {
        Action action{};
        Subject subject{};
        Modifier modifier{};

        friend constexpr bool operator==(const Instruction&, const Instruction&) noexcept = default;
    };

    [[nodiscard]] constexpr Instruction instruction_simple(Action a, Subject s) noexcept {
        return Instruction{a, s, kModifierDefault};
    }

    [[nodiscard]] constexpr bool instruction_needs_rag(const Instruction& i) noexcept {
        return i.subject.is_rag_reference();
    }

    [[nodiscard]] constexpr bool instruction_is_chain(const Instruction& i) noexcept {
        return i.action.is_chain() || i.subject.is_trm_reference();
    }

    [[nodiscard]] constexpr bool instruction_is_system(const Instruction& i) noexcept {
        return i.action.is_system();
    }

    // Returns bytes written (0 if 'out' is too small).
    [[nodiscard]] u32 instruction_write(const Instruction& i, BufferMut out) noexcept;

    [[nodiscard]] std::array<u8, kInstructionBytes> instruction_to_bytes(const Instruction& i) noexcept;
    [[nodiscard]] std::vector<u8> instruction_to_bytes_all(const std::vector<Instruction>& program);

    // 'in' must hold exactly kInstructionBytes. err may be null.
    [[nodiscard]] frameisa::core::Status instruction_parse_one(BufferView in, Instruction* out, DecodeError* err = nullptr) noexcept;

    // 'in' must be a whole number of instructions. On failure 'out' is left
    // untouched.
    [[nodiscard]] frameisa::core::Status instruction_parse_all(BufferView in, std::vector<Instruction>* out, DecodeError* err = nullptr);

    // "AAAA:SSSS:MMMM", uppercase hex, zero padded.
    [[nodiscard]] std::string instruction_to_opcode_string(const Instruction& i);

    // Three colon-separated hex groups, each fitting u16, either case, each
    // with an optional leading '+'. Whitespace and "0x" are rejected.
    [[nodiscard]] frameisa::core::Status instruction_from_opcode_string(std::string_view text, Instruction* out, DecodeError* err = nullptr) noexcept;

    // "[ACT(...) | SUBJ(...) | MOD(...)]"
    [[nodiscard]] std::string instruction_to_string(const Instruction& i);

    class InstructionBuilder {
    public:
        explicit InstructionBuilder(Action action) noexcept : action_(action) {}

        InstructionBuilder& subject(Subject s) noexcept { subject_ = s; return *this; }
        InstructionBuilder& modifier(Modifier m) noexcept { modifier_ = m; return *this; }

        InstructionBuilder& voice(Voice x) noexcept { modifier_ = modifier_.with_voice(x); return *this; }
        InstructionBuilder& tone(Tone x) noexcept { modifier_ = modifier_.with_tone(x); return *this; }
        InstructionBuilder& warmth(Warmth x) noexcept { modifier_ = modifier_.with_warmth(x); return *this; }
        InstructionBuilder& format(Format x) noexcept { modifier_ = modifier_.with_format(x); return *this; }
        InstructionBuilder& accuracy(Accuracy x) noexcept { modifier_ = modifier_.with_accuracy(x); return *this; }
        InstructionBuilder& urgency(Urgency x) noexcept { modifier_ = modifier_.with_urgency(x); return *this; }

        [[nodiscard]] Instruction build() const noexcept { return Instruction{action_, subject_, modifier_}; }

    private:
        Action action_;
        Subject subject_{subjects::kNull};
        Modifier modifier_{kModifierDefault};
    };

    static_assert(sizeof(Instruction) == kInstructionBytes);
    static_assert(std::is_trivially_copyable_v<Instruction>);
    static_assert(std::is_standard_layout_v<Instruction>);
} // namespace frameisa::isa
