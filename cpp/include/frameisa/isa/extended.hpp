#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "frameisa/core/buffer.hpp"
#include "frameisa/core/errors.hpp"
#include "frameisa/core/types.hpp"
#include "frameisa/isa/decode_error.hpp"
#include "frameisa/isa/instruction.hpp"

namespace frameisa::isa {
    using i8 = frameisa::core::i8;
    using i32 = frameisa::core::i32;
    using i64 = frameisa::core::i64;

    // Extended layout:
    //   [instruction:6][payload type:1][payload:N]
    // N is fixed by the type byte: None 0, Calc 17, Time 14.
    enum class PayloadType : u8 {
        None = 0x00,
        Calc = 0x01,
        Time = 0x02,
    };

    inline constexpr u32 kPayloadTypeBytes = 1;
    inline constexpr u32 kCalcPayloadBytes = 17; // [op:1][a:f64][b:f64]
    inline constexpr u32 kTimePayloadBytes = 14; // [ref:i64][delta:i32][unit:1][tz:i8]
    inline constexpr u32 kExtendedMinBytes = kInstructionBytes + kPayloadTypeBytes;

    [[nodiscard]] constexpr std::optional<PayloadType> payload_type_from_byte(u8 b) noexcept {
        switch (b) {
        case 0x00: return PayloadType::None;
        case 0x01: return PayloadType::Calc;
        case 0x02: return PayloadType::Time;
        default: return std::nullopt;
        }
    }

    [[nodiscard]] constexpr u32 payload_size(PayloadType t) noexcept {
        switch (t) {
        case PayloadType::None: return 0;
        case PayloadType::Calc: return kCalcPayloadBytes;
        case PayloadType::Time: return kTimePayloadBytes;
        }
        return 0;
    }

    [[nodiscard]] constexpr u32 payload_total_size(PayloadType t) noexcept {
        return kExtendedMinBytes + payload_size(t);
    }

    // Operator codes are the ASCII symbols, except sqrt which is 'S'.
    enum class CalcOp : u8 {
        Add = 0x2B,
        Sub = 0x2D,
        Mul = 0x2A,
        Div = 0x2F,
        Mod = 0x25,
        Pow = 0x5E,
        Sqrt = 0x53,
    };

    [[nodiscard]] constexpr std::optional<CalcOp> calc_op_from_byte(u8 b) noexcept {
        switch (b) {
        case 0x2B: return CalcOp::Add;
        case 0x2D: return CalcOp::Sub;
        case 0x2A: return CalcOp::Mul;
        case 0x2F: return CalcOp::Div;
        case 0x25: return CalcOp::Mod;
        case 0x5E: return CalcOp::Pow;
        case 0x53: return CalcOp::Sqrt;
        default: return std::nullopt;
        }
    }

    [[nodiscard]] constexpr bool calc_op_is_unary(CalcOp op) noexcept {
        return op == CalcOp::Sqrt;
    }

    // "+", "-", ..., "sqrt"
    [[nodiscard]] const char* calc_op_symbol(CalcOp op) noexcept;

    // Parses the display symbol ("+", "sqrt", ...). Used by the CLI.
    [[nodiscard]] std::optional<CalcOp> calc_op_from_symbol(std::string_view symbol) noexcept;

    struct CalcPayload {
        CalcOp op{CalcOp::Add};
        double a{0.0};
        double b{0.0}; // on the wire for unary ops too, conventionally 0

        [[nodiscard]] static constexpr CalcPayload unary(CalcOp op, double a) noexcept {
            return CalcPayload{op, a, 0.0};
        }

        friend constexpr bool operator==(const CalcPayload&, const CalcPayload&) noexcept = default;
    };

    enum class TimeUnit : u8 {
        Second = 0,
        Minute = 1,
        Hour = 2,
        Day = 3,
        Week = 4,
        Month = 5, // 30 days
        Year = 6,  // 365 days
    };

    [[nodiscard]] constexpr std::optional<TimeUnit> time_unit_from_byte(u8 b) noexcept {
        if (b > static_cast<u8>(TimeUnit::Year)) {
            return std::nullopt;
        }
        return static_cast<TimeUnit>(b);
    }

    [[nodiscard]] constexpr i64 time_unit_seconds(TimeUnit u) noexcept {
        switch (u) {
        case TimeUnit::Second: return 1;
        case TimeUnit::Minute: return 60;
        case TimeUnit::Hour: return 3600;
        case TimeUnit::Day: return 86400;
        case TimeUnit::Week: return 604800;
        case TimeUnit::Month: return 2592000;
        case TimeUnit::Year: return 31536000;
        }
        return 0;
    }

    [[nodiscard]] const char* time_unit_name(TimeUnit u) noexcept;
    [[nodiscard]] std::optional<TimeUnit> time_unit_from_name(std::string_view name) noexcept;

    struct TimePayload {
        frameisa::core::Timestamp reference{0};
        i32 delta{0}; // positive = future
        TimeUnit unit{TimeUnit::Second};
        i8 tz_offset{0}; // hours

        [[nodiscard]] static constexpr TimePayload at(frameisa::core::Timestamp reference) noexcept {
            return TimePayload{reference, 0, TimeUnit::Second, 0};
        }

        [[nodiscard]] static constexpr TimePayload with_delta(frameisa::core::Timestamp reference, i32 delta, TimeUnit unit) noexcept {
            return TimePayload{reference, delta, unit, 0};
        }

        // Reference is the current wall-clock time.
        [[nodiscard]] static TimePayload now() noexcept;

        [[nodiscard]] constexpr TimePayload with_tz(i8 offset) const noexcept {
            return TimePayload{reference, delta, unit, offset};
        }

        // Wraps modulo 2^64 when reference is near the i64 limits.
        [[nodiscard]] constexpr frameisa::core::Timestamp target_timestamp() const noexcept {
            using u64 = frameisa::core::u64;
            const u64 shift = static_cast<u64>(static_cast<i64>(delta) * time_unit_seconds(unit));
            const u64 tz = static_cast<u64>(static_cast<i64>(tz_offset) * 3600);
            return static_cast<frameisa::core::Timestamp>(static_cast<u64>(reference) + shift + tz);
        }

        friend constexpr bool operator==(const TimePayload&, const TimePayload&) noexcept = default;
    };

    union PayloadData {
        CalcPayload calc;
        TimePayload time;
    };

    // Tagged by 'type'; only the matching member of 'data' is meaningful.
    struct Payload {
        PayloadType type{PayloadType::None};
        PayloadData data{};

        [[nodiscard]] static constexpr Payload none() noexcept { return Payload{}; }

        [[nodiscard]] static Payload calc(const CalcPayload& c) noexcept {
            Payload p{};
            p.type = PayloadType::Calc;
            p.data.calc = c;
            return p;
        }

        [[nodiscard]] static Payload time(const TimePayload& t) noexcept {
            Payload p{};
            p.type = PayloadType::Time;
            p.data.time = t;
            return p;
        }
    };

    [[nodiscard]] bool operator==(const Payload& lhs, const Payload& rhs) noexcept;

    // Returns bytes written (payload body only, no type byte), 0 if
    // 'out' is too small. A None payload writes nothing and returns 0.
    [[nodiscard]] u32 payload_write(const Payload& p, BufferMut out) noexcept;

    // Decodes a body of the given type from the front of 'in'.
    [[nodiscard]] frameisa::core::Status payload_read(PayloadType type, BufferView in, Payload* out, DecodeError* err = nullptr) noexcept;

    // "15 + 7" or "sqrt(144)". Operands are printed in fixed notation
    // (shortest round-trip digits), NaN as "NaN", infinities as "inf"/"-inf".
    [[nodiscard]] std::string calc_payload_to_string(const CalcPayload& c);

    struct ExtendedInstruction {
        Instruction base{};
        Payload payload{};
    };

    [[nodiscard]] bool operator==(const ExtendedInstruction& lhs, const ExtendedInstruction& rhs) noexcept;

    [[nodiscard]] inline ExtendedInstruction extended_new(const Instruction& base) noexcept {
        return ExtendedInstruction{base, Payload::none()};
    }

    [[nodiscard]] inline ExtendedInstruction extended_with_calc(const Instruction& base, const CalcPayload& c) noexcept {
        return ExtendedInstruction{base, Payload::calc(c)};
    }

    [[nodiscard]] inline ExtendedInstruction extended_with_time(const Instruction& base, const TimePayload& t) noexcept {
        return ExtendedInstruction{base, Payload::time(t)};
    }

    [[nodiscard]] constexpr u32 extended_byte_size(const ExtendedInstruction& x) noexcept {
        return payload_total_size(x.payload.type);
    }

    [[nodiscard]] const CalcPayload* extended_as_calc(const ExtendedInstruction& x) noexcept;
    [[nodiscard]] const TimePayload* extended_as_time(const ExtendedInstruction& x) noexcept;

    // Returns bytes written (0 if 'out' is smaller than extended_byte_size).
    [[nodiscard]] u32 extended_write(const ExtendedInstruction& x, BufferMut out) noexcept;
    [[nodiscard]] std::vector<u8> extended_to_bytes(const ExtendedInstruction& x);

    // Bytes past the size implied by the type byte are ignored.
    [[nodiscard]] frameisa::core::Status extended_from_bytes(BufferView in, ExtendedInstruction* out, DecodeError* err = nullptr) noexcept;

    // instruction_to_string(base), then " + <calc>" or " @ <target>".
    [[nodiscard]] std::string extended_to_string(const ExtendedInstruction& x);

    static_assert(payload_total_size(PayloadType::None) == 7);
    static_assert(payload_total_size(PayloadType::Calc) == 24);
    static_assert(payload_total_size(PayloadType::Time) == 21);
    static_assert(std::is_trivially_copyable_v<CalcPayload>);
    static_assert(std::is_trivially_copyable_v<TimePayload>);
    static_assert(std::is_trivially_copyable_v<Payload>);
    static_assert(std::is_trivially_copyable_v<ExtendedInstruction>);
} // namespace frameisa::isa
