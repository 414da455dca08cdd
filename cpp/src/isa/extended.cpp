#include "frameisa/isa/extended.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdio>

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

        // Unknown tag bytes are reported as opcode text errors naming the byte.
        [[nodiscard]] Status unknown_tag(DecodeError* err, const char* what, u8 tag) noexcept {
            char msg[kDecodeErrorTextBytes]{};
            const int n = std::snprintf(msg, sizeof(msg), "unknown %s: 0x%02X", what, static_cast<unsigned>(tag));
            decode_error_set_text(err, msg, n > 0 ? static_cast<u32>(n) : 0);
            return frameisa::core::make_status(StatusDomain::Isa, StatusCode::InvalidOpcodeText, tag);
        }

        void write_calc(const CalcPayload& c, u8* p) noexcept {
            p[0] = static_cast<u8>(c.op);
            wire::put_f64_be(p + 1, c.a);
            wire::put_f64_be(p + 9, c.b);
        }

        void write_time(const TimePayload& t, u8* p) noexcept {
            wire::put_u64_be(p + 0, static_cast<frameisa::core::u64>(t.reference));
            wire::put_u32_be(p + 8, static_cast<u32>(t.delta));
            p[12] = static_cast<u8>(t.unit);
            p[13] = static_cast<u8>(t.tz_offset);
        }

        // Longest shortest-fixed output is the smallest subnormal:
        // "-0." then 323 zeros then "5".
        constexpr std::size_t kFixedDoubleChars = 400;

        void append_number(std::string* s, double v) {
            if (std::isnan(v)) {
                s->append("NaN");
                return;
            }
            if (std::isinf(v)) {
                s->append(v < 0 ? "-inf" : "inf");
                return;
            }
            char buf[kFixedDoubleChars];
            const auto r = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
            if (r.ec != std::errc()) {
                s->append("?");
                return;
            }
            s->append(buf, r.ptr);
        }
    } // namespace

    const char* calc_op_symbol(CalcOp op) noexcept {
        switch (op) {
        case CalcOp::Add: return "+";
        case CalcOp::Sub: return "-";
        case CalcOp::Mul: return "*";
        case CalcOp::Div: return "/";
        case CalcOp::Mod: return "%";
        case CalcOp::Pow: return "^";
        case CalcOp::Sqrt: return "sqrt";
        }
        return "?";
    }

    std::optional<CalcOp> calc_op_from_symbol(std::string_view symbol) noexcept {
        static constexpr CalcOp kOps[] = {
            CalcOp::Add, CalcOp::Sub, CalcOp::Mul, CalcOp::Div, CalcOp::Mod, CalcOp::Pow, CalcOp::Sqrt,
        };
        for (const CalcOp op : kOps) {
            if (symbol == calc_op_symbol(op)) {
                return op;
            }
        }
        return std::nullopt;
    }

    const char* time_unit_name(TimeUnit u) noexcept {
        switch (u) {
        case TimeUnit::Second: return "second";
        case TimeUnit::Minute: return "minute";
        case TimeUnit::Hour: return "hour";
        case TimeUnit::Day: return "day";
        case TimeUnit::Week: return "week";
        case TimeUnit::Month: return "month";
        case TimeUnit::Year: return "year";
        }
        return "unknown";
    }

    std::optional<TimeUnit> time_unit_from_name(std::string_view name) noexcept {
        for (u8 b = 0; b <= static_cast<u8>(TimeUnit::Year); ++b) {
            const TimeUnit u = static_cast<TimeUnit>(b);
            if (name == time_unit_name(u)) {
                return u;
            }
        }
        return std::nullopt;
    }

    TimePayload TimePayload::now() noexcept {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
        return TimePayload::at(static_cast<frameisa::core::Timestamp>(secs));
    }

    bool operator==(const Payload& lhs, const Payload& rhs) noexcept {
        if (lhs.type != rhs.type) return false;
        switch (lhs.type) {
        case PayloadType::None: return true;
        case PayloadType::Calc: return lhs.data.calc == rhs.data.calc;
        case PayloadType::Time: return lhs.data.time == rhs.data.time;
        }
        return false;
    }

    bool operator==(const ExtendedInstruction& lhs, const ExtendedInstruction& rhs) noexcept {
        return lhs.base == rhs.base && lhs.payload == rhs.payload;
    }

    u32 payload_write(const Payload& p, BufferMut out) noexcept {
        const u32 need = payload_size(p.type);
        if (need == 0) return 0;
        if (out.data == nullptr || out.len < need) return 0;

        switch (p.type) {
        case PayloadType::Calc:
            write_calc(p.data.calc, out.data);
            break;
        case PayloadType::Time:
            write_time(p.data.time, out.data);
            break;
        case PayloadType::None:
            return 0;
        }
        return need;
    }

    Status payload_read(PayloadType type, BufferView in, Payload* out, DecodeError* err) noexcept {
        if (out == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);

        const u32 need = payload_size(type);
        if (in.len < need) return invalid_length(err, in.len, need);
        if (need > 0 && in.data == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);

        switch (type) {
        case PayloadType::None:
            *out = Payload::none();
            break;
        case PayloadType::Calc: {
            const auto op = calc_op_from_byte(in.data[0]);
            if (!op) return unknown_tag(err, "calc operator", in.data[0]);
            *out = Payload::calc(CalcPayload{*op, wire::get_f64_be(in.data + 1), wire::get_f64_be(in.data + 9)});
            break;
        }
        case PayloadType::Time: {
            const auto unit = time_unit_from_byte(in.data[12]);
            if (!unit) return unknown_tag(err, "time unit", in.data[12]);
            TimePayload t{};
            t.reference = static_cast<frameisa::core::i64>(wire::get_u64_be(in.data + 0));
            t.delta = static_cast<i32>(wire::get_u32_be(in.data + 8));
            t.unit = *unit;
            t.tz_offset = static_cast<i8>(in.data[13]);
            *out = Payload::time(t);
            break;
        }
        }

        decode_error_clear(err);
        return frameisa::core::ok_status();
    }

    std::string calc_payload_to_string(const CalcPayload& c) {
        std::string s;
        if (calc_op_is_unary(c.op)) {
            s += calc_op_symbol(c.op);
            s += '(';
            append_number(&s, c.a);
            s += ')';
            return s;
        }
        append_number(&s, c.a);
        s += ' ';
        s += calc_op_symbol(c.op);
        s += ' ';
        append_number(&s, c.b);
        return s;
    }

    const CalcPayload* extended_as_calc(const ExtendedInstruction& x) noexcept {
        return x.payload.type == PayloadType::Calc ? &x.payload.data.calc : nullptr;
    }

    const TimePayload* extended_as_time(const ExtendedInstruction& x) noexcept {
        return x.payload.type == PayloadType::Time ? &x.payload.data.time : nullptr;
    }

    u32 extended_write(const ExtendedInstruction& x, BufferMut out) noexcept {
        const u32 total = extended_byte_size(x);
        if (out.data == nullptr || out.len < total) {
            return 0;
        }

        u32 off = instruction_write(x.base, {out.data, out.len});
        if (off == 0) return 0;

        out.data[off] = static_cast<u8>(x.payload.type);
        off += kPayloadTypeBytes;

        if (x.payload.type != PayloadType::None) {
            const u32 body = payload_write(x.payload, {out.data + off, out.len - off});
            if (body == 0) return 0;
            off += body;
        }
        return off;
    }

    std::vector<u8> extended_to_bytes(const ExtendedInstruction& x) {
        std::vector<u8> bytes(extended_byte_size(x));
        (void)extended_write(x, {bytes.data(), static_cast<u32>(bytes.size())});
        return bytes;
    }

    Status extended_from_bytes(BufferView in, ExtendedInstruction* out, DecodeError* err) noexcept {
        if (out == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len > 0 && in.data == nullptr) return frameisa::core::make_status(StatusDomain::Isa, StatusCode::Invalid);
        if (in.len < kExtendedMinBytes) return invalid_length(err, in.len, kExtendedMinBytes);

        ExtendedInstruction x{};
        {
            const Status s = instruction_parse_one({in.data, kInstructionBytes}, &x.base, err);
            if (!frameisa::core::is_ok(s)) return s;
        }

        const u8 tag = in.data[kInstructionBytes];
        const auto type = payload_type_from_byte(tag);
        if (!type) return unknown_tag(err, "payload type", tag);

        const u32 total = payload_total_size(*type);
        if (in.len < total) return invalid_length(err, in.len, total);

        {
            const Status s = payload_read(*type, {in.data + kExtendedMinBytes, in.len - kExtendedMinBytes}, &x.payload, err);
            if (!frameisa::core::is_ok(s)) return s;
        }

        *out = x;
        decode_error_clear(err);
        return frameisa::core::ok_status();
    }

    std::string extended_to_string(const ExtendedInstruction& x) {
        std::string s = instruction_to_string(x.base);
        switch (x.payload.type) {
        case PayloadType::None:
            break;
        case PayloadType::Calc:
            s += " + ";
            s += calc_payload_to_string(x.payload.data.calc);
            break;
        case PayloadType::Time:
            s += " @ ";
            s += std::to_string(x.payload.data.time.target_timestamp());
            break;
        }
        return s;
    }
} // namespace frameisa::isa
