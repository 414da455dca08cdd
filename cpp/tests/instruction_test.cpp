#include <array>
#include <cstring>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "frameisa/isa/instruction.hpp"

namespace {
    frameisa::isa::Instruction calc_number() {
        return frameisa::isa::instruction_simple(frameisa::isa::actions::kCalculate, frameisa::isa::subjects::kNumber);
    }
} // namespace

TEST(IsaInstruction, BytesAreBigEndian) {
    const auto bytes = frameisa::isa::instruction_to_bytes(calc_number());
    const std::array<frameisa::isa::u8, 6> expected = {0x04, 0x00, 0x02, 0x00, 0x04, 0x50};
    EXPECT_EQ(bytes, expected);
}

TEST(IsaInstruction, ParseOneRoundTrip) {
    const frameisa::isa::Instruction in{
        frameisa::isa::Action::from_u16(0xABCD),
        frameisa::isa::Subject::rag_ref(0x123),
        frameisa::isa::Modifier::from_u16(0xFFFF)};
    const auto bytes = frameisa::isa::instruction_to_bytes(in);

    frameisa::isa::Instruction out{};
    const frameisa::core::Status s = frameisa::isa::instruction_parse_one({bytes.data(), 6}, &out);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(out, in);
}

TEST(IsaInstruction, ParseOneRejectsWrongLength) {
    const std::array<frameisa::isa::u8, 7> buf{};
    frameisa::isa::Instruction out{};
    frameisa::isa::DecodeError err{};

    frameisa::core::Status s = frameisa::isa::instruction_parse_one({buf.data(), 5}, &out, &err);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::InvalidLength);
    EXPECT_EQ(s.domain, frameisa::core::StatusDomain::Isa);
    EXPECT_EQ(s.aux, 6u);
    EXPECT_EQ(err.actual, 5u);
    EXPECT_EQ(err.expected, 6u);

    s = frameisa::isa::instruction_parse_one({buf.data(), 7}, &out, &err);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::InvalidLength);
    EXPECT_EQ(err.actual, 7u);
}

TEST(IsaInstruction, ParseOneNullOutIsInvalid) {
    const std::array<frameisa::isa::u8, 6> buf{};
    const frameisa::core::Status s = frameisa::isa::instruction_parse_one({buf.data(), 6}, nullptr);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::Invalid);
}

TEST(IsaInstruction, ParseAllKeepsOrder) {
    const std::vector<frameisa::isa::Instruction> program = {
        calc_number(),
        frameisa::isa::InstructionBuilder(frameisa::isa::actions::kGreet).subject(frameisa::isa::subjects::kUser).build(),
        frameisa::isa::instruction_simple(frameisa::isa::actions::kHalt, frameisa::isa::subjects::kNull),
    };
    const std::vector<frameisa::isa::u8> bytes = frameisa::isa::instruction_to_bytes_all(program);
    ASSERT_EQ(bytes.size(), 18u);

    std::vector<frameisa::isa::Instruction> out;
    const frameisa::core::Status s = frameisa::isa::instruction_parse_all(
        {bytes.data(), static_cast<frameisa::isa::u32>(bytes.size())}, &out);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(out, program);
}

TEST(IsaInstruction, ParseAllEmptyIsEmptyProgram) {
    std::vector<frameisa::isa::Instruction> out{calc_number()};
    const frameisa::core::Status s = frameisa::isa::instruction_parse_all({nullptr, 0}, &out);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_TRUE(out.empty());
}

TEST(IsaInstruction, ParseAllRejectsPartialInstruction) {
    const std::vector<frameisa::isa::u8> bytes(13, 0);
    std::vector<frameisa::isa::Instruction> out{calc_number()};
    frameisa::isa::DecodeError err{};

    const frameisa::core::Status s = frameisa::isa::instruction_parse_all(
        {bytes.data(), static_cast<frameisa::isa::u32>(bytes.size())}, &out, &err);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::InvalidLength);
    EXPECT_EQ(err.actual, 13u);
    EXPECT_EQ(err.expected, 6u);
    // Left untouched on failure.
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], calc_number());
}

TEST(IsaInstruction, OpcodeTextRoundTrip) {
    frameisa::isa::Instruction out{};
    const frameisa::core::Status s = frameisa::isa::instruction_from_opcode_string("0100:0101:0050", &out);
    ASSERT_EQ(s.code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(out.action, frameisa::isa::actions::kGreet);
    EXPECT_EQ(out.subject, frameisa::isa::subjects::kTime);
    EXPECT_EQ(out.modifier.as_u16(), 0x0050);
    EXPECT_EQ(frameisa::isa::instruction_to_opcode_string(out), "0100:0101:0050");
}

TEST(IsaInstruction, OpcodeTextAcceptsLowercase) {
    frameisa::isa::Instruction out{};
    ASSERT_EQ(frameisa::isa::instruction_from_opcode_string("abcd:e0a3:ffff", &out).code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(frameisa::isa::instruction_to_opcode_string(out), "ABCD:E0A3:FFFF");
}

TEST(IsaInstruction, OpcodeTextRejectsMalformed) {
    const char* bad[] = {
        "0100:0101",
        "0100:0101:0050:0000",
        "",
        "0100::0050",
        "zzzz:0101:0050",
        "0x10:0101:0050",
        "10000:0101:0050",
        " 0100:0101:0050",
        "+:0101:0050",
        "++10:0101:0050",
        "0100:-101:0050",
    };
    for (const char* text : bad) {
        frameisa::isa::Instruction out{};
        frameisa::isa::DecodeError err{};
        const frameisa::core::Status s = frameisa::isa::instruction_from_opcode_string(text, &out, &err);
        EXPECT_EQ(s.code, frameisa::core::StatusCode::InvalidOpcodeText) << text;
        EXPECT_STREQ(err.text, text);
    }
}

TEST(IsaInstruction, OpcodeTextAcceptsLeadingPlus) {
    frameisa::isa::Instruction out{};
    ASSERT_EQ(frameisa::isa::instruction_from_opcode_string("+0100:+0101:0050", &out).code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(frameisa::isa::instruction_to_opcode_string(out), "0100:0101:0050");

    ASSERT_EQ(frameisa::isa::instruction_from_opcode_string("0001:0002:+ffff", &out).code, frameisa::core::StatusCode::Ok);
    EXPECT_EQ(out.modifier.as_u16(), 0xFFFF);
}

TEST(IsaInstruction, OpcodeTextErrorIsTruncated) {
    const std::string long_text(200, 'A');
    frameisa::isa::Instruction out{};
    frameisa::isa::DecodeError err{};
    const frameisa::core::Status s = frameisa::isa::instruction_from_opcode_string(long_text, &out, &err);
    EXPECT_EQ(s.code, frameisa::core::StatusCode::InvalidOpcodeText);
    EXPECT_EQ(std::strlen(err.text), frameisa::isa::kDecodeErrorTextBytes - 1);
    EXPECT_EQ(std::strlen(err.text), 95u);
    EXPECT_EQ(std::string(err.text), long_text.substr(0, 95));
}

TEST(IsaInstruction, BuilderAppliesFieldsOverDefault) {
    const frameisa::isa::Instruction i = frameisa::isa::InstructionBuilder(frameisa::isa::actions::kExplain)
                                             .subject(frameisa::isa::subjects::kConcept)
                                             .tone(frameisa::isa::Tone::Empathetic)
                                             .format(frameisa::isa::Format::Bulleted)
                                             .build();
    EXPECT_EQ(i.action, frameisa::isa::actions::kExplain);
    EXPECT_EQ(i.subject, frameisa::isa::subjects::kConcept);
    EXPECT_EQ(i.modifier.as_u16(), 0x2550);

    const frameisa::isa::Instruction bare = frameisa::isa::InstructionBuilder(frameisa::isa::actions::kNop).build();
    EXPECT_EQ(bare.subject, frameisa::isa::subjects::kNull);
    EXPECT_EQ(bare.modifier, frameisa::isa::kModifierDefault);
}

TEST(IsaInstruction, Predicates) {
    const auto rag = frameisa::isa::instruction_simple(frameisa::isa::actions::kRetrieve, frameisa::isa::Subject::rag_ref(7));
    EXPECT_TRUE(frameisa::isa::instruction_needs_rag(rag));
    EXPECT_FALSE(frameisa::isa::instruction_is_chain(rag));

    const auto via_action = frameisa::isa::instruction_simple(frameisa::isa::actions::kFork, frameisa::isa::subjects::kNull);
    EXPECT_TRUE(frameisa::isa::instruction_is_chain(via_action));

    const auto via_subject = frameisa::isa::instruction_simple(frameisa::isa::actions::kAsk, frameisa::isa::Subject::trm_ref(3));
    EXPECT_TRUE(frameisa::isa::instruction_is_chain(via_subject));

    EXPECT_TRUE(frameisa::isa::instruction_is_system(
        frameisa::isa::instruction_simple(frameisa::isa::actions::kHalt, frameisa::isa::subjects::kNull)));
    EXPECT_FALSE(frameisa::isa::instruction_is_system(calc_number()));
}

TEST(IsaInstruction, Display) {
    EXPECT_EQ(frameisa::isa::instruction_to_string(calc_number()),
              "[ACT(0x0400:CALCULATE) | SUBJ(0x0200:NUMBER) | MOD(0x0450: Neutral/Neutral/Neutral/Prose)]");
}

TEST(IsaInstruction, WriteFailsWhenBufferTooSmall) {
    std::array<frameisa::isa::u8, 5> buf{};
    EXPECT_EQ(frameisa::isa::instruction_write(calc_number(), {buf.data(), 5}), 0u);
}
