#pragma once

#include <array>
#include <string>
#include <type_traits>

#include "frameisa/core/types.hpp"

namespace frameisa::isa {
    using u8 = frameisa::core::u8;
    using u16 = frameisa::core::u16;

    // Each field is 2 bits wide, so every enum has exactly four levels and
    // the underlying value is the field's bit pattern before shifting.
    enum class Voice : u8 { Neutral = 0, Formal = 1, Casual = 2, Technical = 3 };
    enum class Tone : u8 { Neutral = 0, Positive = 1, Empathetic = 2, Cautious = 3 };
    enum class Warmth : u8 { Cold = 0, Neutral = 1, Warm = 2, VeryWarm = 3 };
    enum class Format : u8 { Prose = 0, Bulleted = 1, Numbered = 2, Structured = 3 };
    enum class Accuracy : u8 { Low = 0, Medium = 1, High = 2, Verified = 3 };
    enum class Urgency : u8 { Low = 0, Normal = 1, High = 2, Critical = 3 };

    // Bit layout (MSB first):
    //   15-14 voice | 13-12 tone | 11-10 warmth | 9-8 format |
    //   7-6 accuracy | 5-4 urgency | 3-0 reserved
    inline constexpr u16 kVoiceMask = 0xC000;
    inline constexpr u16 kToneMask = 0x3000;
    inline constexpr u16 kWarmthMask = 0x0C00;
    inline constexpr u16 kFormatMask = 0x0300;
    inline constexpr u16 kAccuracyMask = 0x00C0;
    inline constexpr u16 kUrgencyMask = 0x0030;
    inline constexpr u16 kReservedMask = 0x000F;

    inline constexpr u16 kVoiceShift = 14;
    inline constexpr u16 kToneShift = 12;
    inline constexpr u16 kWarmthShift = 10;
    inline constexpr u16 kFormatShift = 8;
    inline constexpr u16 kAccuracyShift = 6;
    inline constexpr u16 kUrgencyShift = 4;

    // Warmth::Neutral | Accuracy::Medium | Urgency::Normal. Part of the
    // wire contract; do not derive from field semantics.
    inline constexpr u16 kModifierDefaultBits = 0x0450;

    namespace detail {
        inline constexpr std::array<Voice, 4> kVoiceLevels{Voice::Neutral, Voice::Formal, Voice::Casual, Voice::Technical};
        inline constexpr std::array<Tone, 4> kToneLevels{Tone::Neutral, Tone::Positive, Tone::Empathetic, Tone::Cautious};
        inline constexpr std::array<Warmth, 4> kWarmthLevels{Warmth::Cold, Warmth::Neutral, Warmth::Warm, Warmth::VeryWarm};
        inline constexpr std::array<Format, 4> kFormatLevels{Format::Prose, Format::Bulleted, Format::Numbered, Format::Structured};
        inline constexpr std::array<Accuracy, 4> kAccuracyLevels{Accuracy::Low, Accuracy::Medium, Accuracy::High, Accuracy::Verified};
        inline constexpr std::array<Urgency, 4> kUrgencyLevels{Urgency::Low, Urgency::Normal, Urgency::High, Urgency::Critical};

        [[nodiscard]] constexpr u16 field_index(u16 bits, u16 mask, u16 shift) noexcept {
            return static_cast<u16>((bits & mask) >> shift);
        }

        [[nodiscard]] constexpr u16 field_set(u16 bits, u16 mask, u16 shift, u8 level) noexcept {
            return static_cast<u16>((bits & static_cast<u16>(~mask)) | ((static_cast<u16>(level) << shift) & mask));
        }
    } // namespace detail

    // Style flags (2 bytes). Setters return a new value; the reserved
    // nibble is carried through untouched.
    struct Modifier {
        u16 v{kModifierDefaultBits};

        [[nodiscard]] static constexpr Modifier from_u16(u16 value) noexcept { return Modifier{value}; }
        [[nodiscard]] constexpr u16 as_u16() const noexcept { return v; }

        [[nodiscard]] constexpr Voice voice() const noexcept {
            return detail::kVoiceLevels[detail::field_index(v, kVoiceMask, kVoiceShift)];
        }
        [[nodiscard]] constexpr Tone tone() const noexcept {
            return detail::kToneLevels[detail::field_index(v, kToneMask, kToneShift)];
        }
        [[nodiscard]] constexpr Warmth warmth() const noexcept {
            return detail::kWarmthLevels[detail::field_index(v, kWarmthMask, kWarmthShift)];
        }
        [[nodiscard]] constexpr Format format() const noexcept {
            return detail::kFormatLevels[detail::field_index(v, kFormatMask, kFormatShift)];
        }
        [[nodiscard]] constexpr Accuracy accuracy() const noexcept {
            return detail::kAccuracyLevels[detail::field_index(v, kAccuracyMask, kAccuracyShift)];
        }
        [[nodiscard]] constexpr Urgency urgency() const noexcept {
            return detail::kUrgencyLevels[detail::field_index(v, kUrgencyMask, kUrgencyShift)];
        }

        [[nodiscard]] constexpr Modifier with_voice(Voice x) const noexcept {
            return Modifier{detail::field_set(v, kVoiceMask, kVoiceShift, static_cast<u8>(x))};
        }
        [[nodiscard]] constexpr Modifier with_tone(Tone x) const noexcept {
            return Modifier{detail::field_set(v, kToneMask, kToneShift, static_cast<u8>(x))};
        }
        [[nodiscard]] constexpr Modifier with_warmth(Warmth x) const noexcept {
            return Modifier{detail::field_set(v, kWarmthMask, kWarmthShift, static_cast<u8>(x))};
        }
        [[nodiscard]] constexpr Modifier with_format(Format x) const noexcept {
            return Modifier{detail::field_set(v, kFormatMask, kFormatShift, static_cast<u8>(x))};
        }
        [[nodiscard]] constexpr Modifier with_accuracy(Accuracy x) const noexcept {
            return Modifier{detail::field_set(v, kAccuracyMask, kAccuracyShift, static_cast<u8>(x))};
        }
        [[nodiscard]] constexpr Modifier with_urgency(Urgency x) const noexcept {
            return Modifier{detail::field_set(v, kUrgencyMask, kUrgencyShift, static_cast<u8>(x))};
        }

        [[nodiscard]] constexpr u8 reserved() const noexcept { return static_cast<u8>(v & kReservedMask); }

        // Empathetic, very warm, high urgency, high accuracy.
        [[nodiscard]] static constexpr Modifier crisis() noexcept {
            return Modifier{0x0000}
                .with_tone(Tone::Empathetic)
                .with_warmth(Warmth::VeryWarm)
                .with_urgency(Urgency::High)
                .with_accuracy(Accuracy::High);
        }

        [[nodiscard]] static constexpr Modifier professional() noexcept {
            return Modifier{0x0000}
                .with_voice(Voice::Formal)
                .with_warmth(Warmth::Neutral)
                .with_accuracy(Accuracy::High)
                .with_urgency(Urgency::Normal);
        }

        [[nodiscard]] static constexpr Modifier friendly() noexcept {
            return Modifier{0x0000}
                .with_voice(Voice::Casual)
                .with_tone(Tone::Positive)
                .with_warmth(Warmth::Warm)
                .with_urgency(Urgency::Normal);
        }

        friend constexpr bool operator==(Modifier, Modifier) noexcept = default;
        friend constexpr auto operator<=>(Modifier, Modifier) noexcept = default;
    };

    inline constexpr Modifier kModifierDefault{kModifierDefaultBits};

    namespace modifiers {
        inline constexpr Modifier kVoiceNeutral{0x0000};
        inline constexpr Modifier kVoiceFormal{0x4000};
        inline constexpr Modifier kVoiceCasual{0x8000};
        inline constexpr Modifier kVoiceTechnical{0xC000};

        inline constexpr Modifier kToneNeutral{0x0000};
        inline constexpr Modifier kTonePositive{0x1000};
        inline constexpr Modifier kToneEmpathetic{0x2000};
        inline constexpr Modifier kToneCautious{0x3000};

        inline constexpr Modifier kWarmthCold{0x0000};
        inline constexpr Modifier kWarmthNeutral{0x0400};
        inline constexpr Modifier kWarmthWarm{0x0800};
        inline constexpr Modifier kWarmthVeryWarm{0x0C00};

        inline constexpr Modifier kFormatProse{0x0000};
        inline constexpr Modifier kFormatBulleted{0x0100};
        inline constexpr Modifier kFormatNumbered{0x0200};
        inline constexpr Modifier kFormatStructured{0x0300};

        inline constexpr Modifier kAccuracyLow{0x0000};
        inline constexpr Modifier kAccuracyMedium{0x0040};
        inline constexpr Modifier kAccuracyHigh{0x0080};
        inline constexpr Modifier kAccuracyVerified{0x00C0};

        inline constexpr Modifier kUrgencyLow{0x0000};
        inline constexpr Modifier kUrgencyNormal{0x0010};
        inline constexpr Modifier kUrgencyHigh{0x0020};
        inline constexpr Modifier kUrgencyCritical{0x0030};
    } // namespace modifiers

    [[nodiscard]] const char* voice_name(Voice x) noexcept;
    [[nodiscard]] const char* tone_name(Tone x) noexcept;
    [[nodiscard]] const char* warmth_name(Warmth x) noexcept;
    [[nodiscard]] const char* format_name(Format x) noexcept;
    [[nodiscard]] const char* accuracy_name(Accuracy x) noexcept;
    [[nodiscard]] const char* urgency_name(Urgency x) noexcept;

    // "MOD(0x0450: Neutral/Neutral/Neutral/Prose)"
    [[nodiscard]] std::string modifier_to_string(Modifier m);

    static_assert(Modifier::crisis().as_u16() == 0x2CA0);
    static_assert(Modifier::professional().as_u16() == 0x4490);
    static_assert(Modifier::friendly().as_u16() == 0x9810);
    static_assert(sizeof(Modifier) == 2);
    static_assert(std::is_trivially_copyable_v<Modifier>);
    static_assert(std::is_standard_layout_v<Modifier>);
} // namespace frameisa::isa
