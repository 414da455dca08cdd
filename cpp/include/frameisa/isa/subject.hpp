#pragma once

#include <optional>
#include <string>
#include <type_traits>

#include "frameisa/core/types.hpp"

namespace frameisa::isa {
    using u8 = frameisa::core::u8;
    using u16 = frameisa::core::u16;

    // Model (TRM) references: 0x0600 + 8-bit model id.
    inline constexpr u16 kTrmRefStart = 0x0600;
    inline constexpr u16 kTrmRefEnd = 0x06FF;

    // Document (RAG) references: 0xE000 + 12-bit document id.
    inline constexpr u16 kRagStart = 0xE000;
    inline constexpr u16 kRagEnd = 0xEFFF;
    inline constexpr u16 kRagMaxDocId = 0x0FFF;

    // Subject code (2 bytes). The high byte selects the category:
    //   0x00 System  0x01 Common  0x02 Math/Science  0x03 Technology
    //   0x04 Knowledge  0x05 Emotion
    // plus the two computed reference ranges above.
    struct Subject {
        u16 v{0};

        [[nodiscard]] static constexpr Subject from_u16(u16 value) noexcept { return Subject{value}; }
        [[nodiscard]] constexpr u16 as_u16() const noexcept { return v; }

        [[nodiscard]] constexpr u8 category() const noexcept { return static_cast<u8>(v >> 8); }
        [[nodiscard]] constexpr u8 subcategory() const noexcept { return static_cast<u8>(v & 0xffu); }

        [[nodiscard]] constexpr bool is_rag_reference() const noexcept { return v >= kRagStart && v <= kRagEnd; }
        [[nodiscard]] constexpr bool is_trm_reference() const noexcept { return v >= kTrmRefStart && v <= kTrmRefEnd; }

        [[nodiscard]] constexpr bool is_system() const noexcept { return v <= 0x00FF; }
        [[nodiscard]] constexpr bool is_common_topic() const noexcept { return v >= 0x0100 && v <= 0x01FF; }
        [[nodiscard]] constexpr bool is_math_science() const noexcept { return v >= 0x0200 && v <= 0x02FF; }
        [[nodiscard]] constexpr bool is_technology() const noexcept { return v >= 0x0300 && v <= 0x03FF; }
        [[nodiscard]] constexpr bool is_knowledge() const noexcept { return v >= 0x0400 && v <= 0x04FF; }
        [[nodiscard]] constexpr bool is_emotion() const noexcept { return v >= 0x0500 && v <= 0x05FF; }

        // Ids above kRagMaxDocId are clamped, not rejected.
        [[nodiscard]] static constexpr Subject rag_ref(u16 doc_id) noexcept {
            const u16 id = doc_id > kRagMaxDocId ? kRagMaxDocId : doc_id;
            return Subject{static_cast<u16>(kRagStart + id)};
        }

        [[nodiscard]] static constexpr Subject trm_ref(u8 model_id) noexcept {
            return Subject{static_cast<u16>(kTrmRefStart + model_id)};
        }

        [[nodiscard]] constexpr std::optional<u16> rag_doc_id() const noexcept {
            if (!is_rag_reference()) {
                return std::nullopt;
            }
            return static_cast<u16>(v - kRagStart);
        }

        [[nodiscard]] constexpr std::optional<u8> trm_model_id() const noexcept {
            if (!is_trm_reference()) {
                return std::nullopt;
            }
            return static_cast<u8>(v - kTrmRefStart);
        }

        friend constexpr bool operator==(Subject, Subject) noexcept = default;
        friend constexpr auto operator<=>(Subject, Subject) noexcept = default;
    };

    namespace subjects {
        // System (0x00xx)
        inline constexpr Subject kNull{0x0000};
        inline constexpr Subject kSelf{0x0001};
        inline constexpr Subject kUser{0x0002};
        inline constexpr Subject kContext{0x0003};

        // Common topics (0x01xx)
        inline constexpr Subject kWeather{0x0100};
        inline constexpr Subject kTime{0x0101};
        inline constexpr Subject kDate{0x0102};
        inline constexpr Subject kSchedule{0x0103};
        inline constexpr Subject kHealth{0x0104};
        inline constexpr Subject kHelp{0x0105};
        inline constexpr Subject kTimezone{0x0106};

        // Math/Science (0x02xx)
        inline constexpr Subject kNumber{0x0200};
        inline constexpr Subject kEquation{0x0201};
        inline constexpr Subject kPhysics{0x0202};
        inline constexpr Subject kChemistry{0x0203};

        // Technology (0x03xx)
        inline constexpr Subject kComputer{0x0300};
        inline constexpr Subject kSoftware{0x0301};
        inline constexpr Subject kHardware{0x0302};
        inline constexpr Subject kAi{0x0303};
        inline constexpr Subject kApi{0x0304};

        // Knowledge (0x04xx)
        inline constexpr Subject kDocumentation{0x0400};
        inline constexpr Subject kConcept{0x0401};

        // Emotions (0x05xx)
        inline constexpr Subject kFeelings{0x0500};
        inline constexpr Subject kStress{0x0501};
        inline constexpr Subject kAnxiety{0x0502};
    } // namespace subjects

    // Resolution order: catalog name, then "RAG_REF", then "TRM_REF",
    // then "UNKNOWN". Never null.
    [[nodiscard]] const char* subject_name(Subject s) noexcept;

    // "SUBJ(0x0002:USER)", "SUBJ(RAG:0xE0A3)" or "SUBJ(TRM:0x05)"
    [[nodiscard]] std::string subject_to_string(Subject s);

    static_assert(sizeof(Subject) == 2);
    static_assert(std::is_trivially_copyable_v<Subject>);
    static_assert(std::is_standard_layout_v<Subject>);
} // namespace frameisa::isa
