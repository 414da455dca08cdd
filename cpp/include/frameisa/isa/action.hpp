#pragma once

#include <string>
#include <type_traits>

#include "frameisa/core/types.hpp"

namespace frameisa::isa {
    using u8 = frameisa::core::u8;
    using u16 = frameisa::core::u16;

    // Action code (2 bytes). The high byte selects the category:
    //   0x00 System    0x01 Response  0x02 Query     0x03 Knowledge
    //   0x04 Skill     0x05 Emotion   0x06 Template  0x07 Chain
    // Any 16-bit value is a valid Action; values outside the catalog
    // name as "UNKNOWN" and keep their raw code.
    struct Action {
        u16 v{0};

        [[nodiscard]] static constexpr Action from_u16(u16 value) noexcept { return Action{value}; }
        [[nodiscard]] constexpr u16 as_u16() const noexcept { return v; }

        [[nodiscard]] constexpr u8 category() const noexcept { return static_cast<u8>(v >> 8); }
        [[nodiscard]] constexpr u8 subcategory() const noexcept { return static_cast<u8>(v & 0xffu); }

        [[nodiscard]] constexpr bool is_system() const noexcept { return v <= 0x00FF; }
        [[nodiscard]] constexpr bool is_response() const noexcept { return v >= 0x0100 && v <= 0x01FF; }
        [[nodiscard]] constexpr bool is_query() const noexcept { return v >= 0x0200 && v <= 0x02FF; }
        [[nodiscard]] constexpr bool is_knowledge() const noexcept { return v >= 0x0300 && v <= 0x03FF; }
        [[nodiscard]] constexpr bool is_skill() const noexcept { return v >= 0x0400 && v <= 0x04FF; }
        [[nodiscard]] constexpr bool is_emotion() const noexcept { return v >= 0x0500 && v <= 0x05FF; }
        [[nodiscard]] constexpr bool is_template() const noexcept { return v >= 0x0600 && v <= 0x06FF; }
        [[nodiscard]] constexpr bool is_chain() const noexcept { return v >= 0x0700 && v <= 0x07FF; }

        friend constexpr bool operator==(Action, Action) noexcept = default;
        friend constexpr auto operator<=>(Action, Action) noexcept = default;
    };

    namespace actions {
        // System (0x00xx)
        inline constexpr Action kNop{0x0000};
        inline constexpr Action kHalt{0x0001};
        inline constexpr Action kError{0x0002};
        inline constexpr Action kStatus{0x0003};

        // Response (0x01xx)
        inline constexpr Action kGreet{0x0100};
        inline constexpr Action kConfirm{0x0101};
        inline constexpr Action kDeny{0x0102};
        inline constexpr Action kExplain{0x0103};
        inline constexpr Action kClarify{0x0104};
        inline constexpr Action kApologize{0x0105};
        inline constexpr Action kThank{0x0106};
        inline constexpr Action kRespond{0x0107};

        // Query (0x02xx)
        inline constexpr Action kAsk{0x0200};
        inline constexpr Action kRequest{0x0201};
        inline constexpr Action kSearch{0x0202};
        inline constexpr Action kRetrieve{0x0203};

        // Knowledge (0x03xx)
        inline constexpr Action kDefine{0x0300};
        inline constexpr Action kDescribe{0x0301};
        inline constexpr Action kCompare{0x0302};
        inline constexpr Action kSummarize{0x0303};
        inline constexpr Action kExplainHow{0x0304};
        inline constexpr Action kExplainWhy{0x0305};

        // Skill (0x04xx)
        inline constexpr Action kCalculate{0x0400};
        inline constexpr Action kSetTimer{0x0401};
        inline constexpr Action kKnowledgeSearch{0x0402};

        // Emotion (0x05xx)
        inline constexpr Action kEmpathy{0x0500};
        inline constexpr Action kConcern{0x0501};
        inline constexpr Action kEncouragement{0x0502};
        inline constexpr Action kReassure{0x0503};

        // Template (0x06xx)
        inline constexpr Action kTemplateLoad{0x0600};
        inline constexpr Action kTemplateFill{0x0601};

        // Chain (0x07xx)
        inline constexpr Action kChain{0x0700};
        inline constexpr Action kFork{0x0701};
        inline constexpr Action kMerge{0x0702};
    } // namespace actions

    // Catalog name, or "UNKNOWN". Never null.
    [[nodiscard]] const char* action_name(Action a) noexcept;

    // "ACT(0x0100:GREET)"
    [[nodiscard]] std::string action_to_string(Action a);

    static_assert(sizeof(Action) == 2);
    static_assert(std::is_trivially_copyable_v<Action>);
    static_assert(std::is_standard_layout_v<Action>);
} // namespace frameisa::isa
