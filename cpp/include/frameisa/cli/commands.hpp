#pragma once

#include <type_traits>

#include "frameisa/cli/options.hpp"
#include "frameisa/core/errors.hpp"

namespace frameisa::cli {
    using u32 = frameisa::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Encode = 2,
        Decode = 3,
        Describe = 4,
        Calc = 5,
        Time = 6,
        ExtDecode = 7,
        Digest = 8,
    };

    // min_args/max_args bound the positionals left after options.
    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};
        u32 max_args{0};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        const CommandSpec* spec{nullptr};
        CliArgs args{};
    };

    // Matches argv[0] against specs; args receives the remaining arguments.
    // An unrecognised name yields NotFound.
    frameisa::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Invalid (aux = count) if the positional count is outside
    // [min_args, max_args].
    [[nodiscard]] frameisa::core::Status check_arity(const CommandSpec& spec, u32 positional) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace frameisa::cli
