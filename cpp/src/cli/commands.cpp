#include "frameisa/cli/commands.hpp"

#include <cstring>

namespace frameisa::cli {
    frameisa::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->spec = &s;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return frameisa::core::ok_status();
            }
        }
        return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::NotFound);
    }

    frameisa::core::Status check_arity(const CommandSpec& spec, u32 positional) noexcept {
        if (positional < spec.min_args || positional > spec.max_args) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid, positional);
        }
        return frameisa::core::ok_status();
    }
} // namespace frameisa::cli
