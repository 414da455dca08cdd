#include "frameisa/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace frameisa::cli {
    namespace {
        using frameisa::core::Status;

        [[nodiscard]] Status bad_arg(u32 index) noexcept {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid, index);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool assign_value(OptionType type, const char* value, OptionValue* out) noexcept {
            if (value == nullptr) {
                return false;
            }
            switch (type) {
            case OptionType::String:
                out->str = value;
                return true;
            case OptionType::I64:
                return parse_i64(value, &out->i64v);
            case OptionType::Flag:
                return false;
            }
            return false;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt, u32 index) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return bad_arg(index);
            }
            out->data[out->len++] = opt;
            return frameisa::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Invalid);
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            // "-5" and "-.5" are positional numbers, not options.
            if ((tok[1] >= '0' && tok[1] <= '9') || tok[1] == '.') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const u32 at = i;
            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq != nullptr ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return bad_arg(at);
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return bad_arg(at);
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return bad_arg(at);
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc) {
                        return bad_arg(at);
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                if (!assign_value(spec->type, value, &opt.value)) {
                    return bad_arg(at);
                }
            }

            const Status s = push_option(out, opt, at);
            if (!frameisa::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return frameisa::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& parsed, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < parsed.len; ++i) {
            if (parsed.data[i].id == id) {
                found = &parsed.data[i];
            }
        }
        return found;
    }
} // namespace frameisa::cli
