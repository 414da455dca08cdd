#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "frameisa/cli/commands.hpp"
#include "frameisa/cli/options.hpp"
#include "frameisa/core/errors.hpp"
#include "frameisa/isa/isa.hpp"
#include "frameisa/storage/hashing.hpp"

namespace isa = frameisa::isa;

// ========================================================================
// Configuration
// ========================================================================

struct CliConfig {
    std::string output_path;
    bool hex{false};
    bool verbose{false};
    frameisa::core::i64 tz_hours{0};
    bool has_reference{false};
    frameisa::core::Timestamp reference{0};
};

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

static const frameisa::cli::OptionSpec g_options[] = {
    {frameisa::cli::OptionId::Output, frameisa::cli::OptionType::String, "output", 'o'},
    {frameisa::cli::OptionId::Hex, frameisa::cli::OptionType::Flag, "hex", 'x'},
    {frameisa::cli::OptionId::Verbose, frameisa::cli::OptionType::Flag, "verbose", 'v'},
    {frameisa::cli::OptionId::Tz, frameisa::cli::OptionType::I64, "tz", 'z'},
    {frameisa::cli::OptionId::Reference, frameisa::cli::OptionType::I64, "reference", 'r'},
};

static const frameisa::cli::CommandSpec g_commands[] = {
    {frameisa::cli::CommandId::Help, "help", 0, 0},
    {frameisa::cli::CommandId::Encode, "encode", 1, 4096},
    {frameisa::cli::CommandId::Decode, "decode", 1, 1},
    {frameisa::cli::CommandId::Describe, "describe", 1, 1},
    {frameisa::cli::CommandId::Calc, "calc", 2, 3},
    {frameisa::cli::CommandId::Time, "time", 2, 2},
    {frameisa::cli::CommandId::ExtDecode, "ext-decode", 1, 1},
    {frameisa::cli::CommandId::Digest, "digest", 1, 1},
};

static void load_env(CliConfig* cfg) {
    const char* v = std::getenv("FRAMEISA_VERBOSE");
    if (v != nullptr && *v != '\0' && std::strcmp(v, "0") != 0) {
        cfg->verbose = true;
    }
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_info(const CliConfig& cfg, const char* msg) {
    if (cfg.verbose) {
        fprintf(stderr, "info: %s\n", msg);
    }
}

void print_status_error_detailed(const char* context, frameisa::core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            frameisa::core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            frameisa::core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == frameisa::core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

void print_decode_error(const char* context, frameisa::core::Status s, const isa::DecodeError& err) {
    print_status_error_detailed(context, s);
    if (s.code == frameisa::core::StatusCode::InvalidLength) {
        fprintf(stderr, "error: %s: expected %u bytes, got %u\n", context, err.expected, err.actual);
    } else if (s.code == frameisa::core::StatusCode::InvalidOpcodeText && err.text[0] != '\0') {
        fprintf(stderr, "error: %s: %s\n", context, err.text);
    }
}

// ========================================================================
// File I/O Utilities
// ========================================================================

frameisa::core::Status read_file(const char* path, std::vector<frameisa::core::u8>* out) {
    FILE* f = fopen(path, "rb");
    if (!f) {
        const int e = errno;
        return frameisa::core::make_status(
            frameisa::core::StatusDomain::Cli,
            e == ENOENT ? frameisa::core::StatusCode::NotFound : frameisa::core::StatusCode::Io,
            static_cast<frameisa::core::u32>(e));
    }

    std::vector<frameisa::core::u8> data;
    frameisa::core::u8 chunk[4096];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
        data.insert(data.end(), chunk, chunk + n);
    }
    const bool failed = ferror(f) != 0;
    fclose(f);

    if (failed) {
        return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Io);
    }
    *out = std::move(data);
    return frameisa::core::ok_status();
}

frameisa::core::Status write_file(const char* path, const std::vector<frameisa::core::u8>& data) {
    FILE* f = fopen(path, "wb");
    if (!f) {
        return frameisa::core::make_status(
            frameisa::core::StatusDomain::Cli,
            frameisa::core::StatusCode::Io,
            static_cast<frameisa::core::u32>(errno));
    }

    const size_t written = data.empty() ? 0 : fwrite(data.data(), 1, data.size(), f);
    const int close_rc = fclose(f);

    if (written != data.size() || close_rc != 0) {
        return frameisa::core::make_status(frameisa::core::StatusDomain::Cli, frameisa::core::StatusCode::Io);
    }
    return frameisa::core::ok_status();
}

static std::string bytes_to_hex(const std::vector<frameisa::core::u8>& bytes) {
    static const char hex[] = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (frameisa::core::u8 b : bytes) {
        s.push_back(hex[(b >> 4) & 0xF]);
        s.push_back(hex[b & 0xF]);
    }
    return s;
}

// Writes to --output when given; prints hex when asked or when there is
// nowhere else for the bytes to go.
static int emit_bytes(const CliConfig& cfg, const char* context, const std::vector<frameisa::core::u8>& bytes) {
    if (!cfg.output_path.empty()) {
        const frameisa::core::Status s = write_file(cfg.output_path.c_str(), bytes);
        if (!frameisa::core::is_ok(s)) {
            print_status_error_detailed(context, s);
            return kExitError;
        }
        if (cfg.verbose) {
            fprintf(stderr, "info: wrote %zu bytes to %s\n", bytes.size(), cfg.output_path.c_str());
        }
    }
    if (cfg.hex || cfg.output_path.empty()) {
        printf("%s\n", bytes_to_hex(bytes).c_str());
    }
    return kExitOk;
}

static bool parse_double_arg(const char* s, double* out) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || end == nullptr || *end != '\0' || errno != 0) {
        return false;
    }
    *out = v;
    return true;
}

static bool parse_i32_arg(const char* s, frameisa::core::i32* out) {
    const char* end = s + std::strlen(s);
    frameisa::core::i32 v{};
    const auto r = std::from_chars(s, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: frameisa [options] <command> [options] [args]\n");
    printf("\n");
    printf("Commands:\n");
    printf("  encode <AAAA:SSSS:MMMM>...  Encode instructions to bytes\n");
    printf("  decode <file>               Decode a program and list its instructions\n");
    printf("  describe <AAAA:SSSS:MMMM>   Show names, categories and modifier fields\n");
    printf("  calc <op> <a> [b]           Build a CALCULATE NUMBER extended instruction\n");
    printf("                              op: + - * / %% ^ sqrt\n");
    printf("  time <delta> <unit>         Build a RESPOND TIME extended instruction\n");
    printf("                              unit: second minute hour day week month year\n");
    printf("  ext-decode <file>           Decode an extended instruction\n");
    printf("  digest <file>               BLAKE3 digest of a decoded program\n");
    printf("  help                        Show this help\n");
    printf("\n");
    printf("Options:\n");
    printf("  -o, --output <path>         Write encoded bytes to a file\n");
    printf("  -x, --hex                   Print encoded bytes as hex\n");
    printf("  -v, --verbose               Print info: lines (also FRAMEISA_VERBOSE=1)\n");
    printf("  -z, --tz <hours>            Timezone offset for time (-128..127)\n");
    printf("  -r, --reference <seconds>   Reference Unix time for time (default now)\n");
    printf("\n");
    printf("ISA version %s\n", isa::kIsaVersion);
}

int handle_encode(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    std::vector<isa::Instruction> program;
    program.reserve(args.argc);
    for (frameisa::core::u32 i = 0; i < args.argc; ++i) {
        isa::Instruction ins{};
        isa::DecodeError err{};
        const frameisa::core::Status s = isa::instruction_from_opcode_string(args.argv[i], &ins, &err);
        if (!frameisa::core::is_ok(s)) {
            print_decode_error("encode", s, err);
            return kExitError;
        }
        program.push_back(ins);
    }
    if (cfg.verbose) {
        fprintf(stderr, "info: encoded %zu instruction(s)\n", program.size());
    }
    return emit_bytes(cfg, "encode", isa::instruction_to_bytes_all(program));
}

static int load_program(const char* context, const char* path, std::vector<isa::Instruction>* program) {
    std::vector<frameisa::core::u8> bytes;
    const frameisa::core::Status rs = read_file(path, &bytes);
    if (!frameisa::core::is_ok(rs)) {
        print_status_error_detailed(context, rs);
        return kExitError;
    }

    isa::DecodeError err{};
    const frameisa::core::Status s = isa::instruction_parse_all(
        {bytes.data(), static_cast<frameisa::core::u32>(bytes.size())}, program, &err);
    if (!frameisa::core::is_ok(s)) {
        print_decode_error(context, s, err);
        return kExitError;
    }
    return kExitOk;
}

int handle_decode(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    std::vector<isa::Instruction> program;
    const int rc = load_program("decode", args.argv[0], &program);
    if (rc != kExitOk) return rc;

    for (const isa::Instruction& ins : program) {
        printf("%s  %s\n", isa::instruction_to_opcode_string(ins).c_str(), isa::instruction_to_string(ins).c_str());
    }
    if (cfg.verbose) {
        fprintf(stderr, "info: decoded %zu instruction(s)\n", program.size());
    }
    return kExitOk;
}

int handle_describe(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    (void)cfg;
    isa::Instruction ins{};
    isa::DecodeError err{};
    const frameisa::core::Status s = isa::instruction_from_opcode_string(args.argv[0], &ins, &err);
    if (!frameisa::core::is_ok(s)) {
        print_decode_error("describe", s, err);
        return kExitError;
    }

    const isa::Modifier m = ins.modifier;
    printf("%s\n", isa::instruction_to_string(ins).c_str());
    printf("action:   0x%04X %s (category 0x%02X, sub 0x%02X)\n",
           static_cast<unsigned>(ins.action.v), isa::action_name(ins.action),
           static_cast<unsigned>(ins.action.category()), static_cast<unsigned>(ins.action.subcategory()));
    printf("subject:  0x%04X %s (category 0x%02X, sub 0x%02X)\n",
           static_cast<unsigned>(ins.subject.v), isa::subject_name(ins.subject),
           static_cast<unsigned>(ins.subject.category()), static_cast<unsigned>(ins.subject.subcategory()));
    if (const auto doc = ins.subject.rag_doc_id()) {
        printf("rag doc:  0x%03X\n", static_cast<unsigned>(*doc));
    }
    if (const auto model = ins.subject.trm_model_id()) {
        printf("trm model: 0x%02X\n", static_cast<unsigned>(*model));
    }
    printf("modifier: 0x%04X voice=%s tone=%s warmth=%s format=%s accuracy=%s urgency=%s reserved=0x%X\n",
           static_cast<unsigned>(m.v),
           isa::voice_name(m.voice()), isa::tone_name(m.tone()), isa::warmth_name(m.warmth()),
           isa::format_name(m.format()), isa::accuracy_name(m.accuracy()), isa::urgency_name(m.urgency()),
           static_cast<unsigned>(m.reserved()));
    printf("needs_rag=%s is_chain=%s is_system=%s\n",
           isa::instruction_needs_rag(ins) ? "yes" : "no",
           isa::instruction_is_chain(ins) ? "yes" : "no",
           isa::instruction_is_system(ins) ? "yes" : "no");
    return kExitOk;
}

int handle_calc(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    const auto op = isa::calc_op_from_symbol(args.argv[0]);
    if (!op) {
        fprintf(stderr, "error: calc: unknown operator '%s'\n", args.argv[0]);
        return kExitUsage;
    }

    const bool unary = isa::calc_op_is_unary(*op);
    if ((unary && args.argc != 2) || (!unary && args.argc != 3)) {
        fprintf(stderr, "error: calc: '%s' takes %d operand(s)\n", args.argv[0], unary ? 1 : 2);
        return kExitUsage;
    }

    isa::CalcPayload c{};
    c.op = *op;
    if (!parse_double_arg(args.argv[1], &c.a) || (!unary && !parse_double_arg(args.argv[2], &c.b))) {
        print_error("calc: operands must be numbers");
        return kExitUsage;
    }

    const isa::ExtendedInstruction x = isa::extended_with_calc(
        isa::instruction_simple(isa::actions::kCalculate, isa::subjects::kNumber), c);
    if (cfg.verbose) {
        fprintf(stderr, "info: %s\n", isa::extended_to_string(x).c_str());
    }
    return emit_bytes(cfg, "calc", isa::extended_to_bytes(x));
}

int handle_time(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    frameisa::core::i32 delta{};
    if (!parse_i32_arg(args.argv[0], &delta)) {
        print_error("time: delta must be a 32-bit integer");
        return kExitUsage;
    }
    const auto unit = isa::time_unit_from_name(args.argv[1]);
    if (!unit) {
        fprintf(stderr, "error: time: unknown unit '%s'\n", args.argv[1]);
        return kExitUsage;
    }

    const frameisa::core::Timestamp ref = cfg.has_reference ? cfg.reference : isa::TimePayload::now().reference;
    const isa::TimePayload t = isa::TimePayload::with_delta(ref, delta, *unit)
                                   .with_tz(static_cast<frameisa::core::i8>(cfg.tz_hours));

    const isa::ExtendedInstruction x = isa::extended_with_time(
        isa::instruction_simple(isa::actions::kRespond, isa::subjects::kTime), t);
    if (cfg.verbose) {
        fprintf(stderr, "info: %s\n", isa::extended_to_string(x).c_str());
    }
    return emit_bytes(cfg, "time", isa::extended_to_bytes(x));
}

int handle_ext_decode(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    std::vector<frameisa::core::u8> bytes;
    const frameisa::core::Status rs = read_file(args.argv[0], &bytes);
    if (!frameisa::core::is_ok(rs)) {
        print_status_error_detailed("ext-decode", rs);
        return kExitError;
    }

    isa::ExtendedInstruction x{};
    isa::DecodeError err{};
    const frameisa::core::Status s = isa::extended_from_bytes(
        {bytes.data(), static_cast<frameisa::core::u32>(bytes.size())}, &x, &err);
    if (!frameisa::core::is_ok(s)) {
        print_decode_error("ext-decode", s, err);
        return kExitError;
    }

    printf("%s\n", isa::extended_to_string(x).c_str());
    if (const isa::TimePayload* t = isa::extended_as_time(x)) {
        printf("reference=%lld delta=%d unit=%s tz=%d\n",
               static_cast<long long>(t->reference), static_cast<int>(t->delta),
               isa::time_unit_name(t->unit), static_cast<int>(t->tz_offset));
    }
    if (cfg.verbose && bytes.size() > isa::extended_byte_size(x)) {
        fprintf(stderr, "info: ignored %zu trailing byte(s)\n", bytes.size() - isa::extended_byte_size(x));
    }
    return kExitOk;
}

int handle_digest(const CliConfig& cfg, const frameisa::cli::CliArgs& args) {
    std::vector<isa::Instruction> program;
    const int rc = load_program("digest", args.argv[0], &program);
    if (rc != kExitOk) return rc;

    frameisa::core::Hash256 h{};
    const frameisa::core::Status s = frameisa::storage::program_digest(program, &h);
    if (!frameisa::core::is_ok(s)) {
        print_status_error_detailed("digest", s);
        return kExitError;
    }
    printf("%s\n", frameisa::storage::hash_to_hex(h).c_str());
    if (cfg.verbose) {
        fprintf(stderr, "info: %zu instruction(s)\n", program.size());
    }
    return kExitOk;
}

// ========================================================================
// Option Handling
// ========================================================================

static bool apply_options(const frameisa::cli::ParsedOptions& parsed, CliConfig* cfg) {
    using frameisa::cli::OptionId;
    if (const auto* o = frameisa::cli::find_option(parsed, OptionId::Output)) {
        cfg->output_path = o->value.str;
    }
    if (frameisa::cli::find_option(parsed, OptionId::Hex) != nullptr) {
        cfg->hex = true;
    }
    if (frameisa::cli::find_option(parsed, OptionId::Verbose) != nullptr) {
        cfg->verbose = true;
    }
    if (const auto* o = frameisa::cli::find_option(parsed, OptionId::Tz)) {
        if (o->value.i64v < -128 || o->value.i64v > 127) {
            print_error("--tz must be within -128..127");
            return false;
        }
        cfg->tz_hours = o->value.i64v;
    }
    if (const auto* o = frameisa::cli::find_option(parsed, OptionId::Reference)) {
        cfg->has_reference = true;
        cfg->reference = o->value.i64v;
    }
    return true;
}

// Parses leading options of 'args' into cfg and advances past them.
static bool consume_options(frameisa::cli::CliArgs* args, CliConfig* cfg) {
    frameisa::cli::ParsedOption storage[16]{};
    frameisa::cli::ParsedOptions parsed{storage, 0, 16};
    frameisa::core::u32 consumed = 0;
    const frameisa::core::u32 count = static_cast<frameisa::core::u32>(sizeof(g_options) / sizeof(g_options[0]));

    const frameisa::core::Status s = frameisa::cli::parse_options(*args, g_options, count, &parsed, &consumed);
    if (!frameisa::core::is_ok(s)) {
        const char* bad = s.aux < args->argc ? args->argv[s.aux] : "";
        fprintf(stderr, "error: invalid option '%s'\n", bad);
        return false;
    }
    if (!apply_options(parsed, cfg)) {
        return false;
    }
    args->argv += consumed;
    args->argc -= consumed;
    return true;
}

// Applies options found anywhere in 'args' and collects the rest, in order,
// as positionals. Everything after a "--" is positional.
static bool split_arguments(const frameisa::cli::CliArgs& args, CliConfig* cfg, std::vector<const char*>* positionals) {
    frameisa::core::u32 end = 0;
    while (end < args.argc && std::strcmp(args.argv[end], "--") != 0) {
        ++end;
    }

    frameisa::cli::CliArgs head{args.argv, end};
    while (head.argc > 0) {
        if (!consume_options(&head, cfg)) {
            return false;
        }
        if (head.argc > 0) {
            positionals->push_back(head.argv[0]);
            ++head.argv;
            --head.argc;
        }
    }
    for (frameisa::core::u32 i = end + 1; i < args.argc; ++i) {
        positionals->push_back(args.argv[i]);
    }
    return true;
}

int main(int argc, char** argv) {
    CliConfig cfg;
    load_env(&cfg);

    frameisa::cli::CliArgs args{argv + 1, argc > 0 ? static_cast<frameisa::core::u32>(argc - 1) : 0};
    if (!consume_options(&args, &cfg)) {
        return kExitUsage;
    }
    if (args.argc == 0) {
        handle_help();
        return kExitUsage;
    }

    frameisa::cli::CommandInvocation cmd{};
    frameisa::core::u32 consumed = 0;
    const frameisa::core::u32 command_count = static_cast<frameisa::core::u32>(sizeof(g_commands) / sizeof(g_commands[0]));
    const frameisa::core::Status s = frameisa::cli::parse_command(args, g_commands, command_count, &cmd, &consumed);
    if (!frameisa::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try help)\n", args.argv[0]);
        return kExitUsage;
    }

    std::vector<const char*> positionals;
    if (!split_arguments(cmd.args, &cfg, &positionals)) {
        return kExitUsage;
    }
    const frameisa::cli::CliArgs rest{positionals.data(), static_cast<frameisa::core::u32>(positionals.size())};
    if (!frameisa::core::is_ok(frameisa::cli::check_arity(*cmd.spec, rest.argc))) {
        fprintf(stderr, "error: %s: expected %u to %u argument(s), got %u\n",
                cmd.spec->name, cmd.spec->min_args, cmd.spec->max_args, rest.argc);
        return kExitUsage;
    }
    print_info(cfg, cmd.spec->name);

    switch (cmd.id) {
    case frameisa::cli::CommandId::Help:
        handle_help();
        return kExitOk;
    case frameisa::cli::CommandId::Encode: return handle_encode(cfg, rest);
    case frameisa::cli::CommandId::Decode: return handle_decode(cfg, rest);
    case frameisa::cli::CommandId::Describe: return handle_describe(cfg, rest);
    case frameisa::cli::CommandId::Calc: return handle_calc(cfg, rest);
    case frameisa::cli::CommandId::Time: return handle_time(cfg, rest);
    case frameisa::cli::CommandId::ExtDecode: return handle_ext_decode(cfg, rest);
    case frameisa::cli::CommandId::Digest: return handle_digest(cfg, rest);
    case frameisa::cli::CommandId::None: break;
    }
    print_error("unhandled command");
    return kExitError;
}
