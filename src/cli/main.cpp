// ulid: generate ULIDs and convert between their text, UUID and raw forms.
//
//     ulid generate [--uuid] [--time <ms>] [-n <count>]
//     ulid inspect <value>
//     ulid to-uuid <text> | from-uuid <uuid> | timestamp <value>
//     ulid cast <value>
//     ulid validate <value>
//
// Global options: --config <path>, -v/--verbose, -q/--quiet

#include <ulid/config.hpp>
#include <ulid/log.hpp>
#include <ulid/ulid.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ulid;

static const char* USAGE =
    "usage: ulid [--config <path>] [-v|-q] <command> [args]\n"
    "\n"
    "commands:\n"
    "  generate [--uuid] [--time <ms>] [-n <count>]\n"
    "  inspect <value>        show text, UUID and timestamp\n"
    "  to-uuid <text>\n"
    "  from-uuid <uuid>\n"
    "  timestamp <value>\n"
    "  cast <value>           normalize text or UUID to text\n"
    "  validate <value>       exit 0 if value is valid ULID text\n";

struct Args {
    std::string config_path;
    bool verbose = false;
    bool quiet = false;
    std::string command;
    std::vector<std::string> rest;
};

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) {
                return UlidError{UlidError::InvalidArg, "--config needs a path"};
            }
            args.config_path = argv[++i];
        } else if (a == "-v" || a == "--verbose") {
            args.verbose = true;
        } else if (a == "-q" || a == "--quiet") {
            args.quiet = true;
        } else if (!a.empty() && a[0] == '-') {
            return UlidError{UlidError::InvalidArg, "unknown option: " + a};
        } else {
            break;
        }
    }
    if (i >= argc) {
        return UlidError{UlidError::InvalidArg, "no command given"};
    }
    args.command = argv[i++];
    for (; i < argc; ++i) args.rest.push_back(argv[i]);
    return Result<Args>::ok(std::move(args));
}

static Result<uint64_t> parse_u64(const std::string& flag, const std::string& s) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return UlidError{UlidError::InvalidArg,
            flag + " expects a non-negative integer, got '" + s + "'"};
    }
    try {
        return Result<uint64_t>::ok(std::stoull(s));
    } catch (const std::out_of_range&) {
        return UlidError{UlidError::InvalidArg, flag + " value out of range: " + s};
    }
}

static Result<Config> load_config(const Args& args) {
    std::optional<Config> global;
    std::optional<Config> local;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto g = Config::load(gpath);
        ULID_TRY(g);
        global = std::move(g).value();
    }
    if (!args.config_path.empty()) {
        auto l = Config::load(args.config_path);
        ULID_TRY(l);
        local = std::move(l).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static Status cmd_generate(const Config& cfg, const std::vector<std::string>& rest) {
    OutputFormat format = cfg.format;
    uint64_t count = static_cast<uint64_t>(cfg.count);
    std::optional<uint64_t> fixed_time;

    for (size_t i = 0; i < rest.size(); ++i) {
        const std::string& a = rest[i];
        if (a == "--uuid") {
            format = OutputFormat::Uuid;
        } else if ((a == "--time" || a == "-n") && i + 1 < rest.size()) {
            auto v = parse_u64(a, rest[++i]);
            ULID_TRY(v);
            if (a == "--time") fixed_time = v.value();
            else count = v.value();
        } else {
            return UlidError{UlidError::InvalidArg, "unexpected argument to generate: " + a,
                "usage: ulid generate [--uuid] [--time <ms>] [-n <count>]"};
        }
    }

    log::debug("generating %llu ULID(s) as %s", static_cast<unsigned long long>(count),
               format == OutputFormat::Uuid ? "uuid" : "text");

    for (uint64_t n = 0; n < count; ++n) {
        uint64_t ts = fixed_time.has_value() ? *fixed_time : now_ms();
        auto value = format == OutputFormat::Uuid ? generate_uuid_text(ts) : generate_text(ts);
        ULID_TRY(value);
        std::cout << value.value() << "\n";
    }
    return ok_status();
}

static Result<std::string> single_arg(const std::string& command,
                                      const std::vector<std::string>& rest) {
    if (rest.size() != 1) {
        return UlidError{UlidError::InvalidArg,
            command + " takes exactly one argument",
            "usage: ulid " + command + " <value>"};
    }
    return Result<std::string>::ok(rest[0]);
}

static Status cmd_inspect(const std::string& value) {
    auto text = cast(value);
    ULID_TRY(text);
    auto uuid = to_uuid(text.value());
    ULID_TRY(uuid);
    auto ts = extract_timestamp(text.value());
    ULID_TRY(ts);
    std::cout << "text:      " << text.value() << "\n"
              << "uuid:      " << uuid.value() << "\n"
              << "timestamp: " << ts.value() << "\n";
    return ok_status();
}

template<typename T>
static Status print(const Result<T>& r) {
    if (r.is_err()) return r.error();
    std::cout << r.value() << "\n";
    return ok_status();
}

static bool takes_single_value(const std::string& cmd) {
    for (const char* name : {"inspect", "to-uuid", "from-uuid", "timestamp", "cast", "validate"}) {
        if (cmd == name) return true;
    }
    return false;
}

static Result<int> run(const Args& args, const Config& cfg) {
    const std::string& cmd = args.command;
    if (cmd == "generate") {
        ULID_TRY(cmd_generate(cfg, args.rest));
        return Result<int>::ok(0);
    }
    if (!takes_single_value(cmd)) {
        return UlidError{UlidError::InvalidArg, "unknown command: " + cmd};
    }

    auto arg = single_arg(cmd, args.rest);
    ULID_TRY(arg);
    const std::string& value = arg.value();

    if (cmd == "inspect") {
        ULID_TRY(cmd_inspect(value));
    } else if (cmd == "to-uuid") {
        ULID_TRY(print(to_uuid(value)));
    } else if (cmd == "from-uuid") {
        ULID_TRY(print(from_uuid(value)));
    } else if (cmd == "timestamp") {
        ULID_TRY(print(extract_timestamp(value)));
    } else if (cmd == "cast") {
        ULID_TRY(print(cast(value)));
    } else if (cmd == "validate") {
        bool ok = is_valid_text(value);
        log::debug("'%s' is %s", value.c_str(), ok ? "valid" : "invalid");
        return Result<int>::ok(ok ? 0 : 1);
    }
    return Result<int>::ok(0);
}

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        log::error("%s", args.error().message.c_str());
        std::fputs(USAGE, stderr);
        return 2;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }

    const Config& c = cfg.value();
    log::set_level(c.log_level);
    if (c.color_set) log::set_color_enabled(c.color);
    if (args.value().verbose) log::set_level(log::Debug);
    if (args.value().quiet) log::set_level(log::Error);

    auto rc = run(args.value(), c);
    if (rc.is_err()) {
        log::error("%s failed", args.value().command.c_str());
        std::cerr << rc.error().format() << "\n";
        return rc.error().code == UlidError::InvalidArg ? 2 : 1;
    }
    return rc.value();
}
