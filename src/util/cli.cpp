#include <ulidkit/cli.hpp>
#include <ulidkit/log.hpp>
#include <ulidkit/ulid.hpp>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <ostream>

namespace fs = std::filesystem;

namespace ulidkit::cli {

std::string usage() {
    return
        "usage: ulidkit <command> [options]\n"
        "\n"
        "commands:\n"
        "  standard             ULID from the current time\n"
        "  seeded               ULID from --seed (or the current time)\n"
        "  monotonic            strictly increasing ULIDs within one timestamp\n"
        "  parse <ulid>         split a ULID and decode its timestamp\n"
        "\n"
        "options:\n"
        "  --seed <ms>          timestamp in milliseconds since the Unix epoch\n"
        "  --count <n>          number of ULIDs to generate (default 1)\n"
        "  --config <path>      read configuration from <path>\n"
        "  -v, --verbose        debug logging\n";
}

static Result<int64_t> parse_integer(const std::string& flag, const std::string& text) {
    if (text.empty()) {
        return UlidError{UlidError::InvalidArg, flag + " requires a number"};
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0') {
        return UlidError{UlidError::InvalidArg,
            "invalid number for " + flag + ": " + text,
            "expected a decimal integer"};
    }
    return Result<int64_t>::ok(static_cast<int64_t>(v));
}

static Result<Command> parse_command(const std::string& name) {
    if (name == "standard") return Result<Command>::ok(Command::Standard);
    if (name == "seeded") return Result<Command>::ok(Command::Seeded);
    if (name == "monotonic") return Result<Command>::ok(Command::Monotonic);
    if (name == "parse") return Result<Command>::ok(Command::Parse);
    if (name == "help" || name == "-h" || name == "--help") {
        return Result<Command>::ok(Command::Help);
    }
    return UlidError{UlidError::InvalidArg,
        "unknown command: " + name,
        "expected standard, seeded, monotonic or parse"};
}

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    if (args.empty()) {
        return Result<Options>::ok(opts);
    }
    ULIDKIT_TRY_ASSIGN(opts.command, parse_command(args[0]));

    bool count_given = false;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= args.size()) {
                return UlidError{UlidError::InvalidArg, flag + " requires a value"};
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (a == "--seed") {
            ULIDKIT_TRY_ASSIGN(std::string text, next(a));
            ULIDKIT_TRY_ASSIGN(opts.seed, parse_integer(a, text));
        } else if (a == "--count") {
            ULIDKIT_TRY_ASSIGN(std::string text, next(a));
            ULIDKIT_TRY_ASSIGN(opts.count, parse_integer(a, text));
            if (opts.count < 1) {
                return UlidError{UlidError::InvalidArg,
                    "--count must be at least 1"};
            }
            count_given = true;
        } else if (a == "--config") {
            ULIDKIT_TRY_ASSIGN(opts.config_path, next(a));
        } else if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
        } else if (!a.empty() && a[0] == '-') {
            return UlidError{UlidError::InvalidArg, "unknown option: " + a,
                "run 'ulidkit help' for usage"};
        } else if (opts.command == Command::Parse && opts.ulid.empty()) {
            opts.ulid = a;
        } else {
            return UlidError{UlidError::InvalidArg, "unexpected argument: " + a};
        }
    }

    if (opts.command == Command::Parse) {
        if (opts.ulid.empty()) {
            return UlidError{UlidError::InvalidArg, "parse requires a ULID argument",
                "usage: ulidkit parse <ulid>"};
        }
        if (opts.seed || count_given) {
            return UlidError{UlidError::InvalidArg,
                "--seed and --count do not apply to parse"};
        }
    }
    if (opts.command == Command::Standard && opts.seed) {
        return UlidError{UlidError::InvalidArg, "standard does not take --seed",
            "use 'seeded' or 'monotonic' for an explicit time"};
    }
    return Result<Options>::ok(std::move(opts));
}

Result<Config> load_config(const Options& opts) {
    if (opts.config_path) {
        return Config::load(*opts.config_path);
    }

    std::optional<Config> global;
    std::optional<Config> local;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        ULIDKIT_TRY_ASSIGN(global, Config::load(global_path));
        log::debug("loaded global config %s", global_path.c_str());
    }
    if (fs::exists(local_config_path(), ec)) {
        ULIDKIT_TRY_ASSIGN(local, Config::load(local_config_path()));
        log::debug("loaded local config %s", local_config_path().c_str());
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static void print_generation(std::ostream& out, const GenerationResult& r) {
    out << "ulid:       " << r.ulid << "\n"
        << "timestamp:  " << r.timestamp << "\n"
        << "randomness: " << r.randomness << "\n";
}

static void print_parse(std::ostream& out, const ParseResult& r) {
    out << "ulid:            " << r.ulid << "\n"
        << "timestamp_part:  " << r.timestamp_part << "\n"
        << "randomness_part: " << r.randomness_part << "\n"
        << "timestamp:       " << r.timestamp << "\n"
        << "date:            " << r.date_string() << "\n";
}

Status run(const Options& opts, const Config& cfg, std::ostream& out) {
    if (opts.command == Command::Help) {
        out << usage();
        return ok_status();
    }

    if (opts.command == Command::Parse) {
        ULIDKIT_TRY_ASSIGN(ParseResult parsed, ulidkit::parse(opts.ulid, cfg.parse_options()));
        print_parse(out, parsed);
        return ok_status();
    }

    int64_t max_count = cfg.effective_max_count();
    if (opts.count > max_count) {
        return UlidError{UlidError::InvalidArg,
            "--count " + std::to_string(opts.count) + " exceeds the limit of "
                + std::to_string(max_count),
            "raise generate.max-count in the config file"};
    }

    for (int64_t i = 0; i < opts.count; ++i) {
        if (i > 0) out << "\n";
        Result<GenerationResult> r = [&]() {
            switch (opts.command) {
                case Command::Seeded:    return generate_seeded(opts.seed);
                case Command::Monotonic: return generate_monotonic(opts.seed);
                default:                 return generate_standard();
            }
        }();
        ULIDKIT_TRY(r);
        print_generation(out, r.value());
    }
    log::debug("generated %lld identifier(s)", static_cast<long long>(opts.count));
    return ok_status();
}

} // namespace ulidkit::cli
