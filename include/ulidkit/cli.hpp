#pragma once

#include <ulidkit/config.hpp>
#include <ulidkit/result.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ulidkit::cli {

enum class Command { Standard, Seeded, Monotonic, Parse, Help };

struct Options {
    Command command = Command::Help;
    std::optional<int64_t> seed;
    int64_t count = 1;
    std::string ulid;                       // parse argument
    std::optional<std::string> config_path;
    bool verbose = false;
};

// argv without the program name. Err(InvalidArg) on unknown commands,
// unknown flags, missing values or malformed numbers. Range checks on the
// seed are left to the generators.
Result<Options> parse_args(const std::vector<std::string>& args);

// --config file if given, else global then local config files that exist.
Result<Config> load_config(const Options& opts);

// Runs the command, writing result blocks to `out`.
// Err(InvalidArg) when --count exceeds the configured max-count.
Status run(const Options& opts, const Config& cfg, std::ostream& out);

std::string usage();

} // namespace ulidkit::cli
