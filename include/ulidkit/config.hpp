#pragma once

#include <ulidkit/log.hpp>
#include <ulidkit/result.hpp>
#include <ulidkit/ulid.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ulidkit {

// Layered configuration: global > local (> explicit --config file).
// Lower layers override only the keys they actually set.
struct Config {
    // [parse]
    std::optional<bool> case_insensitive;
    std::optional<bool> remap_ambiguous;
    // [generate]
    std::optional<int64_t> max_count;
    // [log]
    std::optional<log::Level> log_level;
    std::optional<bool> log_color;

    static constexpr int64_t kDefaultMaxCount = 100;
    static constexpr int64_t kMaxCountLimit = 10000;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Resolved values with defaults applied
    ParseOptions parse_options() const;
    int64_t effective_max_count() const;

    // Push [log] settings into the logger
    void apply_logging() const;
};

// ~/.ulidkit/config.toml, or "" when no home directory is known
std::string global_config_path();

// ./ulidkit.toml
std::string local_config_path();

} // namespace ulidkit
