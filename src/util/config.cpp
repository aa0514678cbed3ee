#include <ulidkit/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ulidkit {

static UlidError type_error(const std::string& key, const char* expected) {
    return UlidError{UlidError::Config,
        "config key '" + key + "' must be " + expected};
}

// Reads an optional boolean; a present value of another type is an error.
static Status read_bool(const toml::table& tbl, const std::string& section,
                        const char* key, std::optional<bool>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    if (auto b = node->as_boolean()) {
        out = b->get();
        return ok_status();
    }
    return type_error(section + "." + key, "a boolean");
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [parse] section
    if (auto sec = doc["parse"].as_table()) {
        ULIDKIT_TRY(read_bool(*sec, "parse", "case-insensitive", cfg.case_insensitive));
        ULIDKIT_TRY(read_bool(*sec, "parse", "remap-ambiguous", cfg.remap_ambiguous));
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (const toml::node* node = gen->get("max-count")) {
            auto iv = node->as_integer();
            if (!iv) return type_error("generate.max-count", "an integer");
            int64_t v = iv->get();
            if (v < 1 || v > kMaxCountLimit) {
                return UlidError{UlidError::Config,
                    "generate.max-count out of range: " + std::to_string(v),
                    "expected 1.." + std::to_string(kMaxCountLimit)};
            }
            cfg.max_count = v;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (const toml::node* node = lg->get("level")) {
            auto str = node->as_string();
            if (!str) return type_error("log.level", "a string");
            const std::string& name = str->get();
            auto lvl = log::parse_level(name);
            if (!lvl) {
                return UlidError{UlidError::Config,
                    "unknown log level: " + name,
                    "expected one of trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
        }
        ULIDKIT_TRY(read_bool(*lg, "log", "color", cfg.log_color));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.case_insensitive) case_insensitive = other.case_insensitive;
    if (other.remap_ambiguous) remap_ambiguous = other.remap_ambiguous;
    if (other.max_count) max_count = other.max_count;
    if (other.log_level) log_level = other.log_level;
    if (other.log_color) log_color = other.log_color;
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

ParseOptions Config::parse_options() const {
    ParseOptions opts;
    if (case_insensitive) opts.case_insensitive = *case_insensitive;
    if (remap_ambiguous) opts.remap_ambiguous = *remap_ambiguous;
    return opts;
}

int64_t Config::effective_max_count() const {
    return max_count.value_or(kDefaultMaxCount);
}

void Config::apply_logging() const {
    if (log_level) log::set_level(*log_level);
    if (log_color) log::set_color_enabled(*log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulidkit/config.toml";
}

std::string local_config_path() {
    return "ulidkit.toml";
}

} // namespace ulidkit
