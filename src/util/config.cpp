#include <ulid/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <limits>

namespace ulid {

Result<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "text") return Result<OutputFormat>::ok(OutputFormat::Text);
    if (name == "uuid") return Result<OutputFormat>::ok(OutputFormat::Uuid);
    return UlidError{UlidError::Config,
        "unknown output format '" + name + "'",
        "expected \"text\" or \"uuid\""};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto sect = doc["log"].as_table()) {
        if (auto node = sect->get("level")) {
            auto s = node->value<std::string>();
            if (!s) {
                return UlidError{UlidError::Config, "log.level must be a string"};
            }
            auto lvl = log::parse_level(*s);
            ULID_TRY(lvl);
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto node = sect->get("color")) {
            auto b = node->value<bool>();
            if (!b) {
                return UlidError{UlidError::Config, "log.color must be a boolean"};
            }
            cfg.color = *b;
            cfg.color_set = true;
        }
    }

    // [generate] section
    if (auto sect = doc["generate"].as_table()) {
        if (auto node = sect->get("format")) {
            auto s = node->value<std::string>();
            if (!s) {
                return UlidError{UlidError::Config, "generate.format must be a string"};
            }
            auto fmt = parse_output_format(*s);
            ULID_TRY(fmt);
            cfg.format = fmt.value();
            cfg.format_set = true;
        }
        if (auto node = sect->get("count")) {
            auto n = node->value<int64_t>();
            if (!n || *n < 1) {
                return UlidError{UlidError::Config,
                    "generate.count must be a positive integer"};
            }
            if (*n > std::numeric_limits<int>::max()) {
                return UlidError{UlidError::Config,
                    "generate.count is out of range: " + std::to_string(*n),
                    "the largest accepted count is " +
                        std::to_string(std::numeric_limits<int>::max())};
            }
            cfg.count = static_cast<int>(*n);
            cfg.count_set = true;
        }
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
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.format_set) {
        format = other.format;
        format_set = true;
    }
    if (other.count_set) {
        count = other.count;
        count_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulid/config.toml";
}

} // namespace ulid
