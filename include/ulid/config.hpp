#pragma once

#include <ulid/result.hpp>
#include <ulid/log.hpp>
#include <optional>
#include <string>

namespace ulid {

enum class OutputFormat { Text, Uuid };

// Settings for the ulid command-line tool, read from TOML:
//
//   [log]
//   level = "info"
//   color = true
//
//   [generate]
//   format = "text"   # or "uuid"
//   count = 1
struct Config {
    log::Level log_level = log::Info;
    bool color = false;
    OutputFormat format = OutputFormat::Text;
    int count = 1;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool color_set = false;
    bool format_set = false;
    bool count_set = false;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

Result<OutputFormat> parse_output_format(const std::string& name);

// ~/.ulid/config.toml, or "" when no home directory is known
std::string global_config_path();

} // namespace ulid
