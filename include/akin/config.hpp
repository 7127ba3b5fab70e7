#pragma once

#include <akin/result.hpp>
#include <akin/options.hpp>
#include <akin/log.hpp>
#include <string>
#include <optional>

namespace akin {

// Layered configuration: global > project > explicit file
// Later layers override earlier ones, field by field.
struct Config {
    RenderOptions render;
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool spacing_set = false;
    bool interpolate_set = false;
    bool max_range_len_set = false;
    bool max_output_tokens_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `source_name` is used in error locations
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source_name = "<config>");

    // Merge another config on top (other's explicitly set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> explicit
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);
};

// Discover the global config file path: ~/.akin/config.toml
std::string global_config_path();

// Project-level config file inside `dir`: <dir>/.akin.toml
std::string project_config_path(const std::string& dir);

} // namespace akin
