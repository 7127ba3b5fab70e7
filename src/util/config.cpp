#include <akin/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace akin {

namespace {

AkinError config_error(const std::string& source_name, const std::string& msg,
                       const toml::node& node) {
    const auto& src = node.source();
    return AkinError{AkinError::Config, msg, "",
        source_name, static_cast<int>(src.begin.line),
        static_cast<int>(src.begin.column)};
}

// Reads a positive integer limit; absent keys leave `out` untouched.
Status read_limit(const toml::table& tbl, const char* key,
                  const std::string& source_name,
                  std::size_t& out, bool& set) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value_exact<int64_t>();
    if (!v) {
        return config_error(source_name,
            std::string("render.") + key + " must be an integer", *node);
    }
    if (*v <= 0) {
        return config_error(source_name,
            std::string("render.") + key + " must be positive", *node);
    }
    out = static_cast<std::size_t>(*v);
    set = true;
    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str,
                             const std::string& source_name) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source_name);
    } catch (const toml::parse_error& e) {
        const auto& src = e.source();
        return AkinError{AkinError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source_name, static_cast<int>(src.begin.line),
            static_cast<int>(src.begin.column)};
    }

    Config cfg;

    // [render] section
    if (auto render = doc["render"].as_table()) {
        if (const toml::node* node = render->get("spacing")) {
            auto s = node->value_exact<std::string>();
            if (!s) {
                return config_error(source_name,
                    "render.spacing must be a string", *node);
            }
            auto spacing = parse_spacing(*s);
            if (spacing.is_err()) {
                auto err = config_error(source_name, spacing.error().message, *node);
                err.hint = spacing.error().hint;
                return err;
            }
            cfg.render.spacing = spacing.value();
            cfg.spacing_set = true;
        }
        if (const toml::node* node = render->get("interpolate-strings")) {
            auto b = node->value_exact<bool>();
            if (!b) {
                return config_error(source_name,
                    "render.interpolate-strings must be a boolean", *node);
            }
            cfg.render.interpolate_strings = *b;
            cfg.interpolate_set = true;
        }
        AKIN_TRY(read_limit(*render, "max-range-len", source_name,
                            cfg.render.max_range_len, cfg.max_range_len_set));
        AKIN_TRY(read_limit(*render, "max-output-tokens", source_name,
                            cfg.render.max_output_tokens, cfg.max_output_tokens_set));
    }

    // [log] section
    if (auto logtbl = doc["log"].as_table()) {
        if (const toml::node* node = logtbl->get("level")) {
            auto s = node->value_exact<std::string>();
            if (!s) {
                return config_error(source_name, "log.level must be a string", *node);
            }
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) {
                auto err = config_error(source_name, lvl.error().message, *node);
                err.hint = lvl.error().hint;
                return err;
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (const toml::node* node = logtbl->get("color")) {
            auto b = node->value_exact<bool>();
            if (!b) {
                return config_error(source_name, "log.color must be a boolean", *node);
            }
            cfg.log_color = *b;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return AkinError{AkinError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.spacing_set) {
        render.spacing = other.render.spacing;
        spacing_set = true;
    }
    if (other.interpolate_set) {
        render.interpolate_strings = other.render.interpolate_strings;
        interpolate_set = true;
    }
    if (other.max_range_len_set) {
        render.max_range_len = other.render.max_range_len;
        max_range_len_set = true;
    }
    if (other.max_output_tokens_set) {
        render.max_output_tokens = other.render.max_output_tokens;
        max_output_tokens_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.akin/config.toml";
}

std::string project_config_path(const std::string& dir) {
    if (dir.empty()) return ".akin.toml";
    if (dir.back() == '/') return dir + ".akin.toml";
    return dir + "/.akin.toml";
}

} // namespace akin
