// akin_render.cpp
//
// Command-line front end: renders one template file (or stdin) and
// prints the expansion, or a single diagnostic pointing at the source.
//
//     ./akin-render traits.akin                  # expansion on stdout
//     ./akin-render - < traits.akin              # read stdin
//     ./akin-render --spacing source -o out.rs traits.akin
//     ./akin-render --check traits.akin          # validate only
//
// Exit status: 0 success, 1 template error, 2 usage/IO/config error.

#include <akin/akin.hpp>
#include <akin/config.hpp>
#include <akin/log.hpp>
#include <akin/result.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace akin;

static const char* kUsage =
    "usage: akin-render [options] <file|->\n"
    "\n"
    "options:\n"
    "  -o, --output <path>     write the expansion to <path>\n"
    "  -c, --config <path>     extra config file (overrides ~/.akin/config.toml and ./.akin.toml)\n"
    "      --spacing <mode>    spaced (default) | source\n"
    "      --no-interpolate    leave *name inside string literals alone\n"
    "      --log-level <lvl>   trace | debug | info | warn | error\n"
    "      --no-color          plain log output\n"
    "      --check             expand but print nothing on success\n"
    "  -h, --help              show this help\n";

struct CliArgs {
    std::string input;
    std::string output;
    std::string config_path;
    std::optional<Spacing> spacing;
    std::optional<log::Level> log_level;
    bool no_interpolate = false;
    bool no_color = false;
    bool check = false;
    bool help = false;
};

// ---------------------------------------------------------------------------
// Steps, each returning Result<T> so main() can stop at the first failure
// ---------------------------------------------------------------------------

Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return AkinError{AkinError::InvalidArg,
                    "missing value for " + flag, "see --help"};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
        } else if (arg == "-o" || arg == "--output") {
            auto v = next_value(arg);
            AKIN_TRY(v);
            args.output = v.value();
        } else if (arg == "-c" || arg == "--config") {
            auto v = next_value(arg);
            AKIN_TRY(v);
            args.config_path = v.value();
        } else if (arg == "--spacing") {
            auto v = next_value(arg);
            AKIN_TRY(v);
            auto s = parse_spacing(v.value());
            AKIN_TRY(s);
            args.spacing = s.value();
        } else if (arg == "--log-level") {
            auto v = next_value(arg);
            AKIN_TRY(v);
            auto lvl = log::parse_level(v.value());
            AKIN_TRY(lvl);
            args.log_level = lvl.value();
        } else if (arg == "--no-interpolate") {
            args.no_interpolate = true;
        } else if (arg == "--no-color") {
            args.no_color = true;
        } else if (arg == "--check") {
            args.check = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return AkinError{AkinError::InvalidArg,
                "unknown option '" + arg + "'", "see --help"};
        } else if (args.input.empty()) {
            args.input = arg;
        } else {
            return AkinError{AkinError::InvalidArg,
                "more than one input given ('" + args.input + "' and '" + arg + "')",
                "akin-render expands one template per run"};
        }
    }

    if (!args.help && args.input.empty()) {
        return AkinError{AkinError::InvalidArg,
            "no input file specified",
            "usage: akin-render [options] <file|->"};
    }
    return Result<CliArgs>::ok(std::move(args));
}

// Global and project layers are optional; an explicit --config must exist.
Result<Config> load_config(const CliArgs& args) {
    std::optional<Config> global, project, explicit_file;

    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        log::debug("loading global config %s", global_path.c_str());
        auto c = Config::load(global_path);
        AKIN_TRY(c);
        global = std::move(c).value();
    }

    std::string project_path = project_config_path(fs::current_path().string());
    if (fs::exists(project_path)) {
        log::debug("loading project config %s", project_path.c_str());
        auto c = Config::load(project_path);
        AKIN_TRY(c);
        project = std::move(c).value();
    }

    if (!args.config_path.empty()) {
        log::debug("loading config %s", args.config_path.c_str());
        auto c = Config::load(args.config_path);
        AKIN_TRY(c);
        explicit_file = std::move(c).value();
    }

    Config cfg = Config::effective(global, project, explicit_file);

    // Command-line flags are the last layer
    if (args.spacing) cfg.render.spacing = *args.spacing;
    if (args.no_interpolate) cfg.render.interpolate_strings = false;
    if (args.log_level) cfg.log_level = *args.log_level;
    if (args.no_color) {
        cfg.log_color = false;
        cfg.log_color_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

Result<std::string> read_input(const std::string& path) {
    std::ostringstream buf;
    if (path == "-") {
        buf << std::cin.rdbuf();
        return Result<std::string>::ok(buf.str());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return AkinError{AkinError::IO,
            "could not open file: " + path,
            "check the path and file permissions"};
    }
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

Status write_output(const std::string& path, const std::string& text) {
    if (path.empty() || path == "-") {
        std::cout << text << "\n";
        return ok_status();
    }
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        return AkinError{AkinError::IO, "could not write file: " + path};
    }
    out << text << "\n";
    if (!out) {
        return AkinError{AkinError::IO, "write failed: " + path};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }
    if (args.value().help) {
        std::cout << kUsage;
        return 0;
    }

    auto cfg = load_config(args.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    log::set_level(cfg.value().log_level);
    if (cfg.value().log_color_set) log::set_color_enabled(cfg.value().log_color);

    const std::string& input = args.value().input;
    std::string display_name = (input == "-") ? "<stdin>" : input;

    auto source = read_input(input);
    if (source.is_err()) {
        std::cerr << source.error().format() << "\n";
        return 2;
    }
    log::debug("read %s (%zu bytes)", display_name.c_str(), source.value().size());

    auto out = render(source.value(), display_name, cfg.value().render);
    if (out.is_err()) {
        std::cerr << out.error().format_with_source(source.value()) << "\n";
        return 1;
    }

    if (args.value().check) {
        log::info("%s: ok (%zu bytes of output)", display_name.c_str(),
                  out.value().size());
        return 0;
    }

    auto written = write_output(args.value().output, out.value());
    if (written.is_err()) {
        std::cerr << written.error().format() << "\n";
        return 2;
    }
    return 0;
}
