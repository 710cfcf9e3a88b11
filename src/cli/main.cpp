// ruleguard command line driver
//
//     ruleguard [options] <file>...
//
// Configuration comes from --config when given, otherwise from
// ~/.ruleguard/config.toml overlaid with the nearest .ruleguard.toml.

#include <ruleguard/config.hpp>
#include <ruleguard/linter.hpp>
#include <ruleguard/log.hpp>
#include <ruleguard/report.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ruleguard;

namespace {

constexpr int kExitClean = 0;
constexpr int kExitViolations = 1;
constexpr int kExitFailure = 2;

const char* const kUsage =
    "usage: ruleguard [options] <file>...\n"
    "\n"
    "options:\n"
    "  -c, --config <file>  use this config file instead of discovery\n"
    "  -v, --verbose        debug logging\n"
    "  -q, --quiet          report errors only, hide warnings\n"
    "      --no-color       disable colored log output\n"
    "      --list-rules     print the available rules and exit\n"
    "  -h, --help           show this help\n";

struct CliOptions {
    std::string config_path;
    std::vector<std::string> files;
    bool verbose = false;
    bool quiet = false;
    bool no_color = false;
    bool list_rules = false;
    bool help = false;
};

Result<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                return RuleguardError{RuleguardError::InvalidArg,
                    arg + " requires a file argument", "usage: ruleguard --config <file> <file>..."};
            }
            opts.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg == "--list-rules") {
            opts.list_rules = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return RuleguardError{RuleguardError::InvalidArg,
                "unknown option: " + arg, "run ruleguard --help for usage"};
        } else {
            opts.files.push_back(arg);
        }
    }
    if (!opts.help && !opts.list_rules && opts.files.empty()) {
        return RuleguardError{RuleguardError::InvalidArg,
            "no input files", "usage: ruleguard [options] <file>..."};
    }
    return Result<CliOptions>::ok(std::move(opts));
}

Result<Config> load_config(const CliOptions& opts) {
    if (!opts.config_path.empty()) {
        log::debug("using config %s", opts.config_path.c_str());
        return Config::load(opts.config_path);
    }

    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::is_regular_file(global_path, ec)) {
        RULEGUARD_TRY_ASSIGN(cfg, Config::load(global_path));
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(cfg);
    }

    std::optional<Config> project;
    if (auto path = find_project_config(".")) {
        RULEGUARD_TRY_ASSIGN(cfg, Config::load(*path));
        log::debug("loaded project config %s", path->c_str());
        project = std::move(cfg);
    }

    if (!global && !project) {
        log::warn("no %s found; every rule is off", kProjectConfigName);
    }
    return Result<Config>::ok(Config::effective(global, project));
}

void print_rules() {
    for (const auto& rule : builtin_rules()) {
        std::cout << rule.meta.id << "  " << rule.meta.description
                  << " (" << rule.meta.category << ")\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        log::error("%s", args.error().format().c_str());
        return kExitFailure;
    }
    const CliOptions& opts = args.value();

    if (opts.help) {
        std::cout << kUsage;
        return kExitClean;
    }
    if (opts.no_color) log::set_color_enabled(false);
    if (const char* level = std::getenv("RULEGUARD_LOG")) {
        log::set_level(log::parse_level(level));
    }
    if (opts.verbose) log::set_level(log::Debug);
    if (opts.list_rules) {
        print_rules();
        return kExitClean;
    }

    auto config = load_config(opts);
    if (config.is_err()) {
        log::error("%s", config.error().format().c_str());
        return kExitFailure;
    }

    auto linter = Linter::create(config.value());
    if (linter.is_err()) {
        log::error("%s", linter.error().format().c_str());
        return kExitFailure;
    }

    bool had_failure = false;
    size_t errors = 0;
    size_t warnings = 0;
    for (const auto& file : opts.files) {
        auto result = linter.value().lint_file(file);
        if (result.is_err()) {
            log::error("%s", result.error().format().c_str());
            had_failure = true;
            continue;
        }
        for (const auto& v : result.value().violations) {
            if (opts.quiet && v.severity != Severity::Error) continue;
            std::cout << format_violation(file, v) << "\n";
        }
        errors += result.value().error_count();
        if (!opts.quiet) warnings += result.value().warning_count();
    }

    if (errors + warnings > 0 || !opts.quiet) {
        std::cout << format_summary(errors, warnings) << "\n";
    }

    if (had_failure) return kExitFailure;
    return errors > 0 ? kExitViolations : kExitClean;
}
