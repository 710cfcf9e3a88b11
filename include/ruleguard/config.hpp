#pragma once

#include <ruleguard/result.hpp>
#include <ruleguard/rule.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace ruleguard {

// Configured state of one rule
struct RuleSetting {
    Severity severity = Severity::Error;
    RuleOptions options;
};

// Layered configuration: global, then project. Later layers replace a
// rule's setting wholesale. Rules that appear in no layer are off.
struct Config {
    std::unordered_map<std::string, RuleSetting> rules;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string. A [rules] entry is one of:
    //   max-lines = "warn"                      severity only
    //   max-lines = 200                         error, bare integer option
    //   max-lines = ["warn", 200]               severity + option
    //   max-lines = ["warn", { max = 200 }]
    //   [rules.max-lines] severity = "warn", max = 200, ...
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<config>");

    // Merge another config on top (other's rules override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

inline constexpr const char* kProjectConfigName = ".ruleguard.toml";

// ~/.ruleguard/config.toml, or empty when HOME is unset
std::string global_config_path();

// Nearest .ruleguard.toml in `start_dir` or one of its parents
std::optional<std::string> find_project_config(const std::string& start_dir);

} // namespace ruleguard
