#include <ruleguard/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ruleguard {

namespace {

RuleguardError config_error(const std::string& origin, const std::string& msg,
                            const std::string& hint = "") {
    return RuleguardError{RuleguardError::Config, msg, hint, origin, 0};
}

Result<Severity> read_severity(const std::string& origin, const std::string& rule,
                               const toml::node& node) {
    auto s = node.value<std::string>();
    if (!s) {
        return config_error(origin, "rule '" + rule + "': severity must be a string");
    }
    auto sev = parse_severity(*s);
    if (!sev) {
        return config_error(origin, "rule '" + rule + "': unknown severity '" + *s + "'",
                            "use one of: off, warn, error");
    }
    return Result<Severity>::ok(*sev);
}

Status read_scalar(const std::string& origin, const std::string& rule,
                   const std::string& key, const toml::node& node, RuleOptions& out) {
    if (auto b = node.value_exact<bool>()) {
        out.fields[key] = *b;
    } else if (auto i = node.value_exact<int64_t>()) {
        out.fields[key] = *i;
    } else if (auto s = node.value_exact<std::string>()) {
        out.fields[key] = *s;
    } else {
        return config_error(origin, "rule '" + rule + "': option '" + key +
                            "' must be a boolean, integer or string");
    }
    return ok_status();
}

// The option part of a rule entry: bare integer or inline table
Status read_options(const std::string& origin, const std::string& rule,
                    const toml::node& node, RuleOptions& out) {
    if (auto i = node.value_exact<int64_t>()) {
        out.bare = *i;
        return ok_status();
    }
    if (auto tbl = node.as_table()) {
        for (const auto& [key, val] : *tbl) {
            RULEGUARD_TRY(read_scalar(origin, rule, std::string(key.str()), val, out));
        }
        return ok_status();
    }
    return config_error(origin, "rule '" + rule + "': options must be an integer or a table");
}

Result<RuleSetting> read_rule(const std::string& origin, const std::string& rule,
                              const toml::node& node) {
    RuleSetting setting;

    if (node.is_string()) {
        RULEGUARD_TRY_ASSIGN(sev, read_severity(origin, rule, node));
        setting.severity = sev;
    } else if (node.is_integer()) {
        RULEGUARD_TRY(read_options(origin, rule, node, setting.options));
    } else if (auto arr = node.as_array()) {
        if (arr->empty() || arr->size() > 2) {
            return config_error(origin, "rule '" + rule +
                                "': expected [severity] or [severity, options]");
        }
        RULEGUARD_TRY_ASSIGN(sev, read_severity(origin, rule, *arr->get(0)));
        setting.severity = sev;
        if (arr->size() == 2) {
            RULEGUARD_TRY(read_options(origin, rule, *arr->get(1), setting.options));
        }
    } else if (auto tbl = node.as_table()) {
        for (const auto& [key, val] : *tbl) {
            std::string k(key.str());
            if (k == "severity") {
                RULEGUARD_TRY_ASSIGN(sev, read_severity(origin, rule, val));
                setting.severity = sev;
            } else {
                RULEGUARD_TRY(read_scalar(origin, rule, k, val, setting.options));
            }
        }
    } else {
        return config_error(origin, "rule '" + rule +
                            "': expected a severity, an integer, an array or a table");
    }

    return Result<RuleSetting>::ok(std::move(setting));
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        return RuleguardError{RuleguardError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(begin.line), static_cast<int>(begin.column)};
    }

    Config cfg;

    // [rules] section
    if (auto rules = doc["rules"].as_table()) {
        for (const auto& [key, val] : *rules) {
            std::string id(key.str());
            RULEGUARD_TRY_ASSIGN(setting, read_rule(origin, id, val));
            cfg.rules[id] = std::move(setting);
        }
    } else if (doc.contains("rules")) {
        return config_error(origin, "'rules' must be a table");
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RuleguardError{RuleguardError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    for (const auto& [id, setting] : other.rules) {
        rules[id] = setting;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ruleguard/config.toml";
}

std::optional<std::string> find_project_config(const std::string& start_dir) {
    std::error_code ec;
    fs::path dir = fs::absolute(start_dir, ec);
    if (ec) return std::nullopt;
    while (true) {
        fs::path candidate = dir / kProjectConfigName;
        if (fs::is_regular_file(candidate, ec)) return candidate.string();
        if (!dir.has_parent_path() || dir.parent_path() == dir) break;
        dir = dir.parent_path();
    }
    return std::nullopt;
}

} // namespace ruleguard
