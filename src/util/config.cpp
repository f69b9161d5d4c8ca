#include <depwatch/config.hpp>
#include <depwatch/engine.hpp>
#include <depwatch/log.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace depwatch {

namespace fs = std::filesystem;

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DepwatchError{DepwatchError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        if (auto v = (*scan)["lister"].value<std::string>()) {
            if (*v != "source" && *v != "go-list") {
                return DepwatchError{DepwatchError::Config,
                    "invalid scan.lister '" + *v + "'",
                    "expected \"source\" or \"go-list\""};
            }
            cfg.scan.lister = *v;
            cfg.scan_lister_set = true;
        }
        if (auto v = (*scan)["go"].value<std::string>()) {
            cfg.scan.go_binary = *v;
            cfg.scan_go_binary_set = true;
        }
        if (auto v = (*scan)["test-imports"].value<bool>()) {
            cfg.scan.test_imports = *v;
            cfg.scan_test_imports_set = true;
        }
        if (auto v = (*scan)["timeout-seconds"].value<int64_t>()) {
            if (*v < 0) {
                return DepwatchError{DepwatchError::Config,
                    "scan.timeout-seconds cannot be negative",
                    "use 0 to wait for the lister indefinitely"};
            }
            cfg.scan.timeout_seconds = static_cast<int>(*v);
            cfg.scan_timeout_set = true;
        }
        if (auto dirs = (*scan)["skip-dirs"].as_array()) {
            for (const auto& d : *dirs) {
                if (auto s = d.value<std::string>()) {
                    cfg.scan.skip_dirs.push_back(*s);
                }
            }
        }
    }

    // [resolve] section
    if (auto resolve = doc["resolve"].as_table()) {
        if (auto v = (*resolve)["basename-fallback"].value<bool>()) {
            cfg.resolve.basename_fallback = *v;
            cfg.resolve_basename_fallback_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            log::Level parsed;
            if (!log::parse_level(*v, parsed)) {
                return DepwatchError{DepwatchError::Config,
                    "invalid log.level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.logging.level = *v;
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DepwatchError{DepwatchError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.scan_lister_set) {
        scan.lister = other.scan.lister;
        scan_lister_set = true;
    }
    if (other.scan_go_binary_set) {
        scan.go_binary = other.scan.go_binary;
        scan_go_binary_set = true;
    }
    if (other.scan_test_imports_set) {
        scan.test_imports = other.scan.test_imports;
        scan_test_imports_set = true;
    }
    if (other.scan_timeout_set) {
        scan.timeout_seconds = other.scan.timeout_seconds;
        scan_timeout_set = true;
    }
    for (const auto& d : other.scan.skip_dirs) {
        if (std::find(scan.skip_dirs.begin(), scan.skip_dirs.end(), d) == scan.skip_dirs.end()) {
            scan.skip_dirs.push_back(d);
        }
    }

    if (other.resolve_basename_fallback_set) {
        resolve.basename_fallback = other.resolve.basename_fallback;
        resolve_basename_fallback_set = true;
    }

    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.logging.color.has_value()) {
        logging.color = other.logging.color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    return result;
}

Result<Config> Config::discover(const fs::path& root) {
    std::optional<Config> global, project;
    std::error_code ec;

    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        global = std::move(cfg).value();
    }

    fs::path project_path = project_config_path(root);
    if (fs::exists(project_path, ec)) {
        auto cfg = Config::load(project_path.string());
        if (cfg.is_err()) return std::move(cfg).error();
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

EngineOptions Config::engine_options() const {
    EngineOptions opts;
    opts.test_imports = scan.test_imports;
    opts.basename_fallback = resolve.basename_fallback;
    return opts;
}

void Config::apply_logging() const {
    log::Level lvl = log::Info;
    if (log::parse_level(logging.level, lvl)) {
        log::set_level(lvl);
    }
    if (logging.color.has_value()) {
        log::set_color_enabled(*logging.color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.depwatch/config.toml";
}

fs::path project_config_path(const fs::path& root) {
    return root / "depwatch.toml";
}

} // namespace depwatch
