#pragma once

#include <depwatch/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace depwatch {

struct EngineOptions;

// [scan]
struct ScanConfig {
    std::string lister = "source";   // "source" or "go-list"
    std::string go_binary = "go";
    bool test_imports = false;
    int timeout_seconds = 0;         // go list only, 0 = no timeout
    std::vector<std::string> skip_dirs;
};

// [resolve]
struct ResolveConfig {
    bool basename_fallback = true;
};

// [log]
struct LogConfig {
    std::string level = "info";
    std::optional<bool> color;       // unset: auto-detect from the terminal
};

// Layered configuration: global (~/.depwatch/config.toml) < project
// (<root>/depwatch.toml). Later layers override only what they set.
struct Config {
    ScanConfig scan;
    ResolveConfig resolve;
    LogConfig logging;

    // Track which fields were explicitly set (for merge)
    bool scan_lister_set = false;
    bool scan_go_binary_set = false;
    bool scan_test_imports_set = false;
    bool scan_timeout_set = false;
    bool resolve_basename_fallback_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string. Unknown keys are ignored; known keys with bad
    // values are a Config error.
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win,
    // skip-dirs accumulate)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Load every layer that exists for a project rooted at `root`.
    static Result<Config> discover(const std::filesystem::path& root);

    EngineOptions engine_options() const;

    // Push [log] settings into depwatch::log.
    void apply_logging() const;
};

// ~/.depwatch/config.toml, or "" when no home directory is known
std::string global_config_path();

// <root>/depwatch.toml
std::filesystem::path project_config_path(const std::filesystem::path& root);

} // namespace depwatch
