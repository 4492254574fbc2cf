#pragma once

#include <lockscan/result.hpp>
#include <lockscan/log.hpp>
#include <string>
#include <optional>

namespace lockscan {

// [scan] section of config.toml / .lockscan.toml
struct ScanSettings {
    std::string lockfile = "pnpm-lock.yaml";
    std::string output;               // TSV report path, empty = none
    bool verbose = false;
    unsigned jobs = 1;
    std::optional<bool> color;        // unset: decide from the terminal
    std::optional<log::Level> log_level;
};

// Layered configuration: global then project.
// Later layers override only the keys they set explicitly.
struct Config {
    ScanSettings scan;
    // Track which scalar fields were explicitly set (for merge)
    bool lockfile_set = false;
    bool output_set = false;
    bool verbose_set = false;
    bool jobs_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);
};

// ~/.lockscan/config.toml, empty if no home directory is known
std::string global_config_path();

// Looked up in the working directory
constexpr const char* kProjectConfigFile = ".lockscan.toml";

} // namespace lockscan
