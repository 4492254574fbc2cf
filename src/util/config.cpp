#include <lockscan/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace lockscan {

static ScanError type_error(const std::string& key, const char* expected) {
    std::string full = key.empty() ? "scan" : "scan." + key;
    return ScanError{ScanError::Config,
        "config key '" + full + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScanError{ScanError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    auto scan = doc["scan"].as_table();
    if (!scan) {
        if (doc.contains("scan")) return type_error("", "a table");
        return Result<Config>::ok(std::move(cfg));
    }

    if (auto node = (*scan)["lockfile"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("lockfile", "a string");
        cfg.scan.lockfile = *v;
        cfg.lockfile_set = true;
    }

    if (auto node = (*scan)["output"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("output", "a string");
        cfg.scan.output = *v;
        cfg.output_set = true;
    }

    if (auto node = (*scan)["verbose"]) {
        auto v = node.value<bool>();
        if (!v) return type_error("verbose", "a boolean");
        cfg.scan.verbose = *v;
        cfg.verbose_set = true;
    }

    if (auto node = (*scan)["jobs"]) {
        auto v = node.value<int64_t>();
        if (!v) return type_error("jobs", "an integer");
        if (*v < 1 || *v > 1024) {
            return ScanError{ScanError::Config,
                "config key 'scan.jobs' out of range: " + std::to_string(*v),
                "use a value between 1 and 1024"};
        }
        cfg.scan.jobs = static_cast<unsigned>(*v);
        cfg.jobs_set = true;
    }

    if (auto node = (*scan)["color"]) {
        auto v = node.value<bool>();
        if (!v) return type_error("color", "a boolean");
        cfg.scan.color = *v;
    }

    if (auto node = (*scan)["log-level"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("log-level", "a string");
        auto lvl = log::parse_level(*v);
        if (lvl.is_err()) {
            auto err = std::move(lvl).error();
            err.code = ScanError::Config;
            return err;
        }
        cfg.scan.log_level = lvl.value();
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScanError{ScanError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().in_file(path);
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.lockfile_set) {
        scan.lockfile = other.scan.lockfile;
        lockfile_set = true;
    }
    if (other.output_set) {
        scan.output = other.scan.output;
        output_set = true;
    }
    if (other.verbose_set) {
        scan.verbose = other.scan.verbose;
        verbose_set = true;
    }
    if (other.jobs_set) {
        scan.jobs = other.scan.jobs;
        jobs_set = true;
    }
    if (other.scan.color.has_value()) scan.color = other.scan.color;
    if (other.scan.log_level.has_value()) scan.log_level = other.scan.log_level;
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
    return std::string(home) + "/.lockscan/config.toml";
}

} // namespace lockscan
