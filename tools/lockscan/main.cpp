/**
 * lockscan - pnpm lock file audit
 *
 * Checks whether packages (optionally pinned to versions) appear anywhere in
 * a pnpm-lock.yaml, either for one package or for a batch advisory list.
 */

#include <CLI/CLI.hpp>

#include <lockscan/audit.hpp>
#include <lockscan/config.hpp>
#include <lockscan/expectations.hpp>
#include <lockscan/lockfile.hpp>
#include <lockscan/log.hpp>
#include <lockscan/report.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifndef LOCKSCAN_VERSION
#define LOCKSCAN_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;
using namespace lockscan;

namespace {

struct CliOptions {
    std::string package;
    std::string version;
    std::string lockfile;
    std::string batch;
    std::string output;
    std::string config_path;
    std::string log_level;
    bool verbose = false;
    bool no_color = false;
    unsigned jobs = 1;
};

Result<std::string> read_file(const std::string& path, const char* what) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ScanError{ScanError::IO,
            std::string("cannot read ") + what + ": " + path,
            fs::exists(path) ? "check file permissions"
                             : "double-check the path and try again"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

Status write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ScanError{ScanError::IO, "cannot create report file: " + path};
    }
    out << content;
    if (!out) {
        return ScanError{ScanError::IO, "failed writing report file: " + path};
    }
    return ok_status();
}

// global -> project (or --config) layers
Result<Config> load_config(const std::string& explicit_path) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(cfg).value();
    }

    std::optional<Config> project;
    std::string project_path = explicit_path.empty() ? kProjectConfigFile : explicit_path;
    if (!explicit_path.empty() || fs::exists(project_path)) {
        auto cfg = Config::load(project_path);
        if (cfg.is_err()) return std::move(cfg).error();
        log::debug("loaded project config %s", project_path.c_str());
        project = std::move(cfg).value();
    }

    return Result<Config>::ok(Config::effective(global, project));
}

Result<LockModel> load_lockfile(const std::string& path) {
    auto text = read_file(path, "lock file");
    if (text.is_err()) return std::move(text).error();

    auto model = LockModel::parse(text.value());
    if (model.is_err()) {
        return std::move(model.error().in_file(path));
    }
    for (const auto& key : model.value().skipped_keys()) {
        log::debug("%s:%d: not indexed: %s", path.c_str(), key.line,
                   key.reason.c_str());
    }
    log::debug("indexed %zu occurrences of %zu packages (lockfile version %s)",
               model.value().size(), model.value().package_names().size(),
               model.value().lockfile_version().c_str());
    return model;
}

int run_single(const ScanSettings& settings, const CliOptions& cli,
               const LockModel& model) {
    AuditEngine engine(model);
    std::optional<std::string> version;
    if (!cli.version.empty()) version = cli.version;

    auto result = engine.query(cli.package, version);

    ReportOptions ropts;
    ropts.verbose = settings.verbose;
    ropts.lockfile_version = model.lockfile_version();
    std::cout << render_console(result, ropts);

    return result.status == AuditStatus::Found ? 0 : 1;
}

int run_batch(const ScanSettings& settings, const CliOptions& cli,
              const LockModel& model) {
    auto text = read_file(cli.batch, "batch file");
    if (text.is_err()) {
        log::error("%s", text.error().format().c_str());
        return 1;
    }

    auto parsed = parse_expectations(text.value());
    if (parsed.is_err()) {
        log::error("%s", parsed.error().in_file(cli.batch).format().c_str());
        return 1;
    }
    const auto& list = parsed.value();
    log::debug("batch format: %s, %zu packages", format_name(list.format),
               list.packages.size());
    for (const auto& row : list.skipped) {
        log::warn("%s:%d: skipped row (%s)", cli.batch.c_str(), row.line,
                  row.reason.c_str());
    }
    if (!list.skipped.empty()) {
        log::warn("%zu malformed row(s) skipped", list.skipped.size());
    }

    AuditEngine engine(model);
    AuditOptions aopts;
    aopts.jobs = settings.jobs;
    auto run = engine.run(list.packages, aopts);

    ReportOptions ropts;
    ropts.verbose = settings.verbose;
    ropts.lockfile_version = model.lockfile_version();
    std::cout << render_console(run, ropts);

    if (!settings.output.empty()) {
        auto written = write_file(settings.output, render_tsv(run));
        if (written.is_err()) {
            log::error("%s", written.error().format().c_str());
            return 1;
        }
        log::info("report written to %s", settings.output.c_str());
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"lockscan - check pnpm-lock.yaml for specific packages and versions"};
    app.set_version_flag("-V,--version", LOCKSCAN_VERSION);

    CliOptions cli;
    app.add_option("package", cli.package,
                   "Package to look for (e.g. antd or @ant-design/icons)");
    app.add_option("version", cli.version,
                   "Version or version prefix (any version when omitted)");
    auto* file_opt = app.add_option("-f,--file", cli.lockfile, "Path to pnpm-lock.yaml");
    app.add_option("-b,--batch", cli.batch, "Batch mode: advisory package list file");
    auto* output_opt = app.add_option("-o,--output", cli.output,
                                      "Write a TSV report (batch mode)");
    auto* verbose_opt = app.add_flag("-v,--verbose", cli.verbose, "Show detailed information");
    auto* jobs_opt = app.add_option("-j,--jobs", cli.jobs,
                                    "Worker threads for batch mode (0 = all cores)");
    app.add_flag("--no-color", cli.no_color, "Disable colored log output");
    app.add_option("--config", cli.config_path, "Config file (default: .lockscan.toml)");
    app.add_option("--log-level", cli.log_level, "trace, debug, info, warn or error");

    CLI11_PARSE(app, argc, argv);

    if (!cli.log_level.empty()) {
        auto lvl = log::parse_level(cli.log_level);
        if (lvl.is_err()) {
            log::error("%s", lvl.error().format().c_str());
            return 1;
        }
        log::set_level(lvl.value());
    }

    auto config = load_config(cli.config_path);
    if (config.is_err()) {
        log::error("%s", config.error().format().c_str());
        return 1;
    }

    // Command line overrides configuration
    ScanSettings settings = config.value().scan;
    if (file_opt->count() > 0) settings.lockfile = cli.lockfile;
    if (output_opt->count() > 0) settings.output = cli.output;
    if (verbose_opt->count() > 0) settings.verbose = cli.verbose;
    if (jobs_opt->count() > 0) settings.jobs = cli.jobs;
    if (cli.no_color) settings.color = false;

    if (settings.color.has_value()) log::set_color_enabled(*settings.color);
    if (cli.log_level.empty() && settings.log_level.has_value()) {
        log::set_level(*settings.log_level);
    }

    if (cli.batch.empty() && cli.package.empty()) {
        ScanError err{ScanError::InvalidArg,
            "no package name given",
            "pass a package name, or use -b/--batch with a package list"};
        log::error("%s", err.format().c_str());
        return 1;
    }

    auto model = load_lockfile(settings.lockfile);
    if (model.is_err()) {
        log::error("%s", model.error().format().c_str());
        return 1;
    }

    if (!cli.batch.empty()) {
        return run_batch(settings, cli, model.value());
    }
    return run_single(settings, cli, model.value());
}
