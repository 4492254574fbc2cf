#include <lockscan/report.hpp>
#include <sstream>

namespace lockscan {

static const char* const kTsvHeader[] = {
    "Package Name",
    "Status",
    "Expected Versions",
    "Found Versions",
    "Locations",
    "Original Status",
    "Detection Date",
};

static const char* status_marker(AuditStatus s) {
    switch (s) {
    case AuditStatus::Found:           return "[found]   ";
    case AuditStatus::PartialMatch:    return "[partial] ";
    case AuditStatus::VersionMismatch: return "[mismatch]";
    case AuditStatus::NotFound:        return "[missing] ";
    }
    return "[?]       ";
}

static std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

static std::string expected_text(const ExpectedPackage& pkg) {
    return pkg.versions.empty() ? "any version" : join(pkg.versions, ", ");
}

static void write_occurrence(std::ostringstream& out, const LockOccurrence& occ,
                             bool verbose) {
    if (verbose) {
        out << "    section:   " << section_name(occ.section) << "\n";
        out << "    context:   " << occ.context << "\n";
        if (!occ.specifier.empty()) {
            out << "    specifier: " << occ.specifier << "\n";
        }
        out << "    version:   " << occ.version << "\n\n";
    } else {
        out << "  - " << occ.context << " @ " << occ.version << "\n";
    }
}

// ---------------------------------------------------------------------------
// Console
// ---------------------------------------------------------------------------

std::string render_console(const AuditResult& result, const ReportOptions& opts) {
    std::ostringstream out;
    const auto& name = result.expected.name;

    if (opts.verbose) {
        if (!opts.lockfile_version.empty()) {
            out << "lockfile version: " << opts.lockfile_version << "\n";
        }
        out << "package: " << name << "\n";
        if (!result.expected.versions.empty()) {
            out << "version: " << expected_text(result.expected) << "\n";
        }
        out << "---\n";
    }

    switch (result.status) {
    case AuditStatus::NotFound:
        out << "not found: " << name << "\n";
        break;

    case AuditStatus::VersionMismatch:
        out << "version mismatch: " << name << "\n";
        out << "  expected: " << expected_text(result.expected) << "\n";
        out << "  found:\n";
        for (const auto& occ : result.occurrences) {
            write_occurrence(out, occ, opts.verbose);
        }
        break;

    case AuditStatus::Found:
    case AuditStatus::PartialMatch:
        out << (result.status == AuditStatus::Found ? "found: " : "partial match: ")
            << name;
        if (!result.expected.versions.empty()) {
            out << " @ " << expected_text(result.expected);
        }
        out << "\n";
        for (const auto& occ : result.matched) {
            write_occurrence(out, occ, opts.verbose);
        }
        break;
    }

    return out.str();
}

std::string render_console(const AuditRun& run, const ReportOptions& opts) {
    std::ostringstream out;

    if (opts.verbose) {
        if (!opts.lockfile_version.empty()) {
            out << "lockfile version: " << opts.lockfile_version << "\n";
        }
        out << "batch audit: " << run.results.size() << " packages\n";
        out << "---\n";
    }

    out << "Batch audit results:\n\n";
    for (const auto& r : run.results) {
        out << status_marker(r.status) << " " << r.expected.name << "\n";

        if (!opts.verbose && r.status == AuditStatus::Found) continue;

        out << "  expected: " << expected_text(r.expected) << "\n";
        if (r.status != AuditStatus::NotFound) {
            out << "  found:\n";
            for (const auto& occ : r.occurrences) {
                write_occurrence(out, occ, opts.verbose);
            }
        }
        if (r.expected.original_status && !r.expected.original_status->empty()) {
            out << "  status:   " << *r.expected.original_status << "\n";
        }
        if (r.expected.detection_date && !r.expected.detection_date->empty()) {
            out << "  detected: " << *r.expected.detection_date << "\n";
        }
        out << "\n";
    }

    out << render_summary(run.counters);
    return out.str();
}

std::string render_summary(const Counters& counters) {
    std::ostringstream out;
    out << "Summary:\n";
    out << "  total:            " << counters.total << "\n";
    out << "  found:            " << counters.found << "\n";
    out << "  partial match:    " << counters.partial << "\n";
    out << "  version mismatch: " << counters.mismatch << "\n";
    out << "  not found:        " << counters.not_found << "\n";
    return out.str();
}

// ---------------------------------------------------------------------------
// TSV
// ---------------------------------------------------------------------------

std::string tsv_field(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '\r' && i + 1 < value.size() && value[i + 1] == '\n') {
            continue;  // CRLF collapses to one space
        }
        out += (c == '\t' || c == '\n' || c == '\r') ? ' ' : c;
    }
    return out;
}

std::string render_tsv(const AuditRun& run) {
    std::ostringstream out;

    for (size_t i = 0; i < 7; ++i) {
        if (i > 0) out << '\t';
        out << kTsvHeader[i];
    }
    out << '\n';

    for (const auto& r : run.results) {
        const auto& pkg = r.expected;

        std::vector<std::string> locations;
        for (const auto& occ : r.occurrences) {
            locations.push_back(occ.context);
        }
        auto found = r.found_versions();

        std::string cells[7] = {
            pkg.name,
            status_label(r.status),
            pkg.versions.empty() ? "Any" : join(pkg.versions, ", "),
            found.empty() ? "None" : join(found, ", "),
            locations.empty() ? "None" : join(locations, "; "),
            pkg.original_status.value_or(""),
            pkg.detection_date.value_or(""),
        };

        for (size_t i = 0; i < 7; ++i) {
            if (i > 0) out << '\t';
            out << tsv_field(cells[i]);
        }
        out << '\n';
    }

    return out.str();
}

} // namespace lockscan
