#pragma once

#include <lockscan/audit.hpp>
#include <string>

namespace lockscan {

struct ReportOptions {
    bool verbose = false;
    std::string lockfile_version;  // printed in verbose headers when set
};

// Console text for a single query
std::string render_console(const AuditResult& result, const ReportOptions& opts = {});

// Console text for a batch run, per-package blocks followed by the counters
std::string render_console(const AuditRun& run, const ReportOptions& opts = {});

std::string render_summary(const Counters& counters);

// Seven tab-separated columns, header first, one row per expectation:
// Package Name, Status, Expected Versions, Found Versions, Locations,
// Original Status, Detection Date
std::string render_tsv(const AuditRun& run);

// Replace tabs and line breaks with a single space
std::string tsv_field(const std::string& value);

} // namespace lockscan
