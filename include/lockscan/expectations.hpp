#pragma once

#include <lockscan/result.hpp>
#include <lockscan/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lockscan {

// Tab-separated advisory lists accepted as batch input
enum class BatchFormat {
    StandardList,    // Row | Package Name | Version(s)
    SecurityReport,  // Package Name | Compromised Version(s) | Detection Date | Status
};

const char* format_name(BatchFormat f);

// One package the audit should look for
struct ExpectedPackage {
    std::string name;
    std::vector<VersionSpec> versions;           // empty: any version
    std::optional<std::string> original_status;  // security reports only
    std::optional<std::string> detection_date;   // security reports only

    // Expectation for a single command-line query
    static ExpectedPackage single(std::string name,
                                  std::optional<std::string> version = std::nullopt);
};

// A batch row that could not be used; the rest of the batch still runs
struct SkippedRow {
    int line = 0;  // 1-based, counting the header
    std::string reason;
    std::string text;
};

struct ExpectationList {
    BatchFormat format = BatchFormat::StandardList;
    std::vector<ExpectedPackage> packages;
    std::vector<SkippedRow> skipped;
};

// Detect the layout from the header line. Fails with ScanError::Format.
Result<BatchFormat> detect_format(const std::string& header);

// Parse batch text. Only an unrecognized (or missing) header is fatal;
// malformed rows are collected in `skipped`.
Result<ExpectationList> parse_expectations(const std::string& text);

// "1.0.0, 1.0.1*, 2.0" -> {"1.0.0", "1.0.1", "2.0"}
std::vector<VersionSpec> parse_version_list(const std::string& cell);

} // namespace lockscan
