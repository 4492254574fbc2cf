#pragma once

#include <lockscan/expectations.hpp>
#include <lockscan/lockfile.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lockscan {

enum class AuditStatus {
    Found,            // present, every expected version seen
    PartialMatch,     // present, some expected versions seen
    VersionMismatch,  // present, none of the expected versions seen
    NotFound,         // name absent from every section
};

// "Found", "Partial Match", "Version Mismatch", "Not Found"
const char* status_label(AuditStatus s);

struct AuditResult {
    ExpectedPackage expected;
    AuditStatus status = AuditStatus::NotFound;
    std::vector<LockOccurrence> matched;      // occurrences satisfying a spec
    std::vector<LockOccurrence> occurrences;  // every occurrence of the name

    // Distinct versions across all occurrences, in discovery order
    std::vector<std::string> found_versions() const;
};

struct Counters {
    size_t total = 0;
    size_t found = 0;
    size_t partial = 0;
    size_t mismatch = 0;
    size_t not_found = 0;

    void tally(AuditStatus s);
    bool consistent() const {
        return found + partial + mismatch + not_found == total;
    }
};

// Results in the order the expectations were given
struct AuditRun {
    std::vector<AuditResult> results;
    Counters counters;
};

struct AuditOptions {
    unsigned jobs = 1;  // worker threads for batch runs; 0 means hardware concurrency
};

class AuditEngine {
public:
    explicit AuditEngine(const LockModel& model);

    // Single query; `version` is matched with the same exact-or-prefix rule
    AuditResult query(const std::string& name,
                      const std::optional<std::string>& version = std::nullopt) const;

    // Classify one expectation against the lock model
    AuditResult evaluate(const ExpectedPackage& expected) const;

    AuditRun run(const std::vector<ExpectedPackage>& expectations,
                 const AuditOptions& options = {}) const;

private:
    const LockModel& model_;
};

} // namespace lockscan
