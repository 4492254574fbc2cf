#pragma once

#include <lockscan/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace lockscan {

// The three places a package can be recorded in pnpm-lock.yaml
enum class Section {
    DirectDependency,   // importers.<path>.<kind>.<name>
    PackageDefinition,  // packages.<name>@<version>
    Snapshot,           // snapshots.<name>@<version>[(peers)]
};

const char* section_name(Section s);

struct LockOccurrence {
    std::string name;       // "@scope/name" kept whole
    std::string version;    // peer qualifier stripped
    Section section;
    std::string context;    // ". (dependencies)", "packages", "snapshots[<key>]"
    std::string specifier;  // declared range, direct dependencies only
};

// A packages/snapshots key that names no registry package, such as
// `file:../local-lib` or `github.com/user/repo/<sha>`
struct SkippedKey {
    int line = 0;
    std::string key;
    std::string reason;
};

// Read-only index of every package occurrence in a lock file, grouped by
// exact package name in discovery order.
class LockModel {
public:
    // Parse pnpm-lock.yaml text. Fails with ScanError::Parse when the text is
    // not YAML, is not a mapping, or has none of the recognized sections.
    static Result<LockModel> parse(const std::string& text);

    // Every occurrence of `name`, in discovery order; empty when absent
    const std::vector<LockOccurrence>& occurrences_for(const std::string& name) const;

    bool contains(const std::string& name) const;

    // Distinct package names in the order they were first seen
    const std::vector<std::string>& package_names() const { return names_; }

    // `lockfileVersion` as written ("9.0", "5.4"), empty if the file has none
    const std::string& lockfile_version() const { return lockfile_version_; }

    // Total number of occurrences across all sections
    size_t size() const { return count_; }

    size_t count_in(Section s) const;

    // Keys left out of the index, in document order
    const std::vector<SkippedKey>& skipped_keys() const { return skipped_; }

private:
    void add(LockOccurrence occ);

    std::string lockfile_version_;
    std::vector<std::string> names_;
    std::vector<SkippedKey> skipped_;
    std::unordered_map<std::string, std::vector<LockOccurrence>> index_;
    size_t count_ = 0;
    size_t section_counts_[3] = {0, 0, 0};
};

} // namespace lockscan
