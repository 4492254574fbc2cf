#include <lockscan/lockfile.hpp>
#include <lockscan/package_key.hpp>
#include <lockscan/version.hpp>
#include <yaml-cpp/yaml.h>

namespace lockscan {

namespace {

const char* const kDependencyKinds[] = {
    "dependencies",
    "devDependencies",
    "optionalDependencies",
};

bool is_dependency_kind(const std::string& key) {
    for (const char* kind : kDependencyKinds) {
        if (key == kind) return true;
    }
    return false;
}

int line_of(const YAML::Node& node) {
    YAML::Mark mark = node.Mark();
    return mark.is_null() ? 0 : mark.line + 1;
}

ScanError shape_error(const std::string& what, const YAML::Node& node) {
    return ScanError{ScanError::Parse,
        what + " must be a mapping",
        "is this a pnpm-lock.yaml file?", "", line_of(node)};
}

// A present-but-null section (`packages:` with nothing under it) is empty
Status require_mapping(const YAML::Node& node, const std::string& what) {
    if (!node || node.IsNull() || node.IsMap()) return ok_status();
    return shape_error(what, node);
}

} // namespace

// ---------------------------------------------------------------------------
// Section
// ---------------------------------------------------------------------------

const char* section_name(Section s) {
    switch (s) {
    case Section::DirectDependency:  return "importers";
    case Section::PackageDefinition: return "packages";
    case Section::Snapshot:          return "snapshots";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

namespace {

class Extractor {
public:
    Extractor(std::vector<LockOccurrence>& out, std::vector<SkippedKey>& skipped)
        : out_(out), skipped_(skipped) {}

    // importers.<path> or, for single-project lock files, the document root
    Status importer(const std::string& path, const YAML::Node& node) {
        LOCKSCAN_TRY(require_mapping(node, "importer '" + path + "'"));
        if (!node.IsMap()) return ok_status();

        for (const auto& kv : node) {
            auto kind = kv.first.as<std::string>();
            if (!is_dependency_kind(kind)) continue;

            const YAML::Node& deps = kv.second;
            LOCKSCAN_TRY(require_mapping(deps, path + "." + kind));
            if (!deps.IsMap()) continue;

            for (const auto& dep : deps) {
                LOCKSCAN_TRY(direct_dependency(path, kind, dep.first, dep.second));
            }
        }
        return ok_status();
    }

    Status package_keys(const YAML::Node& section, Section which) {
        for (const auto& kv : section) {
            auto raw = kv.first.as<std::string>();
            auto key = PackageKey::parse(raw);
            if (key.is_err()) {
                skipped_.push_back(SkippedKey{line_of(kv.first), raw, key.error().message});
                continue;
            }

            LockOccurrence occ;
            occ.name = std::move(key.value().name);
            occ.version = std::move(key.value().version);
            occ.section = which;
            occ.context = which == Section::Snapshot
                ? "snapshots[" + raw + "]"
                : std::string("packages");
            out_.push_back(std::move(occ));
        }
        return ok_status();
    }

private:
    Status direct_dependency(const std::string& path, const std::string& kind,
                             const YAML::Node& name_node, const YAML::Node& ref) {
        LockOccurrence occ;
        occ.name = name_node.as<std::string>();
        occ.section = Section::DirectDependency;
        occ.context = path + " (" + kind + ")";

        if (ref.IsMap()) {
            // lockfile v6+: {specifier: ^18.3.1, version: 18.3.1(...)}
            occ.version = ref["version"].as<std::string>("");
            occ.specifier = ref["specifier"].as<std::string>("");
        } else if (ref.IsScalar()) {
            // lockfile v5: bare version reference
            occ.version = ref.as<std::string>();
        }
        occ.version = strip_peer_suffix(occ.version);

        if (occ.name.empty()) {
            return ScanError{ScanError::Parse,
                "empty dependency name under " + occ.context, "",
                "", line_of(name_node)};
        }
        if (occ.version.empty()) {
            return ScanError{ScanError::Parse,
                "dependency '" + occ.name + "' under " + occ.context +
                " has no version", "", "", line_of(ref)};
        }

        out_.push_back(std::move(occ));
        return ok_status();
    }

    std::vector<LockOccurrence>& out_;
    std::vector<SkippedKey>& skipped_;
};

Status extract(const YAML::Node& root, std::vector<LockOccurrence>& out,
               std::vector<SkippedKey>& skipped) {
    Extractor ex(out, skipped);
    bool recognized = false;

    const YAML::Node importers = root["importers"];
    if (importers) {
        recognized = true;
        LOCKSCAN_TRY(require_mapping(importers, "importers"));
        if (importers.IsMap()) {
            for (const auto& kv : importers) {
                LOCKSCAN_TRY(ex.importer(kv.first.as<std::string>(), kv.second));
            }
        }
    } else {
        for (const char* kind : kDependencyKinds) {
            if (root[kind]) recognized = true;
        }
        if (recognized) {
            LOCKSCAN_TRY(ex.importer(".", root));
        }
    }

    const YAML::Node packages = root["packages"];
    if (packages) {
        recognized = true;
        LOCKSCAN_TRY(require_mapping(packages, "packages"));
        if (packages.IsMap()) {
            LOCKSCAN_TRY(ex.package_keys(packages, Section::PackageDefinition));
        }
    }

    const YAML::Node snapshots = root["snapshots"];
    if (snapshots) {
        recognized = true;
        LOCKSCAN_TRY(require_mapping(snapshots, "snapshots"));
        if (snapshots.IsMap()) {
            LOCKSCAN_TRY(ex.package_keys(snapshots, Section::Snapshot));
        }
    }

    if (!recognized) {
        return ScanError{ScanError::Parse,
            "no importers, packages or snapshots section found",
            "is this a pnpm-lock.yaml file?"};
    }
    return ok_status();
}

} // namespace

// ---------------------------------------------------------------------------
// LockModel
// ---------------------------------------------------------------------------

Result<LockModel> LockModel::parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return ScanError{ScanError::Parse,
            "lock file YAML parse error: " + e.msg, "",
            "", e.mark.is_null() ? 0 : e.mark.line + 1};
    }

    if (!root.IsMap()) {
        return ScanError{ScanError::Parse,
            "lock file must be a YAML mapping",
            "is this a pnpm-lock.yaml file?"};
    }

    const YAML::Node& doc = root;
    std::vector<LockOccurrence> found;
    LockModel model;
    try {
        LOCKSCAN_TRY(extract(doc, found, model.skipped_));
        if (const YAML::Node v = doc["lockfileVersion"]; v && v.IsScalar()) {
            model.lockfile_version_ = v.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return ScanError{ScanError::Parse,
            "unexpected lock file structure: " + e.msg, "",
            "", e.mark.is_null() ? 0 : e.mark.line + 1};
    }

    for (auto& occ : found) {
        model.add(std::move(occ));
    }
    return Result<LockModel>::ok(std::move(model));
}

void LockModel::add(LockOccurrence occ) {
    auto it = index_.find(occ.name);
    if (it == index_.end()) {
        names_.push_back(occ.name);
        it = index_.emplace(occ.name, std::vector<LockOccurrence>{}).first;
    }
    ++section_counts_[static_cast<int>(occ.section)];
    ++count_;
    it->second.push_back(std::move(occ));
}

const std::vector<LockOccurrence>& LockModel::occurrences_for(const std::string& name) const {
    static const std::vector<LockOccurrence> empty;
    auto it = index_.find(name);
    return it == index_.end() ? empty : it->second;
}

bool LockModel::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

size_t LockModel::count_in(Section s) const {
    return section_counts_[static_cast<int>(s)];
}

} // namespace lockscan
