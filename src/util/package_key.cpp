#include <lockscan/package_key.hpp>

namespace lockscan {

static ScanError bad_key(const std::string& raw, const std::string& why) {
    return ScanError{ScanError::Parse,
        "invalid package key '" + raw + "': " + why,
        "expected <name>@<version> or @<scope>/<name>@<version>"};
}

Result<PackageKey> PackageKey::parse(const std::string& raw) {
    if (raw.empty()) {
        return bad_key(raw, "empty key");
    }

    std::string base = raw;
    bool legacy_slash = false;
    if (base[0] == '/') {
        base.erase(0, 1);
        legacy_slash = true;
    }

    PackageKey key;
    size_t paren = base.find('(');
    if (paren != std::string::npos) {
        key.peers = base.substr(paren);
        base.erase(paren);
    }

    // Position after which the version separator may appear
    size_t name_start = 0;
    if (!base.empty() && base[0] == '@') {
        size_t slash = base.find('/');
        if (slash == std::string::npos || slash == 1) {
            return bad_key(raw, "malformed scope");
        }
        name_start = slash + 1;
    }

    size_t first_slash = base.find('/', name_start);
    size_t first_at = base.find('@', name_start);
    if (legacy_slash && first_slash != std::string::npos &&
        (first_at == std::string::npos || first_slash < first_at)) {
        // lockfile v5: /<name>/<version>[_<peer suffix>]
        key.name = base.substr(0, first_slash);
        key.version = base.substr(first_slash + 1);
        size_t underscore = key.version.find('_');
        if (underscore != std::string::npos) {
            key.peers = key.version.substr(underscore) + key.peers;
            key.version.erase(underscore);
        }
    } else {
        size_t at = base.rfind('@');
        if (at == std::string::npos || at < name_start || at == 0) {
            return bad_key(raw, "missing version");
        }
        key.name = base.substr(0, at);
        key.version = base.substr(at + 1);
    }

    if (key.name.empty() || key.name == "@" || key.name.back() == '/') {
        return bad_key(raw, "missing package name");
    }
    if (key.version.empty()) {
        return bad_key(raw, "missing version");
    }
    // file:, link: and git host paths
    if (key.name.find(':') != std::string::npos ||
        (legacy_slash && key.version.find('/') != std::string::npos)) {
        return bad_key(raw, "not a registry package");
    }

    return Result<PackageKey>::ok(std::move(key));
}

} // namespace lockscan
