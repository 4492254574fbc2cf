#pragma once

#include <lockscan/result.hpp>
#include <string>

namespace lockscan {

// A `packages:` or `snapshots:` key from a pnpm lock file.
//
//   react@18.3.1                           -> react, 18.3.1
//   @ant-design/icons@4.8.3                -> @ant-design/icons, 4.8.3
//   @ahooksjs/use-request@2.8.15(react@18) -> @ahooksjs/use-request, 2.8.15, "(react@18)"
//   /react@18.3.1                          -> react, 18.3.1   (lockfile v6)
//   /react-dom/18.2.0_react@18.2.0         -> react-dom, 18.2.0 (lockfile v5)
struct PackageKey {
    std::string name;
    std::string version;
    std::string peers;  // raw parenthesized peer qualifier, empty if none

    static Result<PackageKey> parse(const std::string& raw);

    bool is_scoped() const { return !name.empty() && name[0] == '@'; }
};

} // namespace lockscan
