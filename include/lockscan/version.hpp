#pragma once

#include <string>
#include <vector>

namespace lockscan {

// A version expectation as written by the user or an advisory: "1.0.0" or a
// dotted prefix such as "1.0". Whether it acts as an exact or a prefix match
// depends only on its segment count relative to the candidate version.
using VersionSpec = std::string;

// Split a version on '.' into its segments ("1.10.0" -> {"1", "10", "0"}).
std::vector<std::string> version_segments(const std::string& v);

// True when the first N segments of `found` equal the N segments of `spec`.
// A spec with more segments than `found` never matches.
bool version_matches(const std::string& found, const VersionSpec& spec);

// Drop a parenthesized peer qualifier: "4.8.3(react@18.3.1)" -> "4.8.3"
std::string strip_peer_suffix(const std::string& version_ref);

enum class Satisfaction {
    AllSatisfied,
    SomeSatisfied,
    NoneSatisfied,
};

// Each spec is satisfied when at least one found version matches it.
// Callers must not pass an empty `expected` list; presence alone decides
// the outcome in that case.
Satisfaction classify(const std::vector<VersionSpec>& expected,
                      const std::vector<std::string>& found);

const char* satisfaction_name(Satisfaction s);

} // namespace lockscan
