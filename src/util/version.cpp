#include <lockscan/version.hpp>
#include <algorithm>

namespace lockscan {

std::vector<std::string> version_segments(const std::string& v) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t dot = v.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(v.substr(start));
            break;
        }
        segments.push_back(v.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

bool version_matches(const std::string& found, const VersionSpec& spec) {
    auto have = version_segments(found);
    auto want = version_segments(spec);

    if (want.size() > have.size()) return false;
    return std::equal(want.begin(), want.end(), have.begin());
}

std::string strip_peer_suffix(const std::string& version_ref) {
    size_t paren = version_ref.find('(');
    if (paren == std::string::npos) return version_ref;
    return version_ref.substr(0, paren);
}

Satisfaction classify(const std::vector<VersionSpec>& expected,
                      const std::vector<std::string>& found) {
    size_t satisfied = 0;
    for (const auto& spec : expected) {
        bool hit = std::any_of(found.begin(), found.end(),
            [&](const std::string& v) { return version_matches(v, spec); });
        if (hit) ++satisfied;
    }

    if (satisfied == 0) return Satisfaction::NoneSatisfied;
    if (satisfied == expected.size()) return Satisfaction::AllSatisfied;
    return Satisfaction::SomeSatisfied;
}

const char* satisfaction_name(Satisfaction s) {
    switch (s) {
    case Satisfaction::AllSatisfied:  return "all";
    case Satisfaction::SomeSatisfied: return "some";
    case Satisfaction::NoneSatisfied: return "none";
    }
    return "unknown";
}

} // namespace lockscan
