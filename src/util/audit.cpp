#include <lockscan/audit.hpp>
#include <lockscan/version.hpp>

#include <algorithm>
#include <atomic>
#include <thread>

namespace lockscan {

// ---------------------------------------------------------------------------
// Status / counters
// ---------------------------------------------------------------------------

const char* status_label(AuditStatus s) {
    switch (s) {
    case AuditStatus::Found:           return "Found";
    case AuditStatus::PartialMatch:    return "Partial Match";
    case AuditStatus::VersionMismatch: return "Version Mismatch";
    case AuditStatus::NotFound:        return "Not Found";
    }
    return "Unknown";
}

void Counters::tally(AuditStatus s) {
    ++total;
    switch (s) {
    case AuditStatus::Found:           ++found; break;
    case AuditStatus::PartialMatch:    ++partial; break;
    case AuditStatus::VersionMismatch: ++mismatch; break;
    case AuditStatus::NotFound:        ++not_found; break;
    }
}

std::vector<std::string> AuditResult::found_versions() const {
    std::vector<std::string> versions;
    for (const auto& occ : occurrences) {
        if (std::find(versions.begin(), versions.end(), occ.version) == versions.end()) {
            versions.push_back(occ.version);
        }
    }
    return versions;
}

// ---------------------------------------------------------------------------
// AuditEngine
// ---------------------------------------------------------------------------

AuditEngine::AuditEngine(const LockModel& model)
    : model_(model) {}

AuditResult AuditEngine::query(const std::string& name,
                               const std::optional<std::string>& version) const {
    return evaluate(ExpectedPackage::single(name, version));
}

AuditResult AuditEngine::evaluate(const ExpectedPackage& expected) const {
    AuditResult result;
    result.expected = expected;
    result.occurrences = model_.occurrences_for(expected.name);

    if (result.occurrences.empty()) {
        result.status = AuditStatus::NotFound;
        return result;
    }

    if (expected.versions.empty()) {
        result.status = AuditStatus::Found;
        result.matched = result.occurrences;
        return result;
    }

    for (const auto& occ : result.occurrences) {
        bool hit = std::any_of(expected.versions.begin(), expected.versions.end(),
            [&](const VersionSpec& spec) { return version_matches(occ.version, spec); });
        if (hit) result.matched.push_back(occ);
    }

    switch (classify(expected.versions, result.found_versions())) {
    case Satisfaction::AllSatisfied:
        result.status = AuditStatus::Found;
        break;
    case Satisfaction::SomeSatisfied:
        result.status = AuditStatus::PartialMatch;
        break;
    case Satisfaction::NoneSatisfied:
        result.status = AuditStatus::VersionMismatch;
        break;
    }
    return result;
}

AuditRun AuditEngine::run(const std::vector<ExpectedPackage>& expectations,
                          const AuditOptions& options) const {
    AuditRun run;
    run.results.resize(expectations.size());

    unsigned jobs = options.jobs;
    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    jobs = static_cast<unsigned>(
        std::min<size_t>(jobs, std::max<size_t>(1, expectations.size())));

    if (jobs <= 1) {
        for (size_t i = 0; i < expectations.size(); ++i) {
            run.results[i] = evaluate(expectations[i]);
        }
    } else {
        // Each worker writes only its claimed slot, so input order is kept
        std::atomic<size_t> next{0};
        auto worker = [&]() {
            for (size_t i = next++; i < expectations.size(); i = next++) {
                run.results[i] = evaluate(expectations[i]);
            }
        };
        std::vector<std::thread> pool;
        pool.reserve(jobs);
        for (unsigned t = 0; t < jobs; ++t) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    for (const auto& r : run.results) {
        run.counters.tally(r.status);
    }
    return run;
}

} // namespace lockscan
