#include <catch2/catch.hpp>
#include <lockscan/audit.hpp>
#include <lockscan/expectations.hpp>
#include <lockscan/lockfile.hpp>

using namespace lockscan;

static const char* kReactLock = R"YAML(
lockfileVersion: '9.0'

importers:
  .:
    dependencies:
      react:
        specifier: ^18.3.1
        version: 18.3.1

packages:
  react@18.3.1:
    resolution: {integrity: sha512-abc}
)YAML";

static const char* kMultiLock = R"YAML(
lockfileVersion: '9.0'

importers:
  .:
    dependencies:
      debug:
        specifier: ^4.3.0
        version: 4.3.4
  apps/web:
    dependencies:
      debug:
        specifier: 4.4.1
        version: 4.4.1

packages:
  debug@4.3.4:
    resolution: {integrity: sha512-a}
  debug@4.4.1:
    resolution: {integrity: sha512-b}
  chalk@5.3.0:
    resolution: {integrity: sha512-c}
  ms@2.1.3:
    resolution: {integrity: sha512-d}
)YAML";

static LockModel model_of(const char* text) {
    auto r = LockModel::parse(text);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static ExpectedPackage expect(const std::string& name, std::vector<VersionSpec> versions) {
    ExpectedPackage pkg;
    pkg.name = name;
    pkg.versions = std::move(versions);
    return pkg;
}

// ===== Ad-hoc queries =====

TEST_CASE("query without version finds every occurrence", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    auto r = engine.query("react");
    REQUIRE(r.status == AuditStatus::Found);
    REQUIRE(r.occurrences.size() == 2);
    REQUIRE(r.matched.size() == 2);
    REQUIRE(r.occurrences[0].context == ". (dependencies)");
    REQUIRE(r.occurrences[1].context == "packages");
}

TEST_CASE("query with a wrong version is a mismatch", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    auto r = engine.query("react", std::string("17.0.0"));
    REQUIRE(r.status == AuditStatus::VersionMismatch);
    REQUIRE(r.matched.empty());
    REQUIRE(r.occurrences.size() == 2);
    REQUIRE(r.found_versions() == std::vector<std::string>{"18.3.1"});
}

TEST_CASE("query with a version prefix", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    REQUIRE(engine.query("react", std::string("18")).status == AuditStatus::Found);
    REQUIRE(engine.query("react", std::string("18.3")).status == AuditStatus::Found);
    REQUIRE(engine.query("react", std::string("18.3.1")).status == AuditStatus::Found);
    REQUIRE(engine.query("react", std::string("18.3.10")).status == AuditStatus::VersionMismatch);
}

TEST_CASE("absent package is not found regardless of version", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    for (auto version : {std::optional<std::string>{}, std::optional<std::string>("1.0.0")}) {
        auto r = engine.query("react-dom", version);
        REQUIRE(r.status == AuditStatus::NotFound);
        REQUIRE(r.occurrences.empty());
        REQUIRE(r.matched.empty());
    }
}

TEST_CASE("scoped and bare names are distinct", "[audit]") {
    auto model = model_of("packages:\n  '@evil/debug@1.0.0': {}\n");
    AuditEngine engine(model);
    REQUIRE(engine.query("debug").status == AuditStatus::NotFound);
    REQUIRE(engine.query("@evil/debug").status == AuditStatus::Found);
}

// ===== Classification =====

TEST_CASE("every expected version present is Found", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);

    auto r = engine.evaluate(expect("debug", {"4.3.4", "4.4.1"}));
    REQUIRE(r.status == AuditStatus::Found);
    REQUIRE(r.matched.size() == 4);
}

TEST_CASE("some expected versions present is PartialMatch", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);

    auto r = engine.evaluate(expect("debug", {"4.4.1", "4.4.2"}));
    REQUIRE(r.status == AuditStatus::PartialMatch);
    REQUIRE(r.matched.size() == 2);
    for (const auto& occ : r.matched) {
        REQUIRE(occ.version == "4.4.1");
    }
    REQUIRE(r.occurrences.size() == 4);
}

TEST_CASE("partial match with a single found version", "[audit]") {
    auto model = model_of("packages:\n  pkg@1.0.0: {}\n");
    AuditEngine engine(model);
    REQUIRE(engine.evaluate(expect("pkg", {"1.0.0", "1.0.1"})).status ==
            AuditStatus::PartialMatch);
    REQUIRE(engine.evaluate(expect("pkg", {"2.0.0"})).status ==
            AuditStatus::VersionMismatch);
}

TEST_CASE("one prefix spec covering several versions is Found", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);
    REQUIRE(engine.evaluate(expect("debug", {"4"})).status == AuditStatus::Found);
}

TEST_CASE("evidence keeps source metadata", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);

    ExpectedPackage pkg = expect("chalk", {"5.6.1"});
    pkg.original_status = "Removed";
    pkg.detection_date = "2025-09-08";

    auto r = engine.evaluate(pkg);
    REQUIRE(r.status == AuditStatus::VersionMismatch);
    REQUIRE(r.expected.original_status == std::optional<std::string>("Removed"));
    REQUIRE(r.expected.detection_date == std::optional<std::string>("2025-09-08"));
}

TEST_CASE("found_versions deduplicates in discovery order", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);
    auto r = engine.query("debug");
    REQUIRE(r.found_versions() == std::vector<std::string>{"4.3.4", "4.4.1"});
}

// ===== Batch runs =====

TEST_CASE("batch of a missing package", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    auto list = parse_expectations("Row\tPackage Name\tVersion(s)\n1\tlodash\t4.17.21, 4.17.20\n");
    REQUIRE(list.is_ok());

    auto run = engine.run(list.value().packages);
    REQUIRE(run.results.size() == 1);
    REQUIRE(run.results[0].status == AuditStatus::NotFound);
    REQUIRE(run.counters.total == 1);
    REQUIRE(run.counters.found == 0);
    REQUIRE(run.counters.partial == 0);
    REQUIRE(run.counters.mismatch == 0);
    REQUIRE(run.counters.not_found == 1);
}

TEST_CASE("batch results follow input order", "[audit]") {
    auto model = model_of("packages:\n  pkgA@1.0.0: {}\n  pkgB@1.0.0: {}\n");
    AuditEngine engine(model);

    auto run = engine.run({expect("pkgB", {}), expect("pkgA", {})});
    REQUIRE(run.results[0].expected.name == "pkgB");
    REQUIRE(run.results[1].expected.name == "pkgA");
}

TEST_CASE("batch counters tally every status", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);

    auto run = engine.run({
        expect("debug", {"4.3.4"}),          // found
        expect("debug", {"4.4.1", "4.4.2"}), // partial
        expect("chalk", {"5.6.1"}),          // mismatch
        expect("nx", {"20.9.0"}),            // not found
        expect("ms", {}),                    // found, any version
    });

    REQUIRE(run.counters.total == 5);
    REQUIRE(run.counters.found == 2);
    REQUIRE(run.counters.partial == 1);
    REQUIRE(run.counters.mismatch == 1);
    REQUIRE(run.counters.not_found == 1);
    REQUIRE(run.counters.consistent());
}

TEST_CASE("parallel batch keeps input order and counters", "[audit]") {
    auto model = model_of(kMultiLock);
    AuditEngine engine(model);

    std::vector<ExpectedPackage> batch;
    const char* names[] = {"ms", "nx", "debug", "chalk", "left-pad"};
    for (int i = 0; i < 200; ++i) {
        batch.push_back(expect(names[i % 5], {}));
    }

    auto serial = engine.run(batch);
    AuditOptions opts;
    opts.jobs = 4;
    auto parallel = engine.run(batch, opts);

    REQUIRE(parallel.results.size() == batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        REQUIRE(parallel.results[i].expected.name == batch[i].name);
        REQUIRE(parallel.results[i].status == serial.results[i].status);
    }
    REQUIRE(parallel.counters.found == serial.counters.found);
    REQUIRE(parallel.counters.not_found == 80);
    REQUIRE(parallel.counters.consistent());
}

TEST_CASE("empty batch", "[audit]") {
    auto model = model_of(kReactLock);
    AuditEngine engine(model);

    AuditOptions opts;
    opts.jobs = 0;
    auto run = engine.run({}, opts);
    REQUIRE(run.results.empty());
    REQUIRE(run.counters.total == 0);
    REQUIRE(run.counters.consistent());
}

TEST_CASE("status labels", "[audit]") {
    REQUIRE(std::string(status_label(AuditStatus::Found)) == "Found");
    REQUIRE(std::string(status_label(AuditStatus::PartialMatch)) == "Partial Match");
    REQUIRE(std::string(status_label(AuditStatus::VersionMismatch)) == "Version Mismatch");
    REQUIRE(std::string(status_label(AuditStatus::NotFound)) == "Not Found");
}
