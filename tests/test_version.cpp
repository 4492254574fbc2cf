#include <catch2/catch.hpp>
#include <lockscan/version.hpp>

using namespace lockscan;

// ===== Segments =====

TEST_CASE("version_segments splits on dots", "[version]") {
    REQUIRE(version_segments("1.10.0") == std::vector<std::string>{"1", "10", "0"});
    REQUIRE(version_segments("2") == std::vector<std::string>{"2"});
    REQUIRE(version_segments("1.0.0-rc.1") ==
            std::vector<std::string>{"1", "0", "0-rc", "1"});
}

// ===== Matching =====

TEST_CASE("exact match is reflexive", "[version]") {
    for (const char* v : {"1.0.0", "18.3.1", "0.0.1-alpha.3", "4", "link:../pkg"}) {
        REQUIRE(version_matches(v, v));
    }
}

TEST_CASE("exact match with equal segment counts", "[version]") {
    REQUIRE(version_matches("1.0.0", "1.0.0"));
    REQUIRE_FALSE(version_matches("2.0.0", "2.0.1"));
    REQUIRE_FALSE(version_matches("1.0.0", "1.0.1"));
}

TEST_CASE("shorter spec acts as a prefix", "[version]") {
    REQUIRE(version_matches("1.0.5", "1.0"));
    REQUIRE(version_matches("1.0.5", "1"));
    REQUIRE_FALSE(version_matches("1.10.0", "1.0"));
    REQUIRE_FALSE(version_matches("11.0.0", "1"));
}

TEST_CASE("prefix compares whole segments, not characters", "[version]") {
    REQUIRE_FALSE(version_matches("4.17.21", "4.17.2"));
    REQUIRE_FALSE(version_matches("4.17.210", "4.17.21"));
}

TEST_CASE("longer spec never matches", "[version]") {
    REQUIRE_FALSE(version_matches("1.0", "1.0.0"));
    REQUIRE_FALSE(version_matches("1", "1.0"));
}

TEST_CASE("strip_peer_suffix drops the parenthesized qualifier", "[version]") {
    REQUIRE(strip_peer_suffix("4.8.3(react-dom@18.3.1)(react@18.3.1)") == "4.8.3");
    REQUIRE(strip_peer_suffix("18.3.1") == "18.3.1");
    REQUIRE(strip_peer_suffix("") == "");
}

// ===== Classification =====

TEST_CASE("classify: every spec satisfied", "[version]") {
    REQUIRE(classify({"1.0.0", "2.0"}, {"1.0.0", "2.0.3"}) == Satisfaction::AllSatisfied);
}

TEST_CASE("classify: one spec can be satisfied by several versions", "[version]") {
    REQUIRE(classify({"1.0"}, {"1.0.0", "1.0.1"}) == Satisfaction::AllSatisfied);
}

TEST_CASE("classify: some specs satisfied", "[version]") {
    REQUIRE(classify({"1.0.0", "1.0.1"}, {"1.0.0"}) == Satisfaction::SomeSatisfied);
}

TEST_CASE("classify: no spec satisfied", "[version]") {
    REQUIRE(classify({"1.0.0"}, {"2.0.0"}) == Satisfaction::NoneSatisfied);
    REQUIRE(classify({"1.0.0"}, {}) == Satisfaction::NoneSatisfied);
}

TEST_CASE("satisfaction_name", "[version]") {
    REQUIRE(std::string(satisfaction_name(Satisfaction::AllSatisfied)) == "all");
    REQUIRE(std::string(satisfaction_name(Satisfaction::SomeSatisfied)) == "some");
    REQUIRE(std::string(satisfaction_name(Satisfaction::NoneSatisfied)) == "none");
}
