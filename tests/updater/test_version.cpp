#include <catch2/catch_test_macros.hpp>

#include "updater/Version.hpp"

using updater::Version;

TEST_CASE("Version parsing", "[version]") {

    SECTION("Accepts dotted numbers of any length") {
        Version v;
        REQUIRE(Version::tryParse("1.10.0", v));
        REQUIRE(v.segments() == std::vector<unsigned long long>{1, 10, 0});
        REQUIRE(Version::tryParse("7", v));
        REQUIRE(v.toString() == "7");
        REQUIRE(Version::tryParse("1.2.3.4.5", v));
        REQUIRE(v.toString() == "1.2.3.4.5");
    }

    SECTION("Accepts a leading v") {
        Version v;
        REQUIRE(Version::tryParse("v2.3", v));
        REQUIRE(v.toString() == "2.3");
        REQUIRE(Version::tryParse("V0.9.1", v));
        REQUIRE(v.toString() == "0.9.1");
    }

    SECTION("Rejects malformed strings") {
        Version v;
        REQUIRE_FALSE(Version::tryParse("", v));
        REQUIRE_FALSE(Version::tryParse("v", v));
        REQUIRE_FALSE(Version::tryParse("1..2", v));
        REQUIRE_FALSE(Version::tryParse("1.2.", v));
        REQUIRE_FALSE(Version::tryParse(".1", v));
        REQUIRE_FALSE(Version::tryParse("1.2-beta", v));
        REQUIRE_FALSE(Version::tryParse("update_test", v));
        REQUIRE_FALSE(Version::tryParse("99999999999999999999999.1", v));
    }

    SECTION("Unparsable constructor input gives zero") {
        REQUIRE(Version("garbage").toString() == "0");
        REQUIRE(Version("garbage") == Version());
    }
}

TEST_CASE("Version ordering", "[version]") {

    SECTION("Numeric, not lexicographic") {
        REQUIRE(Version("1.10.0") > Version("1.9.9"));
        REQUIRE(Version("2.0") > Version("1.99.99"));
        REQUIRE(Version("0.0.1") < Version("0.1"));
    }

    SECTION("Missing trailing segments compare as zero") {
        REQUIRE(Version("1.0") == Version("1.0.0"));
        REQUIRE(Version("1") == Version("1.0.0.0"));
        REQUIRE(Version("1.0.0.1") > Version("1"));
    }
}

TEST_CASE("Version isNewer decision", "[version]") {

    SECTION("Numeric comparison when both parse") {
        REQUIRE(Version::isNewer("1.0.1", "1.0.2"));
        REQUIRE(Version::isNewer("1.9", "v1.10"));
        REQUIRE_FALSE(Version::isNewer("1.0.2", "1.0.2"));
        REQUIRE_FALSE(Version::isNewer("1.0.2", "1.0.1"));
        REQUIRE_FALSE(Version::isNewer("1.0", "1.0.0"));
    }

    SECTION("Non-numeric side falls back to string inequality") {
        REQUIRE(Version::isNewer("update_test", "1.0.2"));
        REQUIRE(Version::isNewer("1.0.2", "nightly"));
        REQUIRE_FALSE(Version::isNewer("nightly", "nightly"));
    }

    SECTION("Empty candidate is never newer") {
        REQUIRE_FALSE(Version::isNewer("1.0.0", ""));
        REQUIRE_FALSE(Version::isNewer("", ""));
    }
}

TEST_CASE("Version extraction from free text", "[version]") {
    REQUIRE(Version::extractDotted("Release 1.4.2 (stable)") == "1.4.2");
    REQUIRE(Version::extractDotted("modkeep 0.10 hotfix 2") == "0.10");
    REQUIRE(Version::extractDotted("Build 42") == "");
    REQUIRE(Version::extractDotted("") == "");
}
