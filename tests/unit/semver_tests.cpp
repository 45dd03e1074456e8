#include <doctest/doctest.h>
#include <clawrun/semver.hpp>

using clawrun::Version;
using clawrun::parse_version_core;
using clawrun::parse_install_dir_version;
using clawrun::floor_version;

// ============================================================================
// Version Core Parsing
// ============================================================================

TEST_CASE("parse_version_core accepts MAJOR.MINOR.PATCH") {
    auto v = parse_version_core("1.2.3");
    REQUIRE(v);
    CHECK(v->major() == 1);
    CHECK(v->minor() == 2);
    CHECK(v->patch() == 3);
}

TEST_CASE("parse_version_core accepts a leading v") {
    auto v = parse_version_core("v22.14.0");
    REQUIRE(v);
    CHECK(v->major() == 22);
    CHECK(v->minor() == 14);
    CHECK(v->patch() == 0);

    CHECK(parse_version_core("V1.0.0"));
}

TEST_CASE("parse_version_core rejects anything but a plain core") {
    CHECK_FALSE(parse_version_core(""));
    CHECK_FALSE(parse_version_core("v"));
    CHECK_FALSE(parse_version_core("system"));
    CHECK_FALSE(parse_version_core("1.2"));
    CHECK_FALSE(parse_version_core("1.2.3.4"));
    CHECK_FALSE(parse_version_core("1..3"));
    CHECK_FALSE(parse_version_core("v1.2.3-rc.1"));
    CHECK_FALSE(parse_version_core("v1.2.3+build"));
    CHECK_FALSE(parse_version_core(" v1.2.3"));
    CHECK_FALSE(parse_version_core("vv1.2.3"));
}

TEST_CASE("parse_version_core rejects leading zeros") {
    CHECK_FALSE(parse_version_core("v01.2.3"));
}

// ============================================================================
// Install Directory Versions
// ============================================================================

TEST_CASE("parse_install_dir_version falls back to 0.0.0") {
    CHECK(parse_install_dir_version("lts-latest") == floor_version());
    CHECK(parse_install_dir_version("v18") == floor_version());
    CHECK(floor_version().major() == 0);
    CHECK(floor_version().minor() == 0);
    CHECK(floor_version().patch() == 0);
}

TEST_CASE("install dir versions order numerically") {
    CHECK(parse_install_dir_version("v9.0.0") < parse_install_dir_version("v10.0.0"));
    CHECK(parse_install_dir_version("v20.9.0") < parse_install_dir_version("v20.10.0"));
    CHECK(parse_install_dir_version("v1.0.9") < parse_install_dir_version("v1.0.10"));
    CHECK(parse_install_dir_version("garbage") < parse_install_dir_version("v0.0.1"));
    CHECK_FALSE(parse_install_dir_version("v2.0.0") < parse_install_dir_version("2.0.0"));
}
