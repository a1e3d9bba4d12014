#include <catch2/catch.hpp>

#include <sstream>

#include <libhitbox3d/Exception.hpp>
#include <libhitbox3d/HitboxConfig.hpp>

#include "test_meshes.hpp"

#include <boost/nowide/fstream.hpp>

using namespace Hitbox3D;

TEST_CASE("Configuration defaults", "[HitboxConfig]") {
    HitboxConfig config;
    REQUIRE(config.tier == EPrecisionTier::High);
    REQUIRE(config.seed == 42);
    REQUIRE(config.log_level == 2);
    REQUIRE(config.export_json.empty());

    std::istringstream empty("");
    config.load(empty);
    REQUIRE(config.tier == EPrecisionTier::High);
    REQUIRE(config.seed == 42);
}

TEST_CASE("Configuration values", "[HitboxConfig]") {
    std::istringstream is(
        "; hitbox generation\n"
        "[decompose]\n"
        "tier = Super Low\n"
        "seed = 7\n"
        "[log]\n"
        "level = 4\n"
        "dir = /tmp/hitbox-logs\n"
        "[export]\n"
        "json = out.json\n"
        "stl = out.stl\n");
    HitboxConfig config;
    config.load(is);

    REQUIRE(config.tier == EPrecisionTier::Minimal);
    REQUIRE(config.seed == 7);
    REQUIRE(config.log_level == 4);
    REQUIRE(config.log_dir == "/tmp/hitbox-logs");
    REQUIRE(config.export_json == "out.json");
    REQUIRE(config.export_obj.empty());
    REQUIRE(config.export_stl == "out.stl");
}

TEST_CASE("Invalid configuration values", "[HitboxConfig]") {
    HitboxConfig config;

    SECTION("unknown tier") {
        std::istringstream is("[decompose]\ntier = extreme\n");
        REQUIRE_THROWS_AS(config.load(is), InvalidArgument);
    }
    SECTION("negative seed") {
        std::istringstream is("[decompose]\nseed = -1\n");
        REQUIRE_THROWS_AS(config.load(is), InvalidArgument);
    }
    SECTION("log level out of range") {
        std::istringstream is("[log]\nlevel = 9\n");
        REQUIRE_THROWS_AS(config.load(is), InvalidArgument);
    }
    SECTION("the message names the key") {
        std::istringstream is("[decompose]\nseed = many\n");
        REQUIRE_THROWS_WITH(config.load(is), Catch::Contains("decompose.seed"));
    }
    SECTION("syntax error") {
        std::istringstream is("[decompose\ntier = low\n");
        REQUIRE_THROWS_AS(config.load(is), RuntimeError);
    }
}

TEST_CASE("Parsing unsigned command line values", "[HitboxConfig]") {
    unsigned int value = 7;

    REQUIRE(parse_unsigned("42", value));
    REQUIRE(value == 42);
    REQUIRE(parse_unsigned(" 0 ", value));
    REQUIRE(value == 0);
    REQUIRE(parse_unsigned("4294967295", value));
    REQUIRE(value == 4294967295u);

    value = 7;
    REQUIRE(! parse_unsigned("-1", value));
    REQUIRE(! parse_unsigned(" -0", value));
    REQUIRE(! parse_unsigned("4294967296", value));
    REQUIRE(! parse_unsigned("12abc", value));
    REQUIRE(! parse_unsigned("", value));
    REQUIRE(value == 7);
}

TEST_CASE("Configuration file", "[HitboxConfig]") {
    Test::TempFile file(".ini");
    {
        boost::nowide::ofstream ofs(file.string());
        ofs << "[decompose]\ntier = medium\n";
    }
    HitboxConfig config;
    config.load(file.string());
    REQUIRE(config.tier == EPrecisionTier::Medium);

    REQUIRE_THROWS_AS(config.load("/nonexistent/dir/hitbox3d.ini"), RuntimeError);
}
