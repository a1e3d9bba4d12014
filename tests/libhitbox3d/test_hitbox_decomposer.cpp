#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <libhitbox3d/Exception.hpp>
#include <libhitbox3d/HitboxDecomposer.hpp>

#include "test_meshes.hpp"

using namespace Hitbox3D;

TEST_CASE("Minimal tier of a unit cube", "[HitboxDecomposer]") {
    TriangleMesh cube = Test::make_cube();
    HitboxSet hitboxes = HitboxDecomposer(HitboxDecomposer::Config::from_tier(EPrecisionTier::Minimal)).decompose(cube);

    REQUIRE(hitboxes.size() == 1);
    REQUIRE(hitboxes[0].min == Vec3d(0., 0., 0.));
    REQUIRE(hitboxes[0].max == Vec3d(1., 1., 1.));
    REQUIRE(hitboxes[0] == cube.bounding_box());
}

TEST_CASE("Two cubes with two clusters", "[HitboxDecomposer]") {
    TriangleMesh mesh = Test::make_two_cubes();
    HitboxDecomposer::Config config;
    config.cluster_count = 2;
    config.iterations    = 10;
    config.seed          = GENERATE(range(0u, 32u));

    HitboxSet hitboxes = HitboxDecomposer(config).decompose(mesh);
    REQUIRE(hitboxes.size() == 2);

    BoundingBoxf3 first(Vec3d(0., 0., 0.), Vec3d(1., 1., 1.));
    BoundingBoxf3 second(Vec3d(10., 0., 0.), Vec3d(11., 1., 1.));
    REQUIRE(((hitboxes[0] == first && hitboxes[1] == second) || (hitboxes[0] == second && hitboxes[1] == first)));
}

TEST_CASE("Boxes contain the mesh", "[HitboxDecomposer]") {
    TriangleMesh grid = Test::make_grid(30, 20);
    auto tier = GENERATE(EPrecisionTier::Minimal, EPrecisionTier::Low, EPrecisionTier::Medium);
    HitboxSet hitboxes = HitboxDecomposer(HitboxDecomposer::Config::from_tier(tier)).decompose(grid);

    REQUIRE(! hitboxes.empty());
    for (const BoundingBoxf3 &box : hitboxes)
        REQUIRE((box.min.array() <= box.max.array()).all());

    // Every vertex lies in at least one box and the union is the mesh bounds.
    for (const Vec3f &pt : grid.vertices()) {
        bool inside = false;
        for (const BoundingBoxf3 &box : hitboxes)
            inside |= box.contains(Vec3d(pt.cast<double>()));
        REQUIRE(inside);
    }
    REQUIRE(hitboxes.bounding_box() == grid.bounding_box());
}

TEST_CASE("More clusters than vertices gives a degenerate box per vertex", "[HitboxDecomposer]") {
    TriangleMesh cube = Test::make_cube();
    HitboxSet hitboxes = HitboxDecomposer(HitboxDecomposer::Config::from_tier(EPrecisionTier::Ultra)).decompose(cube);

    REQUIRE(hitboxes.size() == cube.vertices_count());
    for (size_t i = 0; i < hitboxes.size(); ++ i) {
        REQUIRE(hitboxes[i].is_degenerate());
        REQUIRE(hitboxes[i].min == cube.vertices()[i].cast<double>());
    }
}

TEST_CASE("Decomposition is deterministic for a fixed seed", "[HitboxDecomposer]") {
    TriangleMesh grid = Test::make_grid(40, 40);
    HitboxDecomposer::Config config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Low, 99);

    HitboxSet a = HitboxDecomposer(config).decompose(grid);
    HitboxSet b = HitboxDecomposer(config).decompose(grid);
    REQUIRE(a == b);
}

TEST_CASE("Invalid meshes are rejected before clustering", "[HitboxDecomposer]") {
    std::vector<int> reported;
    HitboxDecomposer::Config config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Low);
    config.progressind = [&reported](int percent, const std::string &) { reported.push_back(percent); };

    SECTION("empty mesh") {
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(TriangleMesh()), InvalidMeshError);
    }
    SECTION("face index out of range") {
        TriangleMesh mesh({ { 0.f, 0.f, 0.f }, { 1.f, 0.f, 0.f } }, { { 0, 1, 2 } });
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(mesh), InvalidMeshError);
    }
    REQUIRE(reported.empty());
}

TEST_CASE("Progress milestones", "[HitboxDecomposer]") {
    std::vector<int> reported;
    auto record = [&reported](int percent, const std::string &message) {
        REQUIRE(! message.empty());
        reported.push_back(percent);
    };

    SECTION("clustering tier") {
        HitboxDecomposer::Config config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Low);
        config.progressind = record;
        HitboxDecomposer(config).decompose(Test::make_grid(20, 20));
        REQUIRE(reported == std::vector<int>{ 10, 50, 60, 70, 80, 90 });
    }
    SECTION("minimal tier") {
        HitboxDecomposer::Config config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Minimal);
        config.progressind = record;
        HitboxDecomposer(config).decompose(Test::make_cube());
        REQUIRE(reported == std::vector<int>{ 10, 90 });
    }
}

TEST_CASE("Cancellation checkpoints", "[HitboxDecomposer]") {
    TriangleMesh grid = Test::make_grid(20, 20);
    HitboxDecomposer::Config config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Low);

    int polls = 0;
    int last_progress = 0;
    config.progressind = [&last_progress](int percent, const std::string &) { last_progress = percent; };

    SECTION("before the first refinement round") {
        config.stopcondition = [&polls]() { ++ polls; return true; };
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(grid), CanceledException);
        REQUIRE(polls == 1);
        REQUIRE(last_progress == dpClustered);
    }
    SECTION("mid refinement") {
        config.stopcondition = [&last_progress]() { return last_progress >= 70; };
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(grid), CanceledException);
        REQUIRE(last_progress == 70);
    }
    SECTION("between partitioning and extraction") {
        config.stopcondition = [&polls]() { return ++ polls == 4; };
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(grid), CanceledException);
        REQUIRE(last_progress == 80);
    }
    SECTION("minimal tier") {
        config = HitboxDecomposer::Config::from_tier(EPrecisionTier::Minimal);
        config.stopcondition = []() { return true; };
        REQUIRE_THROWS_AS(HitboxDecomposer(config).decompose(grid), CanceledException);
    }
}
