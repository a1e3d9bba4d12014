#include <catch2/catch.hpp>

#include <limits>
#include <string>

#include <libhitbox3d/BoundingBox.hpp>
#include <libhitbox3d/Exception.hpp>
#include <libhitbox3d/HitboxExtractor.hpp>
#include <libhitbox3d/TriangleMesh.hpp>

#include "test_meshes.hpp"

using namespace Hitbox3D;

TEST_CASE("Bounding box of points", "[BoundingBox]") {
    std::vector<Vec3f> pts { { 1.f, -2.f, 3.f }, { -1.f, 4.f, 0.5f }, { 0.f, 0.f, 5.f } };
    BoundingBoxf3 bb(pts);
    REQUIRE(bb.defined);
    REQUIRE(bb.min == Vec3d(-1., -2., 0.5));
    REQUIRE(bb.max == Vec3d(1., 4., 5.));
    REQUIRE(bb.size() == Vec3d(2., 6., 4.5));
    REQUIRE(bb.volume() == Approx(54.));
    for (const Vec3f &pt : pts)
        REQUIRE(bb.contains(Vec3d(pt.cast<double>())));
    REQUIRE(! bb.contains(Vec3d(2., 0., 1.)));
}

TEST_CASE("Single point box is degenerate", "[BoundingBox]") {
    BoundingBoxf3 bb(std::vector<Vec3f>{ { 1.f, 2.f, 3.f } });
    REQUIRE(bb.defined);
    REQUIRE(bb.min == bb.max);
    REQUIRE(bb.is_degenerate());
    REQUIRE(bb.volume() == 0.);
}

TEST_CASE("Merging boxes", "[BoundingBox]") {
    BoundingBoxf3 bb;
    REQUIRE(! bb.defined);
    bb.merge(BoundingBoxf3(Vec3d(0., 0., 0.), Vec3d(1., 1., 1.)));
    bb.merge(BoundingBoxf3(Vec3d(5., -1., 0.), Vec3d(6., 0., 2.)));
    REQUIRE(bb.min == Vec3d(0., -1., 0.));
    REQUIRE(bb.max == Vec3d(6., 1., 2.));
}

TEST_CASE("Mesh validation", "[TriangleMesh]") {
    SECTION("closed cube is valid") {
        TriangleMesh cube = Test::make_cube();
        REQUIRE(cube.vertices_count() == 8);
        REQUIRE(cube.facets_count() == 12);
        REQUIRE(cube.is_valid());
        REQUIRE_NOTHROW(cube.validate());
        REQUIRE(cube.bounding_box() == BoundingBoxf3(Vec3d::Zero(), Vec3d::Ones()));
    }
    SECTION("empty vertex set") {
        TriangleMesh empty;
        std::string message;
        REQUIRE(! empty.is_valid(&message));
        REQUIRE(! message.empty());
        REQUIRE_THROWS_AS(empty.validate(), InvalidMeshError);
    }
    SECTION("face index out of range") {
        TriangleMesh mesh({ { 0.f, 0.f, 0.f }, { 1.f, 0.f, 0.f }, { 0.f, 1.f, 0.f } }, { { 0, 1, 3 } });
        REQUIRE_THROWS_AS(mesh.validate(), InvalidMeshError);
    }
    SECTION("negative face index") {
        TriangleMesh mesh({ { 0.f, 0.f, 0.f }, { 1.f, 0.f, 0.f }, { 0.f, 1.f, 0.f } }, { { -1, 1, 2 } });
        REQUIRE_THROWS_AS(mesh.validate(), InvalidMeshError);
    }
    SECTION("non finite coordinate") {
        TriangleMesh mesh({ { 0.f, 0.f, 0.f }, { std::numeric_limits<float>::quiet_NaN(), 0.f, 0.f } }, {});
        REQUIRE_THROWS_AS(mesh.validate(), InvalidMeshError);
    }
    SECTION("points without faces are accepted") {
        TriangleMesh mesh({ { 0.f, 0.f, 0.f }, { 1.f, 1.f, 1.f } }, {});
        REQUIRE(mesh.is_valid());
    }
}

TEST_CASE("Box mesh spans its bounding box", "[TriangleMesh]") {
    BoundingBoxf3 bb(Vec3d(-1., 2., 3.), Vec3d(4., 5., 6.5));
    indexed_triangle_set its = its_make_box(bb);
    REQUIRE(its.vertices.size() == 8);
    REQUIRE(its.indices.size() == 12);
    REQUIRE(BoundingBoxf3(its.vertices) == bb);

    // Outward winding: the signed volume of a closed mesh is positive.
    double volume = 0.;
    for (const Vec3i &f : its.indices) {
        Vec3d a = its.vertices[f(0)].cast<double>(), b = its.vertices[f(1)].cast<double>(), c = its.vertices[f(2)].cast<double>();
        volume += a.dot(b.cross(c)) / 6.;
    }
    REQUIRE(volume == Approx(bb.volume()));
}

TEST_CASE("Merging triangle sets shifts indices", "[TriangleMesh]") {
    TriangleMesh mesh = Test::make_two_cubes();
    REQUIRE(mesh.vertices_count() == 16);
    REQUIRE(mesh.facets_count() == 24);
    REQUIRE(mesh.is_valid());
    for (size_t i = 12; i < 24; ++ i)
        REQUIRE(mesh.faces()[i].minCoeff() >= 8);
}

TEST_CASE("Extractor", "[HitboxExtractor]") {
    std::vector<Vec3f> pts { { 0.f, 0.f, 0.f }, { 1.f, 1.f, 1.f }, { 10.f, 0.f, 0.f }, { 11.f, 2.f, 1.f } };

    SECTION("whole point set") {
        BoundingBoxf3 bb = HitboxExtractor::extract(pts);
        REQUIRE(bb.min == Vec3d(0., 0., 0.));
        REQUIRE(bb.max == Vec3d(11., 2., 1.));
    }
    SECTION("clusters in order, empty ones skipped") {
        HitboxSet set = HitboxExtractor::extract_clusters(pts, { { 2, 3 }, {}, { 0, 1 } });
        REQUIRE(set.size() == 2);
        REQUIRE(set[0] == BoundingBoxf3(Vec3d(10., 0., 0.), Vec3d(11., 2., 1.)));
        REQUIRE(set[1] == BoundingBoxf3(Vec3d(0., 0., 0.), Vec3d(1., 1., 1.)));
    }
}
