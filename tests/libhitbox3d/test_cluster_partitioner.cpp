#include <catch2/catch.hpp>

#include <algorithm>
#include <numeric>

#include <libhitbox3d/ClusterPartitioner.hpp>
#include <libhitbox3d/Exception.hpp>

#include "test_meshes.hpp"

using namespace Hitbox3D;

// Every point index appears in exactly one cluster.
static bool is_partition(const std::vector<std::vector<size_t>> &clusters, size_t num_points)
{
    std::vector<int> hits(num_points, 0);
    for (const std::vector<size_t> &cluster : clusters)
        for (size_t idx : cluster) {
            if (idx >= num_points)
                return false;
            ++ hits[idx];
        }
    return std::all_of(hits.begin(), hits.end(), [](int h) { return h == 1; });
}

static bool is_point(const std::vector<Vec3f> &points, const Vec3f &pt)
{
    return std::find(points.begin(), points.end(), pt) != points.end();
}

TEST_CASE("Partition property", "[ClusterPartitioner]") {
    TriangleMesh grid = Test::make_grid(20, 20);
    const std::vector<Vec3f> &pts = grid.vertices();

    auto k = GENERATE(1, 2, 7, 50, 399);
    ClusterPartitioner partitioner(pts, k, 10);
    partitioner.run(nullptr);

    REQUIRE(partitioner.fitted());
    REQUIRE(partitioner.refinement_rounds() == CLUSTER_REFINEMENT_ROUNDS);
    REQUIRE(partitioner.cluster_count() == k);
    REQUIRE(partitioner.labels().size() == pts.size());
    REQUIRE(is_partition(partitioner.clusters(), pts.size()));
}

TEST_CASE("Refined centers are mesh vertices", "[ClusterPartitioner]") {
    TriangleMesh grid = Test::make_grid(12, 9);
    const std::vector<Vec3f> &pts = grid.vertices();

    ClusterPartitioner partitioner(pts, 6, 15);
    partitioner.run(nullptr);

    for (const Vec3f &center : partitioner.centers())
        REQUIRE(is_point(pts, center));

    // Every point is assigned to its nearest center.
    for (size_t i = 0; i < pts.size(); ++ i) {
        const Vec3f &own = partitioner.centers()[partitioner.labels()[i]];
        double own_dist = (pts[i] - own).squaredNorm();
        for (const Vec3f &center : partitioner.centers())
            REQUIRE(own_dist <= (pts[i] - center).squaredNorm());
    }
}

TEST_CASE("Cluster count not smaller than the point count gives singletons", "[ClusterPartitioner]") {
    TriangleMesh cube = Test::make_cube();
    const std::vector<Vec3f> &pts = cube.vertices();

    auto k = GENERATE(8, 9, 600);
    ClusterPartitioner partitioner(pts, k, 20);
    partitioner.run(nullptr);

    REQUIRE(partitioner.cluster_count() == 8);
    std::vector<std::vector<size_t>> clusters = partitioner.clusters();
    REQUIRE(clusters.size() == 8);
    for (size_t i = 0; i < clusters.size(); ++ i) {
        REQUIRE(clusters[i].size() == 1);
        REQUIRE(clusters[i].front() == i);
    }
}

TEST_CASE("Cluster count is clamped to the distinct positions", "[ClusterPartitioner]") {
    std::vector<Vec3f> pts { { 0.f, 0.f, 0.f }, { 0.f, 0.f, 0.f }, { 0.f, 0.f, 0.f },
                             { 5.f, 5.f, 5.f }, { 5.f, 5.f, 5.f }, { 5.f, 5.f, 5.f } };
    ClusterPartitioner partitioner(pts, 4, 10);
    partitioner.run(nullptr);

    REQUIRE(partitioner.requested_cluster_count() == 4);
    REQUIRE(partitioner.cluster_count() == 2);
    REQUIRE(is_partition(partitioner.clusters(), pts.size()));
    REQUIRE(partitioner.labels()[0] == partitioner.labels()[2]);
    REQUIRE(partitioner.labels()[3] == partitioner.labels()[5]);
    REQUIRE(partitioner.labels()[0] != partitioner.labels()[3]);
}

TEST_CASE("All points coincide", "[ClusterPartitioner]") {
    std::vector<Vec3f> pts(10, Vec3f(1.f, 2.f, 3.f));
    ClusterPartitioner partitioner(pts, 3, 10);
    partitioner.run(nullptr);

    REQUIRE(partitioner.cluster_count() == 1);
    REQUIRE(partitioner.centers().front() == Vec3f(1.f, 2.f, 3.f));
    REQUIRE(partitioner.clusters().front().size() == 10);
}

TEST_CASE("Two separated cubes form two clusters", "[ClusterPartitioner]") {
    TriangleMesh mesh = Test::make_two_cubes();
    unsigned int seed = GENERATE(range(0u, 32u));
    ClusterPartitioner partitioner(mesh.vertices(), 2, 10, seed);
    partitioner.run(nullptr);

    std::vector<std::vector<size_t>> clusters = partitioner.clusters();
    REQUIRE(clusters.size() == 2);
    for (const std::vector<size_t> &cluster : clusters) {
        REQUIRE(cluster.size() == 8);
        // All members come from the same cube.
        bool first_cube = cluster.front() < 8;
        for (size_t idx : cluster)
            REQUIRE((idx < 8) == first_cube);
    }
}

TEST_CASE("Same seed gives the same clusters", "[ClusterPartitioner]") {
    TriangleMesh grid = Test::make_grid(25, 16);

    ClusterPartitioner a(grid.vertices(), 17, 10, 1234);
    ClusterPartitioner b(grid.vertices(), 17, 10, 1234);
    a.run(nullptr);
    b.run(nullptr);

    REQUIRE(a.labels() == b.labels());
    REQUIRE(a.centers() == b.centers());
}

TEST_CASE("Zero iteration budget still fits", "[ClusterPartitioner]") {
    TriangleMesh grid = Test::make_grid(10, 10);
    ClusterPartitioner partitioner(grid.vertices(), 5, 0);
    partitioner.run(nullptr);
    REQUIRE(partitioner.cluster_count() == 5);
    REQUIRE(is_partition(partitioner.clusters(), grid.vertices_count()));
}

TEST_CASE("Progress and cancellation of the refinement rounds", "[ClusterPartitioner]") {
    TriangleMesh grid = Test::make_grid(10, 10);
    ClusterPartitioner partitioner(grid.vertices(), 4, 10);

    SECTION("progress after the fit and after every round") {
        std::vector<int> rounds;
        partitioner.run(nullptr, [&rounds](int round) { rounds.push_back(round); });
        REQUIRE(rounds == std::vector<int>{ 0, 1, 2, 3 });
    }
    SECTION("cancellation is checked before every round") {
        int checks = 0;
        auto throw_if_canceled = [&checks]() {
            if (++ checks == 2)
                throw CanceledException();
        };
        REQUIRE_THROWS_AS(partitioner.run(throw_if_canceled), CanceledException);
        REQUIRE(checks == 2);
        REQUIRE(partitioner.refinement_rounds() == 1);
    }
}

TEST_CASE("Misuse of the partitioner", "[ClusterPartitioner]") {
    std::vector<Vec3f> empty;
    REQUIRE_THROWS_AS(ClusterPartitioner(empty, 3, 10).fit(), InvalidArgument);

    TriangleMesh cube = Test::make_cube();
    ClusterPartitioner partitioner(cube.vertices(), 2, 10);
    REQUIRE_THROWS_AS(partitioner.refine(), LogicError);
}
