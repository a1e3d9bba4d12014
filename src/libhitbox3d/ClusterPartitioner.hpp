#ifndef hitbox3d_ClusterPartitioner_hpp_
#define hitbox3d_ClusterPartitioner_hpp_

#include <functional>
#include <vector>

#include "libhitbox3d.h"
#include "Point.hpp"

namespace Hitbox3D {

// Splits a point set into spatial clusters.
//
// A Lloyd (k-means) fit with k-means++ initialisation is followed by a fixed number
// of medoid snap rounds: every cluster center is moved onto the closest real point
// and all points are assigned to their closest center again. The final assignment
// is a partition, every point belongs to exactly one cluster. Clusters may end up
// empty after the snapping.
//
// The requested cluster count is clamped to the number of points. If it reaches the
// number of points, every point becomes a singleton cluster and no fit is run.
// If the points have fewer distinct positions than requested clusters, the count is
// clamped to the number of distinct positions.
class ClusterPartitioner
{
public:
    using ThrowIfCanceledFn = std::function<void()>;
    // Called with 0 once the fit is done and with the 1 based round index after each refinement round.
    using ProgressFn        = std::function<void(int round)>;

    // `points` are borrowed and must outlive the partitioner.
    ClusterPartitioner(const std::vector<Vec3f> &points, int cluster_count, int iterations, unsigned int seed = DEFAULT_CLUSTER_SEED);

    void fit();
    // One medoid snap round. Requires fit().
    void refine();
    // fit() followed by CLUSTER_REFINEMENT_ROUNDS calls to refine(), throw_if_canceled() is called before every round.
    void run(const ThrowIfCanceledFn &throw_if_canceled, const ProgressFn &progress = nullptr);

    bool                      fitted() const { return m_fitted; }
    int                       refinement_rounds() const { return m_rounds; }
    int                       requested_cluster_count() const { return m_requested; }
    int                       cluster_count() const { return int(m_centers.size()); }
    const std::vector<int>&   labels() const { return m_labels; }
    const std::vector<Vec3f>& centers() const { return m_centers; }

    // Member point indices of each cluster in cluster order, empty clusters included.
    std::vector<std::vector<size_t>> clusters() const;

private:
    void   fit_singletons();
    void   fit_single_cluster();
    // Throws ClusteringError if the backend fails or produces unusable centers.
    void   fit_lloyd(int num_clusters);
    size_t count_distinct_points() const;
    // Closest point to `pt`, ties resolved to the lowest point index.
    size_t nearest_point(const Vec3f &pt) const;
    // Closest center for every point, ties resolved to the lowest center index.
    void   assign_to_nearest_center();

    const std::vector<Vec3f> &m_points;
    int                       m_requested;
    int                       m_iterations;
    unsigned int              m_seed;

    bool                      m_fitted     { false };
    bool                      m_singletons { false };
    int                       m_rounds     { 0 };
    std::vector<int>          m_labels;
    std::vector<Vec3f>        m_centers;
};

} // namespace Hitbox3D

#endif // hitbox3d_ClusterPartitioner_hpp_
