#include "ClusterPartitioner.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <opencv2/core.hpp>

namespace Hitbox3D {

static inline double squared_distance(const Vec3f &a, const Vec3f &b)
{
    return (a.cast<double>() - b.cast<double>()).squaredNorm();
}

ClusterPartitioner::ClusterPartitioner(const std::vector<Vec3f> &points, int cluster_count, int iterations, unsigned int seed)
    : m_points(points), m_requested(cluster_count), m_iterations(iterations), m_seed(seed)
{}

void ClusterPartitioner::fit()
{
    if (m_points.empty())
        throw InvalidArgument("Cannot cluster an empty point set");

    m_rounds = 0;
    const size_t num_points = m_points.size();
    size_t       k          = size_t(std::max(m_requested, 1));

    if (k >= num_points) {
        this->fit_singletons();
    } else {
        size_t num_distinct = this->count_distinct_points();
        if (num_distinct < k) {
            BOOST_LOG_TRIVIAL(warning) << "ClusterPartitioner: " << k << " clusters requested for " << num_distinct
                                       << " distinct positions, clamping the cluster count";
            k = num_distinct;
        }
        if (k == 1)
            this->fit_single_cluster();
        else {
            try {
                this->fit_lloyd(int(k));
            } catch (const ClusteringError &ex) {
                BOOST_LOG_TRIVIAL(warning) << "ClusterPartitioner: " << ex.what() << ", falling back to a single cluster";
                this->fit_single_cluster();
            }
        }
    }
    m_fitted = true;
    BOOST_LOG_TRIVIAL(debug) << "ClusterPartitioner: fitted " << m_centers.size() << " clusters to " << num_points << " points";
}

void ClusterPartitioner::fit_singletons()
{
    m_singletons = true;
    m_centers    = m_points;
    m_labels.resize(m_points.size());
    for (size_t i = 0; i < m_points.size(); ++ i)
        m_labels[i] = int(i);
}

void ClusterPartitioner::fit_single_cluster()
{
    m_singletons = false;
    Vec3d sum = Vec3d::Zero();
    for (const Vec3f &pt : m_points)
        sum += pt.cast<double>();
    m_centers.assign(1, Vec3f((sum / double(m_points.size())).cast<float>()));
    m_labels.assign(m_points.size(), 0);
}

void ClusterPartitioner::fit_lloyd(int num_clusters)
{
    m_singletons = false;
    const int num_points = int(m_points.size());

    cv::Mat samples(num_points, 3, CV_32F);
    for (int i = 0; i < num_points; ++ i)
        for (int j = 0; j < 3; ++ j)
            samples.at<float>(i, j) = m_points[i][j];

    cv::Mat labels;
    cv::Mat centers;
    // Fixed generator state for a reproducible k-means++ initialisation, the caller's state is restored afterwards.
    uint64 old_state   = cv::theRNG().state;
    cv::theRNG().state = cv::RNG(m_seed).state;
    try {
        cv::kmeans(samples, num_clusters, labels, cv::TermCriteria(cv::TermCriteria::COUNT, std::max(m_iterations, 1), 0.), 1, cv::KMEANS_PP_CENTERS,
                   centers);
    } catch (const cv::Exception &ex) {
        cv::theRNG().state = old_state;
        throw ClusteringError((boost::format("k-means failed for %1% clusters: %2%") % num_clusters % ex.what()).str());
    }
    cv::theRNG().state = old_state;

    if (centers.rows != num_clusters || labels.rows != num_points)
        throw ClusteringError((boost::format("k-means returned %1% centers and %2% labels") % centers.rows % labels.rows).str());

    m_centers.resize(num_clusters);
    for (int i = 0; i < num_clusters; ++ i) {
        Vec3f center(centers.at<float>(i, 0), centers.at<float>(i, 1), centers.at<float>(i, 2));
        if (! std::isfinite(center.x()) || ! std::isfinite(center.y()) || ! std::isfinite(center.z()))
            throw ClusteringError((boost::format("k-means produced a non finite center %1%") % i).str());
        m_centers[i] = center;
    }
    m_labels.resize(num_points);
    for (int i = 0; i < num_points; ++ i) {
        int label = labels.at<int>(i, 0);
        if (label < 0 || label >= num_clusters)
            throw ClusteringError((boost::format("k-means produced an invalid label %1%") % label).str());
        m_labels[i] = label;
    }
}

size_t ClusterPartitioner::count_distinct_points() const
{
    std::vector<Vec3f> sorted(m_points);
    auto lexicographic = [](const Vec3f &a, const Vec3f &b) {
        return std::lexicographical_compare(a.data(), a.data() + 3, b.data(), b.data() + 3);
    };
    std::sort(sorted.begin(), sorted.end(), lexicographic);
    return size_t(std::unique(sorted.begin(), sorted.end()) - sorted.begin());
}

size_t ClusterPartitioner::nearest_point(const Vec3f &pt) const
{
    size_t best_idx  = 0;
    double best_dist = std::numeric_limits<double>::max();
    for (size_t i = 0; i < m_points.size(); ++ i) {
        double d = squared_distance(m_points[i], pt);
        if (d < best_dist) {
            best_dist = d;
            best_idx  = i;
        }
    }
    return best_idx;
}

void ClusterPartitioner::assign_to_nearest_center()
{
    m_labels.resize(m_points.size());
    tbb::parallel_for(tbb::blocked_range<size_t>(0, m_points.size()), [this](const tbb::blocked_range<size_t> &range) {
        for (size_t i = range.begin(); i != range.end(); ++ i) {
            int    best_label = 0;
            double best_dist  = std::numeric_limits<double>::max();
            for (size_t j = 0; j < m_centers.size(); ++ j) {
                double d = squared_distance(m_points[i], m_centers[j]);
                if (d < best_dist) {
                    best_dist  = d;
                    best_label = int(j);
                }
            }
            m_labels[i] = best_label;
        }
    });
}

void ClusterPartitioner::refine()
{
    if (! m_fitted)
        throw LogicError("ClusterPartitioner::refine() called before fit()");

    // A singleton cluster is represented by its only point already.
    if (! m_singletons) {
        std::vector<Vec3f> snapped(m_centers.size());
        tbb::parallel_for(tbb::blocked_range<size_t>(0, m_centers.size()), [this, &snapped](const tbb::blocked_range<size_t> &range) {
            for (size_t j = range.begin(); j != range.end(); ++ j)
                snapped[j] = m_points[this->nearest_point(m_centers[j])];
        });
        m_centers = std::move(snapped);
        this->assign_to_nearest_center();
    }
    ++ m_rounds;
}

void ClusterPartitioner::run(const ThrowIfCanceledFn &throw_if_canceled, const ProgressFn &progress)
{
    this->fit();
    if (progress)
        progress(0);
    for (int round = 1; round <= CLUSTER_REFINEMENT_ROUNDS; ++ round) {
        if (throw_if_canceled)
            throw_if_canceled();
        this->refine();
        if (progress)
            progress(round);
    }
}

std::vector<std::vector<size_t>> ClusterPartitioner::clusters() const
{
    std::vector<std::vector<size_t>> out(m_centers.size());
    for (size_t i = 0; i < m_labels.size(); ++ i)
        out[m_labels[i]].emplace_back(i);
    return out;
}

} // namespace Hitbox3D
