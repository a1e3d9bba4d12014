#include "HitboxExtractor.hpp"

#include <cassert>

namespace Hitbox3D {
namespace HitboxExtractor {

BoundingBoxf3 extract(const std::vector<Vec3f> &points)
{
    assert(! points.empty());
    return BoundingBoxf3(points);
}

BoundingBoxf3 extract(const std::vector<Vec3f> &points, const std::vector<size_t> &indices)
{
    assert(! indices.empty());
    BoundingBoxf3 bbox;
    for (size_t idx : indices)
        bbox.merge(points[idx]);
    return bbox;
}

HitboxSet extract_clusters(const std::vector<Vec3f> &points, const std::vector<std::vector<size_t>> &clusters)
{
    std::vector<BoundingBoxf3> boxes;
    boxes.reserve(clusters.size());
    for (const std::vector<size_t> &cluster : clusters)
        if (! cluster.empty())
            boxes.emplace_back(extract(points, cluster));
    return HitboxSet(std::move(boxes));
}

} // namespace HitboxExtractor
} // namespace Hitbox3D
