#ifndef hitbox3d_HitboxExtractor_hpp_
#define hitbox3d_HitboxExtractor_hpp_

#include <vector>

#include "BoundingBox.hpp"
#include "HitboxSet.hpp"

namespace Hitbox3D {

namespace HitboxExtractor {

// Tightest box of all points. `points` must not be empty.
BoundingBoxf3 extract(const std::vector<Vec3f> &points);

// Tightest box of the indexed subset of `points`. `indices` must not be empty.
BoundingBoxf3 extract(const std::vector<Vec3f> &points, const std::vector<size_t> &indices);

// One box per non empty cluster, in cluster order.
HitboxSet extract_clusters(const std::vector<Vec3f> &points, const std::vector<std::vector<size_t>> &clusters);

} // namespace HitboxExtractor

} // namespace Hitbox3D

#endif // hitbox3d_HitboxExtractor_hpp_
