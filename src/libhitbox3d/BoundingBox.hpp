#ifndef hitbox3d_BoundingBox_hpp_
#define hitbox3d_BoundingBox_hpp_

#include "libhitbox3d.h"
#include "Point.hpp"

namespace Hitbox3D {

// Axis aligned box. A box built from a single point is legal and has zero volume.
class BoundingBoxf3
{
public:
    Vec3d min     = Vec3d::Zero();
    Vec3d max     = Vec3d::Zero();
    bool  defined = false;

    BoundingBoxf3() = default;
    BoundingBoxf3(const Vec3d &pmin, const Vec3d &pmax)
        : min(pmin), max(pmax), defined(pmin.x() <= pmax.x() && pmin.y() <= pmax.y() && pmin.z() <= pmax.z())
    {}
    explicit BoundingBoxf3(const std::vector<Vec3d> &points) { this->merge(points); }
    explicit BoundingBoxf3(const std::vector<Vec3f> &points) { this->merge(points); }

    void reset() { this->defined = false; this->min = Vec3d::Zero(); this->max = Vec3d::Zero(); }
    void merge(const Vec3d &point);
    void merge(const Vec3f &point) { this->merge(Vec3d(point.cast<double>())); }
    void merge(const std::vector<Vec3d> &points);
    void merge(const std::vector<Vec3f> &points);
    void merge(const BoundingBoxf3 &bb);

    Vec3d  size() const { return this->max - this->min; }
    Vec3d  center() const { return 0.5 * (this->min + this->max); }
    double volume() const;
    double radius() const;
    bool   is_degenerate() const;

    bool contains(const Vec3d &point) const
    {
        return point.x() >= this->min.x() && point.x() <= this->max.x()
            && point.y() >= this->min.y() && point.y() <= this->max.y()
            && point.z() >= this->min.z() && point.z() <= this->max.z();
    }
    bool contains(const BoundingBoxf3 &other) const { return this->contains(other.min) && this->contains(other.max); }

    bool operator==(const BoundingBoxf3 &rhs) const { return this->min == rhs.min && this->max == rhs.max; }
    bool operator!=(const BoundingBoxf3 &rhs) const { return !(*this == rhs); }
};

} // namespace Hitbox3D

#endif // hitbox3d_BoundingBox_hpp_
