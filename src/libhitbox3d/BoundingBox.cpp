#include "BoundingBox.hpp"

#include <cassert>

namespace Hitbox3D {

void BoundingBoxf3::merge(const Vec3d &point)
{
    if (this->defined) {
        this->min = this->min.cwiseMin(point);
        this->max = this->max.cwiseMax(point);
    } else {
        this->min     = point;
        this->max     = point;
        this->defined = true;
    }
}

void BoundingBoxf3::merge(const std::vector<Vec3d> &points)
{
    for (const Vec3d &pt : points)
        this->merge(pt);
}

void BoundingBoxf3::merge(const std::vector<Vec3f> &points)
{
    for (const Vec3f &pt : points)
        this->merge(pt);
}

void BoundingBoxf3::merge(const BoundingBoxf3 &bb)
{
    if (! bb.defined)
        return;
    if (this->defined) {
        this->min = this->min.cwiseMin(bb.min);
        this->max = this->max.cwiseMax(bb.max);
    } else {
        this->min     = bb.min;
        this->max     = bb.max;
        this->defined = true;
    }
}

double BoundingBoxf3::volume() const
{
    if (! this->defined)
        return 0.;
    Vec3d sz = this->size();
    return sz.x() * sz.y() * sz.z();
}

double BoundingBoxf3::radius() const
{
    assert(this->defined);
    return 0.5 * this->size().norm();
}

bool BoundingBoxf3::is_degenerate() const
{
    Vec3d sz = this->size();
    return sz.x() <= 0. || sz.y() <= 0. || sz.z() <= 0.;
}

} // namespace Hitbox3D
