#ifndef hitbox3d_Point_hpp_
#define hitbox3d_Point_hpp_

#include <vector>

#include <Eigen/Geometry>

namespace Hitbox3D {

// Eigen types, not aligned, so that they may be stored in std::vector without an aligned allocator.
using Vec3i   = Eigen::Matrix<int,    3, 1, Eigen::DontAlign>;
using Vec3f   = Eigen::Matrix<float,  3, 1, Eigen::DontAlign>;
using Vec3d   = Eigen::Matrix<double, 3, 1, Eigen::DontAlign>;

} // namespace Hitbox3D

#endif // hitbox3d_Point_hpp_
