#ifndef hitbox3d_Format_STL_hpp_
#define hitbox3d_Format_STL_hpp_

namespace Hitbox3D {

class HitboxSet;

// Binary STL of the closed boxes of all hitboxes, 12 facets per box.
extern bool store_stl(const char *path, const HitboxSet &hitboxes);

} // namespace Hitbox3D

#endif /* hitbox3d_Format_STL_hpp_ */
