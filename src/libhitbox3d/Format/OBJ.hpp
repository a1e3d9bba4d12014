#ifndef hitbox3d_Format_OBJ_hpp_
#define hitbox3d_Format_OBJ_hpp_

#include <string>

namespace Hitbox3D {

class TriangleMesh;
class HitboxSet;

// Load the vertices and faces of an OBJ file. Polygons are fan triangulated,
// v/vt/vn references and negative (relative) indices are accepted, all other records are ignored.
extern bool load_obj(const char *path, TriangleMesh *mesh, std::string &message);

// One "o Hitbox_<i>" object per box, 8 vertices and 12 triangles each.
extern bool store_obj(const char *path, const HitboxSet &hitboxes);

} // namespace Hitbox3D

#endif /* hitbox3d_Format_OBJ_hpp_ */
