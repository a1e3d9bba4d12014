#ifndef hitbox3d_Format_HitboxJSON_hpp_
#define hitbox3d_Format_HitboxJSON_hpp_

#include <string>

namespace Hitbox3D {

class HitboxSet;

// {"hitboxes": [[[minx, miny, minz], [maxx, maxy, maxz]], ...]}, boxes in set order, indented by 2 spaces.
extern bool store_hitboxes_json(const char *path, const HitboxSet &hitboxes);

// Reads a file written by store_hitboxes_json(). On failure `message` describes the problem.
extern bool load_hitboxes_json(const char *path, HitboxSet &hitboxes, std::string &message);

} // namespace Hitbox3D

#endif /* hitbox3d_Format_HitboxJSON_hpp_ */
