#ifndef hitbox3d_HitboxSet_hpp_
#define hitbox3d_HitboxSet_hpp_

#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "BoundingBox.hpp"

namespace Hitbox3D {

// Ordered boxes approximating a mesh, in cluster order.
class HitboxSet
{
public:
    HitboxSet() = default;
    explicit HitboxSet(std::vector<BoundingBoxf3> boxes) : m_boxes(std::move(boxes)) {}

    size_t size() const { return m_boxes.size(); }
    bool   empty() const { return m_boxes.empty(); }
    void   clear() { m_boxes.clear(); }

    void add(const BoundingBoxf3 &box) { m_boxes.emplace_back(box); }

    const BoundingBoxf3& operator[](size_t idx) const { return m_boxes[idx]; }
    const std::vector<BoundingBoxf3>& boxes() const { return m_boxes; }

    std::vector<BoundingBoxf3>::const_iterator begin() const { return m_boxes.begin(); }
    std::vector<BoundingBoxf3>::const_iterator end() const { return m_boxes.end(); }

    // Union of all boxes.
    BoundingBoxf3 bounding_box() const;
    double        total_volume() const;

    bool operator==(const HitboxSet &rhs) const { return m_boxes == rhs.m_boxes; }
    bool operator!=(const HitboxSet &rhs) const { return !(*this == rhs); }

private:
    std::vector<BoundingBoxf3> m_boxes;
};

// A box is serialized as [[minx, miny, minz], [maxx, maxy, maxz]],
// a set as {"hitboxes": [box, ...]}.
void to_json(nlohmann::json &j, const BoundingBoxf3 &box);
void from_json(const nlohmann::json &j, BoundingBoxf3 &box);
void to_json(nlohmann::json &j, const HitboxSet &hitboxes);
void from_json(const nlohmann::json &j, HitboxSet &hitboxes);

} // namespace Hitbox3D

#endif // hitbox3d_HitboxSet_hpp_
