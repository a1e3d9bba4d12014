#include "HitboxSet.hpp"
#include "Exception.hpp"

#include <nlohmann/json.hpp>

namespace Hitbox3D {

BoundingBoxf3 HitboxSet::bounding_box() const
{
    BoundingBoxf3 bbox;
    for (const BoundingBoxf3 &box : m_boxes)
        bbox.merge(box);
    return bbox;
}

double HitboxSet::total_volume() const
{
    double volume = 0.;
    for (const BoundingBoxf3 &box : m_boxes)
        volume += box.volume();
    return volume;
}

static nlohmann::json corner_to_json(const Vec3d &pt)
{
    return nlohmann::json::array({ pt.x(), pt.y(), pt.z() });
}

static Vec3d corner_from_json(const nlohmann::json &j)
{
    if (! j.is_array() || j.size() != 3)
        throw InvalidArgument("Invalid hitbox corner JSON format. Expected [x, y, z].");
    for (const nlohmann::json &coord : j)
        if (! coord.is_number())
            throw InvalidArgument("Invalid hitbox corner JSON format. Coordinates must be numbers.");
    return Vec3d(j[0].get<double>(), j[1].get<double>(), j[2].get<double>());
}

void to_json(nlohmann::json &j, const BoundingBoxf3 &box)
{
    j = nlohmann::json::array({ corner_to_json(box.min), corner_to_json(box.max) });
}

void from_json(const nlohmann::json &j, BoundingBoxf3 &box)
{
    if (! j.is_array() || j.size() != 2)
        throw InvalidArgument("Invalid hitbox JSON format. Expected [[minx, miny, minz], [maxx, maxy, maxz]].");
    Vec3d pmin = corner_from_json(j[0]);
    Vec3d pmax = corner_from_json(j[1]);
    box = BoundingBoxf3(pmin, pmax);
    if (! box.defined)
        throw InvalidArgument("Invalid hitbox: the min corner exceeds the max corner.");
}

void to_json(nlohmann::json &j, const HitboxSet &hitboxes)
{
    nlohmann::json boxes = nlohmann::json::array();
    for (const BoundingBoxf3 &box : hitboxes)
        boxes.push_back(box);
    j = nlohmann::json{ { "hitboxes", std::move(boxes) } };
}

void from_json(const nlohmann::json &j, HitboxSet &hitboxes)
{
    if (! j.is_object() || ! j.contains("hitboxes") || ! j.at("hitboxes").is_array())
        throw InvalidArgument("Invalid hitbox set JSON format. Missing 'hitboxes' array.");
    std::vector<BoundingBoxf3> boxes;
    boxes.reserve(j.at("hitboxes").size());
    for (const nlohmann::json &item : j.at("hitboxes"))
        boxes.emplace_back(item.get<BoundingBoxf3>());
    hitboxes = HitboxSet(std::move(boxes));
}

} // namespace Hitbox3D
