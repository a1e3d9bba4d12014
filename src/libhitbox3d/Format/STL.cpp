#include "STL.hpp"
#include "../HitboxSet.hpp"
#include "../TriangleMesh.hpp"

#include <cstdint>
#include <cstring>

#include <boost/log/trivial.hpp>
#include <boost/nowide/cstdio.hpp>

namespace Hitbox3D {

static bool write_floats(FILE *fp, const Vec3f &v)
{
    float data[3] = { v.x(), v.y(), v.z() };
    return fwrite(data, sizeof(float), 3, fp) == 3;
}

bool store_stl(const char *path, const HitboxSet &hitboxes)
{
    FILE *fp = boost::nowide::fopen(path, "wb");
    if (fp == nullptr) {
        BOOST_LOG_TRIVIAL(error) << "store_stl: failed to open " << path << " for writing";
        return false;
    }

    indexed_triangle_set its;
    for (const BoundingBoxf3 &box : hitboxes)
        its_merge(its, its_make_box(box));

    char header[80];
    memset(header, 0, sizeof(header));
    strncpy(header, "Hitbox3D hitboxes", sizeof(header) - 1);
    bool ok = fwrite(header, 80, 1, fp) == 1;

    // STL is little endian, as is every platform this is built for.
    uint32_t num_facets = uint32_t(its.indices.size());
    ok = ok && fwrite(&num_facets, sizeof(num_facets), 1, fp) == 1;

    const uint16_t attribute = 0;
    for (const Vec3i &face : its.indices) {
        if (! ok)
            break;
        const Vec3f &p0 = its.vertices[face[0]];
        const Vec3f &p1 = its.vertices[face[1]];
        const Vec3f &p2 = its.vertices[face[2]];
        Vec3f normal = (p1 - p0).cross(p2 - p0);
        float len    = normal.norm();
        if (len > 0.f)
            normal /= len;
        ok = write_floats(fp, normal) && write_floats(fp, p0) && write_floats(fp, p1) && write_floats(fp, p2) &&
             fwrite(&attribute, sizeof(attribute), 1, fp) == 1;
    }

    if (fclose(fp) != 0)
        ok = false;
    if (! ok)
        BOOST_LOG_TRIVIAL(error) << "store_stl: failed writing " << path;
    return ok;
}

} // namespace Hitbox3D
