#include "TriangleMesh.hpp"
#include "Exception.hpp"

#include <cmath>

#include <boost/format.hpp>

namespace Hitbox3D {

TriangleMesh::TriangleMesh(const std::vector<Vec3f> &vertices, const std::vector<Vec3i> &faces)
{
    this->its.vertices = vertices;
    this->its.indices  = faces;
}

TriangleMesh::TriangleMesh(const indexed_triangle_set &M) : its(M) {}

TriangleMesh::TriangleMesh(indexed_triangle_set &&M) : its(std::move(M)) {}

BoundingBoxf3 TriangleMesh::bounding_box() const
{
    BoundingBoxf3 bbox;
    bbox.merge(this->its.vertices);
    return bbox;
}

bool TriangleMesh::is_valid(std::string *message) const
{
    auto fail = [message](std::string &&msg) {
        if (message != nullptr)
            *message = std::move(msg);
        return false;
    };

    if (this->its.vertices.empty())
        return fail("The mesh has no vertices");

    for (size_t i = 0; i < this->its.vertices.size(); ++ i) {
        const Vec3f &v = this->its.vertices[i];
        if (! std::isfinite(v.x()) || ! std::isfinite(v.y()) || ! std::isfinite(v.z()))
            return fail((boost::format("Vertex %1% has a non finite coordinate") % i).str());
    }

    const int num_vertices = int(this->its.vertices.size());
    for (size_t i = 0; i < this->its.indices.size(); ++ i) {
        const Vec3i &face = this->its.indices[i];
        for (int j = 0; j < 3; ++ j)
            if (face[j] < 0 || face[j] >= num_vertices)
                return fail((boost::format("Face %1% references vertex %2%, the mesh has %3% vertices") % i % face[j] % num_vertices).str());
    }
    return true;
}

void TriangleMesh::validate() const
{
    std::string message;
    if (! this->is_valid(&message))
        throw InvalidMeshError(message);
}

indexed_triangle_set its_make_box(const BoundingBoxf3 &bbox)
{
    const Vec3f lo = bbox.min.cast<float>();
    const Vec3f hi = bbox.max.cast<float>();
    indexed_triangle_set its;
    its.vertices = {
        { lo.x(), lo.y(), lo.z() }, { hi.x(), lo.y(), lo.z() }, { hi.x(), hi.y(), lo.z() }, { lo.x(), hi.y(), lo.z() },
        { lo.x(), lo.y(), hi.z() }, { hi.x(), lo.y(), hi.z() }, { hi.x(), hi.y(), hi.z() }, { lo.x(), hi.y(), hi.z() }
    };
    its.indices = {
        { 0, 2, 1 }, { 0, 3, 2 },   // bottom
        { 4, 5, 6 }, { 4, 6, 7 },   // top
        { 0, 1, 5 }, { 0, 5, 4 },   // front
        { 3, 7, 6 }, { 3, 6, 2 },   // back
        { 0, 4, 7 }, { 0, 7, 3 },   // left
        { 1, 2, 6 }, { 1, 6, 5 }    // right
    };
    return its;
}

void its_merge(indexed_triangle_set &dst, const indexed_triangle_set &src)
{
    const int offset = int(dst.vertices.size());
    dst.vertices.insert(dst.vertices.end(), src.vertices.begin(), src.vertices.end());
    dst.indices.reserve(dst.indices.size() + src.indices.size());
    for (const Vec3i &face : src.indices)
        dst.indices.emplace_back(face + Vec3i(offset, offset, offset));
}

} // namespace Hitbox3D
