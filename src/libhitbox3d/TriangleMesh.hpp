#ifndef hitbox3d_TriangleMesh_hpp_
#define hitbox3d_TriangleMesh_hpp_

#include <vector>
#include <string>

#include "libhitbox3d.h"
#include "Point.hpp"
#include "BoundingBox.hpp"

namespace Hitbox3D {

// Shared vertex triangle soup, indices are 0 based.
struct indexed_triangle_set
{
    void clear() { indices.clear(); vertices.clear(); }

    size_t memsize() const { return sizeof(*this) + sizeof(Vec3i) * indices.size() + sizeof(Vec3f) * vertices.size(); }

    std::vector<Vec3i> indices;
    std::vector<Vec3f> vertices;

    bool empty() const { return indices.empty() || vertices.empty(); }
    bool operator==(const indexed_triangle_set &other) const { return this->indices == other.indices && this->vertices == other.vertices; }
};

// Geometry consumed by the decomposition. Once loaded it is only ever shared as std::shared_ptr<const TriangleMesh>.
class TriangleMesh
{
public:
    TriangleMesh() = default;
    TriangleMesh(const std::vector<Vec3f> &vertices, const std::vector<Vec3i> &faces);
    explicit TriangleMesh(const indexed_triangle_set &M);
    explicit TriangleMesh(indexed_triangle_set &&M);

    bool   empty() const { return this->its.vertices.empty(); }
    size_t facets_count() const { return this->its.indices.size(); }
    size_t vertices_count() const { return this->its.vertices.size(); }

    const std::vector<Vec3f> &vertices() const { return this->its.vertices; }
    const std::vector<Vec3i> &faces() const { return this->its.indices; }

    // Tight box of all vertices, undefined for an empty mesh.
    BoundingBoxf3 bounding_box() const;

    // Throws InvalidMeshError for an empty vertex set, a non finite coordinate
    // or a face index outside of [0, vertices_count()).
    void validate() const;
    // Same checks, the first problem found is returned in `message`.
    bool is_valid(std::string *message = nullptr) const;

    indexed_triangle_set its;
};

// Closed box with 8 vertices and 12 outward facing triangles spanning the bounding box.
indexed_triangle_set its_make_box(const BoundingBoxf3 &bbox);
// Appends the geometry of `src` to `dst`, shifting the indices.
void its_merge(indexed_triangle_set &dst, const indexed_triangle_set &src);

} // namespace Hitbox3D

#endif // hitbox3d_TriangleMesh_hpp_
