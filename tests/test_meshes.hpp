#ifndef hitbox3d_tests_test_meshes_hpp_
#define hitbox3d_tests_test_meshes_hpp_

#include <string>

#include <boost/filesystem.hpp>

#include <libhitbox3d/TriangleMesh.hpp>

namespace Hitbox3D { namespace Test {

// Closed box spanning [origin, origin + size].
inline TriangleMesh make_cube(const Vec3d &origin = Vec3d::Zero(), double size = 1.)
{
    return TriangleMesh(its_make_box(BoundingBoxf3(origin, origin + Vec3d(size, size, size))));
}

// Two unit cubes, the second one shifted by `offset`.
inline TriangleMesh make_two_cubes(const Vec3d &offset = Vec3d(10., 0., 0.))
{
    indexed_triangle_set its = its_make_box(BoundingBoxf3(Vec3d::Zero(), Vec3d::Ones()));
    its_merge(its, its_make_box(BoundingBoxf3(offset, offset + Vec3d::Ones())));
    return TriangleMesh(std::move(its));
}

// Flat grid of nx * ny vertices in the XY plane with unit spacing, two triangles per cell.
inline TriangleMesh make_grid(int nx, int ny)
{
    indexed_triangle_set its;
    for (int y = 0; y < ny; ++ y)
        for (int x = 0; x < nx; ++ x)
            its.vertices.emplace_back(float(x), float(y), 0.f);
    for (int y = 0; y + 1 < ny; ++ y)
        for (int x = 0; x + 1 < nx; ++ x) {
            int v = y * nx + x;
            its.indices.emplace_back(v, v + 1, v + nx + 1);
            its.indices.emplace_back(v, v + nx + 1, v + nx);
        }
    return TriangleMesh(std::move(its));
}

// Unique path in the temp directory, the file is removed when the object goes out of scope.
class TempFile
{
public:
    explicit TempFile(const std::string &extension)
        : m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("hitbox3d-%%%%-%%%%" + extension))
    {}
    ~TempFile()
    {
        boost::system::error_code ec;
        boost::filesystem::remove(m_path, ec);
    }
    TempFile(const TempFile &) = delete;
    TempFile& operator=(const TempFile &) = delete;

    std::string string() const { return m_path.string(); }
    const char* c_str() const { return m_path.c_str(); }
    const boost::filesystem::path& path() const { return m_path; }

private:
    boost::filesystem::path m_path;
};

} } // namespace Hitbox3D::Test

#endif // hitbox3d_tests_test_meshes_hpp_
