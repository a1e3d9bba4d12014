#include "OBJ.hpp"
#include "../HitboxSet.hpp"
#include "../TriangleMesh.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <string>
#include <vector>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>

namespace Hitbox3D {

// Resolves a 1 based or negative (relative to the end) OBJ index into a 0 based one.
static bool parse_vertex_ref(const std::string &token, int num_vertices, int &idx)
{
    std::string first = token.substr(0, token.find('/'));
    if (first.empty())
        return false;
    char *end = nullptr;
    long  val = strtol(first.c_str(), &end, 10);
    if (end == first.c_str() || *end != 0 || val == 0)
        return false;
    idx = val > 0 ? int(val - 1) : num_vertices + int(val);
    return true;
}

bool load_obj(const char *path, TriangleMesh *mesh, std::string &message)
{
    boost::nowide::ifstream ifs(path);
    if (! ifs.is_open()) {
        message = (boost::format("Cannot open %1% for reading") % path).str();
        BOOST_LOG_TRIVIAL(error) << "load_obj: " << message;
        return false;
    }

    indexed_triangle_set its;
    std::string              line;
    std::vector<std::string> tokens;
    size_t                   line_no = 0;
    while (std::getline(ifs, line)) {
        ++ line_no;
        if (! line.empty() && line.back() == '\r')
            line.pop_back();
        boost::split(tokens, line, boost::is_any_of(" \t"), boost::token_compress_on);
        tokens.erase(std::remove(tokens.begin(), tokens.end(), std::string()), tokens.end());
        if (tokens.empty() || tokens.front()[0] == '#')
            continue;

        if (tokens.front() == "v") {
            if (tokens.size() < 4) {
                message = (boost::format("Line %1%: vertex with less than 3 coordinates") % line_no).str();
                BOOST_LOG_TRIVIAL(error) << "load_obj: " << message;
                return false;
            }
            Vec3f pt;
            for (int i = 0; i < 3; ++ i) {
                char *end = nullptr;
                pt[i] = strtof(tokens[i + 1].c_str(), &end);
                if (end == tokens[i + 1].c_str()) {
                    message = (boost::format("Line %1%: invalid vertex coordinate \"%2%\"") % line_no % tokens[i + 1]).str();
                    BOOST_LOG_TRIVIAL(error) << "load_obj: " << message;
                    return false;
                }
            }
            its.vertices.emplace_back(pt);
        } else if (tokens.front() == "f") {
            std::vector<int> polygon;
            for (size_t i = 1; i < tokens.size(); ++ i) {
                int idx;
                if (! parse_vertex_ref(tokens[i], int(its.vertices.size()), idx)) {
                    message = (boost::format("Line %1%: invalid face vertex \"%2%\"") % line_no % tokens[i]).str();
                    BOOST_LOG_TRIVIAL(error) << "load_obj: " << message;
                    return false;
                }
                polygon.emplace_back(idx);
            }
            if (polygon.size() < 3) {
                message = (boost::format("Line %1%: face with less than 3 vertices") % line_no).str();
                BOOST_LOG_TRIVIAL(error) << "load_obj: " << message;
                return false;
            }
            // fan triangulation
            for (size_t i = 2; i < polygon.size(); ++ i)
                its.indices.emplace_back(polygon[0], polygon[i - 1], polygon[i]);
        }
    }

    *mesh = TriangleMesh(std::move(its));
    if (! mesh->is_valid(&message)) {
        BOOST_LOG_TRIVIAL(error) << "load_obj: " << path << ": " << message;
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "load_obj: " << path << ": " << mesh->vertices_count() << " vertices, " << mesh->facets_count() << " faces";
    return true;
}

bool store_obj(const char *path, const HitboxSet &hitboxes)
{
    boost::nowide::ofstream file(path, std::ios::out | std::ios::trunc);
    if (! file.is_open()) {
        BOOST_LOG_TRIVIAL(error) << "store_obj: failed to open " << path << " for writing";
        return false;
    }

    file << std::setprecision(9);
    file << "# " << hitboxes.size() << " hitboxes\n";
    int vertex_offset = 1;
    for (size_t i = 0; i < hitboxes.size(); ++ i) {
        indexed_triangle_set its = its_make_box(hitboxes[i]);
        file << "o Hitbox_" << i << "\n";
        for (const Vec3f &v : its.vertices)
            file << "v " << v.x() << " " << v.y() << " " << v.z() << "\n";
        for (const Vec3i &f : its.indices)
            file << "f " << f[0] + vertex_offset << " " << f[1] + vertex_offset << " " << f[2] + vertex_offset << "\n";
        vertex_offset += int(its.vertices.size());
    }

    file.close();
    if (file.fail()) {
        BOOST_LOG_TRIVIAL(error) << "store_obj: failed writing " << path;
        return false;
    }
    return true;
}

} // namespace Hitbox3D
