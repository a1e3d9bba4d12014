#include "HitboxJSON.hpp"
#include "../Exception.hpp"
#include "../HitboxSet.hpp"

#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>

#include <nlohmann/json.hpp>

namespace Hitbox3D {

bool store_hitboxes_json(const char *path, const HitboxSet &hitboxes)
{
    nlohmann::json j = hitboxes;

    boost::nowide::ofstream file(path, std::ios::out | std::ios::trunc);
    if (! file.is_open()) {
        BOOST_LOG_TRIVIAL(error) << "store_hitboxes_json: failed to open " << path << " for writing";
        return false;
    }
    file << j.dump(2) << "\n";
    file.close();
    if (file.fail()) {
        BOOST_LOG_TRIVIAL(error) << "store_hitboxes_json: failed writing " << path;
        return false;
    }
    BOOST_LOG_TRIVIAL(info) << "store_hitboxes_json: " << hitboxes.size() << " hitboxes written to " << path;
    return true;
}

bool load_hitboxes_json(const char *path, HitboxSet &hitboxes, std::string &message)
{
    message.clear();
    boost::nowide::ifstream file(path);
    if (! file.is_open()) {
        message = std::string("Cannot open ") + path + " for reading";
        BOOST_LOG_TRIVIAL(error) << "load_hitboxes_json: " << message;
        return false;
    }

    HitboxSet loaded;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        loaded = j.get<HitboxSet>();
    } catch (const nlohmann::json::exception &ex) {
        message = ex.what();
    } catch (const InvalidArgument &ex) {
        message = ex.what();
    }
    if (! message.empty()) {
        BOOST_LOG_TRIVIAL(error) << "load_hitboxes_json: " << path << ": " << message;
        return false;
    }
    hitboxes = std::move(loaded);
    return true;
}

} // namespace Hitbox3D
