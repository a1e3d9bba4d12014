#include "LogSink.hpp"
#include "Utils.hpp"
#include "libhitbox3d.h"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <boost/filesystem.hpp>

#include <nlohmann/json.hpp>

namespace Hitbox3D {

static std::string local_time_string(const char *format)
{
    std::time_t t = std::time(nullptr);
    std::ostringstream ss;
    ss << std::put_time(std::localtime(&t), format);
    return ss.str();
}

LogSinkBackend::LogSinkBackend(const std::string &file_name_pattern, uintmax_t rotation_size)
{
    this->set_file_name_pattern(file_name_pattern);
    this->set_rotation_size(rotation_size);
    this->set_open_mode(std::ios::binary | std::ios::app);
    this->set_open_handler([](stream_type &file) { file << header() << "\n"; });
}

std::string LogSinkBackend::header()
{
    nlohmann::json j;
    j["app"]     = HITBOX3D_APP_NAME;
    j["version"] = HITBOX3D_VERSION;
    j["build"]   = HITBOX3D_BUILD_ID;
    j["pid"]     = get_current_pid();
    j["started"] = local_time_string("%Y-%m-%d %H:%M:%S");
    return j.dump();
}

namespace LogSinkUtil {

std::string get_log_filename_format(const std::string &log_dir)
{
    std::string file_name = local_time_string("hitbox3d_%a_%b_%d_%H_%M_%S_") + std::to_string(get_current_pid()) + ".log.%N";
    if (log_dir.empty())
        return file_name;

    boost::system::error_code ec;
    boost::filesystem::path   dir(log_dir);
    if (! boost::filesystem::exists(dir, ec))
        boost::filesystem::create_directories(dir, ec);
    if (ec) {
        // The logger is not set up yet.
        fprintf(stderr, "Cannot create the log directory %s: %s\n", log_dir.c_str(), ec.message().c_str());
        return file_name;
    }
    return (dir / file_name).make_preferred().string();
}

} // namespace LogSinkUtil

} // namespace Hitbox3D
