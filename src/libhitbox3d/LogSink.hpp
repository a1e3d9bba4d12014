#ifndef hitbox3d_LogSink_hpp_
#define hitbox3d_LogSink_hpp_

#include <cstdint>
#include <string>

#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>

namespace Hitbox3D {

// Rotating log files, 100 MB each by default. Every file opened by the backend,
// the ones opened by a rotation included, starts with a one line JSON header
// describing the process which wrote it.
class LogSinkBackend : public boost::log::sinks::text_file_backend
{
public:
    static constexpr uintmax_t DEFAULT_ROTATION_SIZE = 100 * 1024 * 1024;

    explicit LogSinkBackend(const std::string &file_name_pattern, uintmax_t rotation_size = DEFAULT_ROTATION_SIZE);

    // {"app": ..., "version": ..., "build": ..., "pid": ..., "started": ...}
    static std::string header();
};

typedef boost::log::sinks::synchronous_sink<LogSinkBackend> LogSink;

namespace LogSinkUtil {

// <log_dir>/hitbox3d_%a_%b_%d_%H_%M_%S_<pid>.log.%N, the directory is created if missing.
std::string get_log_filename_format(const std::string &log_dir);

} // namespace LogSinkUtil

} // namespace Hitbox3D

#endif // hitbox3d_LogSink_hpp_
