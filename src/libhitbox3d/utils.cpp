#include "Utils.hpp"
#include "LogSink.hpp"

#include <cstdio>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>

namespace Hitbox3D {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::warning;
static boost::shared_ptr<LogSink>          g_log_sink;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everything including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned int get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal:   return 0;
    case boost::log::trivial::error:   return 1;
    case boost::log::trivial::warning: return 2;
    case boost::log::trivial::info:    return 3;
    case boost::log::trivial::debug:   return 4;
    case boost::log::trivial::trace:   return 5;
    default: return 2;
    }
}

std::string set_log_path_and_level(const std::string &log_dir, unsigned int level)
{
    std::string pattern = LogSinkUtil::get_log_filename_format(log_dir);

    if (g_log_sink) {
        boost::log::core::get()->remove_sink(g_log_sink);
        g_log_sink.reset();
    }

    g_log_sink = boost::make_shared<LogSink>(boost::make_shared<LogSinkBackend>(pattern));
    g_log_sink->set_formatter(
        boost::log::expressions::stream
            << "[" << boost::log::expressions::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "] "
            << boost::log::expressions::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << " "
            << "[" << boost::log::trivial::severity << "] "
            << boost::log::expressions::smessage);

    boost::log::add_common_attributes();
    boost::log::core::get()->add_sink(g_log_sink);

    set_logging_level(level);
    return pattern;
}

void flush_logs()
{
    if (g_log_sink)
        g_log_sink->flush();
}

unsigned get_current_pid()
{
#ifdef _WIN32
    return GetCurrentProcessId();
#else
    return ::getpid();
#endif
}

std::string format_memsize(size_t bytes)
{
    static const char *units[] = { "B", "KB", "MB", "GB", "TB" };
    double value = double(bytes);
    int    unit  = 0;
    while (value >= 1024. && unit < 4) {
        value /= 1024.;
        ++ unit;
    }
    char buf[64];
    if (unit == 0)
        snprintf(buf, sizeof(buf), "%zu %s", bytes, units[0]);
    else
        snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

} // namespace Hitbox3D
