#include "Thread.hpp"

#include <cstring>

#ifdef __linux__
#include <pthread.h>
#endif

#include <boost/log/trivial.hpp>

namespace Hitbox3D {

#ifdef __linux__

// pthread names are limited to 16 bytes including the terminating zero.
static void truncated_name(const char *thread_name, char *buf)
{
    strncpy(buf, thread_name, 15);
    buf[15] = 0;
}

bool set_thread_name(boost::thread &thread, const char *thread_name)
{
    char buf[16];
    truncated_name(thread_name, buf);
    if (pthread_setname_np(thread.native_handle(), buf) != 0) {
        BOOST_LOG_TRIVIAL(debug) << "Failed to name thread " << thread_name;
        return false;
    }
    return true;
}

#else

// Thread naming is only wired up for Linux.
bool set_thread_name(boost::thread &, const char *) { return false; }

#endif

} // namespace Hitbox3D
