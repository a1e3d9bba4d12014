#ifndef hitbox3d_Thread_hpp_
#define hitbox3d_Thread_hpp_

#include <string>
#include <utility>

#include <boost/thread.hpp>

namespace Hitbox3D {

// Name the thread for the debugger and for system tools (15 characters at most on Linux).
bool set_thread_name(boost::thread &thread, const char *thread_name);
inline bool set_thread_name(boost::thread &thread, const std::string &thread_name) { return set_thread_name(thread, thread_name.c_str()); }

// Worker threads get the same stack size as the TBB worker threads: 4MB on 64bit, 2MB on 32bit systems.
template<class Fn>
inline boost::thread create_thread(boost::thread::attributes &attrs, Fn &&fn)
{
    attrs.set_stack_size((sizeof(void*) == 4) ? (2048 * 1024) : (4096 * 1024));
    return boost::thread{attrs, std::forward<Fn>(fn)};
}

template<class Fn> inline boost::thread create_thread(Fn &&fn)
{
    boost::thread::attributes attrs;
    return create_thread(attrs, std::forward<Fn>(fn));
}

} // namespace Hitbox3D

#endif // hitbox3d_Thread_hpp_
