#ifndef hitbox3d_Utils_hpp_
#define hitbox3d_Utils_hpp_

#include <string>

namespace Hitbox3D {

// 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
extern void         set_logging_level(unsigned int level);
extern unsigned int get_logging_level();
// Adds a rotating log file sink writing into `log_dir` and sets the logging level.
// Returns the file name pattern of the log files.
extern std::string  set_log_path_and_level(const std::string &log_dir, unsigned int level);
extern void         flush_logs();

extern unsigned     get_current_pid();

// Human readable file size, i.e. "1.5 MB".
extern std::string  format_memsize(size_t bytes);

} // namespace Hitbox3D

#endif // hitbox3d_Utils_hpp_
