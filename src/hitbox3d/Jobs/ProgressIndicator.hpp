#ifndef hitbox3d_ProgressIndicator_hpp_
#define hitbox3d_ProgressIndicator_hpp_

#include <functional>
#include <string>

namespace Hitbox3D {

/**
 * @brief Generic progress indication interface.
 */
class ProgressIndicator {
public:

    /// Cancel callback function type
    using CancelFn = std::function<void()>;

    virtual ~ProgressIndicator() = default;

    virtual void clear_percent() = 0;
    virtual void set_range(int range) = 0;
    virtual void set_cancel_callback(CancelFn = CancelFn()) = 0;
    virtual void set_progress(int pr) = 0;
    virtual void set_status_text(const char *) = 0; // utf8 char array
    virtual int  get_range() const = 0;
};

} // namespace Hitbox3D

#endif // hitbox3d_ProgressIndicator_hpp_
