#ifndef hitbox3d_Job_hpp_
#define hitbox3d_Job_hpp_

#include <exception>
#include <functional>
#include <future>
#include <string>

namespace Hitbox3D {

// A unit of work executed by a Worker. process() runs on the worker's thread,
// finalize() on the thread which pumps the worker's events (Worker::process_events()).
class Job {
public:

    // A controller interface that informs the job about cancellation and
    // makes it possible for the job to advertise its status.
    class Ctl {
    public:
        virtual ~Ctl() = default;

        // status update, to be used from the work thread (process() method)
        virtual void update_status(int st, const std::string &msg = "") = 0;

        // Returns true if the job was asked to cancel itself.
        virtual bool was_canceled() const = 0;

        // Execute a functor on the main thread. The future can be used to wait
        // for the functor's completion.
        virtual std::future<void> call_on_main_thread(std::function<void()> fn) = 0;
    };

    // Runs in a background thread, publishes nothing.
    virtual void process(Ctl &ctl) = 0;

    // Runs on the main thread once process() returned, even if it threw.
    // `canceled` is true if cancellation was requested while the job ran,
    // `eptr` holds the exception which escaped process(). Reset `eptr` once the
    // exception is handled, otherwise the worker rethrows it on the main thread.
    virtual void finalize(bool /*canceled*/, std::exception_ptr &) {}

    virtual ~Job() = default;
};

} // namespace Hitbox3D

#endif // hitbox3d_Job_hpp_
