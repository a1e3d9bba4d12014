#ifndef hitbox3d_Worker_hpp_
#define hitbox3d_Worker_hpp_

#include <memory>

#include "Job.hpp"

namespace Hitbox3D {

// An interface of a worker that runs jobs on a dedicated worker thread, one
// after the other. It is assumed that every method of this class is called
// from the same main thread.
class Worker {
public:
    // Queue up a new job after the current one. This call does not block.
    // Returns false if the job gets discarded.
    virtual bool push(std::unique_ptr<Job> job) = 0;

    // Returns true if no job is running, the job queue is empty and no job
    // message is left to be processed. This means that nothing is left to
    // finalize or take care of in the main thread.
    virtual bool is_idle() const = 0;

    // Ask the current job gracefully to cancel. This call is not blocking and
    // the job may or may not cancel eventually, depending on its
    // implementation. Note that it is not trivial to kill a thread forcefully
    // and we don't need that.
    virtual void cancel() = 0;

    // This method will delete the queued jobs and cancel the current one.
    virtual void cancel_all() = 0;

    // Needs to be called continuously to process events (like status update
    // or finalizing of jobs) in the main thread. This can be done e.g. in a
    // timer event.
    virtual void process_events() = 0;

    // Wait until the current job finishes. Timeout will only be considered
    // if not zero. Returns false if timeout is reached but the job has not
    // finished.
    virtual bool wait_for_current_job(unsigned timeout_ms = 0) = 0;

    // Wait until the whole job queue finishes. Timeout will only be considered
    // if not zero. Returns false only if timeout is reached but the worker has
    // not reached the idle state.
    virtual bool wait_for_idle(unsigned timeout_ms = 0) = 0;

    virtual ~Worker() = default;
};

} // namespace Hitbox3D

#endif // hitbox3d_Worker_hpp_
