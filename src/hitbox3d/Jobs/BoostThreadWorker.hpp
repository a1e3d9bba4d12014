#ifndef hitbox3d_BoostThreadWorker_hpp_
#define hitbox3d_BoostThreadWorker_hpp_

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include <boost/variant.hpp>

#include <libhitbox3d/Thread.hpp>

#include "ProgressIndicator.hpp"
#include "ThreadSafeQueue.hpp"
#include "Worker.hpp"

namespace Hitbox3D {

// Worker running its jobs one after the other on a single boost::thread.
//
// Jobs travel to the thread through an input queue. Everything the thread
// wants the caller to see travels back through an output queue, which is
// drained by process_events() and the wait_*() calls on the caller's thread:
// status updates, functors to be executed on the caller's thread and the
// finished jobs, which are finalized there.
class BoostThreadWorker : public Worker, private Job::Ctl
{
    // A job on its way to the thread and back.
    struct QueuedJob
    {
        std::unique_ptr<Job> job;
        bool                 canceled = false;
        std::exception_ptr   error;
    };

    struct StatusUpdate
    {
        int         percent = 0;
        std::string text;
    };

    struct MainThreadTask
    {
        std::function<void()> fn;
        std::promise<void>    done;
    };

    // boost::blank keeps the message default constructible for the queue.
    using WorkerMessage = boost::variant<boost::blank, StatusUpdate, QueuedJob, MainThreadTask>;

    class MessageDispatcher;

    using JobQueue     = ThreadSafeQueueSPSC<QueuedJob>;
    using MessageQueue = ThreadSafeQueueSPSC<WorkerMessage>;

public:
    explicit BoostThreadWorker(std::shared_ptr<ProgressIndicator> pri, const char *name = "");
    ~BoostThreadWorker() override;

    BoostThreadWorker(const BoostThreadWorker &) = delete;
    BoostThreadWorker &operator=(const BoostThreadWorker &) = delete;

    bool push(std::unique_ptr<Job> job) override;
    bool is_idle() const override { return m_jobs_in_flight == 0 && m_output_queue.empty(); }
    void cancel() override { m_canceled.store(true); }
    void cancel_all() override;
    void process_events() override;
    bool wait_for_current_job(unsigned timeout_ms = 0) override;
    bool wait_for_idle(unsigned timeout_ms = 0) override;

    ProgressIndicator* get_pri() const { return m_progress.get(); }

protected:
    // Job::Ctl, called from the worker thread.
    void              update_status(int st, const std::string &msg = "") override;
    bool              was_canceled() const override { return m_canceled.load(); }
    std::future<void> call_on_main_thread(std::function<void()> fn) override;

private:
    void thread_main();
    // Delivers one message on the caller's thread, returns true for a finished job.
    bool deliver(WorkerMessage &msg);
    bool join(unsigned timeout_ms);

    std::shared_ptr<ProgressIndicator> m_progress;
    std::string                        m_name;
    std::atomic<bool>                  m_canceled { false };
    // Pushed and not yet finalized, only touched on the caller's thread.
    size_t                             m_jobs_in_flight { 0 };
    JobQueue                           m_input_queue;
    MessageQueue                       m_output_queue;
    boost::thread                      m_thread;
};

} // namespace Hitbox3D

#endif // hitbox3d_BoostThreadWorker_hpp_
