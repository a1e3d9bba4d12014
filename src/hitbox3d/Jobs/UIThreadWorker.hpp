#ifndef hitbox3d_UIThreadWorker_hpp_
#define hitbox3d_UIThreadWorker_hpp_

#include <deque>
#include <memory>
#include <string>

#include "ProgressIndicator.hpp"
#include "Worker.hpp"

namespace Hitbox3D {

// Worker without a thread of its own: the queued jobs run synchronously inside
// process_events() and the wait_*() calls, on the caller's thread. Status
// updates reach the progress indicator immediately.
class UIThreadWorker : public Worker, private Job::Ctl
{
public:
    UIThreadWorker() = default;
    explicit UIThreadWorker(std::shared_ptr<ProgressIndicator> pri, const std::string & /* name */ = "");
    ~UIThreadWorker() override;

    bool push(std::unique_ptr<Job> job) override;
    bool is_idle() const override { return ! m_running && m_jobs.empty(); }
    void cancel() override { m_canceled = true; }
    void cancel_all() override;
    void process_events() override;
    bool wait_for_current_job(unsigned timeout_ms = 0) override;
    bool wait_for_idle(unsigned timeout_ms = 0) override;

    ProgressIndicator* get_pri() const { return m_progress.get(); }

protected:
    void              update_status(int st, const std::string &msg = "") override;
    bool              was_canceled() const override { return m_canceled; }
    // Runs `fn` right away, the caller is the main thread already.
    std::future<void> call_on_main_thread(std::function<void()> fn) override;

private:
    // Processes and finalizes the oldest job. Returns false if there was none.
    bool run_next();

    std::deque<std::unique_ptr<Job>>   m_jobs;
    std::shared_ptr<ProgressIndicator> m_progress;
    bool                               m_running  = false;
    bool                               m_canceled = false;
};

} // namespace Hitbox3D

#endif // hitbox3d_UIThreadWorker_hpp_
