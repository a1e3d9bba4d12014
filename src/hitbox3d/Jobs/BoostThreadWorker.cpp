#include "BoostThreadWorker.hpp"

#include <boost/log/trivial.hpp>

namespace Hitbox3D {

// Join timeout of the destructor.
static constexpr unsigned SHUTDOWN_TIMEOUT_MS = 10000;

class BoostThreadWorker::MessageDispatcher : public boost::static_visitor<bool>
{
public:
    explicit MessageDispatcher(BoostThreadWorker &worker) : m_worker(worker) {}

    bool operator()(boost::blank &) const { return false; }

    bool operator()(StatusUpdate &status) const
    {
        if (ProgressIndicator *pri = m_worker.get_pri()) {
            pri->set_progress(status.percent);
            pri->set_status_text(status.text.c_str());
        }
        return false;
    }

    bool operator()(QueuedJob &finished) const
    {
        -- m_worker.m_jobs_in_flight;
        finished.job->finalize(finished.canceled, finished.error);
        // Not handled by the job, escalate on the caller's thread.
        if (finished.error)
            std::rethrow_exception(finished.error);
        return true;
    }

    bool operator()(MainThreadTask &task) const
    {
        task.fn();
        task.done.set_value();
        return false;
    }

private:
    BoostThreadWorker &m_worker;
};

BoostThreadWorker::BoostThreadWorker(std::shared_ptr<ProgressIndicator> pri, const char *name)
    : m_progress(std::move(pri)), m_name(name)
{
    if (m_progress)
        m_progress->set_cancel_callback([this]() { this->cancel(); });

    m_thread = create_thread([this] { this->thread_main(); });
    if (! m_name.empty())
        set_thread_name(m_thread, m_name);
}

BoostThreadWorker::~BoostThreadWorker()
{
    // The indicator may outlive this worker.
    if (m_progress)
        m_progress->set_cancel_callback();

    bool joined = false;
    try {
        this->cancel_all();
        this->wait_for_idle(SHUTDOWN_TIMEOUT_MS);
        // An empty job stops the thread.
        m_input_queue.push(QueuedJob{});
        joined = this->join(SHUTDOWN_TIMEOUT_MS);
    } catch (const std::exception &ex) {
        BOOST_LOG_TRIVIAL(error) << "Worker " << m_name << ": shutdown failed: " << ex.what();
    }
    if (! joined) {
        BOOST_LOG_TRIVIAL(error) << "Worker " << m_name << ": the thread did not finish in time, detaching it";
        m_thread.detach();
    }
}

void BoostThreadWorker::thread_main()
{
    for (bool running = true; running;) {
        m_input_queue.consume_one(BlockingWait{}, [this, &running](QueuedJob &entry) {
            if (! entry.job) {
                running = false;
                return;
            }
            m_canceled.store(false);
            try {
                entry.job->process(*this);
            } catch (...) {
                // Finalized on the caller's thread.
                entry.error = std::current_exception();
            }
            entry.canceled = m_canceled.load();
            m_output_queue.push(std::move(entry));
        });
    }
}

bool BoostThreadWorker::join(unsigned timeout_ms)
{
    if (! m_thread.joinable())
        return true;
    return m_thread.try_join_for(boost::chrono::milliseconds(timeout_ms));
}

bool BoostThreadWorker::deliver(WorkerMessage &msg)
{
    return boost::apply_visitor(MessageDispatcher(*this), msg);
}

void BoostThreadWorker::update_status(int st, const std::string &msg)
{
    m_output_queue.push(StatusUpdate{ st, msg });
}

std::future<void> BoostThreadWorker::call_on_main_thread(std::function<void()> fn)
{
    MainThreadTask task{ std::move(fn), {} };
    std::future<void> future = task.done.get_future();
    m_output_queue.push(std::move(task));
    return future;
}

bool BoostThreadWorker::push(std::unique_ptr<Job> job)
{
    if (! job)
        return false;
    ++ m_jobs_in_flight;
    m_input_queue.push(QueuedJob{ std::move(job) });
    return true;
}

void BoostThreadWorker::cancel_all()
{
    // Jobs which did not start yet are dropped without being finalized.
    m_jobs_in_flight -= m_input_queue.clear();
    this->cancel();
}

void BoostThreadWorker::process_events()
{
    while (m_output_queue.consume_one([this](WorkerMessage &msg) { this->deliver(msg); })) ;
}

bool BoostThreadWorker::wait_for_current_job(unsigned timeout_ms)
{
    bool finished = this->is_idle();
    while (! finished) {
        bool got_message = m_output_queue.consume_one(BlockingWait{ timeout_ms }, [this, &finished](WorkerMessage &msg) {
            finished = this->deliver(msg);
        });
        if (! got_message)
            return false;
    }
    return true;
}

bool BoostThreadWorker::wait_for_idle(unsigned timeout_ms)
{
    while (! this->is_idle()) {
        bool got_message = m_output_queue.consume_one(BlockingWait{ timeout_ms }, [this](WorkerMessage &msg) { this->deliver(msg); });
        if (! got_message)
            return false;
    }
    return true;
}

} // namespace Hitbox3D
