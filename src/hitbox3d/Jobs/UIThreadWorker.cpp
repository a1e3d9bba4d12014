#include "UIThreadWorker.hpp"

namespace Hitbox3D {

UIThreadWorker::UIThreadWorker(std::shared_ptr<ProgressIndicator> pri, const std::string &)
    : m_progress(std::move(pri))
{
    if (m_progress)
        m_progress->set_cancel_callback([this]() { this->cancel(); });
}

UIThreadWorker::~UIThreadWorker()
{
    // The indicator may outlive this worker.
    if (m_progress)
        m_progress->set_cancel_callback();
}

bool UIThreadWorker::push(std::unique_ptr<Job> job)
{
    if (! job)
        return false;
    // A cancel request does not outlive the jobs it was meant for.
    if (this->is_idle())
        m_canceled = false;
    m_jobs.emplace_back(std::move(job));
    return true;
}

bool UIThreadWorker::run_next()
{
    if (m_jobs.empty())
        return false;

    std::unique_ptr<Job> job = std::move(m_jobs.front());
    m_jobs.pop_front();

    std::exception_ptr error;
    m_running = true;
    try {
        job->process(*this);
    } catch (...) {
        // Handed to finalize() below.
        error = std::current_exception();
    }
    m_running = false;

    bool canceled = m_canceled;
    m_canceled = false;
    job->finalize(canceled, error);
    if (error)
        std::rethrow_exception(error);
    return true;
}

void UIThreadWorker::cancel_all()
{
    m_jobs.clear();
    this->cancel();
}

void UIThreadWorker::process_events()
{
    while (this->run_next()) ;
}

bool UIThreadWorker::wait_for_current_job(unsigned)
{
    this->run_next();
    return true;
}

bool UIThreadWorker::wait_for_idle(unsigned)
{
    this->process_events();
    return true;
}

void UIThreadWorker::update_status(int st, const std::string &msg)
{
    if (m_progress) {
        m_progress->set_progress(st);
        m_progress->set_status_text(msg.c_str());
    }
}

std::future<void> UIThreadWorker::call_on_main_thread(std::function<void()> fn)
{
    std::promise<void> done;
    try {
        fn();
        done.set_value();
    } catch (...) {
        // Rethrown from future::get() of the job.
        done.set_exception(std::current_exception());
    }
    return done.get_future();
}

} // namespace Hitbox3D
