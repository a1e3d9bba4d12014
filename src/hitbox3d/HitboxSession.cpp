#include "HitboxSession.hpp"

#include <libhitbox3d/Exception.hpp>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

#include "Jobs/BoostThreadWorker.hpp"
#include "Jobs/UIThreadWorker.hpp"

namespace Hitbox3D {

HitboxSession::HitboxSession(std::shared_ptr<ProgressIndicator> pri, EWorkerType worker_type)
    : m_progress(std::move(pri))
{
    if (m_progress)
        m_progress->set_range(100);

    if (worker_type == EWorkerType::CallerThread)
        m_worker = std::make_unique<UIThreadWorker>(m_progress, "hitbox_worker");
    else
        m_worker = std::make_unique<BoostThreadWorker>(m_progress, "hitbox_worker");
}

HitboxSession::~HitboxSession()
{
    // Let the running job end as cancelled, it references this session.
    try {
        this->cancel();
        m_worker->wait_for_idle();
    } catch (const std::exception &ex) {
        BOOST_LOG_TRIVIAL(error) << "HitboxSession: " << ex.what();
    }
    m_worker.reset();
}

std::shared_ptr<JobHandle> HitboxSession::decompose(std::shared_ptr<const TriangleMesh> mesh, EPrecisionTier tier)
{
    return this->decompose(std::move(mesh), HitboxDecomposer::Config::from_tier(tier, m_seed));
}

std::shared_ptr<JobHandle> HitboxSession::decompose(std::shared_ptr<const TriangleMesh> mesh, HitboxDecomposer::Config config)
{
    if (this->is_running())
        throw JobAlreadyRunning("A hitbox decomposition is already running");

    auto handle = std::make_shared<JobHandle>();
    auto job = std::make_unique<DecompositionJob>(std::move(mesh), std::move(config), handle,
        [this, handle](const JobOutcome &outcome) { this->on_job_finished(handle, outcome); });

    m_active = handle;
    if (m_progress) {
        m_progress->clear_percent();
        m_progress->set_status_text("Generating hitboxes");
    }
    if (!m_worker->push(std::move(job))) {
        m_active.reset();
        throw RuntimeError("The worker rejected the hitbox decomposition job");
    }
    return handle;
}

void HitboxSession::cancel()
{
    if (! this->is_running())
        return;
    m_active->cancel();
    m_worker->cancel();
}

bool HitboxSession::is_running() const
{
    return m_active && !m_active->is_finished();
}

void HitboxSession::process_events()
{
    m_worker->process_events();
}

bool HitboxSession::wait_for_current_job(unsigned timeout_ms)
{
    return m_worker->wait_for_current_job(timeout_ms);
}

std::shared_ptr<const HitboxSet> HitboxSession::hitboxes() const
{
    std::lock_guard<std::mutex> lock(m_hitboxes_mutex);
    return m_hitboxes;
}

void HitboxSession::clear_hitboxes()
{
    std::lock_guard<std::mutex> lock(m_hitboxes_mutex);
    m_hitboxes.reset();
}

void HitboxSession::on_job_finished(const std::shared_ptr<JobHandle> &handle, const JobOutcome &outcome)
{
    if (const JobCompleted *completed = boost::get<JobCompleted>(&outcome)) {
        {
            std::lock_guard<std::mutex> lock(m_hitboxes_mutex);
            m_hitboxes = completed->hitboxes;
        }
        if (m_hitboxes_changed)
            m_hitboxes_changed(completed->hitboxes);

        handle->advance_progress(dpNotified);
        if (m_progress) {
            m_progress->set_progress(dpNotified);
            m_progress->set_status_text((boost::format("Generated %1% hitboxes") % completed->hitboxes->size()).str().c_str());
        }
    } else if (const JobFailed *failed = boost::get<JobFailed>(&outcome)) {
        if (m_progress)
            m_progress->set_status_text(failed->reason.c_str());
    } else if (m_progress) {
        m_progress->set_status_text("Hitbox generation cancelled");
    }

    if (m_progress)
        m_progress->clear_percent();
}

} // namespace Hitbox3D
