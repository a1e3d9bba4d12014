#include "DecompositionJob.hpp"

#include <algorithm>

#include <libhitbox3d/Exception.hpp>

#include <boost/log/trivial.hpp>

namespace Hitbox3D {

const char* job_state_name(EJobState state)
{
    switch (state) {
    case EJobState::Idle:      return "idle";
    case EJobState::Running:   return "running";
    case EJobState::Completed: return "completed";
    case EJobState::Cancelled: return "cancelled";
    case EJobState::Failed:    return "failed";
    }
    return "unknown";
}

EJobState JobHandle::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool JobHandle::is_finished() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome.has_value();
}

std::optional<JobOutcome> JobHandle::outcome() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome;
}

void JobHandle::advance_progress(int percent)
{
    percent = std::max(0, std::min(100, percent));
    int current = m_progress.load();
    while (current < percent && !m_progress.compare_exchange_weak(current, percent)) ;
}

void JobHandle::set_running()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = EJobState::Running;
}

namespace {
struct OutcomeState : public boost::static_visitor<EJobState>
{
    EJobState operator()(const JobCompleted &) const { return EJobState::Completed; }
    EJobState operator()(const JobCancelled &) const { return EJobState::Cancelled; }
    EJobState operator()(const JobFailed &) const { return EJobState::Failed; }
};
} // namespace

void JobHandle::finish(JobOutcome outcome)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state   = boost::apply_visitor(OutcomeState(), outcome);
    m_outcome = std::move(outcome);
}

DecompositionJob::DecompositionJob(std::shared_ptr<const TriangleMesh> mesh,
                                   HitboxDecomposer::Config            config,
                                   std::shared_ptr<JobHandle>          handle,
                                   FinishedFn                          on_finished)
    : m_mesh(std::move(mesh))
    , m_config(std::move(config))
    , m_handle(handle ? std::move(handle) : std::make_shared<JobHandle>())
    , m_on_finished(std::move(on_finished))
{
    m_handle->set_running();
}

void DecompositionJob::process(Ctl &ctl)
{
    if (!m_mesh)
        throw InvalidMeshError("No mesh loaded");

    BOOST_LOG_TRIVIAL(info) << "DecompositionJob: started, " << m_mesh->vertices().size() << " vertices, "
                            << (m_config.bypass_clustering() ? 0 : m_config.cluster_count) << " clusters requested";

    HitboxDecomposer::Config config = m_config;
    std::shared_ptr<JobHandle> handle = m_handle;
    config.progressind = [&ctl, handle](int percent, const std::string &message) {
        handle->advance_progress(percent);
        ctl.update_status(percent, message);
    };
    config.stopcondition = [&ctl, handle]() {
        return ctl.was_canceled() || handle->cancel_requested();
    };

    HitboxDecomposer decomposer(std::move(config));
    m_result = std::make_shared<const HitboxSet>(decomposer.decompose(*m_mesh));
}

void DecompositionJob::finalize(bool canceled, std::exception_ptr &eptr)
{
    JobOutcome outcome = JobCancelled();
    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const CanceledException &) {
            outcome = JobCancelled();
        } catch (const InvalidMeshError &ex) {
            outcome = JobFailed{ std::string("Invalid mesh: ") + ex.what() };
        } catch (const std::exception &ex) {
            outcome = JobFailed{ ex.what() };
        }
        eptr = nullptr;
    } else if (canceled || m_handle->cancel_requested() || !m_result) {
        outcome = JobCancelled();
    } else {
        outcome = JobCompleted{ m_result };
    }

    if (const JobFailed *failed = boost::get<JobFailed>(&outcome))
        BOOST_LOG_TRIVIAL(error) << "DecompositionJob: failed: " << failed->reason;
    else if (boost::get<JobCancelled>(&outcome))
        BOOST_LOG_TRIVIAL(info) << "DecompositionJob: cancelled";
    else
        BOOST_LOG_TRIVIAL(info) << "DecompositionJob: finished, " << m_result->size() << " hitboxes";

    if (m_on_finished)
        m_on_finished(outcome);
    m_handle->finish(std::move(outcome));
}

} // namespace Hitbox3D
