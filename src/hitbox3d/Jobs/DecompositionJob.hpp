#ifndef hitbox3d_DecompositionJob_hpp_
#define hitbox3d_DecompositionJob_hpp_

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/variant.hpp>

#include <libhitbox3d/HitboxDecomposer.hpp>
#include <libhitbox3d/HitboxSet.hpp>
#include <libhitbox3d/TriangleMesh.hpp>

#include "Job.hpp"

namespace Hitbox3D {

enum class EJobState : unsigned char
{
    Idle,
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* job_state_name(EJobState state);

struct JobCompleted
{
    std::shared_ptr<const HitboxSet> hitboxes;
};

struct JobCancelled {};

struct JobFailed
{
    std::string reason;
};

using JobOutcome = boost::variant<JobCompleted, JobCancelled, JobFailed>;

// Shared between the caller and a running DecompositionJob.
// progress() and cancel() may be called from any thread, the outcome is set
// once, on the thread pumping the worker's events.
class JobHandle
{
public:
    JobHandle() = default;
    JobHandle(const JobHandle &) = delete;
    JobHandle& operator=(const JobHandle &) = delete;

    // Percent in [0, 100], never decreases during a run.
    int  progress() const { return m_progress.load(); }
    // Cooperative, honored at the next cancellation checkpoint.
    void cancel() { m_cancel.store(true); }
    bool cancel_requested() const { return m_cancel.load(); }

    EJobState state() const;
    bool      is_running() const { return this->state() == EJobState::Running; }
    bool      is_finished() const;

    // Empty until the job has finished.
    std::optional<JobOutcome> outcome() const;

    // Called by the job.
    void advance_progress(int percent);
    void set_running();
    void finish(JobOutcome outcome);

private:
    std::atomic<int>          m_progress { 0 };
    std::atomic<bool>         m_cancel { false };
    mutable std::mutex        m_mutex;
    EJobState                 m_state { EJobState::Idle };
    std::optional<JobOutcome> m_outcome;
};

// Runs HitboxDecomposer on the worker thread.
class DecompositionJob : public Job
{
public:
    // Invoked from finalize() before the handle is finished.
    using FinishedFn = std::function<void(const JobOutcome &)>;

    DecompositionJob(std::shared_ptr<const TriangleMesh> mesh,
                     HitboxDecomposer::Config            config,
                     std::shared_ptr<JobHandle>          handle,
                     FinishedFn                          on_finished = FinishedFn());

    void process(Ctl &ctl) override;
    void finalize(bool canceled, std::exception_ptr &eptr) override;

    const std::shared_ptr<JobHandle>& handle() const { return m_handle; }

private:
    std::shared_ptr<const TriangleMesh> m_mesh;
    HitboxDecomposer::Config            m_config;
    std::shared_ptr<JobHandle>          m_handle;
    FinishedFn                          m_on_finished;
    std::shared_ptr<const HitboxSet>    m_result;
};

} // namespace Hitbox3D

#endif // hitbox3d_DecompositionJob_hpp_
