#ifndef hitbox3d_HitboxSession_hpp_
#define hitbox3d_HitboxSession_hpp_

#include <functional>
#include <memory>
#include <mutex>

#include <libhitbox3d/HitboxDecomposer.hpp>
#include <libhitbox3d/HitboxSet.hpp>
#include <libhitbox3d/PrecisionCatalog.hpp>
#include <libhitbox3d/TriangleMesh.hpp>

#include "Jobs/DecompositionJob.hpp"
#include "Jobs/ProgressIndicator.hpp"
#include "Jobs/Worker.hpp"

namespace Hitbox3D {

enum class EWorkerType : unsigned char
{
    // Jobs run on a dedicated boost::thread.
    BackgroundThread,
    // Jobs run inside process_events() and the wait calls.
    CallerThread
};

// Owns the worker, the currently running decomposition and the last
// published hitbox set. All methods are to be called from one thread.
class HitboxSession
{
public:
    using HitboxesChangedFn = std::function<void(std::shared_ptr<const HitboxSet>)>;

    explicit HitboxSession(std::shared_ptr<ProgressIndicator> pri = nullptr,
                           EWorkerType worker_type = EWorkerType::BackgroundThread);
    ~HitboxSession();

    HitboxSession(const HitboxSession &) = delete;
    HitboxSession& operator=(const HitboxSession &) = delete;

    // Throws JobAlreadyRunning if the previous decomposition has not finished yet.
    std::shared_ptr<JobHandle> decompose(std::shared_ptr<const TriangleMesh> mesh, EPrecisionTier tier);
    std::shared_ptr<JobHandle> decompose(std::shared_ptr<const TriangleMesh> mesh, HitboxDecomposer::Config config);

    void cancel();
    bool is_running() const;
    const std::shared_ptr<JobHandle>& active_job() const { return m_active; }

    // Pump the worker, finished jobs are published from here.
    void process_events();
    bool wait_for_current_job(unsigned timeout_ms = 0);

    // Last successfully computed set, never a partial one. May be null.
    std::shared_ptr<const HitboxSet> hitboxes() const;
    void clear_hitboxes();

    unsigned int seed() const { return m_seed; }
    void         set_seed(unsigned int seed) { m_seed = seed; }

    // Called after a completed decomposition replaced the published set.
    void set_hitboxes_changed_callback(HitboxesChangedFn fn) { m_hitboxes_changed = std::move(fn); }

private:
    void on_job_finished(const std::shared_ptr<JobHandle> &handle, const JobOutcome &outcome);

    std::shared_ptr<ProgressIndicator> m_progress;
    unsigned int                       m_seed { DEFAULT_CLUSTER_SEED };
    std::shared_ptr<JobHandle>         m_active;
    HitboxesChangedFn                  m_hitboxes_changed;

    mutable std::mutex                 m_hitboxes_mutex;
    std::shared_ptr<const HitboxSet>   m_hitboxes;

    // Last member, the worker thread finishes before the rest is destroyed.
    std::unique_ptr<Worker>            m_worker;
};

} // namespace Hitbox3D

#endif // hitbox3d_HitboxSession_hpp_
