#ifndef hitbox3d_HitboxDecomposer_hpp_
#define hitbox3d_HitboxDecomposer_hpp_

#include <functional>
#include <string>

#include "libhitbox3d.h"
#include "HitboxSet.hpp"
#include "PrecisionCatalog.hpp"
#include "TriangleMesh.hpp"

namespace Hitbox3D {

// Progress milestones reported by HitboxDecomposer::decompose().
enum DecompositionProgress : int
{
    dpIdle            = 0,
    dpMeshAccepted    = 10,
    dpClustered       = 50,
    // Added after every refinement round, 50 -> 80.
    dpRefinementStep  = 10,
    dpExtracted       = 90,
    dpNotified        = 100
};

// Approximates a mesh by axis aligned boxes: the vertices are partitioned into clusters
// (ClusterPartitioner) and every non empty cluster contributes its tight box.
// The minimal tier skips clustering and yields the bounding box of the whole mesh.
class HitboxDecomposer
{
public:
    struct Config
    {
        // 0 skips clustering.
        int          cluster_count = 0;
        int          iterations    = 0;
        unsigned int seed          = DEFAULT_CLUSTER_SEED;

        // Receives the percentage and a status text.
        std::function<void(int, const std::string &)> progressind   = nullptr;
        // Polled at the cancellation checkpoints, returns true to cancel.
        std::function<bool()>                         stopcondition = nullptr;

        bool bypass_clustering() const { return cluster_count <= 0; }

        static Config from_preset(const PrecisionPreset &preset, unsigned int seed = DEFAULT_CLUSTER_SEED);
        static Config from_tier(EPrecisionTier tier, unsigned int seed = DEFAULT_CLUSTER_SEED)
        {
            return from_preset(PrecisionCatalog::lookup(tier), seed);
        }
    };

    explicit HitboxDecomposer(Config config) : m_config(std::move(config)) {}

    // Throws InvalidMeshError before any work if the mesh is malformed,
    // CanceledException if the stop condition fires at a checkpoint.
    HitboxSet decompose(const TriangleMesh &mesh) const;

    const Config& config() const { return m_config; }

private:
    void set_status(int percent, const std::string &message) const;
    void throw_if_canceled() const;

    Config m_config;
};

} // namespace Hitbox3D

#endif // hitbox3d_HitboxDecomposer_hpp_
