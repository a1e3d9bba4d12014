#include "HitboxDecomposer.hpp"
#include "ClusterPartitioner.hpp"
#include "Exception.hpp"
#include "HitboxExtractor.hpp"

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace Hitbox3D {

HitboxDecomposer::Config HitboxDecomposer::Config::from_preset(const PrecisionPreset &preset, unsigned int seed)
{
    Config config;
    config.cluster_count = preset.bypass_clustering() ? 0 : preset.cluster_count;
    config.iterations    = preset.iterations;
    config.seed          = seed;
    return config;
}

void HitboxDecomposer::set_status(int percent, const std::string &message) const
{
    if (m_config.progressind)
        m_config.progressind(percent, message);
}

void HitboxDecomposer::throw_if_canceled() const
{
    if (m_config.stopcondition && m_config.stopcondition())
        throw CanceledException();
}

HitboxSet HitboxDecomposer::decompose(const TriangleMesh &mesh) const
{
    mesh.validate();
    const std::vector<Vec3f> &vertices = mesh.vertices();
    this->set_status(dpMeshAccepted, (boost::format("Mesh accepted: %1% vertices, %2% faces") % vertices.size() % mesh.facets_count()).str());

    if (m_config.bypass_clustering()) {
        this->throw_if_canceled();
        HitboxSet out;
        out.add(HitboxExtractor::extract(vertices));
        this->set_status(dpExtracted, "Generated 1 hitbox");
        return out;
    }

    ClusterPartitioner partitioner(vertices, m_config.cluster_count, m_config.iterations, m_config.seed);
    partitioner.run(
        [this]() { this->throw_if_canceled(); },
        [this, &partitioner](int round) {
            if (round == 0)
                this->set_status(dpClustered, (boost::format("Clustering fit complete: %1% clusters") % partitioner.cluster_count()).str());
            else
                this->set_status(dpClustered + round * dpRefinementStep,
                                 (boost::format("Refinement round %1% of %2%") % round % CLUSTER_REFINEMENT_ROUNDS).str());
        });

    this->throw_if_canceled();
    HitboxSet out = HitboxExtractor::extract_clusters(vertices, partitioner.clusters());
    BOOST_LOG_TRIVIAL(debug) << "HitboxDecomposer: " << out.size() << " boxes from " << partitioner.cluster_count() << " clusters";
    this->set_status(dpExtracted, (boost::format("Generated %1% hitboxes") % out.size()).str());
    return out;
}

} // namespace Hitbox3D
