#ifndef hitbox3d_PrecisionCatalog_hpp_
#define hitbox3d_PrecisionCatalog_hpp_

#include <array>
#include <optional>
#include <string>

namespace Hitbox3D {

enum class EPrecisionTier : unsigned char
{
    Minimal,
    Low,
    Medium,
    High,
    Ultra,
    Count
};

// Clustering effort of a precision tier.
struct PrecisionPreset
{
    EPrecisionTier tier;
    // Name used by the configuration file and the command line.
    const char    *name;
    // Requested number of clusters, 0 for the tier which does not cluster at all.
    int            cluster_count;
    // Iteration budget of the Lloyd fit.
    int            iterations;

    bool bypass_clustering() const { return cluster_count <= 0; }
};

namespace PrecisionCatalog {

// All presets, ordered by EPrecisionTier.
const std::array<PrecisionPreset, size_t(EPrecisionTier::Count)>& presets();

const PrecisionPreset& lookup(EPrecisionTier tier);

const char* tier_name(EPrecisionTier tier);

// Case insensitive, "super low" and "super_low" are accepted for the minimal tier.
std::optional<EPrecisionTier> tier_from_name(const std::string &name);

// As tier_from_name(), throws InvalidArgument for an unknown name.
EPrecisionTier parse_tier(const std::string &name);

} // namespace PrecisionCatalog

} // namespace Hitbox3D

#endif // hitbox3d_PrecisionCatalog_hpp_
