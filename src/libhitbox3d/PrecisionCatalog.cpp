#include "PrecisionCatalog.hpp"
#include "Exception.hpp"

#include <algorithm>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace Hitbox3D {
namespace PrecisionCatalog {

static const std::array<PrecisionPreset, size_t(EPrecisionTier::Count)> s_presets {{
    { EPrecisionTier::Minimal, "minimal",    0,  0 },
    { EPrecisionTier::Low,     "low",      150, 10 },
    { EPrecisionTier::Medium,  "medium",   300, 15 },
    { EPrecisionTier::High,    "high",     600, 20 },
    { EPrecisionTier::Ultra,   "ultra",   1200, 25 },
}};

const std::array<PrecisionPreset, size_t(EPrecisionTier::Count)>& presets()
{
    return s_presets;
}

const PrecisionPreset& lookup(EPrecisionTier tier)
{
    size_t idx = size_t(tier);
    if (idx >= s_presets.size())
        throw OutOfRange("Unknown precision tier");
    return s_presets[idx];
}

const char* tier_name(EPrecisionTier tier)
{
    return lookup(tier).name;
}

std::optional<EPrecisionTier> tier_from_name(const std::string &name)
{
    std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    boost::algorithm::replace_all(key, "_", " ");
    if (key == "super low")
        return EPrecisionTier::Minimal;
    auto it = std::find_if(s_presets.begin(), s_presets.end(), [&key](const PrecisionPreset &preset) { return key == preset.name; });
    if (it == s_presets.end())
        return std::nullopt;
    return it->tier;
}

EPrecisionTier parse_tier(const std::string &name)
{
    std::optional<EPrecisionTier> tier = tier_from_name(name);
    if (! tier)
        throw InvalidArgument("Unknown precision tier \"" + name + "\", expected one of minimal, low, medium, high, ultra");
    return *tier;
}

} // namespace PrecisionCatalog
} // namespace Hitbox3D
