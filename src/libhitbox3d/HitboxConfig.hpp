#ifndef hitbox3d_HitboxConfig_hpp_
#define hitbox3d_HitboxConfig_hpp_

#include <istream>
#include <string>

#include "libhitbox3d.h"
#include "PrecisionCatalog.hpp"

namespace Hitbox3D {

// Settings of a decomposition run, read from an INI file:
//
//   [decompose]
//   tier = high
//   seed = 42
//   [log]
//   level = 2
//   dir =
//   [export]
//   json = out.json
//   obj =
//   stl =
//
// Missing keys keep their defaults.
class HitboxConfig
{
public:
    HitboxConfig() = default;

    // Throws RuntimeError if the file cannot be read or parsed,
    // InvalidArgument naming the key if a value is malformed.
    void load(const std::string &path);
    void load(std::istream &is, const std::string &source_name = "<stream>");

    EPrecisionTier tier      = EPrecisionTier::High;
    unsigned int   seed      = DEFAULT_CLUSTER_SEED;
    unsigned int   log_level = 2;
    std::string    log_dir;
    std::string    export_json;
    std::string    export_obj;
    std::string    export_stl;
};

// Parses a non negative decimal integer, surrounding blanks allowed.
// Returns false on anything else, including a leading minus sign.
bool parse_unsigned(const std::string &str, unsigned int &out);

} // namespace Hitbox3D

#endif // hitbox3d_HitboxConfig_hpp_
