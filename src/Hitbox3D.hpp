#ifndef hitbox3d_Hitbox3D_hpp_
#define hitbox3d_Hitbox3D_hpp_

#include <optional>
#include <string>

#include <libhitbox3d/HitboxConfig.hpp>

namespace Hitbox3D {

enum ExitCode : int
{
    ecOk                  = 0,
    ecCancelled           = 1,
    ecUsage               = 2,
    ecLoadError           = 3,
    ecDecompositionFailed = 4,
    ecExportError         = 5
};

class CLI {
public:
    int run(int argc, char **argv);

private:
    // Returns ecOk or ecUsage.
    int  setup(int argc, char **argv);
    void print_help() const;

    std::string                   m_load;
    std::string                   m_config_file;
    std::optional<std::string>    m_tier;
    std::optional<unsigned int>   m_seed;
    std::optional<unsigned int>   m_loglevel;
    std::optional<std::string>    m_export_json;
    std::optional<std::string>    m_export_obj;
    std::optional<std::string>    m_export_stl;
    bool                          m_info = false;
    bool                          m_help = false;

    HitboxConfig                  m_config;
};

} // namespace Hitbox3D

#endif // hitbox3d_Hitbox3D_hpp_
