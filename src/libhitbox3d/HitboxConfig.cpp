#include "HitboxConfig.hpp"
#include "Exception.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/fstream.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace Hitbox3D {

namespace pt = boost::property_tree;

bool parse_unsigned(const std::string &str, unsigned int &out)
{
    std::string trimmed = boost::algorithm::trim_copy(str);
    // lexical_cast accepts a leading minus sign for unsigned types.
    if (trimmed.empty() || trimmed.front() == '-')
        return false;
    try {
        out = boost::lexical_cast<unsigned int>(trimmed);
    } catch (const boost::bad_lexical_cast &) {
        return false;
    }
    return true;
}

static unsigned int parse_unsigned(const pt::ptree &tree, const char *key, unsigned int default_value)
{
    boost::optional<std::string> value = tree.get_optional<std::string>(key);
    if (! value)
        return default_value;
    std::string str = boost::algorithm::trim_copy(*value);
    if (str.empty())
        return default_value;
    unsigned int result;
    if (! parse_unsigned(str, result))
        throw InvalidArgument((boost::format("Invalid value \"%1%\" of %2%, expected a non negative integer") % str % key).str());
    return result;
}

static std::string parse_string(const pt::ptree &tree, const char *key, const std::string &default_value)
{
    boost::optional<std::string> value = tree.get_optional<std::string>(key);
    return value ? boost::algorithm::trim_copy(*value) : default_value;
}

void HitboxConfig::load(std::istream &is, const std::string &source_name)
{
    pt::ptree tree;
    try {
        pt::read_ini(is, tree);
    } catch (const pt::ini_parser::ini_parser_error &err) {
        throw RuntimeError((boost::format("Failed loading configuration file \"%1%\"\nError: \"%2%\" at line %3%") % source_name % err.message() % err.line()).str());
    }

    std::string tier_name = parse_string(tree, "decompose.tier", "");
    if (! tier_name.empty()) {
        std::optional<EPrecisionTier> parsed = PrecisionCatalog::tier_from_name(tier_name);
        if (! parsed)
            throw InvalidArgument((boost::format("Invalid value \"%1%\" of decompose.tier, expected minimal, low, medium, high or ultra") % tier_name).str());
        this->tier = *parsed;
    }
    this->seed      = parse_unsigned(tree, "decompose.seed", this->seed);
    this->log_level = parse_unsigned(tree, "log.level", this->log_level);
    if (this->log_level > 5)
        throw InvalidArgument((boost::format("Invalid value \"%1%\" of log.level, expected 0 to 5") % this->log_level).str());
    this->log_dir     = parse_string(tree, "log.dir", this->log_dir);
    this->export_json = parse_string(tree, "export.json", this->export_json);
    this->export_obj  = parse_string(tree, "export.obj", this->export_obj);
    this->export_stl  = parse_string(tree, "export.stl", this->export_stl);

    BOOST_LOG_TRIVIAL(info) << "Loaded configuration " << source_name << ": tier " << PrecisionCatalog::tier_name(this->tier) << ", seed " << this->seed;
}

void HitboxConfig::load(const std::string &path)
{
    boost::nowide::ifstream ifs(path);
    if (! ifs.is_open())
        throw RuntimeError("Failed opening configuration file \"" + path + "\"");
    this->load(ifs, path);
}

} // namespace Hitbox3D
