#include "Hitbox3D.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <thread>

#include <boost/log/trivial.hpp>
#include <boost/nowide/args.hpp>

#include <libhitbox3d/libhitbox3d.h>
#include <libhitbox3d/Exception.hpp>
#include <libhitbox3d/Format/HitboxJSON.hpp>
#include <libhitbox3d/Format/OBJ.hpp>
#include <libhitbox3d/Format/STL.hpp>
#include <libhitbox3d/TriangleMesh.hpp>
#include <libhitbox3d/Utils.hpp>

#include "hitbox3d/ConsoleProgressIndicator.hpp"
#include "hitbox3d/HitboxSession.hpp"

namespace Hitbox3D {

namespace {

std::atomic<bool> g_interrupted { false };

extern "C" void on_sigint(int)
{
    g_interrupted.store(true);
}

} // namespace

void CLI::print_help() const
{
    fprintf(stderr, "%s %s (build %s)\n", HITBOX3D_APP_NAME, HITBOX3D_VERSION, HITBOX3D_BUILD_ID);
    fprintf(stderr, "Usage: hitbox3d --load mesh.obj [--tier minimal|low|medium|high|ultra] [--seed n] [--config file.ini]\n"
                    "                [--export-json f] [--export-obj f] [--export-stl f] [--info] [--loglevel 0..5]\n");
}

int CLI::setup(int argc, char **argv)
{
    for (int i = 1; i < argc; ++ i) {
        const char *arg = argv[i];
        bool has_value = i + 1 < argc;
        if (!strcmp(arg, "--load") && has_value) m_load = argv[++ i];
        else if (!strcmp(arg, "--config") && has_value) m_config_file = argv[++ i];
        else if (!strcmp(arg, "--tier") && has_value) m_tier = std::string(argv[++ i]);
        else if (!strcmp(arg, "--seed") && has_value) {
            unsigned int seed;
            if (!parse_unsigned(argv[++ i], seed)) { fprintf(stderr, "Invalid seed: %s\n", argv[i]); return ecUsage; }
            m_seed = seed;
        }
        else if (!strcmp(arg, "--loglevel") && has_value) {
            unsigned int level;
            if (!parse_unsigned(argv[++ i], level) || level > 5) { fprintf(stderr, "Invalid log level: %s\n", argv[i]); return ecUsage; }
            m_loglevel = level;
        }
        else if (!strcmp(arg, "--export-json") && has_value) m_export_json = std::string(argv[++ i]);
        else if (!strcmp(arg, "--export-obj") && has_value) m_export_obj = std::string(argv[++ i]);
        else if (!strcmp(arg, "--export-stl") && has_value) m_export_stl = std::string(argv[++ i]);
        else if (!strcmp(arg, "--info")) m_info = true;
        else if (!strcmp(arg, "--help") || !strcmp(arg, "-h")) m_help = true;
        else { fprintf(stderr, "Unknown or incomplete option: %s\n", arg); return ecUsage; }
    }

    if (m_help)
        return ecOk;
    if (m_load.empty()) {
        fprintf(stderr, "No mesh given, use --load\n");
        return ecUsage;
    }

    try {
        if (!m_config_file.empty())
            m_config.load(m_config_file);
        // Command line overrides the configuration file.
        if (m_tier)        m_config.tier = PrecisionCatalog::parse_tier(*m_tier);
        if (m_seed)        m_config.seed = *m_seed;
        if (m_loglevel)    m_config.log_level = *m_loglevel;
        if (m_export_json) m_config.export_json = *m_export_json;
        if (m_export_obj)  m_config.export_obj = *m_export_obj;
        if (m_export_stl)  m_config.export_stl = *m_export_stl;
    } catch (const Exception &ex) {
        fprintf(stderr, "%s\n", ex.what());
        return ecUsage;
    }
    return ecOk;
}

int CLI::run(int argc, char **argv)
{
    // Convert arguments to UTF-8 on Windows.
    boost::nowide::args nowide_args(argc, argv);

    int ret = this->setup(argc, argv);
    if (ret != ecOk || m_help) {
        this->print_help();
        return ret;
    }

    if (m_config.log_dir.empty())
        set_logging_level(m_config.log_level);
    else
        set_log_path_and_level(m_config.log_dir, m_config.log_level);
    BOOST_LOG_TRIVIAL(info) << HITBOX3D_APP_NAME << " " << HITBOX3D_VERSION << " started, pid " << get_current_pid();

    auto mesh = std::make_shared<TriangleMesh>();
    std::string message;
    if (!load_obj(m_load.c_str(), mesh.get(), message)) {
        fprintf(stderr, "Load error: %s\n", message.c_str());
        flush_logs();
        return ecLoadError;
    }

    auto progress = std::make_shared<ConsoleProgressIndicator>(stdout);
    std::shared_ptr<JobHandle> handle;
    {
        HitboxSession session(progress, EWorkerType::BackgroundThread);
        session.set_seed(m_config.seed);

        g_interrupted.store(false);
        std::signal(SIGINT, on_sigint);

        handle = session.decompose(mesh, m_config.tier);
        while (session.is_running()) {
            if (g_interrupted.load()) {
                BOOST_LOG_TRIVIAL(warning) << "Interrupted, cancelling the decomposition";
                session.cancel();
                g_interrupted.store(false);
            }
            session.process_events();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        std::signal(SIGINT, SIG_DFL);
    }

    std::optional<JobOutcome> outcome = handle->outcome();
    if (!outcome || boost::get<JobCancelled>(&*outcome)) {
        fprintf(stderr, "Cancelled\n");
        flush_logs();
        return ecCancelled;
    }
    if (const JobFailed *failed = boost::get<JobFailed>(&*outcome)) {
        fprintf(stderr, "Decomposition failed: %s\n", failed->reason.c_str());
        flush_logs();
        return ecDecompositionFailed;
    }
    const HitboxSet &hitboxes = *boost::get<JobCompleted>(*outcome).hitboxes;

    if (m_info) {
        BoundingBoxf3 bb = mesh->bounding_box();
        fprintf(stdout, "vertices: %zu\nfaces: %zu\nhitboxes: %zu\n", mesh->vertices().size(), mesh->facets_count(), hitboxes.size());
        fprintf(stdout, "bounds: [%g, %g, %g] - [%g, %g, %g]\n", bb.min.x(), bb.min.y(), bb.min.z(), bb.max.x(), bb.max.y(), bb.max.z());
        fprintf(stdout, "hitbox volume: %g\n", hitboxes.total_volume());
        fprintf(stdout, "mesh memory: %s\n", format_memsize(mesh->its.memsize()).c_str());
    }

    ret = ecOk;
    if (!m_config.export_json.empty() && !store_hitboxes_json(m_config.export_json.c_str(), hitboxes)) {
        fprintf(stderr, "Save error: %s\n", m_config.export_json.c_str());
        ret = ecExportError;
    }
    if (!m_config.export_obj.empty() && !store_obj(m_config.export_obj.c_str(), hitboxes)) {
        fprintf(stderr, "Save error: %s\n", m_config.export_obj.c_str());
        ret = ecExportError;
    }
    if (!m_config.export_stl.empty() && !store_stl(m_config.export_stl.c_str(), hitboxes)) {
        fprintf(stderr, "Save error: %s\n", m_config.export_stl.c_str());
        ret = ecExportError;
    }

    flush_logs();
    return ret;
}

} // namespace Hitbox3D

int main(int argc, char **argv)
{
    return Hitbox3D::CLI().run(argc, argv);
}
