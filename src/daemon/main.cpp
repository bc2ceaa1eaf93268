#include "session_server.hpp"

#include "../app/orchestrator.hpp"
#include "../config/orchestrator_config.hpp"
#include "../core/scheduler.hpp"
#include "../host/headless_host.hpp"
#include "../ipc/transport.hpp"

#ifdef TABWEAVE_USE_GLFW
    #include "../host/glfw_host.hpp"
#endif

#include <tabweave/logger.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>

namespace
{

std::atomic<bool> g_running{true};

void signal_handler(int /*sig*/)
{
    g_running.store(false, std::memory_order_relaxed);
}

// Upper bound on one poll(); keeps heartbeats and host pumping going when
// no timer is armed.
constexpr auto MAX_POLL_WAIT = std::chrono::milliseconds(100);
constexpr int  MAX_TICK_ROUNDS = 8;

void print_usage(const char* argv0)
{
    std::fprintf(stderr,
                 "Usage: %s [options]\n"
                 "  --socket <path>     listen on <path> (default: $XDG_RUNTIME_DIR/tabweave-<pid>.sock)\n"
                 "  --config <path>     orchestrator config (default: %s)\n"
                 "  --log-level <lvl>   trace, debug, info, warn, error, critical\n"
                 "  --log-file <path>   also log to <path>\n"
                 "  --host <name>       surface host: headless"
#ifdef TABWEAVE_USE_GLFW
                 " or glfw"
#endif
                 " (default: headless)\n"
                 "  --help              show this message\n",
                 argv0,
                 tabweave::OrchestratorConfig::default_path().c_str());
}

struct Options
{
    std::string socket_path;
    std::string config_path;
    std::string log_level;
    std::string log_file;
    std::string host = "headless";
    bool        help = false;
    bool        bad  = false;
};

Options parse_args(int argc, char* argv[])
{
    Options opt;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto        value = [&](std::string& out)
        {
            if (i + 1 >= argc)
            {
                std::fprintf(stderr, "%s needs a value\n", arg.c_str());
                opt.bad = true;
                return;
            }
            out = argv[++i];
        };

        if (arg == "--help" || arg == "-h")
            opt.help = true;
        else if (arg == "--socket")
            value(opt.socket_path);
        else if (arg == "--config")
            value(opt.config_path);
        else if (arg == "--log-level")
            value(opt.log_level);
        else if (arg == "--log-file")
            value(opt.log_file);
        else if (arg == "--host")
            value(opt.host);
        else
        {
            std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
            opt.bad = true;
        }
    }
    return opt;
}

}   // namespace

int main(int argc, char* argv[])
{
    using namespace tabweave;

    Options opt = parse_args(argc, argv);
    if (opt.help || opt.bad)
    {
        print_usage(argv[0]);
        return opt.bad ? 2 : 0;
    }

    auto& logger = Logger::instance();
    logger.add_sink(sinks::console_sink());

    // Command line wins over the config file.
    OrchestratorConfig config;
    const std::string  config_path = opt.config_path.empty() ? OrchestratorConfig::default_path() : opt.config_path;
    if (!config.load(config_path) && !opt.config_path.empty())
    {
        TABWEAVE_LOG_ERROR("daemon", "Cannot load config {}", config_path);
        return 1;
    }
    if (!opt.log_level.empty())
        config.log_level = opt.log_level;
    if (!opt.log_file.empty())
        config.log_file = opt.log_file;
    if (!opt.socket_path.empty())
        config.socket_path = opt.socket_path;

    if (auto level = Logger::parse_level(config.log_level))
        logger.set_level(*level);
    else
        TABWEAVE_LOG_WARN("daemon", "Unknown log level '{}', keeping info", config.log_level);
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));

    const std::string socket_path =
        config.socket_path.empty() ? ipc::default_socket_path() : config.socket_path;

    // ─── Surface host ────────────────────────────────────────────────────
    std::unique_ptr<SurfaceHost> host;
    if (opt.host == "headless")
    {
        host = std::make_unique<HeadlessHost>();
    }
#ifdef TABWEAVE_USE_GLFW
    else if (opt.host == "glfw")
    {
        auto glfw = std::make_unique<GlfwHost>();
        if (!glfw->init())
        {
            TABWEAVE_LOG_CRITICAL("daemon", "GLFW host failed to initialize");
            return 1;
        }
        host = std::move(glfw);
    }
#endif
    else
    {
        TABWEAVE_LOG_CRITICAL("daemon", "Unknown host '{}'", opt.host);
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    SteadyClock             clock;
    Orchestrator            orchestrator(*host, clock, config);
    daemon::SessionServer   server(orchestrator, host->name());
    if (!server.listen(socket_path))
    {
        TABWEAVE_LOG_CRITICAL("daemon", "Failed to listen on {}", socket_path);
        return 1;
    }

    TABWEAVE_LOG_INFO("daemon", "tabweave-hostd ready (host={}, socket={})", host->name(), socket_path);

    // ─── Event loop ──────────────────────────────────────────────────────
    int exit_code = 0;
    while (g_running.load(std::memory_order_relaxed))
    {
        auto wait = MAX_POLL_WAIT;
        if (auto next = orchestrator.next_wakeup())
            wait = std::min(wait, *next);

        if (server.poll_once(wait) < 0)
        {
            exit_code = 1;
            break;
        }
        // Drain completions the commands just queued, within a bound.
        for (int round = 0; round < MAX_TICK_ROUNDS && orchestrator.tick() > 0; ++round)
        {
        }
        server.maybe_send_heartbeat();
    }

    TABWEAVE_LOG_INFO("daemon", "Shutting down ({} client(s))", server.client_count());
    server.close();
    return exit_code;
}
