#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "worker/worker.hpp"

static worker::Worker *g_worker = nullptr;

static void on_signal(int)
{
    if (g_worker)
        g_worker->request_stop();
}

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunk-worker [--host <addr>] [--port <n>] [--nickname <name>] [--once]\n"
                         "\n"
                         "Environment:\n"
                         "  CHUNKFARM_HOST, CHUNKFARM_PORT, CHUNKFARM_LOG_LEVEL\n");
}

int main(int argc, char **argv)
{
    chunkfarm::set_log_level_by_name(std::getenv("CHUNKFARM_LOG_LEVEL"));

    worker::Options opts;
    opts.port = constants::DEFAULT_PORT;
    if (const char *e = std::getenv("CHUNKFARM_HOST"); e && *e)
        opts.host = e;
    if (const char *e = std::getenv("CHUNKFARM_PORT"))
    {
        unsigned long long v = 0;
        if (config::parse_uint(e, 1, 65535, v))
            opts.port = static_cast<std::uint16_t>(v);
        else
            LOG_WARN("Ignoring invalid CHUNKFARM_PORT='%s' (expect 1..65535)", e);
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--once")
        {
            opts.once = true;
            continue;
        }
        if (i + 1 >= argc)
        {
            std::fprintf(stderr, "error: %s needs a value\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
        const char *val = argv[++i];
        if (a == "--host")
        {
            opts.host = val;
        }
        else if (a == "--port")
        {
            unsigned long long v = 0;
            if (!config::parse_uint(val, 1, 65535, v))
            {
                std::fprintf(stderr, "error: invalid port: %s\n", val);
                return exitc::bad_args;
            }
            opts.port = static_cast<std::uint16_t>(v);
        }
        else if (a == "--nickname")
        {
            opts.nickname = val;
        }
        else
        {
            std::fprintf(stderr, "Unknown option: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
    }

    worker::Worker w(opts);
    g_worker = &w;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    LOG_SYSTEM("Worker connecting to %s:%u", opts.host.c_str(), (unsigned)opts.port);
    const int rc = w.run();
    LOG_SYSTEM("Worker exiting after %zu task(s)", w.processed());
    g_worker = nullptr;
    return rc;
}
