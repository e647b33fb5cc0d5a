#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "app/dispatcher.hpp"
#include "app/finalizer.hpp"
#include "crypto/block_cipher.hpp"
#include "ctl/ipc.hpp"
#include "job/chunker.hpp"
#include "job/source.hpp"
#include "transport/tcp_server.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

static std::atomic_bool  g_stop{false};
static std::atomic_int   g_exit{exitc::ok};
static app::Dispatcher  *g_disp = nullptr;

static void on_signal(int)
{
    g_stop.store(true);
}

// first failure wins
static void fail(int code)
{
    int expected = exitc::ok;
    g_exit.compare_exchange_strong(expected, code);
    g_stop.store(true);
}

static std::string on_line(const std::string &line)
{
    LOG_DEBUG("IPC line: %s", line.c_str());
    if (line == "HEALTH")
        return g_disp && g_disp->ready() ? "OK" : "LOADING";
    if (line == "STATUS")
        return g_disp ? g_disp->status_line() : "ERR not running";
    if (line == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        g_stop.store(true);  // also cancels source generation
        return "BYE";
    }
    LOG_WARN("CMD: unknown control line '%s'", line.c_str());
    return "ERR unknown command";
}

static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  chunkd [--bind <addr>] [--port <n>] [--data-dir <dir>]\n"
                         "         [--chunk-bytes <n>] [--total-samples <n>] [--sock <path>]\n");
}

// source file -> chunks -> dispatcher, off the event loop
static void load_source(const config::Config &cfg, app::Dispatcher &disp)
{
    const std::size_t total_bytes = cfg.total_samples * constants::FLOAT_SIZE;
    if (!source::ensure_source(cfg.source_path(), total_bytes, cfg.chunk_bytes, &g_stop))
    {
        if (g_stop.load())
            return;  // shutting down
        LOG_ERROR("Cannot create source data at %s", cfg.source_path().c_str());
        fail(exitc::io_error);
        return;
    }

    source::LoadError err  = source::LoadError::None;
    auto              data = source::load(cfg.source_path(), err);
    if (!data)
    {
        LOG_ERROR("Loading %s failed: %s", cfg.source_path().c_str(),
                  source::load_error_name(err));
        fail(exitc::io_error);
        return;
    }
    if (job::chunk_count(data->size(), cfg.chunk_bytes) > tasks::MAX_TASKS)
    {
        LOG_ERROR("%zu bytes in %zu-byte chunks exceeds %zu tasks; raise --chunk-bytes",
                  data->size(), cfg.chunk_bytes, tasks::MAX_TASKS);
        fail(exitc::bad_args);
        return;
    }

    auto chunks = job::partition(*data, cfg.chunk_bytes);
    data.reset();
    if (!chunks)
    {
        fail(exitc::bad_args);
        return;
    }
    LOG_INFO("Partitioned source into %zu chunks of %zu bytes", chunks->size(), cfg.chunk_bytes);
    disp.post(app::TasksLoaded{std::move(*chunks)});
}

int main(int argc, char **argv)
{
    // log level from env var
    chunkfarm::set_log_level_by_name(std::getenv("CHUNKFARM_LOG_LEVEL"));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        args.push_back(std::move(a));
    }

    config::Config cfg = config::Config::from_env();
    if (!config::apply_args(cfg, args))
    {
        print_usage();
        return exitc::bad_args;
    }
    LOG_SYSTEM("Config: bind=%s:%u data=%s chunk=%zu samples=%zu sweep=%u/%u ms",
               cfg.bind_addr.c_str(), (unsigned)cfg.port, cfg.data_dir.c_str(), cfg.chunk_bytes,
               cfg.total_samples, cfg.sweep_timeout_ms, cfg.sweep_interval_ms);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    cipher::AesCbcCipher cipher;
    app::Finalizer       finalizer({cfg.result_path(), cfg.key_path(), cfg.iv_path()}, cipher);

    app::DispatcherSettings ds;
    ds.sweep_timeout  = std::chrono::milliseconds(cfg.sweep_timeout_ms);
    ds.sweep_interval = std::chrono::milliseconds(cfg.sweep_interval_ms);
    app::Dispatcher disp(finalizer, ds);
    disp.set_on_finalized([](const app::FinalizeReport &rep) {
        if (rep.status != app::FinalizeStatus::Ok)
            fail(rep.status == app::FinalizeStatus::IoError ? exitc::io_error
                                                             : exitc::finalize_failed);
    });
    if (!disp.start())
    {
        LOG_ERROR("Dispatcher failed to start");
        return exitc::io_error;
    }
    g_disp = &disp;

    transport::TcpServerTransport tcp;
    transport::Settings           ts;
    ts.bind_addr = cfg.bind_addr;
    ts.port      = cfg.port;
    if (!tcp.start(ts, disp.callbacks()))
    {
        LOG_ERROR("Worker listener failed to start");
        disp.stop();
        g_disp = nullptr;
        return exitc::io_error;
    }

    std::thread loader([&] { load_source(cfg, disp); });

    // control socket; blocks until QUIT, a signal or a fatal error
    if (!ipc::start_server(cfg.ctl_sock, on_line, &g_stop))
    {
        LOG_ERROR("Control socket %s failed", cfg.ctl_sock.c_str());
        fail(exitc::io_error);
    }

    LOG_SYSTEM("Shutting down");
    if (loader.joinable())
        loader.join();
    tcp.stop();
    disp.stop();
    g_disp = nullptr;

    if (auto outcome = disp.finalize_outcome())
        LOG_SYSTEM("Finalize outcome: %s", app::finalize_status_name(*outcome));
    return g_exit.load();
}
