#include <cerrno>
#include <cstdlib>
#include <filesystem>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{
namespace fs = std::filesystem;

static std::string join(const std::string &dir, std::string_view name)
{
    return (fs::path(dir) / fs::path(std::string(name))).string();
}

std::string Config::source_path() const
{
    return join(data_dir, constants::SOURCE_FILE);
}

std::string Config::result_path() const
{
    return join(data_dir, constants::RESULT_FILE);
}

std::string Config::key_path() const
{
    return join(data_dir, constants::KEY_FILE);
}

std::string Config::iv_path() const
{
    return join(data_dir, constants::IV_FILE);
}

bool parse_uint(const char *s, unsigned long long lo, unsigned long long hi,
                unsigned long long &out)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return false;
    char *end = nullptr;
    errno     = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || !end || *end != '\0')
        return false;
    if (v < lo || v > hi)
        return false;
    out = v;
    return true;
}

// chunk size must hold whole float32 samples
static bool valid_chunk_bytes(unsigned long long v)
{
    return v > 0 && v % constants::FLOAT_SIZE == 0;
}

static void env_u64(const char *key, unsigned long long lo, unsigned long long hi,
                    unsigned long long &dst)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long long v = 0;
    if (parse_uint(e, lo, hi, v))
    {
        dst = v;
        LOG_DEBUG("Using %s=%llu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %llu..%llu)", key, e, lo, hi);
    }
}

Config Config::from_env()
{
    Config c;

    if (const char *e = std::getenv("CHUNKFARM_BIND"); e && *e)
        c.bind_addr = e;
    if (const char *e = std::getenv("CHUNKFARM_DATA_DIR"); e && *e)
        c.data_dir = ipc::expand_user(e);

    unsigned long long v = c.port;
    env_u64("CHUNKFARM_PORT", 0, 65535, v);
    c.port = static_cast<std::uint16_t>(v);

    v = c.chunk_bytes;
    env_u64("CHUNKFARM_CHUNK_BYTES", 1, 64ull << 20, v);
    if (valid_chunk_bytes(v))
        c.chunk_bytes = static_cast<std::size_t>(v);
    else
        LOG_WARN("Ignoring CHUNKFARM_CHUNK_BYTES=%llu (not a multiple of 4)", v);

    v = c.total_samples;
    env_u64("CHUNKFARM_TOTAL_SAMPLES", 1, 1ull << 32, v);
    c.total_samples = static_cast<std::size_t>(v);

    v = c.sweep_timeout_ms;
    env_u64("CHUNKFARM_SWEEP_TIMEOUT_MS", 1, 24ull * 3600 * 1000, v);
    c.sweep_timeout_ms = static_cast<std::uint32_t>(v);

    v = c.sweep_interval_ms;
    env_u64("CHUNKFARM_SWEEP_INTERVAL_MS", 10, 3600ull * 1000, v);
    c.sweep_interval_ms = static_cast<std::uint32_t>(v);

    c.ctl_sock = ipc::expand_user(constants::ctl_sock_path());
    return c;
}

bool apply_args(Config &cfg, const std::vector<std::string> &args)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (i + 1 >= args.size())
        {
            LOG_ERROR("Missing value for %s", a.c_str());
            return false;
        }
        const std::string &val = args[++i];

        unsigned long long v = 0;
        if (a == "--bind")
        {
            cfg.bind_addr = val;
        }
        else if (a == "--port")
        {
            if (!parse_uint(val.c_str(), 0, 65535, v))
            {
                LOG_ERROR("Invalid --port '%s'", val.c_str());
                return false;
            }
            cfg.port = static_cast<std::uint16_t>(v);
        }
        else if (a == "--data-dir")
        {
            cfg.data_dir = ipc::expand_user(val);
        }
        else if (a == "--chunk-bytes")
        {
            if (!parse_uint(val.c_str(), 1, 64ull << 20, v) || !valid_chunk_bytes(v))
            {
                LOG_ERROR("Invalid --chunk-bytes '%s' (positive multiple of 4)", val.c_str());
                return false;
            }
            cfg.chunk_bytes = static_cast<std::size_t>(v);
        }
        else if (a == "--total-samples")
        {
            if (!parse_uint(val.c_str(), 1, 1ull << 32, v))
            {
                LOG_ERROR("Invalid --total-samples '%s'", val.c_str());
                return false;
            }
            cfg.total_samples = static_cast<std::size_t>(v);
        }
        else if (a == "--sock")
        {
            cfg.ctl_sock = ipc::expand_user(val);
        }
        else
        {
            LOG_ERROR("Unknown option %s", a.c_str());
            return false;
        }
    }
    return true;
}

}  // namespace config
