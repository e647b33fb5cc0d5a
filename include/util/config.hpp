#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace config
{

struct Config
{
    std::string   bind_addr         = "0.0.0.0";
    std::uint16_t port              = constants::DEFAULT_PORT;
    std::string   data_dir          = "./generated_data";
    std::size_t   chunk_bytes       = constants::CHUNK_BYTES;
    std::size_t   total_samples     = constants::TOTAL_SAMPLES;
    std::uint32_t sweep_timeout_ms  = constants::SWEEP_TIMEOUT_MS;
    std::uint32_t sweep_interval_ms = constants::SWEEP_INTERVAL_MS;
    std::string   ctl_sock;

    std::string source_path() const;
    std::string result_path() const;
    std::string key_path() const;
    std::string iv_path() const;

    // Read CHUNKFARM_* variables; invalid values are logged and the default kept.
    static Config from_env();
};

// Apply --flag value pairs on top of cfg. Unknown flags or bad values -> false.
bool apply_args(Config &cfg, const std::vector<std::string> &args);

// strict unsigned parse: whole string must be digits and within [lo, hi]
bool parse_uint(const char *s, unsigned long long lo, unsigned long long hi,
                unsigned long long &out);

}  // namespace config
