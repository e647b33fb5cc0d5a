#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// one second of 44.1 kHz mono float32 audio
inline constexpr std::size_t SAMPLE_RATE   = 44100;
inline constexpr std::size_t FLOAT_SIZE    = 4;
inline constexpr std::size_t CHUNK_BYTES   = SAMPLE_RATE * FLOAT_SIZE;  // 176400
inline constexpr std::size_t TOTAL_SAMPLES = 158760000;                // ~60 minutes

inline constexpr std::uint16_t DEFAULT_PORT      = 3000;
inline constexpr std::uint32_t SWEEP_TIMEOUT_MS  = 5000;
inline constexpr std::uint32_t SWEEP_INTERVAL_MS = 1000;

// file names inside the data directory
inline constexpr std::string_view SOURCE_FILE = "source.raw";
inline constexpr std::string_view RESULT_FILE = "result.raw";
inline constexpr std::string_view KEY_FILE    = "encryption_key.bin";
inline constexpr std::string_view IV_FILE     = "encryption_iv.bin";

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("CHUNKFARM_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/chunkfarm/ctl.sock";
    LOG_DEBUG("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
