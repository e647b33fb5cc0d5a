#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "transport/tcp_client.hpp"

namespace worker
{

// Compute kernel: flip the sign of every little-endian float32 sample in place.
// false (chunk untouched) if the length is not whole samples.
bool negate_samples(std::vector<std::uint8_t> &chunk);

struct Options
{
    std::string               host     = "127.0.0.1";
    std::uint16_t             port     = 3000;
    std::string               nickname;  // default worker_<pid>
    bool                      once     = false;  // no reconnect after a dropped link
    std::chrono::milliseconds no_task_retry{2000};
    std::chrono::milliseconds reconnect_delay{5000};
    std::chrono::milliseconds ack_timeout{5000};
};

enum class SessionEnd
{
    Completed,     // server broadcast completion
    Disconnected,  // link dropped or could not be opened
    Stopped        // request_stop()
};

const char *session_end_name(SessionEnd e);

class Worker
{
  public:
    explicit Worker(Options opts);

    // one connection: handshake, then request / compute / submit until it ends
    SessionEnd run_session();

    // run_session() with reconnects; returns a process exit code
    int run();

    void request_stop() { stop_.store(true); }

    std::size_t   processed() const { return processed_; }
    std::uint16_t peer_id() const { return peer_id_; }

  private:
    bool handshake(transport::TcpClient &c);
    bool request(transport::TcpClient &c);
    bool on_task(transport::TcpClient &c, std::uint16_t task_id, std::vector<std::uint8_t> chunk);
    // sleep in short slices so request_stop() stays responsive; false if stopped
    bool pause(std::chrono::milliseconds d);

    Options          opts_;
    std::atomic_bool stop_{false};
    std::uint16_t    peer_id_   = 0;
    std::size_t      processed_ = 0;
};

}  // namespace worker
