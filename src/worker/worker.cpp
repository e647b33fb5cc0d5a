#include <algorithm>
#include <cstring>
#include <thread>
#include <unistd.h>

#include "proto/wire.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "worker/worker.hpp"

namespace worker
{

using namespace std::chrono_literals;

static constexpr auto POLL_SLICE = 250ms;

bool negate_samples(std::vector<std::uint8_t> &chunk)
{
    if (chunk.size() % constants::FLOAT_SIZE != 0)
        return false;
    // the sign is the top bit of the last byte of each LE sample
    for (std::size_t i = constants::FLOAT_SIZE - 1; i < chunk.size(); i += constants::FLOAT_SIZE)
        chunk[i] ^= 0x80;
    return true;
}

const char *session_end_name(SessionEnd e)
{
    switch (e)
    {
        case SessionEnd::Completed:
            return "completed";
        case SessionEnd::Disconnected:
            return "disconnected";
        case SessionEnd::Stopped:
            return "stopped";
    }
    return "?";
}

Worker::Worker(Options opts) : opts_(std::move(opts))
{
    if (opts_.nickname.empty())
        opts_.nickname = "worker_" + std::to_string(::getpid());
}

bool Worker::pause(std::chrono::milliseconds d)
{
    const auto until = std::chrono::steady_clock::now() + d;
    while (!stop_.load())
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until)
            return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(POLL_SLICE,
                                                                                 until - now));
    }
    return false;
}

bool Worker::handshake(transport::TcpClient &c)
{
    if (!c.send(wire::encode_handshake(opts_.nickname)))
        return false;

    transport::Frame ack;
    if (c.recv(ack, opts_.ack_timeout) != transport::RecvStatus::Message)
    {
        LOG_WARN("No handshake ack from server");
        return false;
    }
    if (ack.size() != wire::ACK_SIZE)
    {
        LOG_WARN("Unexpected %zu-byte handshake reply", ack.size());
        return false;
    }
    peer_id_ = static_cast<std::uint16_t>((ack[0] << 8) | ack[1]);
    LOG_INFO("Registered as peer #%u (%s)", (unsigned)peer_id_, opts_.nickname.c_str());
    return true;
}

bool Worker::request(transport::TcpClient &c)
{
    LOG_DEBUG("Requesting a task");
    return c.send(wire::encode_request_task(peer_id_));
}

bool Worker::on_task(transport::TcpClient &c, std::uint16_t task_id,
                     std::vector<std::uint8_t> chunk)
{
    LOG_DEBUG("Task #%u: %zu bytes", (unsigned)task_id, chunk.size());
    if (!negate_samples(chunk))
    {
        LOG_ERROR("Task #%u: %zu bytes is not whole float32 samples; skipping", (unsigned)task_id,
                  chunk.size());
        return request(c);
    }
    if (!c.send(wire::encode_submit_result(peer_id_, task_id, chunk)))
        return false;
    processed_++;
    return request(c);
}

SessionEnd Worker::run_session()
{
    transport::TcpClient c;
    if (!c.connect(opts_.host, opts_.port))
        return SessionEnd::Disconnected;
    if (!handshake(c) || !request(c))
        return SessionEnd::Disconnected;

    while (!stop_.load())
    {
        transport::Frame msg;
        switch (c.recv(msg, POLL_SLICE))
        {
            case transport::RecvStatus::Timeout:
                continue;
            case transport::RecvStatus::Closed:
                LOG_WARN("Server closed the connection");
                return SessionEnd::Disconnected;
            case transport::RecvStatus::Error:
                return SessionEnd::Disconnected;
            case transport::RecvStatus::Message:
                break;
        }

        auto hdr = wire::parse_server_header(msg);
        if (!hdr)
            continue;

        if (hdr->command == wire::CMD_TASK_DATA)
        {
            std::vector<std::uint8_t> chunk(msg.begin() + wire::HDR_SIZE, msg.end());
            if (!on_task(c, hdr->value, std::move(chunk)))
                return SessionEnd::Disconnected;
            continue;
        }
        if (hdr->command != wire::CMD_STATUS)
        {
            LOG_WARN("Ignoring unknown server command %u", (unsigned)hdr->command);
            continue;
        }

        auto body   = wire::decode_body(hdr->command, msg);
        auto status = body ? wire::as_status(*body) : std::nullopt;
        if (!status)
        {
            LOG_WARN("Ignoring malformed status message");
            continue;
        }
        if (status->type == wire::STATUS_COMPLETION)
        {
            LOG_SYSTEM("Server reports completion: %s (%zu tasks processed here)",
                       status->message.c_str(), processed_);
            return SessionEnd::Completed;
        }
        if (status->type == wire::STATUS_NO_TASK)
        {
            LOG_DEBUG("No task available; retrying in %lld ms",
                      (long long)opts_.no_task_retry.count());
            if (!pause(opts_.no_task_retry))
                break;
            if (!request(c))
                return SessionEnd::Disconnected;
            continue;
        }
        LOG_WARN("Ignoring status '%s'", status->type.c_str());
    }
    return SessionEnd::Stopped;
}

int Worker::run()
{
    for (;;)
    {
        const SessionEnd end = run_session();
        LOG_DEBUG("Session ended: %s", session_end_name(end));
        switch (end)
        {
            case SessionEnd::Completed:
            case SessionEnd::Stopped:
                return exitc::ok;
            case SessionEnd::Disconnected:
                break;
        }
        if (opts_.once)
            return exitc::no_server;
        LOG_INFO("Reconnecting in %lld ms", (long long)opts_.reconnect_delay.count());
        if (!pause(opts_.reconnect_delay))
            return exitc::ok;
    }
}

}  // namespace worker
