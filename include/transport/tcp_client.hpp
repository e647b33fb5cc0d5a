#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "transport/itransport.hpp"
#include "transport/stream.hpp"

namespace transport
{

enum class RecvStatus
{
    Message,
    Timeout,
    Closed,
    Error
};

// Worker side of the link: one blocking TCP connection speaking length-prefixed messages.
class TcpClient
{
  public:
    TcpClient() = default;
    ~TcpClient() { close(); }
    TcpClient(const TcpClient &)            = delete;
    TcpClient &operator=(const TcpClient &) = delete;

    bool connect(const std::string &host, std::uint16_t port);
    bool send(const Frame &message);
    // timeout < 0 waits forever
    RecvStatus recv(Frame &out, std::chrono::milliseconds timeout = std::chrono::milliseconds(-1));
    void       close();
    bool       connected() const { return fd_ != -1; }

  private:
    int           fd_ = -1;
    StreamDecoder rx_;
};

}  // namespace transport
