#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/tcp_client.hpp"
#include "util/log.hpp"

namespace transport
{

bool TcpClient::connect(const std::string &host, std::uint16_t port)
{
    close();

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo   *res   = nullptr;
    std::string svc   = std::to_string(port);
    int         rc    = getaddrinfo(host.c_str(), svc.c_str(), &hints, &res);
    if (rc != 0)
    {
        LOG_ERROR("getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(rc));
        return false;
    }

    int fd = -1;
    for (addrinfo *ai = res; ai; ai = ai->ai_next)
    {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == -1)
            continue;
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;
        ::close(fd);
        fd = -1;
    }
    freeaddrinfo(res);

    if (fd == -1)
    {
        LOG_WARN("connect(%s:%u) failed: %s", host.c_str(), (unsigned)port, std::strerror(errno));
        return false;
    }
    fd_ = fd;
    rx_ = StreamDecoder{};
    return true;
}

bool TcpClient::send(const Frame &message)
{
    if (fd_ == -1)
        return false;
    return send_message(fd_, message);
}

RecvStatus TcpClient::recv(Frame &out, std::chrono::milliseconds timeout)
{
    if (fd_ == -1)
        return RecvStatus::Closed;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true)
    {
        if (auto m = rx_.next())
        {
            out = std::move(*m);
            return RecvStatus::Message;
        }
        if (rx_.failed())
            return RecvStatus::Error;

        int wait_ms = -1;
        if (timeout.count() >= 0)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0)
                return RecvStatus::Timeout;
            wait_ms = static_cast<int>(left.count());
        }

        pollfd pfd{fd_, POLLIN, 0};
        int    rc = ::poll(&pfd, 1, wait_ms);
        if (rc == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            return RecvStatus::Error;
        }
        if (rc == 0)
            return RecvStatus::Timeout;

        std::uint8_t buf[64 * 1024];
        ssize_t      n = ::recv(fd_, buf, sizeof buf, 0);
        if (n == 0)
            return RecvStatus::Closed;
        if (n == -1)
        {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            LOG_WARN("recv() failed: %s", std::strerror(errno));
            return RecvStatus::Error;
        }
        rx_.feed(buf, static_cast<std::size_t>(n));
    }
}

void TcpClient::close()
{
    if (fd_ != -1)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace transport
