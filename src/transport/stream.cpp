#include <arpa/inet.h>  // htonl, ntohl
#include <cerrno>
#include <cstring>
#include <sys/socket.h>

#include "transport/stream.hpp"
#include "util/log.hpp"

namespace transport
{

Frame frame_message(const Frame &message)
{
    Frame         out(LEN_PREFIX + message.size());
    std::uint32_t len_be = htonl(static_cast<std::uint32_t>(message.size()));
    std::memcpy(out.data(), &len_be, sizeof len_be);
    if (!message.empty())
        std::memcpy(out.data() + LEN_PREFIX, message.data(), message.size());
    return out;
}

bool StreamDecoder::feed(const std::uint8_t *data, std::size_t len)
{
    if (failed_)
        return false;
    // compact once the consumed prefix dominates the buffer
    if (off_ > 0 && off_ * 2 >= buf_.size())
    {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(off_));
        off_ = 0;
    }
    buf_.insert(buf_.end(), data, data + len);
    return true;
}

std::optional<Frame> StreamDecoder::next()
{
    if (failed_)
        return std::nullopt;
    const std::size_t avail = buf_.size() - off_;
    if (avail < LEN_PREFIX)
        return std::nullopt;

    std::uint32_t len_be;
    std::memcpy(&len_be, buf_.data() + off_, sizeof len_be);
    const std::size_t len = ntohl(len_be);
    if (len > MAX_MESSAGE)
    {
        LOG_ERROR("StreamDecoder: message too large (%zu > %zu)", len, MAX_MESSAGE);
        failed_ = true;
        return std::nullopt;
    }
    if (avail < LEN_PREFIX + len)
        return std::nullopt;  // not complete yet

    const auto begin = buf_.begin() + static_cast<std::ptrdiff_t>(off_ + LEN_PREFIX);
    Frame      out(begin, begin + static_cast<std::ptrdiff_t>(len));
    off_ += LEN_PREFIX + len;
    if (off_ == buf_.size())
    {
        buf_.clear();
        off_ = 0;
    }
    return out;
}

bool write_all(int fd, const std::uint8_t *data, std::size_t len)
{
    std::size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_DEBUG("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

bool send_message(int fd, const Frame &message)
{
    if (message.size() > MAX_MESSAGE)
    {
        LOG_ERROR("send_message: message too large (%zu)", message.size());
        return false;
    }
    // prefix and body go out in a single write
    const Frame out = frame_message(message);
    return write_all(fd, out.data(), out.size());
}

}  // namespace transport
