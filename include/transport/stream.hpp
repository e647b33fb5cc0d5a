#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "transport/itransport.hpp"

/*
TCP has no message boundaries, so each protocol message travels as
  [u32 BE length][message bytes]
and StreamDecoder cuts the byte stream back into messages.
*/

namespace transport
{

inline constexpr std::size_t LEN_PREFIX  = 4;
inline constexpr std::size_t MAX_MESSAGE = 64u << 20;  // 64 MiB

Frame frame_message(const Frame &message);

class StreamDecoder
{
  public:
    // false once an oversized length prefix was seen; the stream is unusable after that
    bool                 feed(const std::uint8_t *data, std::size_t len);
    std::optional<Frame> next();
    bool                 failed() const { return failed_; }

  private:
    std::vector<std::uint8_t> buf_;
    std::size_t               off_ = 0;  // consumed prefix of buf_
    bool                      failed_ = false;
};

// blocking helpers on a connected socket (MSG_NOSIGNAL, EINTR-safe)
bool write_all(int fd, const std::uint8_t *data, std::size_t len);
bool send_message(int fd, const Frame &message);

}  // namespace transport
