#include <algorithm>

#include "job/chunker.hpp"
#include "util/log.hpp"

namespace job
{

std::optional<std::vector<Chunk>> partition(const std::uint8_t *data,
                                            std::size_t         total_len,
                                            std::size_t         chunk_size)
{
    if (chunk_size < 1)
    {
        LOG_ERROR("partition: invalid chunk_size (%zu)", chunk_size);
        return std::nullopt;
    }
    std::vector<Chunk> out;
    if (total_len == 0)
        return out;
    if (!data)
    {
        LOG_ERROR("partition: null source with length %zu", total_len);
        return std::nullopt;
    }

    const std::size_t num_chunks = chunk_count(total_len, chunk_size);
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        std::size_t start = i * chunk_size;
        std::size_t take  = std::min(chunk_size, total_len - start);
        Chunk       c;
        c.seq = i;
        c.bytes.assign(data + start, data + start + take);
        out.push_back(std::move(c));
    }
    LOG_DEBUG("partition: %zu bytes -> %zu chunks of %zu", total_len, num_chunks, chunk_size);
    return out;
}

std::optional<std::vector<Chunk>> partition(const std::vector<std::uint8_t> &data,
                                            std::size_t                      chunk_size)
{
    return partition(data.data(), data.size(), chunk_size);
}

}  // namespace job
