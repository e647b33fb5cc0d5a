#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/*
source bytes [0 .................................. total)
  -> partition(data, total, chunk_size)
     -> Chunk{seq=0} [0, cs)  Chunk{seq=1} [cs, 2cs) ... Chunk{seq=n-1} [(n-1)cs, total)
        -> TaskStore::load_tasks  (task id = seq + 1)
*/

namespace job
{

struct Chunk
{
    std::size_t               seq{0};  // reassembly order, 0-based
    std::vector<std::uint8_t> bytes;
};

// nullopt for chunk_size == 0 or a null source with data; an empty source yields no chunks
std::optional<std::vector<Chunk>> partition(const std::uint8_t *data,
                                            std::size_t         total_len,
                                            std::size_t         chunk_size);

std::optional<std::vector<Chunk>> partition(const std::vector<std::uint8_t> &data,
                                            std::size_t                      chunk_size);

// number of chunks partition() would produce
inline std::size_t chunk_count(std::size_t total_len, std::size_t chunk_size)
{
    return chunk_size == 0 ? 0 : (total_len + chunk_size - 1) / chunk_size;
}

}  // namespace job
