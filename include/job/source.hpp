#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace source
{

inline constexpr std::size_t BATCH_CHUNKS = 100;  // chunks per generated batch
inline constexpr std::size_t QUEUE_DEPTH  = 4;    // batches buffered ahead of the writer

enum class LoadError
{
    None,
    NotFound,
    ReadFailed,
    Empty
};

const char *load_error_name(LoadError e);

// Write-behind sink for generated batches. push() blocks while QUEUE_DEPTH batches are
// waiting, so the generator can never run ahead of the disk.
class BatchWriter
{
  public:
    BatchWriter(std::ofstream &out, std::size_t depth = QUEUE_DEPTH);
    ~BatchWriter();

    BatchWriter(const BatchWriter &)            = delete;
    BatchWriter &operator=(const BatchWriter &) = delete;

    // false once a write failed; the batch is dropped
    bool push(std::vector<std::uint8_t> batch);

    // drain, join the writer; true if every byte reached the stream
    bool finish();

    std::size_t written() const { return written_; }

  private:
    void run();

    std::ofstream                        &out_;
    std::size_t                           depth_;
    std::deque<std::vector<std::uint8_t>> queue_;
    std::mutex                            mu_;
    std::condition_variable               not_full_;
    std::condition_variable               not_empty_;
    bool                                  closed_ = false;
    bool                                  failed_ = false;
    std::size_t                           written_ = 0;  // writer thread until finish()
    std::thread                           thr_;
};

// Synthesize total_bytes of little-endian float32 noise in [-1, 1) at path.
// Written to path + ".part" and renamed at the end. A set *stop is checked between
// batches; the partial file is removed and false returned.
bool generate(const std::string &path, std::size_t total_bytes, std::size_t chunk_bytes,
              std::uint32_t seed, const std::atomic_bool *stop = nullptr);

// generate() with a random seed unless the file already exists
bool ensure_source(const std::string &path, std::size_t total_bytes, std::size_t chunk_bytes,
                   const std::atomic_bool *stop = nullptr);

std::optional<std::vector<std::uint8_t>> load(const std::string &path, LoadError &err);

}  // namespace source
