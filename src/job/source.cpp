#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <random>

#include "job/source.hpp"
#include "util/constants.hpp"
#include "util/file_io.hpp"
#include "util/log.hpp"

namespace source
{
namespace fs = std::filesystem;

const char *load_error_name(LoadError e)
{
    switch (e)
    {
        case LoadError::None:
            return "none";
        case LoadError::NotFound:
            return "not-found";
        case LoadError::ReadFailed:
            return "read-failed";
        case LoadError::Empty:
            return "empty";
    }
    return "?";
}

BatchWriter::BatchWriter(std::ofstream &out, std::size_t depth)
    : out_(out), depth_(depth ? depth : 1)
{
    thr_ = std::thread([this] { run(); });
}

BatchWriter::~BatchWriter()
{
    finish();
}

bool BatchWriter::push(std::vector<std::uint8_t> batch)
{
    std::unique_lock<std::mutex> lk(mu_);
    not_full_.wait(lk, [this] { return queue_.size() < depth_ || failed_ || closed_; });
    if (failed_ || closed_)
        return false;
    queue_.push_back(std::move(batch));
    not_empty_.notify_one();
    return true;
}

bool BatchWriter::finish()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
    if (thr_.joinable())
        thr_.join();
    return !failed_;
}

void BatchWriter::run()
{
    for (;;)
    {
        std::vector<std::uint8_t> batch;
        {
            std::unique_lock<std::mutex> lk(mu_);
            not_empty_.wait(lk, [this] { return !queue_.empty() || closed_; });
            if (queue_.empty())
                return;  // closed and drained
            batch = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();

        out_.write(reinterpret_cast<const char *>(batch.data()),
                   static_cast<std::streamsize>(batch.size()));
        if (!out_)
        {
            LOG_ERROR("BatchWriter: write failed after %zu bytes", written_);
            std::lock_guard<std::mutex> lk(mu_);
            failed_ = true;
            queue_.clear();
            not_full_.notify_all();
            return;
        }
        written_ += batch.size();
    }
}

static void put_f32_le(std::uint8_t *out, float f)
{
    std::uint32_t bits;
    std::memcpy(&bits, &f, sizeof bits);
    out[0] = static_cast<std::uint8_t>(bits);
    out[1] = static_cast<std::uint8_t>(bits >> 8);
    out[2] = static_cast<std::uint8_t>(bits >> 16);
    out[3] = static_cast<std::uint8_t>(bits >> 24);
}

bool generate(const std::string &path, std::size_t total_bytes, std::size_t chunk_bytes,
              std::uint32_t seed, const std::atomic_bool *stop)
{
    using constants::FLOAT_SIZE;
    if (total_bytes % FLOAT_SIZE != 0 || chunk_bytes == 0 || chunk_bytes % FLOAT_SIZE != 0)
    {
        LOG_ERROR("generate: sizes must be whole float32 samples (total %zu, chunk %zu)",
                  total_bytes, chunk_bytes);
        return false;
    }
    if (!fileio::ensure_parent_dir(path))
        return false;

    const std::string part = path + ".part";
    std::ofstream     out(part, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        LOG_ERROR("open(%s) failed: %s", part.c_str(), std::strerror(errno));
        return false;
    }

    LOG_INFO("Generating %zu bytes of source data at %s", total_bytes, path.c_str());
    std::mt19937                          rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    const std::size_t batch_bytes = chunk_bytes * BATCH_CHUNKS;
    BatchWriter       writer(out);
    std::size_t       produced  = 0;
    int               last_tick = 0;
    bool              ok        = true;
    bool              cancelled = false;

    while (produced < total_bytes)
    {
        if (stop && stop->load())
        {
            cancelled = true;
            break;
        }
        const std::size_t         n = std::min(batch_bytes, total_bytes - produced);
        std::vector<std::uint8_t> batch(n);
        for (std::size_t off = 0; off < n; off += FLOAT_SIZE)
            put_f32_le(batch.data() + off, dist(rng));

        if (!writer.push(std::move(batch)))
        {
            ok = false;
            break;
        }
        produced += n;

        const int tick = static_cast<int>(produced * 10 / total_bytes);
        if (tick > last_tick)
        {
            last_tick = tick;
            LOG_INFO("Source generation %d%%", tick * 10);
        }
        std::this_thread::yield();
    }

    if (!writer.finish())
        ok = false;
    out.close();
    if (cancelled)
    {
        std::error_code ec;
        fs::remove(part, ec);
        LOG_INFO("Source generation cancelled at %zu of %zu bytes", produced, total_bytes);
        return false;
    }
    if (!ok || !out)
    {
        std::error_code ec;
        fs::remove(part, ec);
        LOG_ERROR("Source generation failed at %zu of %zu bytes", produced, total_bytes);
        return false;
    }

    std::error_code ec;
    fs::rename(part, path, ec);
    if (ec)
    {
        LOG_ERROR("rename(%s -> %s) failed: %s", part.c_str(), path.c_str(),
                  ec.message().c_str());
        return false;
    }
    LOG_INFO("Source data written (%zu bytes)", total_bytes);
    return true;
}

bool ensure_source(const std::string &path, std::size_t total_bytes, std::size_t chunk_bytes,
                   const std::atomic_bool *stop)
{
    std::error_code ec;
    if (fs::exists(path, ec))
    {
        const auto size = fs::file_size(path, ec);
        if (!ec && size != total_bytes)
            LOG_WARN("Existing source %s has %llu bytes (configured %zu); using it as is",
                     path.c_str(), (unsigned long long)size, total_bytes);
        else
            LOG_INFO("Using existing source %s", path.c_str());
        return true;
    }
    std::random_device rd;
    return generate(path, total_bytes, chunk_bytes, rd(), stop);
}

std::optional<std::vector<std::uint8_t>> load(const std::string &path, LoadError &err)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        LOG_ERROR("Source %s does not exist", path.c_str());
        err = LoadError::NotFound;
        return std::nullopt;
    }
    auto data = fileio::read_file(path);
    if (!data)
    {
        err = LoadError::ReadFailed;
        return std::nullopt;
    }
    if (data->empty())
    {
        LOG_ERROR("Source %s is empty", path.c_str());
        err = LoadError::Empty;
        return std::nullopt;
    }
    err = LoadError::None;
    return data;
}

}  // namespace source
