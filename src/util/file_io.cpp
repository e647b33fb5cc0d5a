#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <new>

#include "util/file_io.hpp"
#include "util/log.hpp"

namespace fileio
{
namespace fs = std::filesystem;

bool ensure_parent_dir(const std::string &path)
{
    std::error_code ec;
    fs::path        dir = fs::path(path).parent_path();
    if (dir.empty())
        return true;  // file in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    return true;
}

bool write_file(const std::string &path, const std::uint8_t *data, std::size_t len)
{
    if (!ensure_parent_dir(path))
        return false;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        LOG_ERROR("open(%s) for writing failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    if (len)
        out.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(len));
    out.flush();
    if (!out)
    {
        LOG_ERROR("write(%s) failed after %zu bytes requested", path.c_str(), len);
        return false;
    }
    return true;
}

std::optional<std::vector<std::uint8_t>> read_file(const std::string &path)
{
    std::error_code ec;
    const auto      size = fs::file_size(path, ec);
    if (ec)
    {
        LOG_ERROR("stat(%s) failed: %s", path.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        return std::nullopt;
    }

    std::vector<std::uint8_t> buf;
    try
    {
        buf.resize(static_cast<std::size_t>(size));
    }
    catch (const std::bad_alloc &)
    {
        LOG_ERROR("read(%s): cannot allocate %llu bytes", path.c_str(),
                  (unsigned long long)size);
        return std::nullopt;
    }
    if (!buf.empty())
        in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (static_cast<std::size_t>(in.gcount()) != buf.size() && !buf.empty())
    {
        LOG_ERROR("read(%s): short read (%lld of %zu bytes)", path.c_str(),
                  (long long)in.gcount(), buf.size());
        return std::nullopt;
    }
    return buf;
}

}  // namespace fileio
