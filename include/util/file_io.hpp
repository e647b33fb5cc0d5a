#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fileio
{

// mkdir -p for the directory holding path
bool ensure_parent_dir(const std::string &path);

// truncate and write the whole buffer; false on any I/O error
bool write_file(const std::string &path, const std::uint8_t *data, std::size_t len);

inline bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    return write_file(path, data.data(), data.size());
}

// whole file; nullopt if it cannot be opened or read
std::optional<std::vector<std::uint8_t>> read_file(const std::string &path);

}  // namespace fileio
