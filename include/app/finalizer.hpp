#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/block_cipher.hpp"
#include "tasks/task_store.hpp"

/*
all tasks Done
  -> reassemble results in seq order
  -> reverse float32 samples (whole buffer, not per chunk)
  -> fresh key + iv, AES-256-CBC
  -> write key file, iv file, artifact = iv || ciphertext
  -> re-read, decrypt and log a few samples (never fails the run)
*/

namespace app
{

enum class FinalizeStatus
{
    Ok,
    NotReady,     // some task is not Done; nothing written
    BadLength,    // reassembled length differs from the source, or not whole samples
    CryptoError,  // key generation or encryption failed; nothing written
    IoError       // persisting an output file failed
};

const char *finalize_status_name(FinalizeStatus s);

struct ArtifactPaths
{
    std::string result;  // iv || ciphertext
    std::string key;
    std::string iv;
};

struct FinalizeReport
{
    FinalizeStatus status{FinalizeStatus::NotReady};
    std::size_t    plain_bytes{0};
    std::size_t    artifact_bytes{0};
    bool           verified{false};  // informational only
};

class Finalizer
{
  public:
    Finalizer(ArtifactPaths paths, cipher::BlockCipher &cipher);

    FinalizeReport finalize(const tasks::TaskStore &store);

    const ArtifactPaths &paths() const { return paths_; }

    // concatenated results in seq order; nullopt unless every task is Done
    static std::optional<std::vector<std::uint8_t>> reassemble(const tasks::TaskStore &store);

    // last sample first; false if len is not a multiple of the sample width
    static bool reverse_samples(const std::vector<std::uint8_t> &in,
                                std::vector<std::uint8_t>       &out);

    // little-endian float32 at sample index i
    static float sample_at(const std::vector<std::uint8_t> &buf, std::size_t i);

  private:
    bool persist(const cipher::Key &key, const cipher::Iv &iv,
                 const std::vector<std::uint8_t> &ciphertext, std::size_t &artifact_bytes);
    bool verify(const std::vector<std::uint8_t> &expected);

    ArtifactPaths        paths_;
    cipher::BlockCipher &cipher_;
};

}  // namespace app
