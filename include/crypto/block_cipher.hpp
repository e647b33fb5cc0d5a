#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cipher
{

constexpr std::size_t KEY_SIZE   = 32;  // AES-256
constexpr std::size_t IV_SIZE    = 16;
constexpr std::size_t BLOCK_SIZE = 16;

using Key = std::array<std::uint8_t, KEY_SIZE>;
using Iv  = std::array<std::uint8_t, IV_SIZE>;

class BlockCipher
{
  public:
    virtual ~BlockCipher() = default;

    // out = ciphertext, padded to a whole number of blocks
    virtual bool encrypt(const std::vector<std::uint8_t> &plain,
                         const Key                       &key,
                         const Iv                        &iv,
                         std::vector<std::uint8_t>       &out) = 0;

    // fails on a wrong key/iv (bad padding) or a length that is not block aligned
    virtual bool decrypt(const std::vector<std::uint8_t> &ciphertext,
                         const Key                       &key,
                         const Iv                        &iv,
                         std::vector<std::uint8_t>       &out) = 0;

    virtual const char *name() const = 0;
};

// OpenSSL EVP AES-256-CBC with PKCS#7 padding
class AesCbcCipher : public BlockCipher
{
  public:
    bool encrypt(const std::vector<std::uint8_t> &plain,
                 const Key                       &key,
                 const Iv                        &iv,
                 std::vector<std::uint8_t>       &out) override;

    bool decrypt(const std::vector<std::uint8_t> &ciphertext,
                 const Key                       &key,
                 const Iv                        &iv,
                 std::vector<std::uint8_t>       &out) override;

    const char *name() const override { return "aes-256-cbc"; }
};

// fresh key and iv from libsodium's CSPRNG
bool random_key_iv(Key &key, Iv &iv);

// scrub key material
void wipe(Key &key);
void wipe(std::vector<std::uint8_t> &buf);

}  // namespace cipher
