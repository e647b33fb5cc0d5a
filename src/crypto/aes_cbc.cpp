#include <algorithm>
#include <memory>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <sodium.h>

#include "crypto/block_cipher.hpp"
#include "util/log.hpp"

namespace cipher
{

static_assert(IV_SIZE == BLOCK_SIZE, "CBC iv must be one block");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

static void log_openssl(const char *what)
{
    unsigned long e = ERR_get_error();
    char          buf[256];
    ERR_error_string_n(e, buf, sizeof buf);
    LOG_ERROR("%s failed: %s", what, e ? buf : "unknown error");
}

// EVP update calls take an int length, so large buffers go through in slices
static constexpr std::size_t SLICE = 1u << 30;

static bool run_cipher(bool                             enc,
                       const std::vector<std::uint8_t> &in,
                       const Key                       &key,
                       const Iv                        &iv,
                       std::vector<std::uint8_t>       &out)
{
    CtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx)
    {
        log_openssl("EVP_CIPHER_CTX_new");
        return false;
    }
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data(),
                          enc ? 1 : 0) != 1)
    {
        log_openssl("EVP_CipherInit_ex");
        return false;
    }

    out.resize(in.size() + BLOCK_SIZE);
    std::size_t written = 0;
    for (std::size_t off = 0; off < in.size(); off += SLICE)
    {
        const std::size_t take = std::min(SLICE, in.size() - off);
        int               n    = 0;
        if (EVP_CipherUpdate(ctx.get(), out.data() + written, &n, in.data() + off,
                             static_cast<int>(take)) != 1)
        {
            log_openssl("EVP_CipherUpdate");
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    int n = 0;
    if (EVP_CipherFinal_ex(ctx.get(), out.data() + written, &n) != 1)
    {
        // on decrypt this is the padding check: wrong key/iv or corrupt data
        if (enc)
            log_openssl("EVP_CipherFinal_ex");
        else
            LOG_WARN("decrypt: bad padding (wrong key/iv or corrupt data)");
        ERR_clear_error();
        return false;
    }
    written += static_cast<std::size_t>(n);
    out.resize(written);
    return true;
}

bool AesCbcCipher::encrypt(const std::vector<std::uint8_t> &plain,
                           const Key                       &key,
                           const Iv                        &iv,
                           std::vector<std::uint8_t>       &out)
{
    return run_cipher(true, plain, key, iv, out);
}

bool AesCbcCipher::decrypt(const std::vector<std::uint8_t> &ciphertext,
                           const Key                       &key,
                           const Iv                        &iv,
                           std::vector<std::uint8_t>       &out)
{
    if (ciphertext.empty() || ciphertext.size() % BLOCK_SIZE != 0)
    {
        LOG_WARN("decrypt: ciphertext length %zu is not block aligned", ciphertext.size());
        return false;
    }
    return run_cipher(false, ciphertext, key, iv, out);
}

bool random_key_iv(Key &key, Iv &iv)
{
    if (!ensure_sodium_init())
    {
        LOG_ERROR("sodium_init failed");
        return false;
    }
    randombytes_buf(key.data(), key.size());
    randombytes_buf(iv.data(), iv.size());
    return true;
}

void wipe(Key &key)
{
    sodium_memzero(key.data(), key.size());
}

void wipe(std::vector<std::uint8_t> &buf)
{
    if (!buf.empty())
        sodium_memzero(buf.data(), buf.size());
}

}  // namespace cipher
