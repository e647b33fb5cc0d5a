#include <algorithm>
#include <cstdio>
#include <cstring>

#include "app/finalizer.hpp"
#include "util/constants.hpp"
#include "util/file_io.hpp"
#include "util/log.hpp"

namespace app
{

using constants::FLOAT_SIZE;

static constexpr std::size_t PREVIEW = 5;

const char *finalize_status_name(FinalizeStatus s)
{
    switch (s)
    {
        case FinalizeStatus::Ok:
            return "ok";
        case FinalizeStatus::NotReady:
            return "not-ready";
        case FinalizeStatus::BadLength:
            return "bad-length";
        case FinalizeStatus::CryptoError:
            return "crypto-error";
        case FinalizeStatus::IoError:
            return "io-error";
    }
    return "?";
}

Finalizer::Finalizer(ArtifactPaths paths, cipher::BlockCipher &cipher)
    : paths_(std::move(paths)), cipher_(cipher)
{
}

std::optional<std::vector<std::uint8_t>> Finalizer::reassemble(const tasks::TaskStore &store)
{
    if (!store.is_all_done())
        return std::nullopt;

    // order by seq explicitly; id order happens to match but is not the reassembly key
    std::vector<const tasks::Task *> order;
    order.reserve(store.tasks().size());
    std::size_t total = 0;
    for (const auto &t : store.tasks())
    {
        order.push_back(&t);
        total += t.result->size();
    }
    std::sort(order.begin(), order.end(),
              [](const tasks::Task *a, const tasks::Task *b) { return a->seq < b->seq; });

    std::vector<std::uint8_t> out;
    out.reserve(total);
    for (const auto *t : order)
        out.insert(out.end(), t->result->begin(), t->result->end());
    return out;
}

bool Finalizer::reverse_samples(const std::vector<std::uint8_t> &in,
                                std::vector<std::uint8_t>       &out)
{
    if (in.size() % FLOAT_SIZE != 0)
        return false;

    // byte copies keep every sample bit-exact (NaN payloads included)
    const std::size_t n = in.size() / FLOAT_SIZE;
    out.resize(in.size());
    for (std::size_t i = 0; i < n; i++)
        std::memcpy(out.data() + i * FLOAT_SIZE, in.data() + (n - 1 - i) * FLOAT_SIZE,
                    FLOAT_SIZE);
    return true;
}

float Finalizer::sample_at(const std::vector<std::uint8_t> &buf, std::size_t i)
{
    const std::uint8_t *p    = buf.data() + i * FLOAT_SIZE;
    std::uint32_t       bits = static_cast<std::uint32_t>(p[0]) |
                         (static_cast<std::uint32_t>(p[1]) << 8) |
                         (static_cast<std::uint32_t>(p[2]) << 16) |
                         (static_cast<std::uint32_t>(p[3]) << 24);
    float f;
    std::memcpy(&f, &bits, sizeof f);
    return f;
}

FinalizeReport Finalizer::finalize(const tasks::TaskStore &store)
{
    FinalizeReport rep;

    auto joined = reassemble(store);
    if (!joined)
    {
        const auto c = store.counts();
        LOG_WARN("Finalize refused: %zu of %zu tasks not done", c.total - c.done, c.total);
        rep.status = FinalizeStatus::NotReady;
        return rep;
    }

    std::size_t source_len = 0;
    for (const auto &t : store.tasks())
        source_len += t.payload.size();
    if (joined->size() != source_len)
    {
        LOG_ERROR("Finalize: reassembled %zu bytes, source has %zu", joined->size(), source_len);
        rep.status = FinalizeStatus::BadLength;
        return rep;
    }

    std::vector<std::uint8_t> reversed;
    if (!reverse_samples(*joined, reversed))
    {
        LOG_ERROR("Finalize: %zu bytes is not a whole number of float32 samples",
                  joined->size());
        rep.status = FinalizeStatus::BadLength;
        return rep;
    }
    joined.reset();
    rep.plain_bytes = reversed.size();
    LOG_INFO("Reassembled and reversed %zu samples", reversed.size() / FLOAT_SIZE);

    cipher::Key key{};
    cipher::Iv  iv{};
    if (!cipher::random_key_iv(key, iv))
    {
        rep.status = FinalizeStatus::CryptoError;
        return rep;
    }

    std::vector<std::uint8_t> ciphertext;
    if (!cipher_.encrypt(reversed, key, iv, ciphertext))
    {
        cipher::wipe(key);
        LOG_ERROR("Finalize: %s encryption failed", cipher_.name());
        rep.status = FinalizeStatus::CryptoError;
        return rep;
    }

    const bool written = persist(key, iv, ciphertext, rep.artifact_bytes);
    cipher::wipe(key);
    if (!written)
    {
        rep.status = FinalizeStatus::IoError;
        return rep;
    }
    LOG_SYSTEM("Encrypted artifact written to %s (%zu bytes, %s)", paths_.result.c_str(),
               rep.artifact_bytes, cipher_.name());

    rep.verified = verify(reversed);
    rep.status   = FinalizeStatus::Ok;
    return rep;
}

bool Finalizer::persist(const cipher::Key &key, const cipher::Iv &iv,
                        const std::vector<std::uint8_t> &ciphertext,
                        std::size_t                     &artifact_bytes)
{
    if (!fileio::write_file(paths_.key, key.data(), key.size()))
        return false;
    if (!fileio::write_file(paths_.iv, iv.data(), iv.size()))
        return false;

    std::vector<std::uint8_t> artifact;
    artifact.reserve(iv.size() + ciphertext.size());
    artifact.insert(artifact.end(), iv.begin(), iv.end());
    artifact.insert(artifact.end(), ciphertext.begin(), ciphertext.end());
    if (!fileio::write_file(paths_.result, artifact))
        return false;

    artifact_bytes = artifact.size();
    return true;
}

bool Finalizer::verify(const std::vector<std::uint8_t> &expected)
{
    auto key_bytes = fileio::read_file(paths_.key);
    auto iv_bytes  = fileio::read_file(paths_.iv);
    auto artifact  = fileio::read_file(paths_.result);
    if (!key_bytes || !iv_bytes || !artifact)
    {
        LOG_WARN("Verification skipped: could not re-read output files");
        return false;
    }
    if (key_bytes->size() != cipher::KEY_SIZE || iv_bytes->size() != cipher::IV_SIZE ||
        artifact->size() < cipher::IV_SIZE)
    {
        LOG_WARN("Verification failed: key %zu / iv %zu / artifact %zu bytes",
                 key_bytes->size(), iv_bytes->size(), artifact->size());
        return false;
    }
    if (!std::equal(iv_bytes->begin(), iv_bytes->end(), artifact->begin()))
    {
        LOG_WARN("Verification failed: artifact does not start with the iv");
        return false;
    }

    cipher::Key key{};
    cipher::Iv  iv{};
    std::copy(key_bytes->begin(), key_bytes->end(), key.begin());
    std::copy(iv_bytes->begin(), iv_bytes->end(), iv.begin());
    cipher::wipe(*key_bytes);

    const std::vector<std::uint8_t> ciphertext(artifact->begin() + cipher::IV_SIZE,
                                               artifact->end());
    std::vector<std::uint8_t> plain;
    const bool                ok = cipher_.decrypt(ciphertext, key, iv, plain);
    cipher::wipe(key);
    if (!ok)
    {
        LOG_WARN("Verification failed: artifact does not decrypt");
        return false;
    }
    if (plain != expected)
    {
        LOG_WARN("Verification failed: decrypted %zu bytes differ from the %zu written",
                 plain.size(), expected.size());
        return false;
    }

    const std::size_t n    = plain.size() / FLOAT_SIZE;
    const std::size_t show = std::min(PREVIEW, n);
    std::string       head, tail;
    char              num[32];
    for (std::size_t i = 0; i < show; i++)
    {
        std::snprintf(num, sizeof num, "%s%.6f", i ? ", " : "", sample_at(plain, i));
        head += num;
        std::snprintf(num, sizeof num, "%s%.6f", i ? ", " : "", sample_at(plain, n - show + i));
        tail += num;
    }
    LOG_INFO("Verified %zu samples; first [%s] last [%s]", n, head.c_str(), tail.c_str());
    return true;
}

}  // namespace app
