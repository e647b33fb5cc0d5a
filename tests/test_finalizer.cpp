#include <algorithm>
#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <unistd.h>

#include "app/finalizer.hpp"
#include "util/file_io.hpp"

using namespace app;
namespace fs = std::filesystem;

static std::vector<std::uint8_t> floats_le(const std::vector<float> &vals)
{
    std::vector<std::uint8_t> out(vals.size() * 4);
    for (std::size_t i = 0; i < vals.size(); i++)
    {
        std::uint32_t bits;
        std::memcpy(&bits, &vals[i], 4);
        out[i * 4 + 0] = static_cast<std::uint8_t>(bits);
        out[i * 4 + 1] = static_cast<std::uint8_t>(bits >> 8);
        out[i * 4 + 2] = static_cast<std::uint8_t>(bits >> 16);
        out[i * 4 + 3] = static_cast<std::uint8_t>(bits >> 24);
    }
    return out;
}

// fresh artifact directory per test
struct FinalizerTest : ::testing::Test
{
    fs::path             dir;
    cipher::AesCbcCipher aes;

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("chunkfarm-fin-") + info->name() + "-" + std::to_string(::getpid()));
        fs::remove_all(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    ArtifactPaths paths() const
    {
        return {(dir / "result.raw").string(), (dir / "encryption_key.bin").string(),
                (dir / "encryption_iv.bin").string()};
    }

    // store with n chunks of chunk_floats samples; results = payload
    static void fill(tasks::TaskStore &s, const std::vector<float> &samples, std::size_t per_chunk,
                     bool complete = true)
    {
        auto                    bytes = floats_le(samples);
        std::vector<job::Chunk> chunks;
        for (std::size_t off = 0, seq = 0; off < bytes.size(); off += per_chunk * 4, seq++)
        {
            job::Chunk c;
            c.seq = seq;
            c.bytes.assign(bytes.begin() + off,
                           bytes.begin() + std::min(bytes.size(), off + per_chunk * 4));
            chunks.push_back(std::move(c));
        }
        ASSERT_TRUE(s.load_tasks(std::move(chunks)));
        const std::size_t n = s.tasks().size();
        for (std::size_t i = 0; i < n; i++)
        {
            if (!complete && i == n - 1)
                break;
            const auto &t = s.tasks()[i];
            ASSERT_TRUE(s.submit_result(t.id, t.payload));
        }
    }
};

TEST(FinalizerReverse, IsInvolutive)
{
    auto                      in = floats_le({0.5f, -1.0f, 3.25f, 0.0f, -0.0f, 1e-30f, 7.0f});
    std::vector<std::uint8_t> once, twice;
    ASSERT_TRUE(Finalizer::reverse_samples(in, once));
    ASSERT_TRUE(Finalizer::reverse_samples(once, twice));
    EXPECT_EQ(twice, in);
    EXPECT_NE(once, in);
}

TEST(FinalizerReverse, WholeSequenceNotPerChunk)
{
    auto                      in = floats_le({1.0f, 2.0f, 3.0f, 4.0f, 5.0f});
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(Finalizer::reverse_samples(in, out));
    EXPECT_EQ(out, floats_le({5.0f, 4.0f, 3.0f, 2.0f, 1.0f}));
    EXPECT_FLOAT_EQ(Finalizer::sample_at(out, 0), 5.0f);
    EXPECT_FLOAT_EQ(Finalizer::sample_at(out, 4), 1.0f);
}

TEST(FinalizerReverse, RejectsPartialSamples)
{
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(Finalizer::reverse_samples(std::vector<std::uint8_t>(6), out));
    EXPECT_TRUE(Finalizer::reverse_samples({}, out));
    EXPECT_TRUE(out.empty());
}

TEST_F(FinalizerTest, ReassembleFollowsSequence)
{
    tasks::TaskStore s;
    fill(s, {1, 2, 3, 4, 5, 6, 7}, 3);
    auto joined = Finalizer::reassemble(s);
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(*joined, floats_le({1, 2, 3, 4, 5, 6, 7}));
}

TEST_F(FinalizerTest, RefusesWhenTaskPendingAndWritesNothing)
{
    tasks::TaskStore s;
    fill(s, {1, 2, 3, 4, 5, 6}, 2, /*complete=*/false);
    Finalizer f(paths(), aes);

    auto rep = f.finalize(s);
    EXPECT_EQ(rep.status, FinalizeStatus::NotReady);
    EXPECT_FALSE(fs::exists(paths().result));
    EXPECT_FALSE(fs::exists(paths().key));
    EXPECT_FALSE(fs::exists(paths().iv));
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(FinalizerTest, WritesDecryptableArtifact)
{
    const std::vector<float> samples = {0.25f, -0.5f, 0.75f, -1.0f, 0.125f, 0.0625f, 0.9f, -0.3f};
    tasks::TaskStore         s;
    fill(s, samples, 3);
    Finalizer f(paths(), aes);

    auto rep = f.finalize(s);
    ASSERT_EQ(rep.status, FinalizeStatus::Ok);
    EXPECT_TRUE(rep.verified);
    EXPECT_EQ(rep.plain_bytes, samples.size() * 4);

    auto key = fileio::read_file(paths().key);
    auto iv  = fileio::read_file(paths().iv);
    auto art = fileio::read_file(paths().result);
    ASSERT_TRUE(key && iv && art);
    ASSERT_EQ(key->size(), cipher::KEY_SIZE);
    ASSERT_EQ(iv->size(), cipher::IV_SIZE);
    EXPECT_EQ(art->size(), rep.artifact_bytes);
    ASSERT_GT(art->size(), cipher::IV_SIZE);
    EXPECT_TRUE(std::equal(iv->begin(), iv->end(), art->begin()));

    cipher::Key k{};
    cipher::Iv  v{};
    std::copy(key->begin(), key->end(), k.begin());
    std::copy(iv->begin(), iv->end(), v.begin());
    std::vector<std::uint8_t> ct(art->begin() + cipher::IV_SIZE, art->end()), plain;
    ASSERT_TRUE(aes.decrypt(ct, k, v, plain));

    std::vector<float> reversed(samples.rbegin(), samples.rend());
    EXPECT_EQ(plain, floats_le(reversed));
}

TEST_F(FinalizerTest, EachRunUsesFreshKey)
{
    tasks::TaskStore s;
    fill(s, {1, 2, 3, 4}, 2);
    Finalizer f(paths(), aes);
    ASSERT_EQ(f.finalize(s).status, FinalizeStatus::Ok);
    auto k1 = fileio::read_file(paths().key);
    ASSERT_EQ(f.finalize(s).status, FinalizeStatus::Ok);
    auto k2 = fileio::read_file(paths().key);
    ASSERT_TRUE(k1 && k2);
    EXPECT_NE(*k1, *k2);
}

// a cipher whose output cannot be decrypted again
class BrokenCipher : public cipher::BlockCipher
{
  public:
    bool encrypt(const std::vector<std::uint8_t> &plain, const cipher::Key &,
                 const cipher::Iv &, std::vector<std::uint8_t> &out) override
    {
        out.assign(plain.size() + 16, 0x42);
        return true;
    }
    bool decrypt(const std::vector<std::uint8_t> &, const cipher::Key &, const cipher::Iv &,
                 std::vector<std::uint8_t> &) override
    {
        return false;
    }
    const char *name() const override { return "broken"; }
};

TEST_F(FinalizerTest, VerificationFailureDoesNotFailFinalize)
{
    tasks::TaskStore s;
    fill(s, {1, 2, 3, 4}, 4);
    BrokenCipher broken;
    Finalizer    f(paths(), broken);

    testing::internal::CaptureStderr();
    auto        rep = f.finalize(s);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(rep.status, FinalizeStatus::Ok);
    EXPECT_FALSE(rep.verified);
    EXPECT_TRUE(fs::exists(paths().result));
    EXPECT_NE(err.find("Verification failed"), std::string::npos);
}

TEST(FinalizerStatus, Names)
{
    EXPECT_STREQ(finalize_status_name(FinalizeStatus::Ok), "ok");
    EXPECT_STREQ(finalize_status_name(FinalizeStatus::NotReady), "not-ready");
    EXPECT_STREQ(finalize_status_name(FinalizeStatus::IoError), "io-error");
}
