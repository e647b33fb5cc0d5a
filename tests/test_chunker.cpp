#include <gtest/gtest.h>
#include <numeric>

#include "job/chunker.hpp"

using namespace job;

static std::vector<std::uint8_t> make_bytes(std::size_t n)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; i++)
        v[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    return v;
}

static std::vector<std::uint8_t> concat(const std::vector<Chunk> &chunks)
{
    std::vector<std::uint8_t> out;
    for (const auto &c : chunks)
        out.insert(out.end(), c.bytes.begin(), c.bytes.end());
    return out;
}

TEST(Chunker, ConcatenationRestoresSource)
{
    for (std::size_t total : {1u, 7u, 64u, 100u, 1001u})
    {
        for (std::size_t cs : {1u, 3u, 16u, 100u, 4096u})
        {
            auto src    = make_bytes(total);
            auto chunks = partition(src, cs);
            ASSERT_TRUE(chunks.has_value());
            EXPECT_EQ(chunks->size(), chunk_count(total, cs));
            EXPECT_EQ(concat(*chunks), src) << "total=" << total << " cs=" << cs;
        }
    }
}

TEST(Chunker, LastChunkCarriesRemainder)
{
    auto src    = make_bytes(10);
    auto chunks = partition(src, 4);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 3u);
    EXPECT_EQ((*chunks)[0].bytes.size(), 4u);
    EXPECT_EQ((*chunks)[1].bytes.size(), 4u);
    EXPECT_EQ((*chunks)[2].bytes.size(), 2u);
    for (std::size_t i = 0; i < chunks->size(); i++)
        EXPECT_EQ((*chunks)[i].seq, i);
}

TEST(Chunker, ExactMultipleHasNoShortChunk)
{
    auto chunks = partition(make_bytes(12), 4);
    ASSERT_TRUE(chunks.has_value());
    ASSERT_EQ(chunks->size(), 3u);
    EXPECT_EQ(chunks->back().bytes.size(), 4u);
}

TEST(Chunker, ZeroChunkSizeRejected)
{
    EXPECT_FALSE(partition(make_bytes(8), 0).has_value());
    EXPECT_EQ(chunk_count(8, 0), 0u);
}

TEST(Chunker, EmptySourceYieldsNoChunks)
{
    auto chunks = partition(std::vector<std::uint8_t>{}, 4);
    ASSERT_TRUE(chunks.has_value());
    EXPECT_TRUE(chunks->empty());
}

TEST(Chunker, NullSourceWithLengthRejected)
{
    EXPECT_FALSE(partition(nullptr, 8, 4).has_value());
}
