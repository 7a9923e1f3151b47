// tests/test_size_estimator.cpp
#include <gtest/gtest.h>

#include <limits>

#include "chunkvault/size_estimator.hpp"

using ChunkVault::Chunks::SizeEstimator;

TEST(SizeEstimatorTest, ZeroBytesNeedsNoChunks)
{
    EXPECT_EQ(SizeEstimator::estimateChunkCount(0, 800000), 0u);
    EXPECT_EQ(SizeEstimator::encodedLength(0), 0u);
    EXPECT_EQ(SizeEstimator::chunkCountForEncodedLength(0, 800000), 0u);
}

TEST(SizeEstimatorTest, TwoMegabyteFileNeedsFourChunks)
{
    // 2,000,000 * 1.34 = 2,680,000 -> ceil(2,680,000 / 800,000) = 4
    EXPECT_EQ(SizeEstimator::estimateChunkCount(2000000, 800000), 4u);
    EXPECT_EQ(SizeEstimator::encodedLength(2000000), 2666668u);
    EXPECT_EQ(SizeEstimator::chunkCountForEncodedLength(2666668, 800000), 4u);
}

TEST(SizeEstimatorTest, SmallFileFitsInOneChunk)
{
    EXPECT_EQ(SizeEstimator::estimateChunkCount(500, 800000), 1u);
    EXPECT_EQ(SizeEstimator::estimateChunkCount(1, 800000), 1u);
}

TEST(SizeEstimatorTest, EstimateIsMonotonic)
{
    size_t previous = 0;
    for (uint64_t n = 0; n < 5000; ++n)
    {
        size_t current = SizeEstimator::estimateChunkCount(n, 64);
        EXPECT_GE(current, previous) << "at n = " << n;
        previous = current;
    }
}

TEST(SizeEstimatorTest, EstimateDoesNotWrapForHugeInputs)
{
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t samples[] = {uint64_t{1} << 56, 137438953472000000ull, 137438953472000100ull,
                          uint64_t{1} << 60, max / 134 * 100, max - 1, max};
    size_t previous = 0;
    for (uint64_t n : samples)
    {
        size_t current = SizeEstimator::estimateChunkCount(n, 800000);
        EXPECT_GE(current, previous) << "at n = " << n;
        previous = current;
    }
    // 1e17 bytes -> 1.34e17 encoded -> 167,500,000,000 fragments of 800,000
    EXPECT_EQ(SizeEstimator::estimateChunkCount(100000000000000000ull, 800000), 167500000000u);
}

TEST(SizeEstimatorTest, EstimateNeverUndercountsActualChunks)
{
    for (uint64_t n = 1; n < 3000; n += 7)
    {
        size_t actual = SizeEstimator::chunkCountForEncodedLength(SizeEstimator::encodedLength(n), 100);
        EXPECT_GE(SizeEstimator::estimateChunkCount(n, 100), actual) << "at n = " << n;
    }
}

TEST(SizeEstimatorTest, ExactMultipleAndOnePast)
{
    EXPECT_EQ(SizeEstimator::chunkCountForEncodedLength(1600, 800), 2u);
    EXPECT_EQ(SizeEstimator::chunkCountForEncodedLength(1601, 800), 3u);
    EXPECT_EQ(SizeEstimator::chunkCountForEncodedLength(799, 800), 1u);
}

TEST(SizeEstimatorTest, ZeroFragmentSizeIsRejected)
{
    EXPECT_THROW(SizeEstimator::estimateChunkCount(10, 0), std::invalid_argument);
    EXPECT_THROW(SizeEstimator::chunkCountForEncodedLength(10, 0), std::invalid_argument);
}

TEST(SizeEstimatorTest, FormatsHumanReadableSizes)
{
    EXPECT_EQ(SizeEstimator::formatFileSize(0), "0 Bytes");
    EXPECT_EQ(SizeEstimator::formatFileSize(512), "512 Bytes");
    EXPECT_EQ(SizeEstimator::formatFileSize(1536), "1.5 KB");
    EXPECT_EQ(SizeEstimator::formatFileSize(1048576), "1 MB");
    EXPECT_EQ(SizeEstimator::formatFileSize(2000000), "1.91 MB");
    EXPECT_EQ(SizeEstimator::formatFileSize(3ull * 1024 * 1024 * 1024), "3 GB");
}
