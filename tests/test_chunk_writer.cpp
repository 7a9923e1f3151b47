// tests/test_chunk_writer.cpp
#include <gtest/gtest.h>

#include <memory>

#include "chunkvault/cancellation.hpp"
#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/errors.hpp"
#include "test_support.hpp"

using namespace ChunkVault;
using ChunkVault::Testing::FlakyRecordStore;
using ChunkVault::Testing::testConfig;

class ChunkWriterTest : public ::testing::Test
{
protected:
    std::shared_ptr<FlakyRecordStore> store = std::make_shared<FlakyRecordStore>();
};

TEST_F(ChunkWriterTest, SplitsIntoOrderedBoundedFragments)
{
    Chunks::ChunkWriter writer(store, testConfig(4));
    EXPECT_EQ(writer.writeChunked("doc1", "alice", "abcdefghij"), 3u);

    auto fragments = store->queryAll("doc1");
    ASSERT_EQ(fragments.size(), 3u);
    const char *expected[] = {"abcd", "efgh", "ij"};
    for (size_t i = 0; i < 3; ++i)
    {
        auto fragment = store->getByIndex("doc1", i);
        ASSERT_TRUE(fragment.has_value());
        EXPECT_EQ(fragment->content, expected[i]);
        EXPECT_EQ(fragment->chunk_index, i);
        EXPECT_EQ(fragment->total_chunks, 3u);
        EXPECT_EQ(fragment->owner_id, "alice");
        EXPECT_FALSE(fragment->created_at.empty());
        EXPECT_TRUE(fragment->digestMatches());
    }
}

TEST_F(ChunkWriterTest, ExactMultipleProducesOnlyFullFragments)
{
    Chunks::ChunkWriter writer(store, testConfig(800));
    std::string payload = Testing::repeatPattern(1600);
    EXPECT_EQ(writer.writeChunked("doc", "o", payload), 2u);
    EXPECT_EQ(store->getByIndex("doc", 0)->content.size(), 800u);
    EXPECT_EQ(store->getByIndex("doc", 1)->content.size(), 800u);
}

TEST_F(ChunkWriterTest, OnePastMultipleAddsSingleCharacterFragment)
{
    Chunks::ChunkWriter writer(store, testConfig(800));
    std::string payload = Testing::repeatPattern(1601);
    EXPECT_EQ(writer.writeChunked("doc", "o", payload), 3u);
    EXPECT_EQ(store->getByIndex("doc", 2)->content, payload.substr(1600));
}

TEST_F(ChunkWriterTest, SmallPayloadIsOneFragment)
{
    Chunks::ChunkWriter writer(store, testConfig(Config::ChunkConfig::DEFAULT_MAX_FRAGMENT_SIZE));
    std::string payload = Testing::repeatPattern(500);
    EXPECT_EQ(writer.writeChunked("doc", "o", payload), 1u);
    EXPECT_EQ(store->getByIndex("doc", 0)->content, payload);
}

TEST_F(ChunkWriterTest, EmptyPayloadWritesNothing)
{
    Chunks::ChunkWriter writer(store, testConfig());
    EXPECT_EQ(writer.writeChunked("doc", "o", ""), 0u);
    EXPECT_EQ(store->put_calls.load(), 0u);
    EXPECT_EQ(store->query_calls.load(), 0u);
}

TEST_F(ChunkWriterTest, SplitMatchesWindowing)
{
    auto slices = Chunks::ChunkWriter::split("abcdefghij", 4);
    ASSERT_EQ(slices.size(), 3u);
    EXPECT_EQ(slices[2], "ij");
    EXPECT_TRUE(Chunks::ChunkWriter::split("", 4).empty());
}

TEST_F(ChunkWriterTest, RetriesTransientFailures)
{
    store->fail_put_index = 1;
    store->put_failures = 2;
    Chunks::ChunkWriter writer(store, testConfig(4));

    EXPECT_EQ(writer.writeChunked("doc", "o", "abcdefghij"), 3u);
    EXPECT_EQ(store->size(), 3u);
    EXPECT_EQ(store->put_calls.load(), 5u); // 3 fragments + 2 failed attempts
}

TEST_F(ChunkWriterTest, ExhaustedRetriesRollBack)
{
    store->fail_put_index = 2;
    store->put_failures = 10;
    Chunks::ChunkWriter writer(store, testConfig(4));

    try
    {
        writer.writeChunked("doc", "o", "abcdefghijklmnop");
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_EQ(e.documentId(), "doc");
        ASSERT_TRUE(e.details().failed_index.has_value());
        EXPECT_EQ(*e.details().failed_index, 2u);
        EXPECT_EQ(e.details().attempts, 3u);
        EXPECT_EQ(e.details().fragments_written, 2u);
        EXPECT_TRUE(e.rolledBack());
        EXPECT_FALSE(e.cancelled());
    }
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(ChunkWriterTest, PermanentFailureIsNotRetried)
{
    store->fail_put_index = 0;
    store->put_failures = 1;
    store->put_failure_transient = false;
    Chunks::ChunkWriter writer(store, testConfig(4));

    try
    {
        writer.writeChunked("doc", "o", "abcdefgh");
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_EQ(e.details().attempts, 1u);
    }
    EXPECT_EQ(store->put_calls.load(), 1u);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(ChunkWriterTest, ReportsRollbackFailure)
{
    store->fail_put_index = 1;
    store->put_failures = 1;
    store->put_failure_transient = false;
    store->fail_removes = true;
    Chunks::ChunkWriter writer(store, testConfig(4));

    try
    {
        writer.writeChunked("doc", "o", "abcdefgh");
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_FALSE(e.rolledBack());
        EXPECT_FALSE(e.details().rollback_failure.empty());
        EXPECT_NE(std::string(e.what()).find("rollback incomplete"), std::string::npos);
    }
}

TEST_F(ChunkWriterTest, RefusesToOverwriteExistingFragments)
{
    Chunks::ChunkWriter writer(store, testConfig(4));
    writer.writeChunked("doc", "o", "abcdefgh");

    EXPECT_THROW(writer.writeChunked("doc", "o", "zzzzzzzzzzzz"), ChunkWriteError);
    // The original chunk set is untouched
    EXPECT_EQ(store->size(), 2u);
    EXPECT_EQ(store->getByIndex("doc", 0)->content, "abcd");
}

TEST_F(ChunkWriterTest, CancellationMidWriteRollsBack)
{
    Concurrency::CancellationToken token;
    store->after_put = [&token](const Chunks::Fragment &fragment)
    {
        if (fragment.chunk_index == 1)
            token.cancel();
    };
    Chunks::ChunkWriter writer(store, testConfig(4));

    try
    {
        writer.writeChunked("doc", "o", "abcdefghijklmnop", &token);
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_TRUE(e.cancelled());
        EXPECT_EQ(e.details().fragments_written, 2u);
        EXPECT_TRUE(e.rolledBack());
    }
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(ChunkWriterTest, OversizedRecordFailsWithoutWriting)
{
    Config::ChunkConfig config = testConfig(100);
    config.metadata_headroom = 0;
    config.record_size_ceiling = 150; // JSON field names and digest alone exceed 50 bytes
    Chunks::ChunkWriter writer(store, config);

    try
    {
        writer.writeChunked("doc", "o", Testing::repeatPattern(100));
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_EQ(*e.details().failed_index, 0u);
        EXPECT_NE(std::string(e.what()).find("exceeds ceiling"), std::string::npos);
    }
    EXPECT_EQ(store->put_calls.load(), 0u);
}

TEST_F(ChunkWriterTest, RejectsInvalidConfiguration)
{
    Config::ChunkConfig config = testConfig(4);
    config.max_fragment_size = 0;
    EXPECT_THROW({ Chunks::ChunkWriter writer(store, config); }, ConfigError);
}
