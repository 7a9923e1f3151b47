// tests/test_content_store.cpp
#include <gtest/gtest.h>

#include <memory>

#include "chunkvault/content_codec.hpp"
#include "chunkvault/content_store.hpp"
#include "chunkvault/document_registry.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/file_record_store.hpp"
#include "chunkvault/preprocessor.hpp"
#include "test_support.hpp"

using namespace ChunkVault;
using ChunkVault::Testing::FlakyRecordStore;
using ChunkVault::Testing::TempDir;

namespace
{
    // File registry whose markReady can be made to fail after the chunks are written
    class FailingReadyRegistry : public Registry::DocumentRegistry
    {
    public:
        explicit FailingReadyRegistry(const Config::ChunkConfig &config) : inner(config) {}

        bool fail_mark_ready = true;

        Registry::DocumentRecord reserve(const std::string &owner_id, const std::string &filename,
                                         const std::string &content_type, uint64_t original_size_bytes) override
        {
            return inner.reserve(owner_id, filename, content_type, original_size_bytes);
        }

        std::optional<Registry::DocumentRecord> get(const std::string &document_id) override
        {
            return inner.get(document_id);
        }

        Registry::DocumentRecord markReady(const std::string &document_id, size_t chunk_count,
                                           uint64_t stored_size_bytes) override
        {
            if (fail_mark_ready)
            {
                throw std::runtime_error("registry disk full");
            }
            return inner.markReady(document_id, chunk_count, stored_size_bytes);
        }

        bool remove(const std::string &document_id) override { return inner.remove(document_id); }

    private:
        Registry::FileDocumentRegistry inner;
    };
} // namespace

class ContentStoreTest : public ::testing::Test
{
protected:
    TempDir dir;
    Config::ChunkConfig config;
    std::shared_ptr<FlakyRecordStore> store = std::make_shared<FlakyRecordStore>();
    std::shared_ptr<Registry::FileDocumentRegistry> registry;

    void SetUp() override
    {
        config = Testing::testConfig(64);
        config.storage_root = dir.path;
        registry = std::make_shared<Registry::FileDocumentRegistry>(config);
    }

    ContentStore makeStore() { return ContentStore(config, store, registry); }
};

TEST_F(ContentStoreTest, UploadThenDownloadReturnsSameBytes)
{
    ContentStore content = makeStore();
    std::vector<char> raw = Testing::pseudoRandomBytes(1000);

    Registry::DocumentRecord record = content.uploadDocument("alice", "blob.bin", "application/octet-stream", raw);
    EXPECT_EQ(record.status, Registry::DocumentStatus::Ready);
    EXPECT_EQ(record.original_size_bytes, 1000u);
    EXPECT_EQ(record.stored_size_bytes, 1000u);
    // 1000 bytes -> 1336 base64 characters -> 21 fragments of 64
    EXPECT_EQ(record.chunk_count, 21u);
    EXPECT_EQ(store->size(), 21u);

    EXPECT_EQ(content.downloadDocument(record.document_id), raw);
    EXPECT_EQ(content.readEncoded(record.document_id), Codec::ContentCodec::encodeBase64(raw));
}

TEST_F(ContentStoreTest, RetrievesIndividualChunks)
{
    ContentStore content = makeStore();
    std::vector<char> raw = Testing::pseudoRandomBytes(100);
    Registry::DocumentRecord record = content.uploadDocument("alice", "a.bin", "application/octet-stream", raw);
    ASSERT_EQ(record.chunk_count, 3u);

    auto last = content.retrieveChunk(record.document_id, 2);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->chunk_index, 2u);
    EXPECT_EQ(last->total_chunks, 3u);
    EXPECT_EQ(last->content, Codec::ContentCodec::encodeBase64(raw).substr(128));
    EXPECT_FALSE(content.retrieveChunk(record.document_id, 3).has_value());
}

TEST_F(ContentStoreTest, EmptyDocumentHasNoChunks)
{
    ContentStore content = makeStore();
    Registry::DocumentRecord record = content.uploadDocument("alice", "empty.txt", "text/plain", {});
    EXPECT_EQ(record.chunk_count, 0u);
    EXPECT_TRUE(content.downloadDocument(record.document_id).empty());
}

TEST_F(ContentStoreTest, ShrinksJpegUploads)
{
    config.image_quality = 0.4;
    ContentStore content = makeStore();
    std::vector<char> jpeg = Testing::makeTestJpeg(256, 256);

    Registry::DocumentRecord record = content.uploadDocument("alice", "photo.jpg", "image/jpeg", jpeg);
    EXPECT_EQ(record.original_size_bytes, jpeg.size());
    EXPECT_LT(record.stored_size_bytes, jpeg.size());

    std::vector<char> stored = content.downloadDocument(record.document_id);
    EXPECT_EQ(stored.size(), record.stored_size_bytes);
    auto image = Preprocess::Preprocessor::decodeJpeg(stored);
    EXPECT_EQ(image.width, 256u);
}

TEST_F(ContentStoreTest, SkipsPreprocessingWhenDisabled)
{
    config.preprocess_images = false;
    ContentStore content = makeStore();
    std::vector<char> jpeg = Testing::makeTestJpeg(64, 64);

    Registry::DocumentRecord record = content.uploadDocument("alice", "photo.jpg", "image/jpeg", jpeg);
    EXPECT_EQ(content.downloadDocument(record.document_id), jpeg);
}

TEST_F(ContentStoreTest, CorruptJpegFallsBackToOriginalBytes)
{
    ContentStore content = makeStore();
    std::vector<char> garbage = Testing::pseudoRandomBytes(300, 99);

    Registry::DocumentRecord record = content.uploadDocument("alice", "broken.jpg", "image/jpeg", garbage);
    EXPECT_EQ(record.stored_size_bytes, 300u);
    EXPECT_EQ(content.downloadDocument(record.document_id), garbage);
}

TEST_F(ContentStoreTest, FailedWriteLeavesNoDocument)
{
    store->fail_put_index = 1;
    store->put_failures = 100;
    ContentStore content = makeStore();

    EXPECT_THROW(content.uploadDocument("alice", "a.bin", "application/octet-stream",
                                        Testing::pseudoRandomBytes(200)),
                 ChunkWriteError);
    EXPECT_EQ(store->size(), 0u);
    // The reserved record was released too
    EXPECT_TRUE(std::filesystem::is_empty(config.getMetadataDirPath()));
}

TEST_F(ContentStoreTest, CancelledUploadLeavesNoDocument)
{
    Concurrency::CancellationToken token;
    token.cancel();
    ContentStore content = makeStore();

    try
    {
        content.uploadDocument("alice", "a.bin", "application/octet-stream", Testing::pseudoRandomBytes(200), &token);
        FAIL() << "expected ChunkWriteError";
    }
    catch (const ChunkWriteError &e)
    {
        EXPECT_TRUE(e.cancelled());
    }
    EXPECT_EQ(store->size(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(config.getMetadataDirPath()));
}

TEST_F(ContentStoreTest, RejectsOversizedUpload)
{
    config.max_upload_size = 100;
    ContentStore content = makeStore();
    EXPECT_THROW(content.uploadDocument("alice", "big.bin", "application/octet-stream",
                                        Testing::pseudoRandomBytes(101)),
                 std::invalid_argument);
    EXPECT_EQ(store->put_calls.load(), 0u);
}

TEST_F(ContentStoreTest, UnknownDocumentIsNotFound)
{
    ContentStore content = makeStore();
    EXPECT_THROW(content.downloadDocument("0123456789abcdef0123456789abcdef"), DocumentNotFoundError);
    EXPECT_THROW(content.retrieveChunk("0123456789abcdef0123456789abcdef", 0), DocumentNotFoundError);
    EXPECT_FALSE(content.getDocument("0123456789abcdef0123456789abcdef").has_value());
    EXPECT_FALSE(content.deleteDocument("0123456789abcdef0123456789abcdef"));
}

TEST_F(ContentStoreTest, PendingDocumentIsNotReadable)
{
    ContentStore content = makeStore();
    Registry::DocumentRecord pending = registry->reserve("alice", "a.bin", "application/octet-stream", 10);
    EXPECT_THROW(content.downloadDocument(pending.document_id), DocumentNotFoundError);
    EXPECT_TRUE(content.getDocument(pending.document_id).has_value());
}

TEST_F(ContentStoreTest, DeleteRemovesChunksAndRecord)
{
    ContentStore content = makeStore();
    Registry::DocumentRecord record =
        content.uploadDocument("alice", "a.bin", "application/octet-stream", Testing::pseudoRandomBytes(500));
    ASSERT_GT(store->size(), 0u);

    EXPECT_TRUE(content.deleteDocument(record.document_id));
    EXPECT_EQ(store->size(), 0u);
    EXPECT_FALSE(content.getDocument(record.document_id).has_value());
    EXPECT_THROW(content.downloadDocument(record.document_id), DocumentNotFoundError);
    EXPECT_FALSE(content.deleteDocument(record.document_id));
}

TEST_F(ContentStoreTest, SameBytesUploadedTwiceGetDistinctDocuments)
{
    ContentStore content = makeStore();
    std::vector<char> raw = Testing::pseudoRandomBytes(150);
    std::string first = content.uploadDocument("alice", "a.bin", "application/octet-stream", raw).document_id;
    std::string second = content.uploadDocument("alice", "a.bin", "application/octet-stream", raw).document_id;
    EXPECT_NE(first, second);
    EXPECT_EQ(content.downloadDocument(first), content.downloadDocument(second));
}

TEST_F(ContentStoreTest, WorksOverFileRecordStore)
{
    auto files = std::make_shared<Storage::FileRecordStore>(config);
    ContentStore content(config, files, registry);
    std::vector<char> raw = Testing::pseudoRandomBytes(700);

    Registry::DocumentRecord record = content.uploadDocument("bob", "f.bin", "application/octet-stream", raw);
    EXPECT_EQ(content.downloadDocument(record.document_id), raw);
    EXPECT_TRUE(content.deleteDocument(record.document_id));
    EXPECT_TRUE(files->queryAll(record.document_id).empty());
}

TEST_F(ContentStoreTest, RegistryFailureAfterWriteLeavesNoDocument)
{
    auto failing = std::make_shared<FailingReadyRegistry>(config);
    ContentStore content(config, store, failing);

    EXPECT_THROW(content.uploadDocument("alice", "a.bin", "application/octet-stream",
                                        Testing::pseudoRandomBytes(1000)),
                 std::runtime_error);
    // All 21 fragments were written before markReady failed
    EXPECT_EQ(store->put_calls.load(), 21u);
    EXPECT_EQ(store->size(), 0u);
    EXPECT_TRUE(std::filesystem::is_empty(config.getMetadataDirPath()));

    failing->fail_mark_ready = false;
    Registry::DocumentRecord record =
        content.uploadDocument("alice", "a.bin", "application/octet-stream", Testing::pseudoRandomBytes(1000));
    EXPECT_EQ(record.chunk_count, 21u);
}
