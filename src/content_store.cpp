// src/content_store.cpp
#include "chunkvault/content_store.hpp"
#include "chunkvault/content_codec.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/preprocessor.hpp"
#include "chunkvault/retry.hpp"
#include "chunkvault/size_estimator.hpp"

#include <iostream>

namespace ChunkVault
{

    ContentStore::ContentStore(Config::ChunkConfig config,
                               std::shared_ptr<Storage::RecordStore> store,
                               std::shared_ptr<Registry::DocumentRegistry> registry)
        : config(std::move(config)),
          store(store),
          registry(std::move(registry)),
          writer(store, this->config),
          reader(store, this->config)
    {
        if (!this->registry)
        {
            throw std::invalid_argument("ContentStore requires a document registry");
        }
        std::cout << "ContentStore initialized (max fragment " << this->config.max_fragment_size
                  << " bytes, read strategy " << Config::toString(this->config.read_strategy) << ")." << std::endl;
    }

    std::vector<char> ContentStore::preprocess(const std::vector<char> &raw, const std::string &content_type) const
    {
        if (!config.preprocess_images || !Preprocess::Preprocessor::isReducible(content_type))
        {
            return raw;
        }

        try
        {
            std::vector<char> reduced = Preprocess::Preprocessor::reduce(raw, content_type, config.image_quality);
            std::cout << "Preprocessed " << content_type << " payload: "
                      << Chunks::SizeEstimator::formatFileSize(raw.size()) << " -> "
                      << Chunks::SizeEstimator::formatFileSize(reduced.size()) << std::endl;
            return reduced;
        }
        catch (const PreprocessingError &e)
        {
            std::cerr << "Warning: " << e.what() << "; storing the original payload." << std::endl;
            return raw;
        }
    }

    Registry::DocumentRecord ContentStore::uploadDocument(const std::string &owner_id,
                                                          const std::string &filename,
                                                          const std::string &content_type,
                                                          const std::vector<char> &raw,
                                                          const Concurrency::CancellationToken *cancel)
    {
        if (raw.size() > config.max_upload_size)
        {
            throw std::invalid_argument("Upload of " + Chunks::SizeEstimator::formatFileSize(raw.size()) +
                                        " exceeds the limit of " +
                                        Chunks::SizeEstimator::formatFileSize(config.max_upload_size));
        }

        std::cout << "Uploading document '" << filename << "' ("
                  << Chunks::SizeEstimator::formatFileSize(raw.size()) << ")" << std::endl;
        Registry::DocumentRecord record = registry->reserve(owner_id, filename, content_type, raw.size());

        // Nothing below may leave fragments or a Pending record behind
        try
        {
            std::vector<char> payload = preprocess(raw, content_type);
            std::string encoded = Codec::ContentCodec::encodeBase64(payload);
            size_t estimate = Chunks::SizeEstimator::estimateChunkCount(payload.size(), config.max_fragment_size);

            size_t chunk_count = writer.writeChunked(record.document_id, owner_id, encoded, cancel);
            record = registry->markReady(record.document_id, chunk_count, payload.size());
            std::cout << "Document '" << filename << "' stored as " << record.document_id << " in " << chunk_count
                      << " chunk(s) (estimated " << estimate << ")." << std::endl;
            return record;
        }
        catch (const std::exception &e)
        {
            std::cerr << "Upload of " << record.document_id << " failed: " << e.what() << std::endl;
            discardUpload(record.document_id);
            throw;
        }
    }

    void ContentStore::discardUpload(const std::string &document_id)
    {
        try
        {
            size_t attempts = 0;
            Concurrency::withRetries(
                Concurrency::RetryPolicy::fromConfig(config), [&]
                { return store->removeAll(document_id); },
                attempts);
        }
        catch (const StoreError &e)
        {
            std::cerr << "Could not delete fragments of " << document_id << ": " << e.what() << std::endl;
        }

        try
        {
            registry->remove(document_id);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Could not release reservation " << document_id << ": " << e.what() << std::endl;
        }
    }

    Registry::DocumentRecord ContentStore::requireReady(const std::string &document_id)
    {
        std::optional<Registry::DocumentRecord> record = registry->get(document_id);
        if (!record)
        {
            throw DocumentNotFoundError(document_id);
        }
        if (record->status != Registry::DocumentStatus::Ready)
        {
            throw DocumentNotFoundError(document_id, "is still being written");
        }
        return *record;
    }

    std::string ContentStore::readEncoded(const std::string &document_id,
                                          const Concurrency::CancellationToken *cancel)
    {
        Registry::DocumentRecord record = requireReady(document_id);
        return reader.readChunked(document_id, record.chunk_count, cancel);
    }

    std::vector<char> ContentStore::downloadDocument(const std::string &document_id,
                                                     const Concurrency::CancellationToken *cancel)
    {
        std::cout << "Retrieving document: " << document_id << std::endl;
        return Codec::ContentCodec::decodeBase64(readEncoded(document_id, cancel));
    }

    std::optional<Chunks::Fragment> ContentStore::retrieveChunk(const std::string &document_id, size_t chunk_index)
    {
        Registry::DocumentRecord record = requireReady(document_id);
        if (chunk_index >= record.chunk_count)
        {
            return std::nullopt;
        }
        return store->getByIndex(document_id, chunk_index);
    }

    std::optional<Registry::DocumentRecord> ContentStore::getDocument(const std::string &document_id)
    {
        return registry->get(document_id);
    }

    bool ContentStore::deleteDocument(const std::string &document_id)
    {
        std::cout << "Deleting document: " << document_id << std::endl;
        if (!registry->get(document_id))
        {
            return false;
        }

        // Fragments first, so a failure here leaves the record in place for a retry
        size_t removed = store->removeAll(document_id);
        registry->remove(document_id);
        std::cout << "Document " << document_id << " deleted (" << removed << " chunk(s))." << std::endl;
        return true;
    }

} // namespace ChunkVault
